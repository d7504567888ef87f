#include "io/Config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <map>
#include <ratio>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {
    std::string trim(const std::string& s) {
        std::size_t begin = 0;
        std::size_t end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(begin, end - begin);
    }

    bool isSeparator(const std::string& line) {
        return line.size() >= 3 && std::all_of(line.begin(), line.end(), [](char c) { return c == '-'; });
    }

    // Days since 1970-01-01 of a proleptic Gregorian date.
    std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    bool leapYear(int y) {
        return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    }

    class Properties {
    public:
        void set(const std::string& key, const std::string& value) { values_[key] = value; }
        bool has(const std::string& key) const { return values_.count(key) != 0; }

        const std::string& require(const std::string& key) const {
            auto it = values_.find(key);
            if (it == values_.end()) {
                throw std::runtime_error("Property \"" + key + "\" is not defined");
            }
            return it->second;
        }

        double number(const std::string& key) const {
            const std::string& text = require(key);
            try {
                std::size_t used = 0;
                const double v = std::stod(text, &used);
                if (used != text.size()) {
                    throw std::invalid_argument(text);
                }
                return v;
            } catch (const std::exception&) {
                throw std::runtime_error("Property \"" + key + "\" is not a number (got \"" + text + "\")");
            }
        }

        std::int64_t integer(const std::string& key) const {
            const std::string& text = require(key);
            try {
                std::size_t used = 0;
                const long long v = std::stoll(text, &used);
                if (used != text.size()) {
                    throw std::invalid_argument(text);
                }
                return v;
            } catch (const std::exception&) {
                throw std::runtime_error("Property \"" + key + "\" is not an integer (got \"" + text + "\")");
            }
        }

        std::string text(const std::string& key) const { return require(key); }

    private:
        std::map<std::string, std::string> values_;
    };

    std::vector<std::string> splitList(const std::string& text) {
        std::vector<std::string> items;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) items.push_back(item);
        }
        return items;
    }

    const Color kPalette[] = {
        {230, 25, 75}, {60, 180, 75}, {0, 130, 200}, {245, 130, 48},
        {145, 30, 180}, {70, 240, 240}, {240, 50, 230}, {128, 128, 0},
    };
}

Timestamp parseDate(const std::string& text) {
    std::istringstream in(trim(text));
    int year = 0;
    int month = 0;
    int day = 0;
    char s1 = 0;
    char s2 = 0;
    if (!(in >> year >> s1 >> month >> s2 >> day) || s1 != '/' || s2 != '/' || !(in >> std::ws).eof()) {
        throw std::runtime_error("Date \"" + text + "\" is not in yyyy/MM/dd form");
    }
    static const int kMonthDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::runtime_error("Date \"" + text + "\" has an invalid month");
    }
    const int maxDay = kMonthDays[month - 1] + (month == 2 && leapYear(year) ? 1 : 0);
    if (day < 1 || day > maxDay) {
        throw std::runtime_error("Date \"" + text + "\" has an invalid day");
    }
    const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::hours(24 * days)));
}

SimulationConfig loadConfig(std::istream& in) {
    Properties props;
    std::vector<ParameterSpec> parameters;
    bool inParameters = false;
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        const std::size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        if (!inParameters) {
            if (isSeparator(line)) {
                inParameters = true;
                continue;
            }
            const std::size_t eq = line.find('=');
            if (eq == std::string::npos) {
                throw std::runtime_error("Line " + std::to_string(lineNumber) + ": expected KEY = value");
            }
            props.set(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
            continue;
        }

        ParameterSpec spec;
        const std::size_t semi = line.find(';');
        spec.name = trim(line.substr(0, semi));
        if (semi != std::string::npos) {
            const std::string width = trim(line.substr(semi + 1));
            try {
                spec.sampleWidth = std::stoi(width);
            } catch (const std::exception&) {
                throw std::runtime_error("Line " + std::to_string(lineNumber) +
                                         ": parameter width is not a number (got \"" + width + "\")");
            }
        }
        parameters.push_back(std::move(spec));
    }

    SimulationConfig cfg;
    const std::string start = props.text("START_TIME");
    try {
        cfg.startTime = parseDate(start);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Property \"START_TIME\": " + std::string(e.what()));
    }
    cfg.timeStepDays = props.number("TIME_STEP");
    if (props.has("PAUSE")) cfg.pauseMillis = static_cast<std::int64_t>(props.number("PAUSE") * 1000.0);
    if (props.has("RESOLUTION")) cfg.resolutionArcMinutes = props.number("RESOLUTION");
    if (props.has("DAILY_DISTANCE")) cfg.dailyDistance = props.number("DAILY_DISTANCE");
    if (props.has("PERCEPTION_RADIUS")) cfg.perceptionRadius = props.number("PERCEPTION_RADIUS");
    if (props.has("HEADING_NOISE")) cfg.headingNoiseDegrees = props.number("HEADING_NOISE");
    if (props.has("MAX_STEPS")) cfg.maxSteps = props.integer("MAX_STEPS");
    if (props.has("SEED")) cfg.seed = static_cast<std::uint64_t>(props.integer("SEED"));
    if (props.has("SPECIES")) cfg.species = splitList(props.text("SPECIES"));
    cfg.parameters = std::move(parameters);
    return cfg;
}

SimulationConfig loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open configuration file \"" + path + "\"");
    }
    return loadConfig(in);
}

void applyEnvironmentOverrides(SimulationConfig& cfg) {
    if (const char* seed = std::getenv("ANIMAT_SEED")) {
        try {
            cfg.seed = std::stoull(seed);
        } catch (const std::exception&) {
            throw std::runtime_error("ANIMAT_SEED is not an integer (got \"" + std::string(seed) + "\")");
        }
    }
    if (const char* steps = std::getenv("ANIMAT_MAX_STEPS")) {
        try {
            cfg.maxSteps = std::stoll(steps);
        } catch (const std::exception&) {
            throw std::runtime_error("ANIMAT_MAX_STEPS is not an integer (got \"" + std::string(steps) + "\")");
        }
    }
}

void validate(const SimulationConfig& cfg) {
    if (!(cfg.timeStepDays > 0.0)) {
        throw std::invalid_argument("timeStepDays must be > 0 (got " + std::to_string(cfg.timeStepDays) + ")");
    }
    if (cfg.pauseMillis < 0) {
        throw std::invalid_argument("pauseMillis must be >= 0 (got " + std::to_string(cfg.pauseMillis) + ")");
    }
    if (!(cfg.resolutionArcMinutes > 0.0)) {
        throw std::invalid_argument("resolutionArcMinutes must be > 0 (got " +
                                    std::to_string(cfg.resolutionArcMinutes) + ")");
    }
    if (cfg.dailyDistance < 0.0) {
        throw std::invalid_argument("dailyDistance must be >= 0 (got " + std::to_string(cfg.dailyDistance) + ")");
    }
    if (cfg.perceptionRadius < 0.0) {
        throw std::invalid_argument("perceptionRadius must be >= 0 (got " +
                                    std::to_string(cfg.perceptionRadius) + ")");
    }
    if (cfg.headingNoiseDegrees < 0.0) {
        throw std::invalid_argument("headingNoiseDegrees must be >= 0 (got " +
                                    std::to_string(cfg.headingNoiseDegrees) + ")");
    }
    if (cfg.maxSteps < 0) {
        throw std::invalid_argument("maxSteps must be >= 0 (got " + std::to_string(cfg.maxSteps) + ")");
    }
    for (const auto& p : cfg.parameters) {
        if (p.sampleWidth != 1 && p.sampleWidth != Parameter::kLocatedWidth) {
            throw std::invalid_argument("parameter '" + p.name + "' width must be 1 or 3 (got " +
                                        std::to_string(p.sampleWidth) + ")");
        }
    }
}

std::shared_ptr<Clock> makeClock(const SimulationConfig& cfg, std::shared_ptr<const SolarPosition> sun) {
    validate(cfg);
    const auto step = std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double, std::ratio<86400>>(cfg.timeStepDays));
    return Clock::createClock(cfg.startTime, cfg.startTime + step, std::move(sun));
}

std::vector<Parameter> makeParameters(const SimulationConfig& cfg) {
    std::vector<Parameter> parameters;
    parameters.push_back(Parameter::heading());
    for (const auto& p : cfg.parameters) {
        parameters.emplace_back(p.name, p.sampleWidth);
    }
    return parameters;
}

std::vector<std::shared_ptr<const Species>> makeSpecies(const SimulationConfig& cfg) {
    const std::vector<Parameter> parameters = makeParameters(cfg);
    PerceptionTemplate perception;
    perception.alongHeading = cfg.perceptionRadius;
    perception.acrossHeading = cfg.perceptionRadius / 2.0;

    std::vector<std::shared_ptr<const Species>> species;
    const std::size_t paletteSize = sizeof(kPalette) / sizeof(kPalette[0]);
    for (std::size_t i = 0; i < cfg.species.size(); ++i) {
        species.push_back(std::make_shared<const Species>(
            std::vector<LocalizedName>{{"", cfg.species[i]}}, kPalette[i % paletteSize],
            parameters, perception));
    }
    return species;
}

MovementConfig makeMovement(const SimulationConfig& cfg) {
    MovementConfig movement;
    movement.dailyDistance = cfg.dailyDistance;
    movement.headingNoise = cfg.headingNoiseDegrees;
    return movement;
}

int searchGridSize(const SimulationConfig& cfg) {
    validate(cfg);
    const double cells = std::ceil(2.0 * cfg.perceptionRadius / cfg.resolutionArcMinutes);
    return static_cast<int>(std::min(std::max(cells, 1.0), 4096.0));
}

std::shared_ptr<PeakSearchCoverage> makePeakSearchCoverage(const SimulationConfig& cfg,
                                                           PeakSearchCoverage::Field field) {
    return std::make_shared<PeakSearchCoverage>(std::move(field), searchGridSize(cfg));
}
