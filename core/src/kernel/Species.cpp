#include "kernel/Species.h"

#include <algorithm>
#include <atomic>
#include <set>
#include <stdexcept>
#include <utility>

namespace {
    std::atomic<std::uint64_t> gNextSpeciesId{0};

    std::string language(const std::string& locale) {
        const auto sep = locale.find_first_of("_-");
        return sep == std::string::npos ? locale : locale.substr(0, sep);
    }

    std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }
}

// ---------- Parameter ----------

Parameter::Parameter(std::string name, int sampleWidth)
    : name_(trim(name)), width_(sampleWidth) {
    if (name_.empty()) {
        throw std::invalid_argument("Parameter name must not be empty");
    }
    if (width_ != 1 && width_ != kLocatedWidth) {
        throw std::invalid_argument("Parameter '" + name_ + "' sample width must be 1 or 3 (got " +
                                    std::to_string(width_) + ")");
    }
}

Parameter::Parameter(HeadingTag) : name_("Heading"), width_(kHeadingWidth), heading_(true) {}

const Parameter& Parameter::heading() {
    static const Parameter instance{HeadingTag{}};
    return instance;
}

bool Parameter::operator==(const Parameter& other) const {
    return heading_ == other.heading_ && width_ == other.width_ && name_ == other.name_;
}

// ---------- Species ----------

Species::Species(std::vector<LocalizedName> names, Color color,
                 std::vector<Parameter> parameters, PerceptionTemplate perception)
    : id_(++gNextSpeciesId), names_(std::move(names)), color_(color), parameters_(std::move(parameters)),
      perception_(perception) {
    if (names_.empty()) {
        throw std::invalid_argument("Species needs at least one name");
    }
    std::set<std::string> locales;
    for (const auto& n : names_) {
        if (n.name.empty()) {
            throw std::invalid_argument("Species name for locale '" + n.locale + "' is empty");
        }
        if (!locales.insert(n.locale).second) {
            throw std::invalid_argument("Duplicate species locale '" + n.locale + "'");
        }
    }
    if (perception_.alongHeading < 0 || perception_.acrossHeading < 0) {
        throw std::invalid_argument("Perception radii must be >= 0");
    }

    std::set<std::string> seen;
    offsets_.reserve(parameters_.size() + 1);
    storedOffsets_.reserve(parameters_.size());
    offsets_.push_back(0);
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        const Parameter& p = parameters_[i];
        if (!seen.insert(p.name()).second) {
            throw std::invalid_argument("Parameter '" + p.name() + "' appears twice in species '" +
                                        names_.front().name + "'");
        }
        offsets_.push_back(offsets_.back() + p.sampleWidth());
        if (p.isHeading()) {
            headingIndex_ = static_cast<int>(i);
            storedOffsets_.push_back(-1);
        } else {
            storedOffsets_.push_back(reducedWidth_);
            reducedWidth_ += p.sampleWidth();
        }
    }
}

std::string Species::name(const std::string& locale) const {
    if (locale.empty()) {
        for (const auto& n : names_) {
            if (n.locale.empty()) return n.name;
        }
        return names_.front().name;
    }
    for (const auto& n : names_) {
        if (n.locale == locale) return n.name;
    }
    const std::string lang = language(locale);
    for (const auto& n : names_) {
        if (!n.locale.empty() && language(n.locale) == lang) return n.name;
    }
    return {};
}

int Species::indexOf(const std::string& parameterName) const {
    for (std::size_t i = 0; i < parameters_.size(); ++i) {
        if (parameters_[i].name() == parameterName) return static_cast<int>(i);
    }
    return -1;
}

bool Species::operator==(const Species& other) const {
    if (this == &other) return true;
    if (names_.size() != other.names_.size() || !(color_ == other.color_) ||
        parameters_ != other.parameters_) {
        return false;
    }
    return std::equal(names_.begin(), names_.end(), other.names_.begin(),
        [](const LocalizedName& a, const LocalizedName& b) {
            return a.locale == b.locale && a.name == b.name;
        });
}
