#include "kernel/Agent.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include "kernel/Environment.h"
#include "kernel/Errors.h"
#include "kernel/Population.h"

namespace {
    constexpr double kPi = 3.14159265358979323846;
    constexpr double kDegToRad = kPi / 180.0;
    constexpr double kMilesPerDegree = 60.0;
    constexpr std::size_t kGrowthSteps = 1024;  // records reserved at once

    const float kNaN = std::numeric_limits<float>::quiet_NaN();

    std::atomic<std::uint64_t> gNextAgentId{0};

    std::string describe(std::uint64_t id) {
        return "agent #" + std::to_string(id);
    }
}

Agent::Agent(const Birth& birth, std::shared_ptr<const Species> species)
    : id_(++gNextAgentId), population_(&birth.population), species_(std::move(species)) {
    if (!species_) {
        throw std::invalid_argument("Agent needs a species");
    }
    Environment* env = birth.population.environment();
    if (!env) {
        throw DeadAgent("cannot spawn an agent in a dead population");
    }
    clock_ = env->clock_->spawnRelativeClock();
    path_ = std::make_unique<GeoPath>(birth.position);
}

Agent::~Agent() = default;

// ---------- Locking ----------

Agent::TreeLock Agent::lockTree() const {
    for (;;) {
        TreeLock tree;
        Population* population = population_.load();
        if (!population) {
            return tree;
        }
        Environment* env = population->environment_.load();
        if (!env) {
            return tree;
        }
        tree.guard = env->acquire();
        // Migration may have moved us while we were waiting
        if (population_.load() == population && population->environment_.load() == env) {
            tree.alive = true;
            return tree;
        }
    }
}

// ---------- Lifecycle ----------

void Agent::migrate(Population& target) {
    for (;;) {
        Population* from = population_.load();
        if (!from) {
            throw DeadAgent(describe(id_) + " is dead");
        }
        Environment* source = from->environment_.load();
        Environment* dest = target.environment_.load();
        if (!dest) {
            throw DeadAgent("target population #" + std::to_string(target.id()) + " is dead");
        }
        if (!source) {
            throw DeadAgent(describe(id_) + " is dead");
        }
        auto guards = Environment::acquirePair(*source, *dest);
        if (population_.load() != from || from->environment_.load() != source ||
            target.environment_.load() != dest) {
            continue;
        }
        if (from == &target) {
            return;
        }

        if (source != dest) {
            dest->requireCompatibleClock(*source);
        }
        auto self = shared_from_this();
        auto oldPopulation = from->shared_from_this();
        auto newPopulation = target.shared_from_this();

        from->detachLocked(this);
        population_.store(&target);
        if (source != dest) {
            rebaseClockLocked(*dest);
        }
        target.agents_.push_back(self);
        target.bounds_.reset();

        fireLocked(*dest, AgentChangeType::PopulationChanged, oldPopulation, newPopulation);
        from->fireLocked(*source, PopulationChangeType::AgentRemoved, self);
        target.fireLocked(*dest, PopulationChangeType::AgentAdded, self);
        dest->event_log_.logMigration(dest->clock_->currentStep(), id_, from->id(), target.id());

        if (source != dest) {
            source->withdrawLocked(*this);
            dest->publishLocked(*this);
        }
        return;
    }
}

void Agent::metamorphose(std::shared_ptr<const Species> species) {
    if (!species) {
        throw std::invalid_argument("metamorphose needs a species");
    }
    auto tree = lockTree();
    if (!tree.alive) {
        throw DeadAgent(describe(id_) + " is dead");
    }
    if (species == species_) {
        return;
    }
    if (!species_->layoutCompatible(*species)) {
        throw IncompatibleSpecies("species '" + species->name() +
                                  "' does not observe the same parameters as '" +
                                  species_->name() + "'");
    }
    Environment& env = *population_.load()->environment_.load();
    const int step = env.clock_->currentStep();

    std::shared_ptr<const Species> old = std::move(species_);
    species_ = std::move(species);
    if (env.publisher_) {
        env.publisher_->acquire(Environment::handleOf(*species_));
        env.publisher_->release(Environment::handleOf(*old), step);
    }
    fireLocked(env, AgentChangeType::SpeciesChanged, nullptr, nullptr, old);
    env.event_log_.logMetamorphosis(step, id_, species_->name());
}

void Agent::kill() {
    auto tree = lockTree();
    if (!tree.alive) {
        return;
    }
    killLocked();
}

void Agent::killLocked() {
    Population* from = population_.load();
    Environment& env = *from->environment_.load();
    auto self = shared_from_this();
    auto oldPopulation = from->shared_from_this();

    from->detachLocked(this);
    env.withdrawLocked(*this);
    fireLocked(env, AgentChangeType::Killed, oldPopulation);
    from->fireLocked(env, PopulationChangeType::AgentRemoved, self);
    env.event_log_.logDeath(env.clock_->currentStep(), id_, from->id());

    population_.store(nullptr);
    listeners_.clear();
}

// Moves the agent onto the master of `destination`, keeping its age so that
// records stay indexed by the agent's own steps.
void Agent::rebaseClockLocked(const Environment& destination) {
    clock_ = destination.clock_->spawnAgedClock(clock_->currentStep());
}

void Agent::fireLocked(Environment& env, AgentChangeType type,
                       std::shared_ptr<Population> oldPopulation,
                       std::shared_ptr<Population> newPopulation,
                       std::shared_ptr<const Species> oldSpecies) {
    auto listeners = listeners_.snapshot();
    if (listeners->empty()) {
        return;
    }
    AgentChangeEvent event;
    event.source = shared_from_this();
    event.type = type;
    event.step = env.clock_->currentStep();
    event.oldPopulation = std::move(oldPopulation);
    event.newPopulation = std::move(newPopulation);
    event.oldSpecies = std::move(oldSpecies);
    event.newSpecies = species_;
    EventLog* log = &env.event_log_;
    env.queue_.invokeLaterLocked([listeners, event, log] {
        ListenerList<AgentChangeEvent>::dispatch(listeners, event, *log, "agent");
    });
}

// ---------- Observations ----------

Ellipse Agent::perceptionAreaAt(int step) const {
    const int last = path_->pointCount() - 1;
    const int s = std::max(0, std::min(step, last));
    const GeoPoint c = path_->locationAt(s);
    const double heading = path_->headingAt(s) * kDegToRad;
    const double cosLat = std::max(std::cos(c.y * kDegToRad), 1e-6);
    const PerceptionTemplate& t = species_->perception();

    Ellipse area;
    area.center.x = c.x + t.forwardOffset * std::sin(heading) / (kMilesPerDegree * cosLat);
    area.center.y = c.y + t.forwardOffset * std::cos(heading) / kMilesPerDegree;
    area.radiusX = t.alongHeading / kMilesPerDegree;
    area.radiusY = t.acrossHeading / kMilesPerDegree;
    area.angle = kPi / 2 - heading;
    return area;
}

void Agent::observe() {
    auto tree = lockTree();
    if (!tree.alive) {
        throw DeadAgent(describe(id_) + " is dead");
    }
    SamplingReport report;
    observeLocked(report);
    Environment& env = *population_.load()->environment_.load();
    env.report_.add(report);
    env.fullReport_.add(report);
}

void Agent::observeLocked(SamplingReport& report) {
    const Environment& env = *population_.load()->environment_.load();
    const int step = clock_->currentStep();
    path_->setPointCount(step + 1);

    const GeoPoint position = path_->locationAt(step);
    const Ellipse area = perceptionAreaAt(step);
    const Species& species = *species_;
    const std::size_t width = static_cast<std::size_t>(species.reducedRecordWidth());
    ++report.agents;

    if (width > 0) {
        const std::size_t offset = static_cast<std::size_t>(step) * width;
        ensureCapacity(offset, width);
        float* record = buffer_.data() + offset;

        const auto& parameters = species.parameters();
        for (std::size_t i = 0; i < parameters.size(); ++i) {
            const Parameter& parameter = parameters[i];
            if (parameter.isHeading()) continue;

            float* dest = record + species.storedOffset(i);
            ++report.points;
            const CoverageSampler* sampler = env.coverageLocked(parameter);
            const bool inside = sampler && sampler->evaluate(*this, position, area, dest);
            if (!inside) {
                std::fill(dest, dest + parameter.sampleWidth(), kNaN);
                if (sampler) ++report.pointsOutside;
            }
        }
    }
    observedSteps_ = std::max(observedSteps_, step + 1);
}

void Agent::ensureCapacity(std::size_t offset, std::size_t width) {
    if (offset + width <= buffer_.size()) {
        return;
    }
    // Grow by a large chunk, at least doubling
    buffer_.resize(offset + std::max(offset, width * kGrowthSteps), kNaN);
}

Observations Agent::recordLocked(int step) const {
    const Species& species = *species_;
    std::vector<float> record(static_cast<std::size_t>(species.recordWidth()), kNaN);
    const std::size_t width = static_cast<std::size_t>(species.reducedRecordWidth());
    const int s = std::min(step, path_->pointCount() - 1);

    const auto& parameters = species.parameters();
    for (std::size_t i = 0; i < parameters.size(); ++i) {
        float* dest = record.data() + species.offsets()[i];
        if (parameters[i].isHeading()) {
            path_->locationAt(s, dest);
            continue;
        }
        const float* stored = buffer_.data() + static_cast<std::size_t>(step) * width +
                              species.storedOffset(i);
        std::copy(stored, stored + parameters[i].sampleWidth(), dest);
    }
    return Observations(species_, step, std::move(record), static_cast<float>(path_->headingAt(s)));
}

std::optional<Observations> Agent::observations(Timestamp date) const {
    auto tree = lockTree();
    if (!tree.alive) {
        return std::nullopt;
    }
    const int step = clock_->stepForDate(date);
    if (step == Clock::kOutOfRange || step >= observedSteps_) {
        return std::nullopt;
    }
    return recordLocked(step);
}

Observations Agent::requireObservations(Timestamp date) const {
    auto tree = lockTree();
    if (!tree.alive) {
        throw DeadAgent(describe(id_) + " is dead");
    }
    const int step = clock_->requireStepForDate(date);
    if (step >= observedSteps_) {
        throw DateOutOfRange(describe(id_) + " has no observation for step " + std::to_string(step));
    }
    return recordLocked(step);
}

// ---------- Navigation ----------

void Agent::setDestination(const GeoPoint& point) {
    auto tree = lockTree();
    if (!tree.alive) {
        throw DeadAgent(describe(id_) + " is dead");
    }
    destination_ = point;
}

void Agent::clearDestination() {
    auto tree = lockTree();
    destination_.reset();
}

Path& Agent::mutablePath() {
    if (Population* population = population_.load()) {
        population->bounds_.reset();
    }
    return *path_;
}

const MovementConfig& Agent::movement() const {
    Population* population = population_.load();
    if (!population) {
        throw DeadAgent(describe(id_) + " is dead");
    }
    return population->movement();
}

void Agent::move(double duration, std::mt19937_64& rng) {
    const MovementConfig& config = movement();
    const double distance = config.dailyDistance * duration;
    Path& path = mutablePath();
    if (destination_) {
        if (path.moveToward(*destination_, distance)) {
            destination_.reset();
        }
        return;
    }
    if (config.headingNoise > 0.0) {
        std::normal_distribution<double> turn(0.0, config.headingNoise);
        path.rotate(turn(rng));
    }
    path.moveForward(distance);
}

// ---------- Listeners ----------

ListenerId Agent::addAgentChangeListener(ListenerList<AgentChangeEvent>::Listener listener) {
    auto tree = lockTree();
    return listeners_.add(std::move(listener));
}

ListenerId Agent::addAgentChangeListener(AgentChangeType type,
                                         ListenerList<AgentChangeEvent>::Listener listener) {
    auto tree = lockTree();
    return listeners_.add(type, std::move(listener));
}

bool Agent::removeAgentChangeListener(ListenerId id) {
    auto tree = lockTree();
    return listeners_.remove(id);
}
