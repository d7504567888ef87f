#include "kernel/Population.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif
#include "kernel/Environment.h"
#include "kernel/Errors.h"

namespace {
    std::atomic<std::uint64_t> gNextPopulationId{0};
}

Population::Population(Environment& environment, MovementConfig movement, std::uint64_t seed)
    : id_(++gNextPopulationId), environment_(&environment), movement_(movement), rng_(seed) {
    if (movement_.dailyDistance < 0.0) {
        throw std::invalid_argument("dailyDistance must be >= 0 (got " +
                                    std::to_string(movement_.dailyDistance) + ")");
    }
    if (movement_.headingNoise < 0.0) {
        throw std::invalid_argument("headingNoise must be >= 0 (got " +
                                    std::to_string(movement_.headingNoise) + ")");
    }
}

Population::~Population() = default;

std::optional<std::unique_lock<std::mutex>> Population::tryLockTree() const {
    for (;;) {
        Environment* env = environment_.load();
        if (!env) {
            return std::nullopt;
        }
        auto guard = env->acquire();
        // addPopulation may have moved us while we were waiting
        if (environment_.load() == env) {
            return std::optional<std::unique_lock<std::mutex>>(std::move(guard));
        }
    }
}

std::unique_lock<std::mutex> Population::lockTree() const {
    auto guard = tryLockTree();
    if (!guard) {
        throw DeadAgent("population #" + std::to_string(id_) + " is dead");
    }
    return std::move(*guard);
}

// ---------- Agents ----------

std::shared_ptr<Agent> Population::spawn(std::shared_ptr<const Species> species,
                                         const GeoPoint& position) {
    auto guard = lockTree();
    auto agent = std::make_shared<Agent>(Agent::Birth(*this, position), std::move(species));
    attachLocked(agent);
    return agent;
}

void Population::attachLocked(const std::shared_ptr<Agent>& agent) {
    Environment& env = *environment_.load();

    // Record the birth step before the agent becomes visible
    SamplingReport report;
    agent->observeLocked(report);
    env.report_.add(report);
    env.fullReport_.add(report);

    agents_.push_back(agent);
    bounds_.reset();
    env.publishLocked(*agent);
    fireLocked(env, PopulationChangeType::AgentAdded, agent);
    env.event_log_.logSpawn(env.clock_->currentStep(), agent->id(), id_);
}

std::shared_ptr<Agent> Population::detachLocked(const Agent* agent) {
    auto it = std::find_if(agents_.begin(), agents_.end(),
                           [agent](const std::shared_ptr<Agent>& a) { return a.get() == agent; });
    if (it == agents_.end()) {
        return nullptr;
    }
    std::shared_ptr<Agent> removed = std::move(*it);
    agents_.erase(it);
    bounds_.reset();
    return removed;
}

std::vector<std::shared_ptr<Agent>> Population::agents() const {
    auto guard = tryLockTree();
    if (!guard) {
        return {};
    }
    return agents_;
}

std::size_t Population::size() const {
    auto guard = tryLockTree();
    return guard ? agents_.size() : 0;
}

// ---------- Simulation ----------

void Population::evoluate(double duration) {
    auto guard = lockTree();
    evoluateLocked(duration);
}

void Population::evoluateLocked(double duration) {
    if (duration < 0.0) {
        throw std::invalid_argument("evoluate duration must be >= 0 (got " +
                                    std::to_string(duration) + ")");
    }
    // Serial: agents share the population random stream
    for (const auto& agent : agents_) {
        agent->path_->setPointCount(agent->clock_->currentStep() + 2);
        agent->move(duration, rng_);
    }
    bounds_.reset();
}

void Population::observe() {
    auto guard = lockTree();
    SamplingReport report;
    observeLocked(report);
    Environment& env = *environment_.load();
    env.report_.add(report);
    env.fullReport_.add(report);
}

void Population::observeLocked(SamplingReport& report) {
    const std::int64_t n = static_cast<std::int64_t>(agents_.size());
    std::uint64_t observed = 0;
    std::uint64_t points = 0;
    std::uint64_t outside = 0;
    std::exception_ptr failure;

    #pragma omp parallel for schedule(dynamic) reduction(+:observed, points, outside)
    for (std::int64_t i = 0; i < n; ++i) {
        try {
            SamplingReport local;
            agents_[static_cast<std::size_t>(i)]->observeLocked(local);
            observed += local.agents;
            points += local.points;
            outside += local.pointsOutside;
        } catch (...) {
            // Exceptions must not cross the parallel region; rethrown below
            #pragma omp critical(population_observe_failure)
            {
                if (!failure) failure = std::current_exception();
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    report.agents += observed;
    report.points += points;
    report.pointsOutside += outside;
}

void Population::kill() {
    auto guard = tryLockTree();
    if (!guard) {
        return;
    }
    killLocked();
}

void Population::killLocked() {
    Environment& env = *environment_.load();
    auto self = shared_from_this();

    const std::vector<std::shared_ptr<Agent>> members = agents_;
    for (const auto& agent : members) {
        agent->killLocked();
    }
    env.detachLocked(this);
    env.withdrawLocked(*this);
    env.fireLocked(EnvironmentChangeType::PopulationRemoved, self);
    fireLocked(env, PopulationChangeType::Killed, nullptr);

    environment_.store(nullptr);
    listeners_.clear();
    bounds_.reset();
}

std::optional<GeoRect> Population::spatialBounds() const {
    auto guard = lockTree();
    if (agents_.empty()) {
        return std::nullopt;
    }
    if (!bounds_) {
        GeoRect box;
        for (const auto& agent : agents_) {
            box.add(agent->path().boundingShape());
        }
        bounds_ = box;
    }
    return bounds_;
}

void Population::fireLocked(Environment& env, PopulationChangeType type,
                            std::shared_ptr<Agent> agent) {
    auto listeners = listeners_.snapshot();
    if (listeners->empty()) {
        return;
    }
    PopulationChangeEvent event;
    event.source = shared_from_this();
    event.type = type;
    event.step = env.clock_->currentStep();
    event.agent = std::move(agent);
    EventLog* log = &env.event_log_;
    env.queue_.invokeLaterLocked([listeners, event, log] {
        ListenerList<PopulationChangeEvent>::dispatch(listeners, event, *log, "population");
    });
}

// ---------- Listeners ----------

ListenerId Population::addPopulationChangeListener(
        ListenerList<PopulationChangeEvent>::Listener listener) {
    auto guard = lockTree();
    return listeners_.add(std::move(listener));
}

ListenerId Population::addPopulationChangeListener(
        PopulationChangeType type, ListenerList<PopulationChangeEvent>::Listener listener) {
    auto guard = lockTree();
    return listeners_.add(type, std::move(listener));
}

bool Population::removePopulationChangeListener(ListenerId id) {
    auto guard = tryLockTree();
    return listeners_.remove(id);
}

std::size_t Population::listenerCount() const {
    auto guard = tryLockTree();
    return listenerCountLocked();
}

std::size_t Population::listenerCountLocked() const {
    std::size_t count = listeners_.size();
    for (const auto& agent : agents_) {
        count += agent->listenerCount();
    }
    return count;
}
