#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <type_traits>
#include <utility>
#include <vector>
#include "kernel/Agent.h"
#include "kernel/Events.h"
#include "modules/Geometry.h"

class Environment;
struct SamplingReport;

// Default movement rule parameters.
struct MovementConfig {
    double dailyDistance = 20.0;  // nautical miles per day
    double headingNoise = 30.0;   // degrees, std dev of the daily course change
};

// ---------- Population ----------
// Set of agents attached to one environment. Created by
// Environment::newPopulation and alive until killed.
class Population : public std::enable_shared_from_this<Population> {
public:
    ~Population();

    Population(const Population&) = delete;
    Population& operator=(const Population&) = delete;

    std::uint64_t id() const { return id_; }
    Environment* environment() const { return environment_.load(); }  // nullptr once dead
    bool alive() const { return environment_.load() != nullptr; }
    const MovementConfig& movement() const { return movement_; }

    // Agents
    std::shared_ptr<Agent> spawn(std::shared_ptr<const Species> species, const GeoPoint& position);

    template <typename AgentT, typename... Args>
    std::shared_ptr<AgentT> spawnAs(std::shared_ptr<const Species> species,
                                    const GeoPoint& position, Args&&... args) {
        static_assert(std::is_base_of<Agent, AgentT>::value, "AgentT must derive from Agent");
        auto guard = lockTree();
        auto agent = std::make_shared<AgentT>(Agent::Birth(*this, position), std::move(species),
                                              std::forward<Args>(args)...);
        attachLocked(agent);
        return agent;
    }

    std::vector<std::shared_ptr<Agent>> agents() const;
    std::size_t size() const;

    // Simulation
    void evoluate(double duration);  // days
    void observe();
    void kill();
    std::optional<GeoRect> spatialBounds() const;  // nullopt when empty

    // Listeners
    ListenerId addPopulationChangeListener(ListenerList<PopulationChangeEvent>::Listener listener);
    ListenerId addPopulationChangeListener(PopulationChangeType type,
                                           ListenerList<PopulationChangeEvent>::Listener listener);
    bool removePopulationChangeListener(ListenerId id);
    std::size_t listenerCount() const;  // own listeners plus those of its agents

private:
    friend class Agent;
    friend class Environment;

    Population(Environment& environment, MovementConfig movement, std::uint64_t seed);

    std::unique_lock<std::mutex> lockTree() const;  // throws DeadAgent
    std::optional<std::unique_lock<std::mutex>> tryLockTree() const;  // nullopt once dead

    void attachLocked(const std::shared_ptr<Agent>& agent);
    std::shared_ptr<Agent> detachLocked(const Agent* agent);
    void evoluateLocked(double duration);
    void observeLocked(SamplingReport& report);
    void killLocked();
    std::size_t listenerCountLocked() const;
    void fireLocked(Environment& env, PopulationChangeType type, std::shared_ptr<Agent> agent);

    const std::uint64_t id_;
    std::atomic<Environment*> environment_;
    std::vector<std::shared_ptr<Agent>> agents_;
    mutable std::optional<GeoRect> bounds_;
    ListenerList<PopulationChangeEvent> listeners_;
    MovementConfig movement_;
    std::mt19937_64 rng_;
};
