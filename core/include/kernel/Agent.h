#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <vector>
#include "kernel/Clock.h"
#include "kernel/Events.h"
#include "kernel/Observations.h"
#include "kernel/Species.h"
#include "modules/Geometry.h"
#include "modules/Path.h"

class Population;
class Environment;
struct MovementConfig;
struct SamplingReport;

// ---------- Agent ----------
// Mobile individual of a population. Owns its relative clock, its track and
// its observation buffer (one reduced record per step of its own clock).
//
// Mutators take the environment lock themselves. Plain accessors do not: call
// them from the driver thread, from a listener or from a coverage sampler.
class Agent : public std::enable_shared_from_this<Agent> {
public:
    // Only a Population can create a Birth, so only a Population can create agents.
    class Birth {
    public:
        Population& population;
        GeoPoint position;

    private:
        friend class Population;
        Birth(Population& p, const GeoPoint& pos) : population(p), position(pos) {}
    };

    Agent(const Birth& birth, std::shared_ptr<const Species> species);
    virtual ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Identity
    std::uint64_t id() const { return id_; }
    Population* population() const { return population_.load(); }  // nullptr once dead
    bool alive() const { return population_.load() != nullptr; }
    const std::shared_ptr<const Species>& species() const { return species_; }
    const Clock& clock() const { return *clock_; }
    const Path& path() const { return *path_; }
    GeoPoint location() const { return path_->location(); }
    Ellipse perceptionArea() const { return perceptionAreaAt(clock_->currentStep()); }

    // Lifecycle
    void migrate(Population& target);
    void metamorphose(std::shared_ptr<const Species> species);
    void kill();

    // Observations
    void observe();
    std::optional<Observations> observations(Timestamp date) const;
    Observations requireObservations(Timestamp date) const;  // throws DeadAgent / DateOutOfRange
    int observedSteps() const { return observedSteps_; }
    std::size_t observationCapacity() const { return buffer_.size(); }

    // Navigation
    void setDestination(const GeoPoint& point);
    void clearDestination();
    std::optional<GeoPoint> destination() const { return destination_; }

    // Listeners
    ListenerId addAgentChangeListener(ListenerList<AgentChangeEvent>::Listener listener);
    ListenerId addAgentChangeListener(AgentChangeType type,
                                      ListenerList<AgentChangeEvent>::Listener listener);
    bool removeAgentChangeListener(ListenerId id);
    std::size_t listenerCount() const { return listeners_.size(); }

protected:
    // One step of movement lasting `duration` days. Runs with the lock held;
    // the track already has a point for the next step.
    virtual void move(double duration, std::mt19937_64& rng);

    Path& mutablePath();
    const MovementConfig& movement() const;

private:
    friend class Population;
    friend class Environment;

    struct TreeLock {
        std::unique_lock<std::mutex> guard;
        bool alive = false;
    };
    TreeLock lockTree() const;

    Ellipse perceptionAreaAt(int step) const;
    void observeLocked(SamplingReport& report);
    Observations recordLocked(int step) const;
    void ensureCapacity(std::size_t offset, std::size_t width);
    void killLocked();
    void rebaseClockLocked(const Environment& destination);
    void fireLocked(Environment& env, AgentChangeType type,
                    std::shared_ptr<Population> oldPopulation = nullptr,
                    std::shared_ptr<Population> newPopulation = nullptr,
                    std::shared_ptr<const Species> oldSpecies = nullptr);

    const std::uint64_t id_;
    std::atomic<Population*> population_;
    std::shared_ptr<const Species> species_;
    std::shared_ptr<Clock> clock_;
    std::unique_ptr<Path> path_;
    std::vector<float> buffer_;
    int observedSteps_ = 0;
    std::optional<GeoPoint> destination_;
    ListenerList<AgentChangeEvent> listeners_;
};
