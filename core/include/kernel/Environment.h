#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "kernel/Clock.h"
#include "kernel/EventQueue.h"
#include "kernel/Events.h"
#include "kernel/Population.h"
#include "modules/Coverage.h"
#include "modules/RemoteHandles.h"
#include "utils/EventLog.h"

// Counts of the observation pass.
struct SamplingReport {
    std::uint64_t agents = 0;
    std::uint64_t points = 0;         // parameter samples requested
    std::uint64_t pointsOutside = 0;  // samples outside their coverage

    double percentOutside() const {
        return points == 0 ? 0.0 : 100.0 * static_cast<double>(pointsOutside) / static_cast<double>(points);
    }
    void add(const SamplingReport& other) {
        agents += other.agents;
        points += other.points;
        pointsOutside += other.pointsOutside;
    }
};

// ---------- Environment ----------
// Root of a simulation: master clock, populations, coverages, the lock and the
// notification queue. Not copyable; disposing it kills everything it owns.
class Environment {
public:
    explicit Environment(std::shared_ptr<Clock> clock, std::string name = "environment");
    ~Environment();

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    std::uint64_t id() const { return id_; }
    const std::string& name() const { return name_; }

    // Populations
    std::shared_ptr<Population> newPopulation(MovementConfig movement = MovementConfig(),
                                              std::uint64_t seed = 42);
    void addPopulation(const std::shared_ptr<Population>& population);
    std::vector<std::shared_ptr<Population>> populations() const;

    // Coverages, keyed by parameter name
    void setCoverage(const Parameter& parameter, std::shared_ptr<const CoverageSampler> sampler);
    void removeCoverage(const std::string& parameterName);
    std::vector<std::string> coverageNames() const;

    // Time
    Clock& clock() { return *clock_; }
    const Clock& clock() const { return *clock_; }
    void advanceStep();
    void runStep();  // evoluate every population, then advance

    // Sampling statistics of the current step, or cumulative when full is set
    SamplingReport report(bool full = false) const;

    // Listeners
    ListenerId addEnvironmentChangeListener(ListenerList<EnvironmentChangeEvent>::Listener listener);
    ListenerId addEnvironmentChangeListener(EnvironmentChangeType type,
                                            ListenerList<EnvironmentChangeEvent>::Listener listener);
    bool removeEnvironmentChangeListener(ListenerId id);
    std::size_t listenerCount() const;  // every listener of the tree

    // Remote publication
    void publish(std::shared_ptr<HandleRegistry> registry, TeardownPolicy policy = TeardownPolicy());
    void withdraw();
    bool published() const;

    // Teardown
    void dispose();
    bool disposed() const;

    // Blocks until every notification queued so far has been delivered.
    void flushEvents() { queue_.flush(); }

    std::mutex& lock() { return queue_.lock(); }
    EventLog& eventLog() { return event_log_; }
    const EventLog& eventLog() const { return event_log_; }

private:
    friend class Population;
    friend class Agent;

    // Unowned when called by a listener: the worker already holds the lock.
    std::unique_lock<std::mutex> acquire();
    std::unique_lock<std::mutex> acquire() const;
    // Both locks without lock-order inversion; a and b may be the same.
    static std::pair<std::unique_lock<std::mutex>, std::unique_lock<std::mutex>>
    acquirePair(Environment& a, Environment& b);

    void advanceStepLocked();
    // Agents moving in from `source` must keep the same step length.
    void requireCompatibleClock(const Environment& source) const;
    void attachLocked(const std::shared_ptr<Population>& population);
    void detachLocked(const Population* population);
    void fireLocked(EnvironmentChangeType type, std::shared_ptr<Population> population);
    const CoverageSampler* coverageLocked(const Parameter& parameter) const;

    // Handles of the tree, no-ops when not published
    void publishLocked(const Population& population);
    void withdrawLocked(const Population& population);
    void publishLocked(const Agent& agent);
    void withdrawLocked(const Agent& agent);
    void withdrawAllLocked();

    static RemoteHandle handleOf(const Population& population);
    static RemoteHandle handleOf(const Agent& agent);
    static RemoteHandle handleOf(const Species& species);

    const std::uint64_t id_;
    std::string name_;
    EventLog event_log_;
    mutable EventQueue queue_;
    std::shared_ptr<Clock> clock_;
    std::vector<std::shared_ptr<Population>> populations_;
    std::map<std::string, std::shared_ptr<const CoverageSampler>> coverages_;
    ListenerList<EnvironmentChangeEvent> listeners_;
    SamplingReport report_;  // current step
    SamplingReport fullReport_;
    std::unique_ptr<HandlePublisher> publisher_;
    bool disposed_ = false;
};

#endif // ENVIRONMENT_H
