#ifndef SIMULATION_H
#define SIMULATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "kernel/Clock.h"
#include "kernel/Environment.h"
#include "kernel/Species.h"

// ---------- Configuration ----------
struct ParameterSpec {
    std::string name;
    int sampleWidth = 1;
};

struct SimulationConfig {
    Timestamp startTime{};
    double timeStepDays = 1.0;
    std::int64_t pauseMillis = 0;       // delay between driver steps
    double resolutionArcMinutes = 1.0;  // coverage grid resolution
    double dailyDistance = 20.0;        // nautical miles per day
    double perceptionRadius = 20.0;     // nautical miles
    double headingNoiseDegrees = 30.0;
    std::int64_t maxSteps = 0;          // 0 = unbounded
    std::uint64_t seed = 42;
    std::vector<std::string> species;   // species codes
    std::vector<ParameterSpec> parameters;
};

// ---------- Simulation Driver ----------
// Runs an environment step after step: every population moves, then the
// clock advances and every agent records the new step. Either synchronously
// (step / stepN) or on a background driver thread (start / stop / join).
class Simulation {
public:
    Simulation(std::string name, Environment& environment, SimulationConfig config = SimulationConfig());
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    void step();
    void stepN(int n);  // stops early once finished

    void start();
    void stop();
    void join();  // rethrows what stopped the driver, if anything
    bool running() const { return running_; }
    bool finished() const;

    std::uint64_t steps() const { return steps_; }
    const std::string& name() const { return name_; }
    Environment& environment() { return environment_; }
    const Environment& environment() const { return environment_; }
    const SimulationConfig& config() const { return cfg_; }

    struct Statistics {
        std::uint64_t steps = 0;
        int masterStep = 0;
        std::size_t populations = 0;
        std::size_t aliveAgents = 0;
        SamplingReport lastStep;
        SamplingReport cumulative;
        std::size_t listenerFailures = 0;
        std::size_t handleFailures = 0;
    };
    Statistics getStatistics() const;  // not from a listener

private:
    void runLoop();

    std::string name_;
    Environment& environment_;
    SimulationConfig cfg_;

    std::thread driver_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::atomic<std::uint64_t> steps_{0};
    std::exception_ptr failure_;
    std::mutex pauseMutex_;
    std::condition_variable pauseWake_;
};

#endif // SIMULATION_H
