#include "kernel/Simulation.h"

#include <stdexcept>
#include <utility>
#include "io/Config.h"

Simulation::Simulation(std::string name, Environment& environment, SimulationConfig cfg)
    : name_(std::move(name)), environment_(environment), cfg_(std::move(cfg)) {
    validate(cfg_);
}

Simulation::~Simulation() {
    stop();
    if (driver_.joinable()) {
        driver_.join();
    }
}

void Simulation::step() {
    environment_.runStep();
    ++steps_;
}

void Simulation::stepN(int n) {
    for (int i = 0; i < n && !finished(); ++i) {
        step();
    }
}

bool Simulation::finished() const {
    return cfg_.maxSteps > 0 && steps_ >= static_cast<std::uint64_t>(cfg_.maxSteps);
}

// ---------- Background Driver ----------

void Simulation::start() {
    if (running_) {
        throw std::logic_error("simulation '" + name_ + "' is already running");
    }
    if (driver_.joinable()) {
        driver_.join();
    }
    failure_ = nullptr;
    stopRequested_ = false;
    running_ = true;
    driver_ = std::thread(&Simulation::runLoop, this);
}

void Simulation::stop() {
    {
        std::lock_guard<std::mutex> guard(pauseMutex_);
        stopRequested_ = true;
    }
    pauseWake_.notify_all();
}

void Simulation::join() {
    if (driver_.joinable()) {
        driver_.join();
    }
    if (failure_) {
        std::exception_ptr failure = std::move(failure_);
        failure_ = nullptr;
        std::rethrow_exception(failure);
    }
}

void Simulation::runLoop() {
    const auto pause = std::chrono::milliseconds(cfg_.pauseMillis);
    while (!stopRequested_ && !finished()) {
        try {
            step();
        } catch (const std::exception& e) {
            environment_.eventLog().logWarning(environment_.clock().currentStep(), name_,
                                               std::string("driver stopped: ") + e.what());
            failure_ = std::current_exception();
            break;
        } catch (...) {
            environment_.eventLog().logWarning(environment_.clock().currentStep(), name_,
                                               "driver stopped: unknown exception");
            failure_ = std::current_exception();
            break;
        }
        if (pause.count() > 0) {
            std::unique_lock<std::mutex> guard(pauseMutex_);
            pauseWake_.wait_for(guard, pause, [this] { return stopRequested_.load(); });
        }
    }
    running_ = false;
}

// ---------- Statistics ----------

Simulation::Statistics Simulation::getStatistics() const {
    Statistics s;
    s.steps = steps_;
    const auto populations = environment_.populations();
    s.populations = populations.size();
    for (const auto& population : populations) {
        s.aliveAgents += population->size();
    }
    {
        std::lock_guard<std::mutex> guard(environment_.lock());
        s.masterStep = environment_.clock().currentStep();
    }
    s.lastStep = environment_.report(false);
    s.cumulative = environment_.report(true);
    s.listenerFailures = environment_.eventLog().count(EventCategory::ListenerFailure);
    s.handleFailures = environment_.eventLog().count(EventCategory::HandleFailure);
    return s;
}
