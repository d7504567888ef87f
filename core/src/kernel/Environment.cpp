#include "kernel/Environment.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <utility>
#include "kernel/Errors.h"

namespace {
    std::atomic<std::uint64_t> gNextEnvironmentId{0};
}

Environment::Environment(std::shared_ptr<Clock> clock, std::string name)
    : id_(++gNextEnvironmentId),
      name_(std::move(name)),
      queue_(event_log_, name_ + " events"),
      clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("Environment needs a clock");
    }
}

Environment::~Environment() {
    dispose();
}

// ---------- Locking ----------

std::unique_lock<std::mutex> Environment::acquire() {
    if (queue_.isDispatchThread()) {
        return std::unique_lock<std::mutex>();
    }
    return std::unique_lock<std::mutex>(queue_.lock());
}

std::unique_lock<std::mutex> Environment::acquire() const {
    if (queue_.isDispatchThread()) {
        return std::unique_lock<std::mutex>();
    }
    return std::unique_lock<std::mutex>(queue_.lock());
}

std::pair<std::unique_lock<std::mutex>, std::unique_lock<std::mutex>>
Environment::acquirePair(Environment& a, Environment& b) {
    std::unique_lock<std::mutex> first;
    std::unique_lock<std::mutex> second;
    const bool needA = !a.queue_.isDispatchThread();
    const bool needB = &a != &b && !b.queue_.isDispatchThread();
    if (needA && needB) {
        first = std::unique_lock<std::mutex>(a.lock(), std::defer_lock);
        second = std::unique_lock<std::mutex>(b.lock(), std::defer_lock);
        std::lock(first, second);
    } else if (needA) {
        first = std::unique_lock<std::mutex>(a.lock());
    } else if (needB) {
        second = std::unique_lock<std::mutex>(b.lock());
    }
    return {std::move(first), std::move(second)};
}

// ---------- Populations ----------

std::shared_ptr<Population> Environment::newPopulation(MovementConfig movement, std::uint64_t seed) {
    auto guard = acquire();
    if (disposed_) {
        throw std::logic_error("environment '" + name_ + "' is disposed");
    }
    std::shared_ptr<Population> population(new Population(*this, movement, seed));
    attachLocked(population);
    return population;
}

void Environment::addPopulation(const std::shared_ptr<Population>& population) {
    if (!population) {
        throw std::invalid_argument("addPopulation needs a population");
    }
    for (;;) {
        Environment* old = population->environment_.load();
        if (!old) {
            throw DeadAgent("population #" + std::to_string(population->id()) + " is dead");
        }
        auto guards = acquirePair(*old, *this);
        if (population->environment_.load() != old) {
            continue;
        }
        if (old == this) {
            return;
        }
        if (disposed_) {
            throw std::logic_error("environment '" + name_ + "' is disposed");
        }
        requireCompatibleClock(*old);
        old->detachLocked(population.get());
        old->withdrawLocked(*population);
        old->fireLocked(EnvironmentChangeType::PopulationRemoved, population);
        population->environment_.store(this);
        population->bounds_.reset();
        for (const auto& agent : population->agents_) {
            agent->rebaseClockLocked(*this);
        }
        attachLocked(population);
        return;
    }
}

void Environment::requireCompatibleClock(const Environment& source) const {
    if (source.clock_->stepDuration() != clock_->stepDuration()) {
        throw std::invalid_argument("environment '" + source.name_ + "' steps by " +
                                    std::to_string(source.clock_->stepDuration().count()) +
                                    "ms but '" + name_ + "' steps by " +
                                    std::to_string(clock_->stepDuration().count()) + "ms");
    }
}

void Environment::attachLocked(const std::shared_ptr<Population>& population) {
    populations_.push_back(population);
    publishLocked(*population);
    fireLocked(EnvironmentChangeType::PopulationAdded, population);
}

void Environment::detachLocked(const Population* population) {
    populations_.erase(std::remove_if(populations_.begin(), populations_.end(),
                                      [population](const std::shared_ptr<Population>& p) {
                                          return p.get() == population;
                                      }),
                       populations_.end());
}

std::vector<std::shared_ptr<Population>> Environment::populations() const {
    auto guard = acquire();
    return populations_;
}

// ---------- Coverages ----------

void Environment::setCoverage(const Parameter& parameter, std::shared_ptr<const CoverageSampler> sampler) {
    if (!sampler) {
        throw std::invalid_argument("setCoverage needs a sampler for '" + parameter.name() + "'");
    }
    if (parameter.isHeading()) {
        throw std::invalid_argument("the heading parameter is read from the agent path");
    }
    if (sampler->sampleWidth() != parameter.sampleWidth()) {
        throw std::invalid_argument("sampler for '" + parameter.name() + "' writes " +
                                    std::to_string(sampler->sampleWidth()) + " values, parameter needs " +
                                    std::to_string(parameter.sampleWidth()));
    }
    auto guard = acquire();
    coverages_[parameter.name()] = std::move(sampler);
}

void Environment::removeCoverage(const std::string& parameterName) {
    auto guard = acquire();
    coverages_.erase(parameterName);
}

std::vector<std::string> Environment::coverageNames() const {
    auto guard = acquire();
    std::vector<std::string> names;
    names.reserve(coverages_.size());
    for (const auto& entry : coverages_) {
        names.push_back(entry.first);
    }
    return names;
}

const CoverageSampler* Environment::coverageLocked(const Parameter& parameter) const {
    auto it = coverages_.find(parameter.name());
    if (it == coverages_.end() || it->second->sampleWidth() != parameter.sampleWidth()) {
        return nullptr;
    }
    return it->second.get();
}

// ---------- Time ----------

void Environment::advanceStep() {
    auto guard = acquire();
    if (disposed_) {
        throw std::logic_error("environment '" + name_ + "' is disposed");
    }
    advanceStepLocked();
}

void Environment::runStep() {
    auto guard = acquire();
    if (disposed_) {
        throw std::logic_error("environment '" + name_ + "' is disposed");
    }
    const double duration = clock_->stepDurationDays();
    for (const auto& population : populations_) {
        population->evoluateLocked(duration);
    }
    advanceStepLocked();
}

void Environment::advanceStepLocked() {
    clock_->advance();
    report_ = SamplingReport();

    // Every agent records the new step; DateChanged fires even if a sampler fails
    SamplingReport pass;
    std::exception_ptr failure;
    for (const auto& population : populations_) {
        try {
            population->observeLocked(pass);
        } catch (...) {
            if (!failure) failure = std::current_exception();
        }
    }
    report_.add(pass);
    fullReport_.add(pass);
    fireLocked(EnvironmentChangeType::DateChanged, nullptr);
    if (failure) {
        std::rethrow_exception(failure);
    }
}

SamplingReport Environment::report(bool full) const {
    auto guard = acquire();
    return full ? fullReport_ : report_;
}

// ---------- Listeners ----------

void Environment::fireLocked(EnvironmentChangeType type, std::shared_ptr<Population> population) {
    auto listeners = listeners_.snapshot();
    if (listeners->empty()) {
        return;
    }
    EnvironmentChangeEvent event;
    event.source = this;
    event.type = type;
    event.step = clock_->currentStep();
    event.date = clock_->currentDate();
    event.population = std::move(population);
    EventLog* log = &event_log_;
    queue_.invokeLaterLocked([listeners, event, log] {
        ListenerList<EnvironmentChangeEvent>::dispatch(listeners, event, *log, "environment");
    });
}

ListenerId Environment::addEnvironmentChangeListener(
        ListenerList<EnvironmentChangeEvent>::Listener listener) {
    auto guard = acquire();
    return listeners_.add(std::move(listener));
}

ListenerId Environment::addEnvironmentChangeListener(
        EnvironmentChangeType type, ListenerList<EnvironmentChangeEvent>::Listener listener) {
    auto guard = acquire();
    return listeners_.add(type, std::move(listener));
}

bool Environment::removeEnvironmentChangeListener(ListenerId id) {
    auto guard = acquire();
    return listeners_.remove(id);
}

std::size_t Environment::listenerCount() const {
    auto guard = acquire();
    std::size_t count = listeners_.size();
    for (const auto& population : populations_) {
        count += population->listenerCountLocked();
    }
    return count;
}

// ---------- Remote Publication ----------

RemoteHandle Environment::handleOf(const Population& population) {
    return RemoteHandle{"population", population.id()};
}

RemoteHandle Environment::handleOf(const Agent& agent) {
    return RemoteHandle{"agent", agent.id()};
}

RemoteHandle Environment::handleOf(const Species& species) {
    return RemoteHandle{"species", species.id()};
}

void Environment::publish(std::shared_ptr<HandleRegistry> registry, TeardownPolicy policy) {
    auto guard = acquire();
    if (disposed_) {
        throw std::logic_error("environment '" + name_ + "' is disposed");
    }
    if (publisher_) {
        throw std::logic_error("environment '" + name_ + "' is already published");
    }
    publisher_ = std::make_unique<HandlePublisher>(std::move(registry), event_log_, policy);
    publisher_->publish(RemoteHandle{"environment", id_});
    for (const auto& population : populations_) {
        publishLocked(*population);
    }
}

void Environment::withdraw() {
    auto guard = acquire();
    withdrawAllLocked();
}

bool Environment::published() const {
    auto guard = acquire();
    return publisher_ != nullptr;
}

void Environment::publishLocked(const Population& population) {
    if (!publisher_) return;
    publisher_->publish(handleOf(population));
    for (const auto& agent : population.agents_) {
        publishLocked(*agent);
    }
}

void Environment::withdrawLocked(const Population& population) {
    if (!publisher_) return;
    for (const auto& agent : population.agents_) {
        withdrawLocked(*agent);
    }
    publisher_->withdraw(handleOf(population), clock_->currentStep());
}

void Environment::publishLocked(const Agent& agent) {
    if (!publisher_) return;
    publisher_->publish(handleOf(agent));
    publisher_->acquire(handleOf(*agent.species()));
}

void Environment::withdrawLocked(const Agent& agent) {
    if (!publisher_) return;
    const int step = clock_->currentStep();
    publisher_->withdraw(handleOf(agent), step);
    publisher_->release(handleOf(*agent.species()), step);
}

void Environment::withdrawAllLocked() {
    if (!publisher_) return;
    for (const auto& population : populations_) {
        withdrawLocked(*population);
    }
    publisher_->withdraw(RemoteHandle{"environment", id_}, clock_->currentStep());
    publisher_.reset();
}

// ---------- Teardown ----------

void Environment::dispose() {
    {
        auto guard = acquire();
        if (disposed_) {
            return;
        }
        disposed_ = true;
        const std::vector<std::shared_ptr<Population>> owned = populations_;
        for (const auto& population : owned) {
            population->killLocked();
        }
        withdrawAllLocked();
        listeners_.clear();
    }
    // Delivers what the kills queued, then stops the worker
    queue_.dispose();
}

bool Environment::disposed() const {
    auto guard = acquire();
    return disposed_;
}
