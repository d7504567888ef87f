#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include "io/Snapshot.h"
#include "kernel/Simulation.h"
#include "modules/Coverage.h"
#include "TestSupport.h"

namespace {
    class ExplodingCoverage : public CoverageSampler {
    public:
        bool evaluate(const Agent&, const GeoPoint&, const Ellipse&, float*) const override {
            throw std::runtime_error("coverage file unreadable");
        }
    };

    class RefusingCoverage : public CoverageSampler {
    public:
        bool evaluate(const Agent&, const GeoPoint&, const Ellipse&, float*) const override {
            throw 3;
        }
    };

    SimulationConfig boundedConfig(std::int64_t maxSteps) {
        SimulationConfig cfg;
        cfg.startTime = testEpoch();
        cfg.maxSteps = maxSteps;
        return cfg;
    }

    std::shared_ptr<Agent> seedAgents(Environment& env, std::uint64_t seed, int count) {
        auto pop = env.newPopulation(MovementConfig(), seed);
        std::shared_ptr<Agent> last;
        for (int i = 0; i < count; ++i) {
            last = pop->spawn(tunaSpecies(), GeoPoint{-30.0 + i, 10.0});
        }
        return last;
    }
}

// Same seed, same trajectories
TEST(SimulationTest, DeterministicRuns) {
    Environment envA(dailyClock());
    Environment envB(dailyClock());
    auto a = seedAgents(envA, 12345, 20);
    auto b = seedAgents(envB, 12345, 20);
    Simulation simA("a", envA);
    Simulation simB("b", envB);

    simA.stepN(10);
    simB.stepN(10);

    EXPECT_EQ(simA.steps(), 10u);
    EXPECT_DOUBLE_EQ(a->location().x, b->location().x);
    EXPECT_DOUBLE_EQ(a->location().y, b->location().y);
    EXPECT_EQ(a->observedSteps(), 11);
}

TEST(SimulationTest, StepNStopsAtMaxSteps) {
    Environment env(dailyClock());
    seedAgents(env, 1, 3);
    Simulation sim("bounded", env, boundedConfig(5));

    sim.stepN(3);
    EXPECT_FALSE(sim.finished());
    sim.stepN(10);
    EXPECT_TRUE(sim.finished());
    EXPECT_EQ(sim.steps(), 5u);
    EXPECT_EQ(env.clock().currentStep(), 5);
}

TEST(SimulationTest, BackgroundDriverRunsToCompletion) {
    Environment env(dailyClock());
    seedAgents(env, 1, 3);
    Simulation sim("driver", env, boundedConfig(8));

    sim.start();
    EXPECT_THROW(sim.start(), std::logic_error);
    sim.join();
    EXPECT_FALSE(sim.running());
    EXPECT_EQ(sim.steps(), 8u);
}

TEST(SimulationTest, StopInterruptsThePause) {
    Environment env(dailyClock());
    seedAgents(env, 1, 1);
    SimulationConfig cfg = boundedConfig(0);
    cfg.pauseMillis = 60000;
    Simulation sim("paused", env, cfg);

    const auto begin = std::chrono::steady_clock::now();
    sim.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    sim.stop();
    sim.join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
    EXPECT_GE(sim.steps(), 1u);
    EXPECT_FALSE(sim.running());
}

TEST(SimulationTest, DriverFailureReachesJoin) {
    Environment env(dailyClock());
    env.eventLog().setEcho(nullptr);
    seedAgents(env, 1, 2);
    env.setCoverage(sstParameter(), std::make_shared<ExplodingCoverage>());
    Simulation sim("failing", env, boundedConfig(10));

    sim.start();
    EXPECT_THROW(sim.join(), std::runtime_error);
    EXPECT_EQ(sim.steps(), 0u);
    EXPECT_EQ(env.eventLog().count(EventCategory::Warning), 1u);
    EXPECT_NO_THROW(sim.join());
}

TEST(SimulationTest, DriverStopsOnAnyThrownValue) {
    Environment env(dailyClock());
    env.eventLog().setEcho(nullptr);
    seedAgents(env, 1, 1);
    env.setCoverage(sstParameter(), std::make_shared<RefusingCoverage>());
    Simulation sim("refusing", env, boundedConfig(10));

    sim.start();
    EXPECT_ANY_THROW(sim.join());
    EXPECT_FALSE(sim.running());
    EXPECT_EQ(env.eventLog().count(EventCategory::Warning), 1u);
}

TEST(SimulationTest, StatisticsAndMetrics) {
    Environment env(dailyClock());
    env.setCoverage(sstParameter(), std::make_shared<UniformCoverage>(20.0f));
    seedAgents(env, 1, 4);
    Simulation sim("stats", env, boundedConfig(0));
    sim.stepN(2);

    const auto stats = sim.getStatistics();
    EXPECT_EQ(stats.steps, 2u);
    EXPECT_EQ(stats.masterStep, 2);
    EXPECT_EQ(stats.populations, 1u);
    EXPECT_EQ(stats.aliveAgents, 4u);
    EXPECT_EQ(stats.lastStep.agents, 4u);
    EXPECT_EQ(stats.lastStep.points, 8u);         // SST and chlorophyll
    EXPECT_EQ(stats.lastStep.pointsOutside, 0u);  // chlorophyll has no coverage
    EXPECT_EQ(stats.cumulative.agents, 12u);

    std::ostringstream out;
    out << metricsHeader();
    logMetrics(sim, out);
    EXPECT_EQ(out.str(),
              "step,populations,agents,points,pointsOutside,percentOutside,listenerFailures\n"
              "2,1,4,8,0,0.00,0\n");
}

TEST(SimulationTest, RejectsInvalidConfig) {
    Environment env(dailyClock());
    SimulationConfig cfg;
    cfg.timeStepDays = 0.0;
    EXPECT_THROW(Simulation("bad", env, cfg), std::invalid_argument);
}
