#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include "kernel/Clock.h"
#include "kernel/Errors.h"
#include "TestSupport.h"

using std::chrono::hours;

TEST(ClockTest, RejectsEmptyOrInvertedRange) {
    EXPECT_THROW(Clock::createClock(testEpoch(), testEpoch()), InvalidRange);
    EXPECT_THROW(Clock::createClock(testEpoch(), testEpoch() - hours(1)), InvalidRange);
}

TEST(ClockTest, MasterAdvancesByFixedSteps) {
    auto clock = dailyClock();
    EXPECT_EQ(clock->currentStep(), 0);
    EXPECT_EQ(clock->offset(), 0);
    EXPECT_DOUBLE_EQ(clock->stepDurationDays(), 1.0);

    for (int i = 0; i < 3; ++i) clock->advance();
    EXPECT_EQ(clock->currentStep(), 3);

    const TimeRange range = clock->currentRange();
    EXPECT_EQ(range.start, testEpoch() + hours(72));
    EXPECT_EQ(range.end, testEpoch() + hours(96));
    EXPECT_TRUE(range.contains(range.start));
    EXPECT_FALSE(range.contains(range.end));
    // Current date is the middle of the step
    EXPECT_EQ(clock->currentDate(), testEpoch() + hours(84));
    EXPECT_DOUBLE_EQ(clock->age(), 3.0);
}

TEST(ClockTest, StepForDateCoversElapsedSteps) {
    auto clock = dailyClock();
    clock->advance();
    clock->advance();

    EXPECT_EQ(clock->stepForDate(testEpoch()), 0);
    EXPECT_EQ(clock->stepForDate(testEpoch() + hours(36)), 1);
    EXPECT_EQ(clock->stepForDate(testEpoch() + hours(71)), 2);
    EXPECT_EQ(clock->stepForDate(testEpoch() + hours(72)), Clock::kOutOfRange);
    EXPECT_EQ(clock->stepForDate(testEpoch() - hours(1)), Clock::kOutOfRange);

    EXPECT_EQ(clock->requireStepForDate(testEpoch() + hours(36)), 1);
    EXPECT_THROW(clock->requireStepForDate(testEpoch() + hours(500)), DateOutOfRange);
}

TEST(ClockTest, RelativeClockCountsFromItsOffset) {
    auto master = dailyClock();
    for (int i = 0; i < 5; ++i) master->advance();

    auto relative = master->spawnRelativeClock();
    EXPECT_EQ(relative->offset(), 5);
    EXPECT_EQ(relative->currentStep(), 0);

    for (int i = 0; i < 3; ++i) master->advance();
    EXPECT_EQ(master->currentStep(), 8);
    EXPECT_EQ(relative->currentStep(), 3);
    EXPECT_EQ(relative->currentStep() + relative->offset(), master->currentStep());

    EXPECT_EQ(relative->dateAt(0), master->dateAt(5));
    EXPECT_EQ(relative->stepForDate(master->dateAt(6)), 1);
    // Dates before the relative clock existed are out of its range
    EXPECT_EQ(relative->stepForDate(master->dateAt(4)), Clock::kOutOfRange);
    EXPECT_EQ(relative->currentDate(), master->currentDate());
}

TEST(ClockTest, RelativeClockAdvancesItsMaster) {
    auto master = dailyClock();
    auto relative = master->spawnRelativeClock();
    relative->advance();
    EXPECT_EQ(master->currentStep(), 1);
    EXPECT_EQ(relative->currentStep(), 1);
}

TEST(ClockTest, RelativeClockCachedWithinStep) {
    auto master = dailyClock();
    auto a = master->spawnRelativeClock();
    auto b = master->spawnRelativeClock();
    EXPECT_EQ(a.get(), b.get());
    // Spawning from a relative clock forwards to the master
    EXPECT_EQ(a->spawnRelativeClock().get(), a.get());

    master->advance();
    auto c = master->spawnRelativeClock();
    EXPECT_NE(c.get(), a.get());
    EXPECT_EQ(c->offset(), 1);
    EXPECT_EQ(a->offset(), 0);
}

TEST(ClockTest, SunElevationIsAnAngle) {
    auto clock = dailyClock();
    const double noonEquator = clock->sunElevation(GeoPoint{0.0, 0.0});
    EXPECT_FALSE(std::isnan(noonEquator));
    EXPECT_GE(noonEquator, -90.0);
    EXPECT_LE(noonEquator, 90.0);
    // Current date is 12:00 UTC: the sun is up at Greenwich, down on the antimeridian
    EXPECT_GT(noonEquator, 0.0);
    EXPECT_LT(clock->sunElevation(GeoPoint{180.0, 0.0}), 0.0);
}

TEST(ClockTest, AgedClockKeepsAgeOnAnotherMaster) {
    auto master = dailyClock();
    master->advance();

    auto aged = master->spawnAgedClock(3);
    EXPECT_EQ(aged->currentStep(), 3);
    EXPECT_EQ(aged->offset(), -2);
    EXPECT_EQ(aged->dateAt(0), testEpoch() - hours(48));
    EXPECT_EQ(aged->stepForDate(testEpoch() - hours(36)), 0);
    EXPECT_EQ(aged->stepForDate(testEpoch() + hours(36)), 3);
    EXPECT_EQ(aged->stepForDate(testEpoch() - hours(72)), Clock::kOutOfRange);
    EXPECT_EQ(aged->stepForDate(testEpoch() + hours(48)), Clock::kOutOfRange);

    master->advance();
    EXPECT_EQ(aged->currentStep(), 4);
    EXPECT_EQ(aged->currentStep() + aged->offset(), master->currentStep());
    EXPECT_EQ(master->spawnAgedClock(0), master->spawnRelativeClock());
    EXPECT_THROW(master->spawnAgedClock(-1), std::invalid_argument);
}
