#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>
#include <memory>
#include "modules/Geometry.h"

class SolarPosition;

using Timestamp = std::chrono::system_clock::time_point;

// Half-open interval [start, end).
struct TimeRange {
    Timestamp start;
    Timestamp end;
    bool contains(Timestamp t) const { return t >= start && t < end; }
};

// ---------- Simulation Clock ----------
// A master clock stores the date and advances by fixed steps. Relative clocks
// share the master's advancement but count steps from the master step at which
// they were spawned, which gives every agent its own age.
class Clock {
public:
    static constexpr int kOutOfRange = -1;

    // startTime..endTime is the first step; its length is the step duration.
    // Throws InvalidRange if endTime <= startTime.
    static std::shared_ptr<Clock> createClock(Timestamp startTime, Timestamp endTime,
                                              std::shared_ptr<const SolarPosition> sun = nullptr);

    virtual ~Clock() = default;

    // Lifecycle
    virtual void advance() = 0;
    virtual std::shared_ptr<Clock> spawnRelativeClock() = 0;
    // Relative clock whose current step is `age`; moves an aged agent onto
    // this master. Its step 0 may precede the master's first step.
    virtual std::shared_ptr<Clock> spawnAgedClock(int age) = 0;

    // Steps
    virtual int currentStep() const = 0;
    virtual int offset() const = 0;  // master step of this clock's step 0
    virtual int stepForDate(Timestamp date) const = 0;  // kOutOfRange if outside
    int requireStepForDate(Timestamp date) const;

    // Dates
    virtual Timestamp dateAt(int step) const = 0;       // start of the step
    virtual Timestamp currentDate() const = 0;          // middle of the current step
    virtual TimeRange currentRange() const = 0;
    virtual std::chrono::milliseconds stepDuration() const = 0;
    double stepDurationDays() const;
    double age() const { return currentStep() * stepDurationDays(); }  // days

    virtual double sunElevation(const GeoPoint& position) const = 0;
};

#endif // CLOCK_H
