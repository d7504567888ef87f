#include "kernel/Clock.h"

#include <stdexcept>
#include <string>
#include <utility>
#include "kernel/Errors.h"
#include "modules/SolarPosition.h"

namespace {

using Millis = std::chrono::milliseconds;

std::string formatMillis(Timestamp t) {
    return std::to_string(std::chrono::duration_cast<Millis>(t.time_since_epoch()).count()) + "ms";
}

class MasterClock : public Clock, public std::enable_shared_from_this<MasterClock> {
public:
    MasterClock(Timestamp startTime, Millis duration, std::shared_ptr<const SolarPosition> sun)
        : initial_(startTime), time_(startTime), duration_(duration), sun_(std::move(sun)) {
        if (!sun_) {
            sun_ = std::make_shared<SimpleSolarPosition>();
        }
    }

    void advance() override {
        time_ += duration_;
        relative_.reset();
    }

    std::shared_ptr<Clock> spawnRelativeClock() override;
    std::shared_ptr<Clock> spawnAgedClock(int age) override;

    int currentStep() const override {
        return static_cast<int>((time_ - initial_) / duration_);
    }

    int offset() const override { return 0; }

    int stepForDate(Timestamp date) const override {
        if (date < time_ + duration_ && date >= initial_) {
            return static_cast<int>((date - initial_) / duration_);
        }
        return kOutOfRange;
    }

    Timestamp dateAt(int step) const override { return initial_ + duration_ * step; }
    Timestamp currentDate() const override { return time_ + duration_ / 2; }
    TimeRange currentRange() const override { return {time_, time_ + duration_}; }
    Millis stepDuration() const override { return duration_; }

    double sunElevation(const GeoPoint& position) const override {
        return sun_->elevation(position, currentDate());
    }

private:
    Timestamp initial_;
    Timestamp time_;  // start of the current step
    Millis duration_;
    std::shared_ptr<const SolarPosition> sun_;
    std::weak_ptr<Clock> relative_;  // identity-relative clock of the current step
};

class RelativeClock : public Clock {
public:
    RelativeClock(std::shared_ptr<MasterClock> master, int offset)
        : master_(std::move(master)), offset_(offset) {}

    void advance() override { master_->advance(); }
    std::shared_ptr<Clock> spawnRelativeClock() override { return master_->spawnRelativeClock(); }
    std::shared_ptr<Clock> spawnAgedClock(int age) override { return master_->spawnAgedClock(age); }

    int currentStep() const override { return master_->currentStep() - offset_; }
    int offset() const override { return offset_; }

    int stepForDate(Timestamp date) const override {
        // Counted from this clock's step 0, which may precede the master's
        const Timestamp first = dateAt(0);
        if (date < first || date >= master_->currentRange().end) {
            return kOutOfRange;
        }
        return static_cast<int>((date - first) / master_->stepDuration());
    }

    Timestamp dateAt(int step) const override { return master_->dateAt(step + offset_); }
    Timestamp currentDate() const override { return master_->currentDate(); }
    TimeRange currentRange() const override { return master_->currentRange(); }
    Millis stepDuration() const override { return master_->stepDuration(); }

    double sunElevation(const GeoPoint& position) const override {
        return master_->sunElevation(position);
    }

private:
    std::shared_ptr<MasterClock> master_;
    int offset_;
};

std::shared_ptr<Clock> MasterClock::spawnRelativeClock() {
    std::shared_ptr<Clock> cached = relative_.lock();
    if (!cached) {
        cached = std::make_shared<RelativeClock>(shared_from_this(), currentStep());
        relative_ = cached;
    }
    return cached;
}

std::shared_ptr<Clock> MasterClock::spawnAgedClock(int age) {
    if (age < 0) {
        throw std::invalid_argument("clock age must be >= 0 (got " + std::to_string(age) + ")");
    }
    if (age == 0) {
        return spawnRelativeClock();
    }
    return std::make_shared<RelativeClock>(shared_from_this(), currentStep() - age);
}

} // namespace

std::shared_ptr<Clock> Clock::createClock(Timestamp startTime, Timestamp endTime,
                                          std::shared_ptr<const SolarPosition> sun) {
    if (endTime <= startTime) {
        throw InvalidRange("Clock end time must be after start time (got start=" +
                           formatMillis(startTime) + ", end=" + formatMillis(endTime) + ")");
    }
    const Millis duration = std::chrono::duration_cast<Millis>(endTime - startTime);
    if (duration.count() <= 0) {
        throw InvalidRange("Clock step must last at least one millisecond");
    }
    return std::make_shared<MasterClock>(startTime, duration, std::move(sun));
}

int Clock::requireStepForDate(Timestamp date) const {
    const int n = stepForDate(date);
    if (n >= 0) {
        return n;
    }
    throw DateOutOfRange("Date " + formatMillis(date) + " is outside the clock coverage");
}

double Clock::stepDurationDays() const {
    return std::chrono::duration<double, std::ratio<86400>>(stepDuration()).count();
}
