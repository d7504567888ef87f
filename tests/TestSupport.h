#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "kernel/Clock.h"
#include "kernel/Species.h"

// 2022-01-08 00:00 UTC
inline Timestamp testEpoch() {
    return Timestamp(std::chrono::hours(24 * 19000));
}

inline std::shared_ptr<Clock> dailyClock() {
    return Clock::createClock(testEpoch(), testEpoch() + std::chrono::hours(24));
}

inline const Parameter& sstParameter() {
    static const Parameter p("SST");
    return p;
}

inline const Parameter& chlorophyllParameter() {
    static const Parameter p("Chlorophyll", Parameter::kLocatedWidth);
    return p;
}

// [Heading(2), SST(1), Chlorophyll(3)]: record width 6, stored width 4
inline std::shared_ptr<const Species> tunaSpecies(const std::string& name = "Albacore",
                                                  PerceptionTemplate perception = PerceptionTemplate()) {
    return std::make_shared<const Species>(
        std::vector<LocalizedName>{{"", name}}, Color{0, 0, 255},
        std::vector<Parameter>{Parameter::heading(), sstParameter(), chlorophyllParameter()},
        perception);
}

// Thread-safe list of event tags, written by listeners on the dispatch worker
class Trace {
public:
    void add(std::string tag) {
        std::lock_guard<std::mutex> guard(mutex_);
        tags_.push_back(std::move(tag));
    }
    std::vector<std::string> tags() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return tags_;
    }
    std::size_t count(const std::string& tag) const {
        std::lock_guard<std::mutex> guard(mutex_);
        std::size_t n = 0;
        for (const auto& t : tags_) n += (t == tag);
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> tags_;
};

#endif // TEST_SUPPORT_H
