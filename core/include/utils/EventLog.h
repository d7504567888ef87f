#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

// ---------- Event Categories ----------
enum class EventCategory {
    Spawn,
    Death,
    Migration,
    Metamorphosis,
    ListenerFailure,    // a listener threw while being dispatched
    HandleFailure,      // remote handle could not be deregistered
    Warning
};

const char* categoryName(EventCategory category);

struct EventRecord {
    std::int64_t step = 0;          // master clock step when recorded
    EventCategory category = EventCategory::Warning;
    std::uint64_t subject = 0;      // agent / population id, 0 if none
    std::uint64_t other = 0;        // secondary id (target population, ...)
    std::string message;
};

// Simulation event log shared by an environment and everything it owns.
// Safe to call from the driver thread and from the dispatch worker.
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 100000);

    // Simulation events
    void logSpawn(std::int64_t step, std::uint64_t agentId, std::uint64_t populationId);
    void logDeath(std::int64_t step, std::uint64_t agentId, std::uint64_t populationId);
    void logMigration(std::int64_t step, std::uint64_t agentId,
                      std::uint64_t fromPopulation, std::uint64_t toPopulation);
    void logMetamorphosis(std::int64_t step, std::uint64_t agentId, const std::string& species);

    // Warnings (echoed)
    void logListenerFailure(std::int64_t step, const std::string& source, const std::string& what);
    void logHandleFailure(std::int64_t step, const std::string& handle, const std::string& what);
    void logWarning(std::int64_t step, const std::string& source, const std::string& what);

    // Access
    std::vector<EventRecord> entries() const;
    std::size_t count(EventCategory category) const;
    std::size_t size() const;
    void clear();

    // Warnings go to std::cerr unless redirected; nullptr silences them.
    void setEcho(std::ostream* out);

private:
    void append(EventRecord record, bool echo);

    mutable std::mutex mutex_;
    std::deque<EventRecord> entries_;
    std::size_t capacity_;
    std::ostream* echo_;
};

#endif // EVENT_LOG_H
