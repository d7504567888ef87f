#include "utils/EventLog.h"

#include <algorithm>
#include <iostream>
#include <utility>

const char* categoryName(EventCategory category) {
    switch (category) {
        case EventCategory::Spawn:           return "spawn";
        case EventCategory::Death:           return "death";
        case EventCategory::Migration:       return "migration";
        case EventCategory::Metamorphosis:   return "metamorphosis";
        case EventCategory::ListenerFailure: return "listener-failure";
        case EventCategory::HandleFailure:   return "handle-failure";
        case EventCategory::Warning:         return "warning";
    }
    return "unknown";
}

EventLog::EventLog(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)), echo_(&std::cerr) {}

void EventLog::logSpawn(std::int64_t step, std::uint64_t agentId, std::uint64_t populationId) {
    append({step, EventCategory::Spawn, agentId, populationId, {}}, false);
}

void EventLog::logDeath(std::int64_t step, std::uint64_t agentId, std::uint64_t populationId) {
    append({step, EventCategory::Death, agentId, populationId, {}}, false);
}

void EventLog::logMigration(std::int64_t step, std::uint64_t agentId,
                            std::uint64_t fromPopulation, std::uint64_t toPopulation) {
    append({step, EventCategory::Migration, agentId, toPopulation,
            "from population " + std::to_string(fromPopulation)}, false);
}

void EventLog::logMetamorphosis(std::int64_t step, std::uint64_t agentId, const std::string& species) {
    append({step, EventCategory::Metamorphosis, agentId, 0, species}, false);
}

void EventLog::logListenerFailure(std::int64_t step, const std::string& source, const std::string& what) {
    append({step, EventCategory::ListenerFailure, 0, 0, source + ": " + what}, true);
}

void EventLog::logHandleFailure(std::int64_t step, const std::string& handle, const std::string& what) {
    append({step, EventCategory::HandleFailure, 0, 0, handle + ": " + what}, true);
}

void EventLog::logWarning(std::int64_t step, const std::string& source, const std::string& what) {
    append({step, EventCategory::Warning, 0, 0, source + ": " + what}, true);
}

std::vector<EventRecord> EventLog::entries() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return {entries_.begin(), entries_.end()};
}

std::size_t EventLog::count(EventCategory category) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [category](const EventRecord& r) { return r.category == category; }));
}

std::size_t EventLog::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.size();
}

void EventLog::clear() {
    std::lock_guard<std::mutex> guard(mutex_);
    entries_.clear();
}

void EventLog::setEcho(std::ostream* out) {
    std::lock_guard<std::mutex> guard(mutex_);
    echo_ = out;
}

void EventLog::append(EventRecord record, bool echo) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (echo && echo_) {
        *echo_ << "[WARN] step " << record.step << " " << categoryName(record.category)
               << " " << record.message << "\n";
    }
    if (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(std::move(record));
}
