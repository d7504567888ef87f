#ifndef EVENTS_H
#define EVENTS_H

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "kernel/Clock.h"
#include "utils/EventLog.h"

class Environment;
class Population;
class Agent;
class Species;

// ---------- Change Events ----------
enum class EnvironmentChangeType { PopulationAdded, PopulationRemoved, DateChanged };
enum class PopulationChangeType { AgentAdded, AgentRemoved, Killed };
enum class AgentChangeType { PopulationChanged, SpeciesChanged, Killed };

struct EnvironmentChangeEvent {
    Environment* source = nullptr;
    EnvironmentChangeType type = EnvironmentChangeType::DateChanged;
    int step = 0;                             // master step when the change happened
    Timestamp date;                           // current date for DateChanged
    std::shared_ptr<Population> population;   // for PopulationAdded / PopulationRemoved
};

struct PopulationChangeEvent {
    std::shared_ptr<Population> source;
    PopulationChangeType type = PopulationChangeType::AgentAdded;
    int step = 0;
    std::shared_ptr<Agent> agent;
};

struct AgentChangeEvent {
    std::shared_ptr<Agent> source;
    AgentChangeType type = AgentChangeType::PopulationChanged;
    int step = 0;
    std::shared_ptr<Population> oldPopulation;
    std::shared_ptr<Population> newPopulation;
    std::shared_ptr<const Species> oldSpecies;
    std::shared_ptr<const Species> newSpecies;
};

using ListenerId = std::uint64_t;

// ---------- Listener Registry ----------
// Callbacks per event class, optionally filtered by kind. The entry list is
// copy-on-write so a notification can capture the listeners registered at the
// moment the change happened and run them later on the dispatch worker.
template <typename Event>
class ListenerList {
public:
    using Listener = std::function<void(const Event&)>;
    using Kind = decltype(Event::type);

    struct Entry {
        ListenerId id;
        std::optional<Kind> kind;
        Listener callback;
    };
    using Snapshot = std::shared_ptr<const std::vector<Entry>>;

    ListenerId add(Listener listener) { return insert(std::nullopt, std::move(listener)); }
    ListenerId add(Kind kind, Listener listener) { return insert(kind, std::move(listener)); }

    bool remove(ListenerId id) {
        auto next = std::make_shared<std::vector<Entry>>(*entries_);
        auto it = std::find_if(next->begin(), next->end(), [id](const Entry& e) { return e.id == id; });
        if (it == next->end()) {
            return false;
        }
        next->erase(it);
        entries_ = std::move(next);
        return true;
    }

    void clear() { entries_ = std::make_shared<std::vector<Entry>>(); }
    std::size_t size() const { return entries_->size(); }
    bool empty() const { return entries_->empty(); }
    Snapshot snapshot() const { return entries_; }

    // Runs every matching listener. A throwing listener is logged and the
    // remaining ones still run.
    static void dispatch(const Snapshot& listeners, const Event& event,
                         EventLog& log, const char* source) {
        for (const Entry& entry : *listeners) {
            if (entry.kind && *entry.kind != event.type) {
                continue;
            }
            try {
                entry.callback(event);
            } catch (const std::exception& e) {
                log.logListenerFailure(event.step, source, e.what());
            } catch (...) {
                log.logListenerFailure(event.step, source, "unknown exception");
            }
        }
    }

private:
    ListenerId insert(std::optional<Kind> kind, Listener listener) {
        auto next = std::make_shared<std::vector<Entry>>(*entries_);
        const ListenerId id = ++nextId_;
        next->push_back(Entry{id, kind, std::move(listener)});
        entries_ = std::move(next);
        return id;
    }

    std::shared_ptr<const std::vector<Entry>> entries_ = std::make_shared<std::vector<Entry>>();
    ListenerId nextId_ = 0;
};

#endif // EVENTS_H
