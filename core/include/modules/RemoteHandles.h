#ifndef REMOTE_HANDLES_H
#define REMOTE_HANDLES_H

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <utility>

class EventLog;

// Network-visible name of a simulation object.
struct RemoteHandle {
    std::string kind;   // "environment", "population", "agent", "species"
    std::uint64_t id = 0;

    std::string str() const { return kind + "#" + std::to_string(id); }
    bool operator<(const RemoteHandle& o) const { return std::tie(kind, id) < std::tie(o.kind, o.id); }
    bool operator==(const RemoteHandle& o) const { return kind == o.kind && id == o.id; }
};

// ---------- Handle Registry ----------
// Transport-side registry. unexportHandle returns false while the handle is
// busy (graceful mode refuses to cut in-flight calls) and throws NoSuchHandle
// if the handle is not registered.
class HandleRegistry {
public:
    virtual ~HandleRegistry() = default;
    virtual void exportHandle(const RemoteHandle& handle) = 0;
    virtual bool unexportHandle(const RemoteHandle& handle, bool force) = 0;
};

// Registry kept in the local process. Busy handles simulate in-flight calls.
class InProcessHandleRegistry : public HandleRegistry {
public:
    void exportHandle(const RemoteHandle& handle) override;
    bool unexportHandle(const RemoteHandle& handle, bool force) override;

    bool isExported(const RemoteHandle& handle) const;
    std::size_t size() const;
    void setBusy(const RemoteHandle& handle, bool busy);

private:
    mutable std::mutex mutex_;
    std::set<RemoteHandle> exported_;
    std::set<RemoteHandle> busy_;
};

struct TeardownPolicy {
    int attempts = 4;                               // per mode
    std::chrono::milliseconds delay{250};           // between attempts
};

// Deregisters a handle: `attempts` graceful tries, then as many forced ones.
// Exhaustion is logged as a warning and reported as false; an already
// deregistered handle counts as success.
bool withdrawHandle(HandleRegistry& registry, const RemoteHandle& handle,
                    EventLog& log, const TeardownPolicy& policy = TeardownPolicy(),
                    std::int64_t step = -1);

// Publication state of one environment: what is exported, with reference
// counts for handles shared by several owners (species).
class HandlePublisher {
public:
    HandlePublisher(std::shared_ptr<HandleRegistry> registry, EventLog& log,
                    TeardownPolicy policy = TeardownPolicy());

    void publish(const RemoteHandle& handle);
    bool withdraw(const RemoteHandle& handle, std::int64_t step = -1);

    void acquire(const RemoteHandle& shared);
    bool release(const RemoteHandle& shared, std::int64_t step = -1);

    HandleRegistry& registry() { return *registry_; }
    const TeardownPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<HandleRegistry> registry_;
    EventLog& log_;
    TeardownPolicy policy_;
    std::map<RemoteHandle, int> sharedCounts_;
};

#endif // REMOTE_HANDLES_H
