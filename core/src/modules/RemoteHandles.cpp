#include "modules/RemoteHandles.h"

#include <exception>
#include <stdexcept>
#include <thread>
#include "kernel/Errors.h"
#include "utils/EventLog.h"

// ---------- InProcessHandleRegistry ----------

void InProcessHandleRegistry::exportHandle(const RemoteHandle& handle) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!exported_.insert(handle).second) {
        throw std::invalid_argument("Handle " + handle.str() + " is already exported");
    }
}

bool InProcessHandleRegistry::unexportHandle(const RemoteHandle& handle, bool force) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (exported_.count(handle) == 0) {
        throw NoSuchHandle("Handle " + handle.str() + " is not exported");
    }
    if (!force && busy_.count(handle) != 0) {
        return false;
    }
    busy_.erase(handle);
    exported_.erase(handle);
    return true;
}

bool InProcessHandleRegistry::isExported(const RemoteHandle& handle) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return exported_.count(handle) != 0;
}

std::size_t InProcessHandleRegistry::size() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return exported_.size();
}

void InProcessHandleRegistry::setBusy(const RemoteHandle& handle, bool busy) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (busy) {
        busy_.insert(handle);
    } else {
        busy_.erase(handle);
    }
}

// ---------- Teardown protocol ----------

bool withdrawHandle(HandleRegistry& registry, const RemoteHandle& handle,
                    EventLog& log, const TeardownPolicy& policy, std::int64_t step) {
    std::string lastError = "still busy";
    const int total = 2 * policy.attempts;
    int attempt = 0;
    for (bool force : {false, true}) {
        for (int i = 0; i < policy.attempts; ++i) {
            try {
                if (registry.unexportHandle(handle, force)) {
                    return true;
                }
                lastError = "still busy";
            } catch (const NoSuchHandle&) {
                return true;  // already deregistered
            } catch (const std::exception& e) {
                lastError = e.what();
            }
            if (++attempt < total && policy.delay.count() > 0) {
                std::this_thread::sleep_for(policy.delay);
            }
        }
    }
    log.logHandleFailure(step, handle.str(),
                         "deregistration abandoned after " + std::to_string(total) +
                         " attempts (" + lastError + ")");
    return false;
}

// ---------- HandlePublisher ----------

HandlePublisher::HandlePublisher(std::shared_ptr<HandleRegistry> registry, EventLog& log,
                                 TeardownPolicy policy)
    : registry_(std::move(registry)), log_(log), policy_(policy) {
    if (!registry_) {
        throw std::invalid_argument("HandlePublisher needs a registry");
    }
}

void HandlePublisher::publish(const RemoteHandle& handle) {
    registry_->exportHandle(handle);
}

bool HandlePublisher::withdraw(const RemoteHandle& handle, std::int64_t step) {
    return withdrawHandle(*registry_, handle, log_, policy_, step);
}

void HandlePublisher::acquire(const RemoteHandle& shared) {
    int& count = sharedCounts_[shared];
    if (count == 0) {
        try {
            registry_->exportHandle(shared);
        } catch (...) {
            sharedCounts_.erase(shared);
            throw;
        }
    }
    ++count;
}

bool HandlePublisher::release(const RemoteHandle& shared, std::int64_t step) {
    auto it = sharedCounts_.find(shared);
    if (it == sharedCounts_.end()) {
        return true;
    }
    if (--it->second > 0) {
        return true;
    }
    sharedCounts_.erase(it);
    return withdrawHandle(*registry_, shared, log_, policy_, step);
}
