#include "kernel/EventQueue.h"

#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>
#include "utils/EventLog.h"

EventQueue::EventQueue(EventLog& log, std::string name) : log_(log), name_(std::move(name)) {}

EventQueue::~EventQueue() {
    dispose();
}

void EventQueue::invokeLater(Task task) {
    std::lock_guard<std::mutex> guard(lock_);
    invokeLaterLocked(std::move(task));
}

void EventQueue::invokeLaterLocked(Task task) {
    if (killed_) {
        log_.logWarning(-1, name_, "event queue disposed, notification dropped");
        return;
    }
    const bool wasEmpty = tasks_.empty();
    tasks_.push_back(std::move(task));
    ++enqueued_;
    if (!running_) {
        // First use: the worker blocks on the lock until the caller releases it
        try {
            worker_ = std::thread(&EventQueue::run, this);
        } catch (const std::system_error&) {
            tasks_.pop_back();
            --enqueued_;
            throw;
        }
        running_ = true;
        workerId_.store(worker_.get_id());
    } else if (wasEmpty) {
        wakeup_.notify_one();
    }
}

void EventQueue::flush() {
    if (isDispatchThread()) {
        throw std::logic_error("EventQueue::flush called from the dispatch worker");
    }
    std::unique_lock<std::mutex> guard(lock_);
    const std::uint64_t target = enqueued_;
    drained_.wait(guard, [this, target] { return completed_ >= target || !running_; });
}

void EventQueue::dispose() {
    if (isDispatchThread()) {
        // Called by a listener: the lock is already held by this thread and
        // run() leaves after the current drain.
        if (!killed_.exchange(true) && worker_.joinable()) {
            worker_.detach();
        }
        return;
    }
    {
        std::unique_lock<std::mutex> guard(lock_);
        if (killed_.exchange(true)) {
            // Another caller or a listener stopped it: wait for the last drain
            drained_.wait(guard, [this] { return !running_; });
            return;
        }
        wakeup_.notify_all();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool EventQueue::isDispatchThread() const {
    return std::this_thread::get_id() == workerId_.load();
}

bool EventQueue::disposed() const {
    return killed_;
}

void EventQueue::run() {
    std::unique_lock<std::mutex> guard(lock_);
    for (;;) {
        wakeup_.wait(guard, [this] { return killed_ || !tasks_.empty(); });
        // Drain while holding the lock
        while (!tasks_.empty()) {
            Task task = std::move(tasks_.front());
            tasks_.pop_front();
            try {
                task();
            } catch (const std::exception& e) {
                log_.logListenerFailure(-1, name_, e.what());
            } catch (...) {
                log_.logListenerFailure(-1, name_, "unknown exception");
            }
            ++completed_;
        }
        drained_.notify_all();
        if (killed_) {
            break;
        }
    }
    running_ = false;
    drained_.notify_all();
}
