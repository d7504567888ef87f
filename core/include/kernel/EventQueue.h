#ifndef EVENT_QUEUE_H
#define EVENT_QUEUE_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

class EventLog;

// ---------- Deferred Notification Queue ----------
// Owns the lock of an environment. Tasks are queued by mutators while they
// hold the lock and run in FIFO order on a background worker that holds the
// same lock for a whole drain, so a listener never observes a half-applied
// mutation. Listeners run with the lock held and must not try to take it again.
class EventQueue {
public:
    using Task = std::function<void()>;

    explicit EventQueue(EventLog& log, std::string name = "events");
    ~EventQueue();

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Queue a task; invokeLaterLocked requires the caller to hold lock().
    void invokeLater(Task task);
    void invokeLaterLocked(Task task);

    // Blocks until every task queued before the call has run. Must be called
    // without holding lock() and never from the dispatch worker.
    void flush();

    // Runs what is still queued, then stops the worker. Terminal.
    void dispose();

    std::mutex& lock() { return lock_; }
    bool isDispatchThread() const;
    bool disposed() const;
    std::size_t pendingLocked() const { return tasks_.size(); }

    const std::string& name() const { return name_; }

private:
    void run();

    std::mutex lock_;
    std::condition_variable wakeup_;
    std::condition_variable drained_;
    std::deque<Task> tasks_;
    std::thread worker_;
    std::atomic<std::thread::id> workerId_{};
    std::atomic<bool> killed_{false};
    bool running_ = false;
    std::uint64_t enqueued_ = 0;
    std::uint64_t completed_ = 0;
    EventLog& log_;
    std::string name_;
};

#endif // EVENT_QUEUE_H
