#ifndef TIMEOUT_SCHEDULER_HPP
#define TIMEOUT_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

// Runs at most one pending one-shot task on its own thread. Scheduling a new
// task cancels the previous one. cancel() never blocks on a running task.
class TimeoutScheduler {
public:
    using Task = std::function<void(const CancellationTokenPtr&)>;

    TimeoutScheduler();
    ~TimeoutScheduler();

    TimeoutScheduler(const TimeoutScheduler&) = delete;
    TimeoutScheduler& operator=(const TimeoutScheduler&) = delete;

    CancellationTokenPtr schedule(std::chrono::milliseconds delay, Task task);

    void cancel();

    bool hasPending() const;

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = true;

    Task task_;
    CancellationTokenPtr token_;
    std::chrono::steady_clock::time_point deadline_;

    std::thread thread_;
};

#endif
