#ifndef SERIAL_QUEUE_HPP
#define SERIAL_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Single-worker FIFO job queue. Jobs run one at a time in the order they were
// posted. tryPost() is bounded and never blocks, so it can be called from the
// audio capture thread; when the bound is reached the new job is dropped.
class SerialQueue {
public:
    using Job = std::function<void()>;

    // maxPending == 0 means unbounded.
    explicit SerialQueue(std::string name, std::size_t maxPending = 0);
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    // Unbounded; false only after stop().
    bool post(Job job);

    // Bounded; false when stopped or full.
    bool tryPost(Job job);

    // Blocks until every job posted before the call has finished. Returns
    // immediately when called from the worker itself.
    void drain();

    // Runs the remaining jobs, then joins the worker. Idempotent.
    void stop();

    bool isWorkerThread() const;
    std::size_t pending() const;
    std::size_t droppedCount() const { return dropped_.load(); }

private:
    void run();

    std::string name_;
    std::size_t maxPending_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::atomic<std::size_t> dropped_{0};

    std::thread thread_;
};

#endif
