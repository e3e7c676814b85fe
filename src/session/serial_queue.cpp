#include "session/serial_queue.hpp"
#include "core/log.hpp"

#include <exception>
#include <future>
#include <utility>

// Constructor
SerialQueue::SerialQueue(std::string name, std::size_t maxPending)
    : name_(std::move(name)), maxPending_(maxPending) {
    thread_ = std::thread(&SerialQueue::run, this);
}

// Destructor
SerialQueue::~SerialQueue() { stop(); }

bool SerialQueue::post(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

bool SerialQueue::tryPost(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        if (maxPending_ != 0 && jobs_.size() >= maxPending_) {
            const std::size_t dropped = ++dropped_;
            if (dropped == 1 || dropped % 100 == 0) {
                logWarn(name_, "queue full, dropped " + std::to_string(dropped) + " job(s)");
            }
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void SerialQueue::drain() {
    if (isWorkerThread()) {
        logWarn(name_, "drain() called from the worker thread");
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    if (!post([done] { done->set_value(); })) return;
    finished.wait();
}

void SerialQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && !isWorkerThread()) thread_.join();
}

bool SerialQueue::isWorkerThread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

std::size_t SerialQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

// Worker loop
void SerialQueue::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !jobs_.empty() || stopping_; });
            if (jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            logError(name_, std::string("job failed: ") + e.what());
        }
    }
}
