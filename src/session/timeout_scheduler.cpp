#include "session/timeout_scheduler.hpp"
#include "core/log.hpp"

#include <exception>
#include <utility>

// Constructor
TimeoutScheduler::TimeoutScheduler() {
    thread_ = std::thread(&TimeoutScheduler::run, this);
}

// Destructor
TimeoutScheduler::~TimeoutScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        if (token_) token_->cancel();
        task_ = nullptr;
        token_.reset();
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

CancellationTokenPtr TimeoutScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    auto token = std::make_shared<CancellationToken>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token_) token_->cancel();
        task_ = std::move(task);
        token_ = token;
        deadline_ = std::chrono::steady_clock::now() + delay;
    }
    cv_.notify_all();
    return token;
}

void TimeoutScheduler::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token_) token_->cancel();
        task_ = nullptr;
        token_.reset();
    }
    cv_.notify_all();
}

bool TimeoutScheduler::hasPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_ != nullptr;
}

// Waits for the pending deadline; the task runs outside the lock
void TimeoutScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (!token_) {
            cv_.wait(lock);
            continue;
        }

        if (std::chrono::steady_clock::now() < deadline_) {
            cv_.wait_until(lock, deadline_);
            continue;
        }

        Task task = std::move(task_);
        CancellationTokenPtr token = std::move(token_);
        task_ = nullptr;
        token_.reset();

        if (!task || token->isCancelled()) continue;

        lock.unlock();
        try {
            task(token);
        } catch (const std::exception& e) {
            logError("Timeout", std::string("task failed: ") + e.what());
        }
        lock.lock();
    }
}
