#include "upkit/task_runner.hpp"
#include "upkit/logger.hpp"

namespace upkit {

TaskRunner::TaskRunner()
    : worker_([this](std::stop_token stop) { loop(stop); }) {}

TaskRunner::~TaskRunner() {
    shutdown();
}

bool TaskRunner::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

bool TaskRunner::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this] { return queue_.empty() && !running_; });
}

void TaskRunner::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    LOG_DEBUG("Shutting down TaskRunner, draining queued work...");
    worker_.request_stop();
    if (worker_.joinable()) worker_.join();
}

void TaskRunner::loop(std::stop_token stop) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            if (queue_.empty()) {
                // Stop requested and nothing left to run.
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            running_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Background task failed: " + std::string(e.what()));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        idleCv_.notify_all();
    }
}

} // namespace upkit
