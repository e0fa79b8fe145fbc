#ifndef UPKIT_TASK_RUNNER_HPP
#define UPKIT_TASK_RUNNER_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace upkit {

// Runs posted tasks one after another on a single managed jthread, so work
// handed to it never overlaps.
class TaskRunner {
public:
    TaskRunner();
    ~TaskRunner();

    // Returns false once shutdown() has been called.
    bool post(std::function<void()> task);

    // Blocks until the queue is empty and no task is running. Returns false
    // on timeout.
    bool waitIdle(std::chrono::milliseconds timeout);

    // Runs what is already queued, then joins the worker.
    void shutdown();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

private:
    void loop(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idleCv_;
    std::deque<std::function<void()>> queue_;
    bool running_ = false;
    bool closed_ = false;
    std::jthread worker_;
};

} // namespace upkit

#endif // UPKIT_TASK_RUNNER_HPP
