#pragma once

// ============================================================
// task_runner.hpp -- Background task execution
//
// TaskRunner runs the per-connection work spawned by the accept
// loop. ThreadPerTaskRunner gives every task its own detached
// thread (no admission limit).
// ============================================================

#include "logger.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <memory>
#include <chrono>
#include <string>
#include <exception>

class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    // Run task in the background; must not block on the task itself
    virtual void spawn(std::function<void()> task) = 0;

    // Number of tasks started but not yet finished
    virtual size_t active() const = 0;

    // Block until no task is active or the timeout expires.
    // Returns true if the runner went idle.
    virtual bool wait_idle(std::chrono::milliseconds timeout) = 0;
};

class ThreadPerTaskRunner : public TaskRunner {
public:
    ThreadPerTaskRunner() : state_(std::make_shared<State>()) {}

    void spawn(std::function<void()> task) override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->active;
        }
        // The thread keeps the shared state alive, so the runner may be
        // destroyed while tasks are still draining.
        std::shared_ptr<State> state = state_;
        try {
            std::thread([state, task = std::move(task)]() {
                try {
                    task();
                } catch (const std::exception& e) {
                    LOG_ERROR("task failed: " + std::string(e.what()));
                }
                std::lock_guard<std::mutex> lock(state->mutex);
                if (--state->active == 0) state->idle_cv.notify_all();
            }).detach();
        } catch (...) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (--state_->active == 0) state_->idle_cv.notify_all();
            throw;
        }
    }

    size_t active() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->active;
    }

    bool wait_idle(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->idle_cv.wait_for(lock, timeout, [this] { return state_->active == 0; });
    }

    // Non-copyable, non-movable
    ThreadPerTaskRunner(const ThreadPerTaskRunner&) = delete;
    ThreadPerTaskRunner& operator=(const ThreadPerTaskRunner&) = delete;

private:
    struct State {
        std::mutex              mutex;
        std::condition_variable idle_cv;
        size_t                  active{0};
    };

    std::shared_ptr<State> state_;
};
