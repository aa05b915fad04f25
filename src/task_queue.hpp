#pragma once
// =============================================================================
// Tether - Task Queue
// =============================================================================
// MainContext: "run this later on the owning context" collaborator.
// TaskQueue:   single worker thread draining a FIFO of tasks; used by the
//              daemon for status pushes and pairing attempts.
// =============================================================================

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "tether_log.hpp"

namespace tether {

using Task = std::function<void()>;

class MainContext {
public:
    virtual ~MainContext() = default;
    // false once the context no longer accepts work
    virtual bool post(Task task) = 0;
};

class TaskQueue : public MainContext {
public:
    TaskQueue() : worker_(&TaskQueue::run, this) {}
    ~TaskQueue() override { shutdown(); }

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    bool post(Task task) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return false;
            tasks_.push_back(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    // Runs everything already queued, then joins the worker. Idempotent.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && !worker_.joinable()) return;
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

private:
    void run() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty()) return;   // stopping and drained
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            try {
                task();
            } catch (const std::exception& e) {
                TLOG_ERROR("tasks", "Task threw: %s", e.what());
            }
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace tether
