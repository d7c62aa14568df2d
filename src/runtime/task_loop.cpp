#include "runtime/task_loop.hpp"
#include <spdlog/spdlog.h>

namespace perfmon::runtime {

TaskLoop::TaskLoop(size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

TaskLoop::~TaskLoop() {
    stop();
}

bool TaskLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void TaskLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t TaskLoop::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void TaskLoop::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Task loop: task failed: {}", e.what());
        }
    }
}

} // namespace perfmon::runtime
