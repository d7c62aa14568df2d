#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace perfmon::runtime {

// FIFO task queue drained by a fixed set of workers. With one worker (the
// default) tasks run strictly in posting order, one at a time.
class TaskLoop {
public:
    using Task = std::function<void()>;

    explicit TaskLoop(size_t worker_count = 1);
    ~TaskLoop();

    TaskLoop(const TaskLoop&) = delete;
    TaskLoop& operator=(const TaskLoop&) = delete;

    // Queue a task; false once the loop is stopping.
    bool post(Task task);

    // Run fn on the loop and wait for its result. nullopt if the loop is
    // stopping. Exceptions thrown by fn are rethrown here.
    // Must not be called from a loop worker.
    template <typename Fn>
    auto call(Fn fn) -> std::optional<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = task->get_future();
        if (!post([task]() { (*task)(); })) {
            return std::nullopt;
        }
        return future.get();
    }

    // Drain queued tasks and join the workers. Idempotent.
    void stop();

    size_t pending() const;
    bool stopping() const { return stopping_; }

private:
    void worker_loop();

    std::deque<Task> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopping_{false};
};

} // namespace perfmon::runtime
