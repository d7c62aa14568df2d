#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace perfmon::runtime {
class TaskLoop;
}

namespace perfmon::metrics {

// Most recent event-loop lag in milliseconds. Written by LagProbe, read by
// the aggregator.
class LagGauge {
public:
    double read() const { return value_.load(std::memory_order_relaxed); }
    void write(double ms) { value_.store(ms, std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0.0};
};

/**
 * Periodically posts a zero-delay task onto the request loop and records how
 * long it waited before running. Busy request handling delays the task and
 * the gauge rises. The timer runs on its own thread and never waits for the
 * measurement to finish.
 */
class LagProbe {
public:
    LagProbe(runtime::TaskLoop& loop, LagGauge& gauge,
             std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    ~LagProbe();

    LagProbe(const LagProbe&) = delete;
    LagProbe& operator=(const LagProbe&) = delete;

    // Take one measurement immediately and start the timer. Restarts if running.
    void start();
    void stop();
    bool running() const { return running_; }

    // Post a single measurement; false if the loop no longer accepts tasks.
    bool measure_once();

    std::chrono::milliseconds interval() const { return interval_; }

private:
    void timer_loop();

    runtime::TaskLoop& loop_;
    LagGauge& gauge_;
    std::chrono::milliseconds interval_;

    std::thread timer_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
};

} // namespace perfmon::metrics
