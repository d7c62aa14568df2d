#include "metrics/lag_probe.hpp"
#include "runtime/task_loop.hpp"
#include <spdlog/spdlog.h>

namespace perfmon::metrics {

LagProbe::LagProbe(runtime::TaskLoop& loop, LagGauge& gauge, std::chrono::milliseconds interval)
    : loop_(loop), gauge_(gauge), interval_(interval) {
    if (interval_.count() <= 0) {
        interval_ = std::chrono::milliseconds(1000);
    }
}

LagProbe::~LagProbe() {
    stop();
}

void LagProbe::start() {
    stop();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    measure_once();
    timer_ = std::thread([this]() { timer_loop(); });
    spdlog::debug("Lag probe started (interval={}ms)", interval_.count());
}

void LagProbe::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }
    running_ = false;
}

bool LagProbe::measure_once() {
    auto scheduled = std::chrono::steady_clock::now();
    LagGauge* gauge = &gauge_;
    return loop_.post([gauge, scheduled]() {
        auto waited = std::chrono::steady_clock::now() - scheduled;
        gauge->write(std::chrono::duration<double, std::milli>(waited).count());
    });
}

void LagProbe::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        if (!measure_once()) {
            spdlog::debug("Lag probe: loop stopped, ending timer");
            lock.lock();
            break;
        }
        lock.lock();
    }
}

} // namespace perfmon::metrics
