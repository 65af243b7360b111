/**
 * @file scheduler.cpp
 * @brief Fixed-interval scheduler implementation
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "scheduler.hpp"
#include "logger.hpp"
#include <chrono>

namespace drLogger {

// Constructor
Scheduler::Scheduler(const std::string& name)
    : name_(name) {}

// Destructor
Scheduler::~Scheduler() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    stopLocked();
}

// Start
void Scheduler::start(Duration interval, Action action) {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (running_.load()) {
        LOG_WARN("{} already running", name_);
        throw AlreadyRunningException();
    }

    startLocked(interval, std::move(action));
}

// Stop
void Scheduler::stop() {
    if (calledFromAction()) {
        throw SchedulerException(name_ + ": stop() called from inside the scheduled action");
    }

    std::lock_guard<std::mutex> lock(control_mutex_);
    stopLocked();
}

// Reconfigure
void Scheduler::reconfigure(Duration interval) {
    if (interval.count() <= 0) {
        throw ValidationException("interval must be positive");
    }
    if (calledFromAction()) {
        throw SchedulerException(name_ + ": reconfigure() called from inside the scheduled action");
    }

    std::lock_guard<std::mutex> lock(control_mutex_);

    if (!running_.load()) {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        interval_ = interval;
        LOG_INFO("{} interval set to {}ms", name_, interval.count());
        return;
    }

    stopLocked();
    startLocked(interval, action_);
}

Duration Scheduler::getInterval() const {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    return interval_;
}

bool Scheduler::calledFromAction() const {
    return worker_id_.load() == std::this_thread::get_id();
}

void Scheduler::startLocked(Duration interval, Action action) {
    if (interval.count() <= 0) {
        throw ValidationException("interval must be positive");
    }
    if (!action) {
        throw ValidationException("scheduler action must be callable");
    }

    action_ = std::move(action);
    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        interval_ = interval;
        stop_requested_ = false;
    }

    running_ = true;
    worker_ = std::thread(&Scheduler::runLoop, this);

    LOG_INFO("{} started with interval {}ms", name_, interval.count());
}

void Scheduler::stopLocked() {
    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
        LOG_INFO("{} stopped", name_);
    }

    running_ = false;
}

// Main loop
void Scheduler::runLoop() {
    worker_id_ = std::this_thread::get_id();
    LOG_DEBUG("{} loop started", name_);

    while (true) {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            if (stop_requested_) {
                break;
            }
        }

        auto fired_at = std::chrono::steady_clock::now();

        try {
            action_();
        } catch (const std::exception& e) {
            LOG_ERROR("{}: error in scheduled action: {}", name_, e.what());
        }
        fire_count_++;

        // Overruns fire again right away; missed ticks are not replayed
        std::unique_lock<std::mutex> lock(wake_mutex_);
        if (wake_cv_.wait_until(lock, fired_at + interval_, [this] { return stop_requested_; })) {
            break;
        }
    }

    worker_id_ = std::thread::id();
    LOG_DEBUG("{} loop stopped", name_);
}

} // namespace drLogger
