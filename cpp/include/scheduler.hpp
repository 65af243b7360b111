/**
 * @file scheduler.hpp
 * @brief Fixed-interval scheduler for repeating actions
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace drLogger {

/**
 * @brief Runs an action repeatedly on a background thread
 *
 * The first firing is immediate. An action that overruns the interval
 * defers the next firing until it returns; missed ticks are not queued.
 */
class Scheduler {
public:
    using Action = std::function<void()>;

    /**
     * @brief Constructor
     * @param name Name used in log messages
     */
    explicit Scheduler(const std::string& name = "scheduler");

    /**
     * @brief Destructor, stops the scheduler
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Start firing action every interval
     * @throws AlreadyRunningException if already running
     * @throws ValidationException if interval is not positive
     */
    void start(Duration interval, Action action);

    /**
     * @brief Stop firing
     *
     * Waits for an in-flight action to finish; no action runs after this returns.
     * @throws SchedulerException if called from inside the action
     */
    void stop();

    /**
     * @brief Restart with a new interval and the same action
     *
     * When not running, only the stored interval changes.
     */
    void reconfigure(Duration interval);

    /**
     * @brief Check if the scheduler is running
     */
    bool isRunning() const { return running_.load(); }

    Duration getInterval() const;

    /**
     * @brief Number of completed action invocations since construction
     */
    uint64_t getFireCount() const { return fire_count_.load(); }

private:
    /**
     * @brief Main loop (runs in separate thread)
     */
    void runLoop();

    bool calledFromAction() const;
    void startLocked(Duration interval, Action action);
    void stopLocked();

    std::string name_;
    Action action_;
    Duration interval_{Duration(1000)};

    // Threading
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_{};
    std::mutex control_mutex_;          // serializes start/stop/reconfigure
    mutable std::mutex wake_mutex_;     // guards stop_requested_ and interval_
    std::condition_variable wake_cv_;

    std::atomic<uint64_t> fire_count_{0};
};

} // namespace drLogger
