/**
 * @file dr_session.hpp
 * @brief Logging session for one DR setup
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include "watcher.hpp"
#include "dataset_store.hpp"
#include "scheduler.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace drLogger {

enum class SessionState {
    IDLE,
    LOGGING,
    SHUTDOWN
};

std::string to_string(SessionState state);

/**
 * @brief Polls the watchers of one setup and appends merged rows to a dataset
 *
 * Every cycle either writes one row holding data from every watcher, or
 * writes nothing and replaces the error list with what went wrong. The
 * target dataset is created lazily and recreated after a day change, an
 * explicit newDataset(), or loss by the store.
 */
class DrSession {
public:
    using Clock = std::function<TimePoint()>;

    /**
     * @brief Constructor
     * @param setup Setup configuration (name, dataset path and name template, interval)
     * @param watchers Watchers in configured order
     * @param store Dataset store
     * @param clock Time source for timestamps and day rollover; system clock if empty
     * @throws ValidationException if the configured interval is not positive
     */
    DrSession(const SetupConfig& setup,
              std::vector<UniquePtr<Watcher>> watchers,
              SharedPtr<DatasetStore> store,
              Clock clock = Clock());

    /**
     * @brief Destructor, shuts the session down
     */
    ~DrSession();

    DrSession(const DrSession&) = delete;
    DrSession& operator=(const DrSession&) = delete;

    const std::string& getName() const { return setup_.name; }

    /**
     * @brief Run one poll, merge and persist cycle
     *
     * Never throws; failures end up in getErrors().
     */
    void cycle();

    /**
     * @brief Start or stop periodic logging; repeated calls are no-ops
     * @throws SessionException when starting a session that was shut down
     */
    void logging(bool start);

    bool isLogging() const;

    /**
     * @brief Change the poll interval, restarting the schedule if logging
     * @throws ValidationException if interval is not positive
     */
    void setInterval(Duration interval);

    Duration getInterval() const;

    /**
     * @brief Drop the current dataset; the next successful cycle creates a new one
     */
    void newDataset();

    /**
     * @brief Failures of the most recent cycle; empty after a clean cycle
     */
    std::vector<ErrorRecord> getErrors() const;

    TimePoint currentTime() const { return clock_(); }

    /**
     * @brief Stop logging and release the watchers; irreversible
     */
    void shutdown();

    SessionState getState() const { return state_.load(); }

    SessionStatistics getStatistics() const;

    bool hasDataset() const;

    /**
     * @brief Copy of the current dataset handle, if any
     */
    std::optional<DatasetHandle> currentDataset() const;

    /**
     * @brief Local calendar date of a time point as "YYYY-MM-DD"
     */
    static std::string dayMarker(TimePoint time_point);

    /**
     * @brief Expand the "[t]" token of a name template to "YYYY-MM-DD HH:MM"
     */
    static std::string resolveName(const std::string& name_template, TimePoint time_point);

private:
    DatasetHandle makeDataset(TimePoint now);
    void writeRow(const Row& row, TimePoint now);
    void finishCycle(std::vector<ErrorRecord> errors, bool row_written);

    SetupConfig setup_;
    std::vector<UniquePtr<Watcher>> watchers_;
    SharedPtr<DatasetStore> store_;
    Clock clock_;
    std::shared_ptr<spdlog::logger> log_;

    Scheduler scheduler_;
    std::optional<DatasetHandle> dataset_;
    bool schema_fresh_ = false;          // dataset_ built from current getVariables(), nothing appended yet
    std::atomic<SessionState> state_{SessionState::IDLE};

    std::vector<ErrorRecord> errors_;
    SessionStatistics stats_;

    mutable std::mutex cycle_mutex_;     // guards watchers_ and dataset_
    std::mutex control_mutex_;           // serializes logging/setInterval/shutdown
    mutable std::mutex status_mutex_;    // guards errors_ and stats_
};

} // namespace drLogger
