/**
 * @file dr_session.cpp
 * @brief Implementation of the DR setup logging session
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "dr_session.hpp"
#include "logger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace drLogger {

namespace {

const VariableDescriptor kTimeVariable("time", "", "s");
const std::string kNameTimeToken = "[t]";

std::string formatLocal(TimePoint time_point, const char* format) {
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

double toSeconds(TimePoint time_point) {
    return std::chrono::duration<double>(time_point.time_since_epoch()).count();
}

} // namespace

std::string to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "IDLE";
        case SessionState::LOGGING: return "LOGGING";
        case SessionState::SHUTDOWN: return "SHUTDOWN";
        default: return "UNKNOWN";
    }
}

DrSession::DrSession(const SetupConfig& setup,
                     std::vector<UniquePtr<Watcher>> watchers,
                     SharedPtr<DatasetStore> store,
                     Clock clock)
    : setup_(setup),
      watchers_(std::move(watchers)),
      store_(std::move(store)),
      clock_(std::move(clock)),
      log_(Logger::forSetup(setup.name)),
      scheduler_(setup.name + " scheduler") {

    if (!store_) {
        throw ValidationException("session '" + setup_.name + "' has no dataset store");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
    scheduler_.reconfigure(setup_.time_interval);

    log_->info("Session created with {} watchers, dataset path {}",
               watchers_.size(), joinPath(setup_.dataset_path));
}

DrSession::~DrSession() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        log_->error("Error during session shutdown: {}", e.what());
    }
}

void DrSession::cycle() {
    std::lock_guard<std::mutex> lock(cycle_mutex_);

    if (state_.load() == SessionState::SHUTDOWN) {
        log_->debug("Cycle skipped, session is shut down");
        return;
    }

    TimePoint now = clock_();
    std::vector<ErrorRecord> errors;

    Reading reading;
    reading.emplace_back(toSeconds(now), kTimeVariable.unit);

    for (auto& watcher : watchers_) {
        try {
            Reading part = watcher->takePoint();
            reading.insert(reading.end(), part.begin(), part.end());
        } catch (const std::exception& e) {
            log_->warn("Error taking point from {}: {}", watcher->sourceName(), e.what());
            errors.emplace_back(watcher->sourceName(), e.what());
        }
    }

    if (!errors.empty()) {
        finishCycle(std::move(errors), false);
        return;
    }

    Row row = stripUnits(reading);

    if (dataset_ && dataset_->day_marker != dayMarker(now)) {
        log_->info("Day changed since dataset '{}' was created, starting a new one", dataset_->name);
        dataset_.reset();
    }

    try {
        if (!dataset_) {
            dataset_ = makeDataset(now);
        }

        if (row.size() != dataset_->columnCount()) {
            SchemaMismatchException mismatch(dataset_->columnCount(), row.size());
            log_->warn("{}", mismatch.what());
            errors.emplace_back("Schema", mismatch.what());
            // A schema rebuilt from the watchers' own variables would not match either
            if (!schema_fresh_) {
                dataset_.reset();
            }
            finishCycle(std::move(errors), false);
            return;
        }

        writeRow(row, now);
    } catch (const std::exception& e) {
        log_->warn("Error writing to dataset: {}", e.what());
        errors.emplace_back("General", e.what());
        finishCycle(std::move(errors), false);
        return;
    }

    finishCycle({}, true);
}

void DrSession::writeRow(const Row& row, TimePoint now) {
    try {
        store_->append(*dataset_, row);
    } catch (const DatasetNotFoundException& e) {
        log_->warn("{}; recreating dataset", e.what());
        dataset_.reset();
        dataset_ = makeDataset(now);
        store_->append(*dataset_, row);
    }
    schema_fresh_ = false;
    log_->debug("Wrote row of {} values to dataset {}", row.size(), dataset_->id);
}

DatasetHandle DrSession::makeDataset(TimePoint now) {
    std::vector<VariableDescriptor> dependents;
    for (auto& watcher : watchers_) {
        auto variables = watcher->getVariables();
        dependents.insert(dependents.end(), variables.begin(), variables.end());
    }

    std::string name = resolveName(setup_.dataset_name, now);
    DatasetHandle handle = store_->createDataset(setup_.dataset_path, name, {kTimeVariable}, dependents);
    handle.day_marker = dayMarker(now);
    schema_fresh_ = true;

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        stats_.datasets_created++;
    }

    log_->info("Created dataset '{}' in {} with {} dependent variables",
               name, joinPath(setup_.dataset_path), dependents.size());
    return handle;
}

void DrSession::finishCycle(std::vector<ErrorRecord> errors, bool row_written) {
    std::lock_guard<std::mutex> lock(status_mutex_);

    stats_.total_cycles++;
    stats_.last_cycle_time = clock_();
    if (row_written) {
        stats_.successful_cycles++;
        stats_.rows_written++;
    } else {
        stats_.failed_cycles++;
    }

    errors_ = std::move(errors);
}

void DrSession::logging(bool start) {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (state_.load() == SessionState::SHUTDOWN) {
        if (start) {
            throw SessionException("session '" + setup_.name + "' has been shut down");
        }
        return;
    }

    if (start) {
        if (scheduler_.isRunning()) {
            return;
        }
        scheduler_.start(scheduler_.getInterval(), [this] { cycle(); });
        state_ = SessionState::LOGGING;
        log_->info("Logging started");
    } else {
        if (!scheduler_.isRunning()) {
            return;
        }
        scheduler_.stop();
        state_ = SessionState::IDLE;
        log_->info("Logging stopped");
    }
}

bool DrSession::isLogging() const {
    return state_.load() == SessionState::LOGGING;
}

void DrSession::setInterval(Duration interval) {
    std::lock_guard<std::mutex> lock(control_mutex_);
    scheduler_.reconfigure(interval);
    setup_.time_interval = interval;
}

Duration DrSession::getInterval() const {
    return scheduler_.getInterval();
}

void DrSession::newDataset() {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    if (dataset_) {
        log_->info("Dropping dataset '{}' on request", dataset_->name);
        dataset_.reset();
    }
}

std::vector<ErrorRecord> DrSession::getErrors() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return errors_;
}

void DrSession::shutdown() {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (state_.load() == SessionState::SHUTDOWN) {
        return;
    }

    scheduler_.stop();

    std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
    state_ = SessionState::SHUTDOWN;
    watchers_.clear();
    dataset_.reset();

    log_->info("Session shut down");
}

SessionStatistics DrSession::getStatistics() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return stats_;
}

bool DrSession::hasDataset() const {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    return dataset_.has_value();
}

std::optional<DatasetHandle> DrSession::currentDataset() const {
    std::lock_guard<std::mutex> lock(cycle_mutex_);
    return dataset_;
}

std::string DrSession::dayMarker(TimePoint time_point) {
    return formatLocal(time_point, "%Y-%m-%d");
}

std::string DrSession::resolveName(const std::string& name_template, TimePoint time_point) {
    std::string name = name_template;
    std::string stamp = formatLocal(time_point, "%Y-%m-%d %H:%M");

    size_t pos = name.find(kNameTimeToken);
    while (pos != std::string::npos) {
        name.replace(pos, kNameTimeToken.size(), stamp);
        pos = name.find(kNameTimeToken, pos + stamp.size());
    }
    return name;
}

} // namespace drLogger
