/**
 * @file dataset_store.cpp
 * @brief SQLite dataset store implementation
 * @author DR Logger Team
 * @date 2026-10-19
 */

#include "dataset_store.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <chrono>

namespace drLogger {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StatementPtr prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageException("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
    return StatementPtr(stmt, &sqlite3_finalize);
}

void stepDone(sqlite3* db, sqlite3_stmt* stmt, const std::string& what) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw StorageException("Failed to " + what + ": " + std::string(sqlite3_errmsg(db)));
    }
}

/**
 * @brief BEGIN on construction, ROLLBACK on destruction unless committed
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec("BEGIN");
    }

    ~Transaction() {
        if (committed_ || sqlite3_get_autocommit(db_)) {
            return;
        }
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            LOG_ERROR("Rollback failed: {}", sqlite3_errmsg(db_));
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec("COMMIT");
        committed_ = true;
    }

private:
    void exec(const char* sql) {
        char* error_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
            std::string error = std::string(sql) + " failed: " + (error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg);
            throw StorageException(error);
        }
    }

    sqlite3* db_;
    bool committed_ = false;
};

int64_t toMillis(const TimePoint& time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

} // namespace

SQLiteDatasetStore::SQLiteDatasetStore(const std::string& db_path)
    : db_path_(db_path), db_(nullptr) {

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database: " + std::string(sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageException(error);
    }

    try {
        initializeDatabase();
    } catch (const StorageException&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    LOG_INFO("SQLiteDatasetStore initialized with database: {}", db_path_);
}

SQLiteDatasetStore::~SQLiteDatasetStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SQLiteDatasetStore::initializeDatabase() {
    const char* create_tables_sql = R"(
        PRAGMA foreign_keys = ON;

        CREATE TABLE IF NOT EXISTS datasets (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT NOT NULL,
            name TEXT NOT NULL,
            created_at INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_datasets_path ON datasets(path);

        CREATE TABLE IF NOT EXISTS dataset_variables (
            dataset_id INTEGER NOT NULL REFERENCES datasets(id) ON DELETE CASCADE,
            position INTEGER NOT NULL,
            kind TEXT NOT NULL,
            label TEXT NOT NULL,
            category TEXT,
            unit TEXT,
            PRIMARY KEY (dataset_id, kind, position)
        );

        CREATE TABLE IF NOT EXISTS dataset_rows (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            dataset_id INTEGER NOT NULL REFERENCES datasets(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_rows_dataset ON dataset_rows(dataset_id);

        CREATE TABLE IF NOT EXISTS row_values (
            row_id INTEGER NOT NULL REFERENCES dataset_rows(id) ON DELETE CASCADE,
            column_index INTEGER NOT NULL,
            value REAL NOT NULL,
            PRIMARY KEY (row_id, column_index)
        );
    )";

    executeSQL(create_tables_sql);
}

void SQLiteDatasetStore::executeSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = "SQL error: " + std::string(error_msg ? error_msg : sqlite3_errmsg(db_));
        sqlite3_free(error_msg);
        throw StorageException(error);
    }
}

DatasetHandle SQLiteDatasetStore::createDataset(const std::vector<std::string>& path,
                                                const std::string& name,
                                                const std::vector<VariableDescriptor>& independents,
                                                const std::vector<VariableDescriptor>& dependents) {
    std::lock_guard<std::mutex> lock(mutex_);

    DatasetHandle handle;
    handle.path = path;
    handle.name = name;
    handle.independents = independents;
    handle.dependents = dependents;
    handle.created_at = std::chrono::system_clock::now();

    Transaction transaction(db_);
    {
        auto stmt = prepare(db_, "INSERT INTO datasets (path, name, created_at) VALUES (?, ?, ?)");
        std::string joined_path = joinPath(path);
        sqlite3_bind_text(stmt.get(), 1, joined_path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 3, toMillis(handle.created_at));
        stepDone(db_, stmt.get(), "create dataset");
        handle.id = sqlite3_last_insert_rowid(db_);

        auto var_stmt = prepare(db_, R"(
            INSERT INTO dataset_variables (dataset_id, position, kind, label, category, unit)
            VALUES (?, ?, ?, ?, ?, ?)
        )");

        auto insert_vars = [&](const std::vector<VariableDescriptor>& vars, const char* kind) {
            for (size_t i = 0; i < vars.size(); ++i) {
                sqlite3_reset(var_stmt.get());
                sqlite3_bind_int64(var_stmt.get(), 1, handle.id);
                sqlite3_bind_int(var_stmt.get(), 2, static_cast<int>(i));
                sqlite3_bind_text(var_stmt.get(), 3, kind, -1, SQLITE_STATIC);
                sqlite3_bind_text(var_stmt.get(), 4, vars[i].label.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(var_stmt.get(), 5, vars[i].category.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(var_stmt.get(), 6, vars[i].unit.c_str(), -1, SQLITE_TRANSIENT);
                stepDone(db_, var_stmt.get(), "declare variable");
            }
        };
        insert_vars(independents, "independent");
        insert_vars(dependents, "dependent");
    }
    transaction.commit();

    LOG_DEBUG("Created dataset {} '{}' in {} ({} columns)", handle.id, name, joinPath(path),
              handle.columnCount());
    return handle;
}

void SQLiteDatasetStore::append(const DatasetHandle& handle, const Row& row) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!datasetExistsLocked(handle.id)) {
        throw DatasetNotFoundException("dataset " + std::to_string(handle.id) + " '" + handle.name + "'");
    }

    size_t columns = columnCountLocked(handle.id);
    if (row.size() != columns) {
        throw SchemaMismatchException(columns, row.size());
    }

    Transaction transaction(db_);
    {
        auto row_stmt = prepare(db_, "INSERT INTO dataset_rows (dataset_id) VALUES (?)");
        sqlite3_bind_int64(row_stmt.get(), 1, handle.id);
        stepDone(db_, row_stmt.get(), "insert row");
        int64_t row_id = sqlite3_last_insert_rowid(db_);

        auto value_stmt = prepare(db_, "INSERT INTO row_values (row_id, column_index, value) VALUES (?, ?, ?)");
        for (size_t i = 0; i < row.size(); ++i) {
            sqlite3_reset(value_stmt.get());
            sqlite3_bind_int64(value_stmt.get(), 1, row_id);
            sqlite3_bind_int(value_stmt.get(), 2, static_cast<int>(i));
            sqlite3_bind_double(value_stmt.get(), 3, row[i]);
            stepDone(db_, value_stmt.get(), "insert value");
        }
    }
    transaction.commit();
}

bool SQLiteDatasetStore::deleteDataset(int64_t dataset_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(db_, "DELETE FROM datasets WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, dataset_id);
    stepDone(db_, stmt.get(), "delete dataset");

    bool deleted = sqlite3_changes(db_) > 0;
    if (deleted) {
        LOG_INFO("Deleted dataset {}", dataset_id);
    }
    return deleted;
}

std::vector<DatasetHandle> SQLiteDatasetStore::listDatasets(const std::vector<std::string>& path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(db_, "SELECT id, name, created_at FROM datasets WHERE path = ? ORDER BY id");
    std::string joined_path = joinPath(path);
    sqlite3_bind_text(stmt.get(), 1, joined_path.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<DatasetHandle> result;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        DatasetHandle handle;
        handle.id = sqlite3_column_int64(stmt.get(), 0);
        handle.path = path;
        handle.name = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
        handle.created_at = TimePoint(std::chrono::milliseconds(sqlite3_column_int64(stmt.get(), 2)));
        result.push_back(handle);
    }

    for (auto& handle : result) {
        handle.independents = loadVariables(handle.id, "independent");
        handle.dependents = loadVariables(handle.id, "dependent");
    }

    return result;
}

std::vector<Row> SQLiteDatasetStore::readRows(int64_t dataset_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!datasetExistsLocked(dataset_id)) {
        throw DatasetNotFoundException("dataset " + std::to_string(dataset_id));
    }

    auto stmt = prepare(db_, R"(
        SELECT r.id, v.value
        FROM dataset_rows r JOIN row_values v ON v.row_id = r.id
        WHERE r.dataset_id = ?
        ORDER BY r.id, v.column_index
    )");
    sqlite3_bind_int64(stmt.get(), 1, dataset_id);

    std::vector<Row> rows;
    int64_t current_row = -1;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        int64_t row_id = sqlite3_column_int64(stmt.get(), 0);
        if (row_id != current_row) {
            rows.emplace_back();
            current_row = row_id;
        }
        rows.back().push_back(sqlite3_column_double(stmt.get(), 1));
    }

    return rows;
}

uint64_t SQLiteDatasetStore::rowCount(int64_t dataset_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto stmt = prepare(db_, "SELECT COUNT(*) FROM dataset_rows WHERE dataset_id = ?");
    sqlite3_bind_int64(stmt.get(), 1, dataset_id);

    uint64_t count = 0;
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        count = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
    }
    return count;
}

bool SQLiteDatasetStore::datasetExists(int64_t dataset_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return datasetExistsLocked(dataset_id);
}

bool SQLiteDatasetStore::datasetExistsLocked(int64_t dataset_id) const {
    auto stmt = prepare(db_, "SELECT 1 FROM datasets WHERE id = ?");
    sqlite3_bind_int64(stmt.get(), 1, dataset_id);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

size_t SQLiteDatasetStore::columnCountLocked(int64_t dataset_id) const {
    auto stmt = prepare(db_, "SELECT COUNT(*) FROM dataset_variables WHERE dataset_id = ?");
    sqlite3_bind_int64(stmt.get(), 1, dataset_id);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StorageException("Failed to read schema: " + std::string(sqlite3_errmsg(db_)));
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<VariableDescriptor> SQLiteDatasetStore::loadVariables(int64_t dataset_id,
                                                                  const std::string& kind) const {
    auto stmt = prepare(db_, R"(
        SELECT label, category, unit FROM dataset_variables
        WHERE dataset_id = ? AND kind = ?
        ORDER BY position
    )");
    sqlite3_bind_int64(stmt.get(), 1, dataset_id);
    sqlite3_bind_text(stmt.get(), 2, kind.c_str(), -1, SQLITE_TRANSIENT);

    auto column_text = [&stmt](int col) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), col);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    };

    std::vector<VariableDescriptor> vars;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        vars.emplace_back(column_text(0), column_text(1), column_text(2));
    }
    return vars;
}

} // namespace drLogger
