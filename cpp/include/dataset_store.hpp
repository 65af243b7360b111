/**
 * @file dataset_store.hpp
 * @brief Append-only dataset storage
 * @author DR Logger Team
 * @date 2026-10-19
 */

#pragma once

#include "types.hpp"
#include "exceptions.hpp"
#include <vector>
#include <memory>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace drLogger {

/**
 * @brief Store of schema-described, append-only datasets addressed by path and name
 */
class DatasetStore {
public:
    virtual ~DatasetStore() = default;

    /**
     * @brief Create a new dataset; the schema is fixed from here on
     * @throws StorageException on failure
     */
    virtual DatasetHandle createDataset(const std::vector<std::string>& path,
                                        const std::string& name,
                                        const std::vector<VariableDescriptor>& independents,
                                        const std::vector<VariableDescriptor>& dependents) = 0;

    /**
     * @brief Append one row
     * @throws DatasetNotFoundException if the dataset no longer exists
     * @throws SchemaMismatchException if the row width differs from the schema
     * @throws StorageException on other failures
     */
    virtual void append(const DatasetHandle& handle, const Row& row) = 0;
};

/**
 * @brief SQLite-based dataset store
 */
class SQLiteDatasetStore : public DatasetStore {
public:
    /**
     * @brief Constructor
     * @param db_path Database file path, or ":memory:"
     */
    explicit SQLiteDatasetStore(const std::string& db_path);

    /**
     * @brief Destructor
     */
    ~SQLiteDatasetStore() override;

    SQLiteDatasetStore(const SQLiteDatasetStore&) = delete;
    SQLiteDatasetStore& operator=(const SQLiteDatasetStore&) = delete;

    DatasetHandle createDataset(const std::vector<std::string>& path,
                                const std::string& name,
                                const std::vector<VariableDescriptor>& independents,
                                const std::vector<VariableDescriptor>& dependents) override;

    void append(const DatasetHandle& handle, const Row& row) override;

    /**
     * @brief Delete a dataset and its rows
     * @return True if the dataset existed
     */
    bool deleteDataset(int64_t dataset_id);

    /**
     * @brief Datasets under a path, oldest first
     */
    std::vector<DatasetHandle> listDatasets(const std::vector<std::string>& path) const;

    /**
     * @brief All rows of a dataset, in append order
     * @throws DatasetNotFoundException if the dataset does not exist
     */
    std::vector<Row> readRows(int64_t dataset_id) const;

    uint64_t rowCount(int64_t dataset_id) const;

    bool datasetExists(int64_t dataset_id) const;

private:
    void initializeDatabase();
    void executeSQL(const std::string& sql) const;
    bool datasetExistsLocked(int64_t dataset_id) const;
    size_t columnCountLocked(int64_t dataset_id) const;
    std::vector<VariableDescriptor> loadVariables(int64_t dataset_id, const std::string& kind) const;

    std::string db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;
};

} // namespace drLogger
