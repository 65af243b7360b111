/**
 * @file test_dataset_store.cpp
 * @brief Tests for the SQLite dataset store
 * @author DR Logger Test Team
 * @date 2026-10-19
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../cpp/include/dataset_store.hpp"
#include "../cpp/include/exceptions.hpp"
#include <filesystem>
#include <sqlite3.h>

using namespace drLogger;
using namespace testing;

class SQLiteDatasetStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<SQLiteDatasetStore>(":memory:");

        path_ = {"", "DR", "Ivan"};
        independents_ = {VariableDescriptor("time", "", "s")};
        dependents_ = {
            VariableDescriptor("4Kin", "Diode", "K"),
            VariableDescriptor("Mix", "Diode", "K"),
            VariableDescriptor("He Flow", "LHe", "L/h")
        };
    }

    DatasetHandle createDefault(const std::string& name = "Ivan log - 2026-10-19 12:00") {
        return store_->createDataset(path_, name, independents_, dependents_);
    }

    std::unique_ptr<SQLiteDatasetStore> store_;
    std::vector<std::string> path_;
    std::vector<VariableDescriptor> independents_;
    std::vector<VariableDescriptor> dependents_;
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(SQLiteDatasetStoreTest, CreateDataset_ReturnsHandleWithSchema) {
    auto handle = createDefault();

    EXPECT_GT(handle.id, 0);
    EXPECT_EQ(handle.path, path_);
    EXPECT_EQ(handle.name, "Ivan log - 2026-10-19 12:00");
    EXPECT_EQ(handle.independents, independents_);
    EXPECT_EQ(handle.dependents, dependents_);
    EXPECT_EQ(handle.columnCount(), 4u);
    EXPECT_TRUE(store_->datasetExists(handle.id));
}

TEST_F(SQLiteDatasetStoreTest, CreateDataset_SameNameTwice_GivesDistinctDatasets) {
    auto first = createDefault("log");
    auto second = createDefault("log");

    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(store_->listDatasets(path_).size(), 2u);
}

TEST_F(SQLiteDatasetStoreTest, ListDatasets_RestoresSchemaInOrder) {
    auto created = createDefault();
    store_->createDataset({"", "DR", "Jules"}, "other", independents_, {});

    auto listed = store_->listDatasets(path_);
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].id, created.id);
    EXPECT_EQ(listed[0].name, created.name);
    EXPECT_EQ(listed[0].independents, independents_);
    EXPECT_EQ(listed[0].dependents, dependents_);
}

// ============================================================================
// APPEND
// ============================================================================

TEST_F(SQLiteDatasetStoreTest, Append_RowsReadBackInOrder) {
    auto handle = createDefault();

    store_->append(handle, {1.0, 4.2, 0.01, 3.5});
    store_->append(handle, {2.0, 4.1, 0.02, 3.6});

    auto rows = store_->readRows(handle.id);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_THAT(rows[0], ElementsAre(1.0, 4.2, 0.01, 3.5));
    EXPECT_THAT(rows[1], ElementsAre(2.0, 4.1, 0.02, 3.6));
    EXPECT_EQ(store_->rowCount(handle.id), 2u);
}

TEST_F(SQLiteDatasetStoreTest, Append_WrongWidth_ThrowsSchemaMismatch) {
    auto handle = createDefault();

    EXPECT_THROW(store_->append(handle, {1.0, 2.0}), SchemaMismatchException);
    EXPECT_THROW(store_->append(handle, {1.0, 2.0, 3.0, 4.0, 5.0}), SchemaMismatchException);
    EXPECT_EQ(store_->rowCount(handle.id), 0u) << "Rejected rows must not be stored";
}

TEST_F(SQLiteDatasetStoreTest, Append_DeletedDataset_ThrowsDatasetNotFound) {
    auto handle = createDefault();
    ASSERT_TRUE(store_->deleteDataset(handle.id));

    EXPECT_THROW(store_->append(handle, {1.0, 2.0, 3.0, 4.0}), DatasetNotFoundException);
}

TEST_F(SQLiteDatasetStoreTest, Append_UnknownHandle_ThrowsDatasetNotFound) {
    DatasetHandle handle;
    handle.id = 4242;

    EXPECT_THROW(store_->append(handle, {1.0}), DatasetNotFoundException);
}

TEST_F(SQLiteDatasetStoreTest, DatasetNotFound_IsAStorageException) {
    DatasetHandle handle;
    handle.id = 7;

    EXPECT_THROW(store_->append(handle, {}), StorageException);
}

// ============================================================================
// DELETE / READ
// ============================================================================

TEST_F(SQLiteDatasetStoreTest, DeleteDataset_RemovesRows) {
    auto handle = createDefault();
    store_->append(handle, {1.0, 2.0, 3.0, 4.0});

    EXPECT_TRUE(store_->deleteDataset(handle.id));
    EXPECT_FALSE(store_->deleteDataset(handle.id));
    EXPECT_FALSE(store_->datasetExists(handle.id));
    EXPECT_EQ(store_->rowCount(handle.id), 0u);
    EXPECT_THROW(store_->readRows(handle.id), DatasetNotFoundException);
}

TEST_F(SQLiteDatasetStoreTest, DeleteDataset_LeavesOtherDatasetsIntact) {
    auto old_day = createDefault("day one");
    auto new_day = createDefault("day two");
    store_->append(old_day, {1.0, 2.0, 3.0, 4.0});
    store_->append(new_day, {5.0, 6.0, 7.0, 8.0});

    store_->deleteDataset(new_day.id);

    EXPECT_EQ(store_->rowCount(old_day.id), 1u);
}

// ============================================================================
// PERSISTENCE
// ============================================================================

TEST(SQLiteDatasetStoreFileTest, Datasets_SurviveReopen) {
    auto db_path = std::filesystem::temp_directory_path() / "dr_logger_store_test.db";
    std::filesystem::remove(db_path);

    int64_t id = 0;
    {
        SQLiteDatasetStore store(db_path.string());
        auto handle = store.createDataset({"", "DR", "Ivan"}, "persisted",
                                          {VariableDescriptor("time", "", "s")},
                                          {VariableDescriptor("Mix", "Diode", "K")});
        store.append(handle, {1.0, 0.01});
        id = handle.id;
    }

    {
        SQLiteDatasetStore store(db_path.string());
        EXPECT_TRUE(store.datasetExists(id));
        auto rows = store.readRows(id);
        ASSERT_EQ(rows.size(), 1u);
        EXPECT_THAT(rows[0], ElementsAre(1.0, 0.01));
    }

    std::filesystem::remove(db_path);
}

TEST(SQLiteDatasetStoreFileTest, Open_UnwritableLocation_ThrowsStorageException) {
    EXPECT_THROW(SQLiteDatasetStore("/nonexistent_dir_dr_logger/db.sqlite"), StorageException);
}

TEST(SQLiteDatasetStoreFileTest, FailedWrite_RollsBackAndStoreStaysUsable) {
    auto db_path = std::filesystem::temp_directory_path() / "dr_logger_store_lock_test.db";
    std::filesystem::remove(db_path);

    SQLiteDatasetStore store(db_path.string());
    auto handle = store.createDataset({"", "DR", "Ivan"}, "locked",
                                      {VariableDescriptor("time", "", "s")},
                                      {VariableDescriptor("Mix", "Diode", "K")});

    // A second writer holds the write lock, so inserts fail inside the transaction
    sqlite3* other = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.string().c_str(), &other), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(other, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr), SQLITE_OK);

    EXPECT_THROW(store.append(handle, {1.0, 0.01}), StorageException);
    EXPECT_THROW(store.createDataset({"", "DR", "Ivan"}, "blocked",
                                     {VariableDescriptor("time", "", "s")}, {}),
                 StorageException);

    ASSERT_EQ(sqlite3_exec(other, "ROLLBACK", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(other);

    for (int i = 0; i < 3; ++i) {
        EXPECT_NO_THROW(store.append(handle, {2.0 + i, 0.02}));
    }
    EXPECT_EQ(store.rowCount(handle.id), 3u);
    EXPECT_EQ(store.listDatasets({"", "DR", "Ivan"}).size(), 1u);

    std::filesystem::remove(db_path);
}
