/**
 * @file test_checkpoint_store.cpp
 * @brief Unit tests for checkpoint_store
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_orchestrator/core/checkpoint_store.h>

#include <chrono>
#include <filesystem>
#include <fstream>

namespace kcenon::transfer_orchestrator::test {

class CheckpointStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("transfer_orch_test_store_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto make_entry() -> persisted_transfer {
        persisted_transfer entry;
        entry.request.id = transfer_id::generate();
        entry.request.kind = transfer_kind::copy;
        entry.request.sources = {"/data/file1", "/data/file2", "/data/file3"};
        entry.request.destination = "backup/";
        entry.request.source_backend = backend_id::local();
        entry.request.destination_backend = backend_id::object_storage("conn-1");
        entry.request.label = "nightly";
        entry.state.files_completed = {"/data/file1"};
        entry.state.bytes_done = 100;
        entry.state.bytes_total = 300;
        entry.state.files_done = 1;
        entry.state.files_total = 3;
        entry.priority = 42;
        entry.saved_at = std::chrono::system_clock::now();
        return entry;
    }

    std::filesystem::path test_dir_;
};

TEST_F(CheckpointStoreTest, SaveThenLoad) {
    checkpoint_store store(checkpoint_store_config{test_dir_});
    auto entry = make_entry();

    ASSERT_TRUE(store.save(entry).has_value());
    EXPECT_TRUE(store.contains(*entry.request.id));
    EXPECT_TRUE(std::filesystem::exists(
        test_dir_ / (entry.request.id->to_string() + ".json")));

    auto loaded = store.load(*entry.request.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().request.sources, entry.request.sources);
    EXPECT_EQ(loaded.value().state, entry.state);
    EXPECT_EQ(loaded.value().priority, 42u);
}

TEST_F(CheckpointStoreTest, EntriesSurviveANewStoreInstance) {
    auto entry = make_entry();
    {
        checkpoint_store store(checkpoint_store_config{test_dir_});
        ASSERT_TRUE(store.save(entry).has_value());
    }

    checkpoint_store reopened(checkpoint_store_config{test_dir_});
    auto loaded = reopened.load(*entry.request.id);
    ASSERT_TRUE(loaded.has_value());

    const auto& req = loaded.value().request;
    EXPECT_EQ(req.kind, transfer_kind::copy);
    EXPECT_EQ(req.destination, "backup/");
    EXPECT_EQ(req.source_backend, backend_id::local());
    EXPECT_EQ(req.destination_backend, backend_id::object_storage("conn-1"));
    EXPECT_EQ(req.label, "nightly");
    EXPECT_EQ(loaded.value().state.files_completed,
              std::vector<std::string>{"/data/file1"});

    auto saved_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.saved_at.time_since_epoch()).count();
    auto loaded_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        loaded.value().saved_at.time_since_epoch()).count();
    EXPECT_EQ(loaded_ms, saved_ms);
}

TEST_F(CheckpointStoreTest, EncryptedRequestIsNeverWritten) {
    checkpoint_store store(checkpoint_store_config{test_dir_});
    auto entry = make_entry();
    entry.request.encryption = encryption_options{"secret"};

    auto saved = store.save(entry);
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, error_code::invalid_request);
    EXPECT_FALSE(store.contains(*entry.request.id));
    EXPECT_TRUE(std::filesystem::is_empty(test_dir_));
}

TEST_F(CheckpointStoreTest, EntryWithoutIdIsRejected) {
    checkpoint_store store(checkpoint_store_config{test_dir_});
    auto entry = make_entry();
    entry.request.id.reset();
    EXPECT_FALSE(store.save(entry).has_value());
}

TEST_F(CheckpointStoreTest, LoadMissingReturnsFileNotFound) {
    checkpoint_store store(checkpoint_store_config{test_dir_});
    auto loaded = store.load(transfer_id::generate());
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::file_not_found);
}

TEST_F(CheckpointStoreTest, RemoveDeletesFileAndMissingIsNotAnError) {
    checkpoint_store store(checkpoint_store_config{test_dir_});
    auto entry = make_entry();
    ASSERT_TRUE(store.save(entry).has_value());

    EXPECT_TRUE(store.remove(*entry.request.id).has_value());
    EXPECT_FALSE(store.contains(*entry.request.id));
    EXPECT_TRUE(store.remove(*entry.request.id).has_value());
}

TEST_F(CheckpointStoreTest, ListSkipsUnreadableFiles) {
    checkpoint_store store(checkpoint_store_config{test_dir_});
    ASSERT_TRUE(store.save(make_entry()).has_value());
    ASSERT_TRUE(store.save(make_entry()).has_value());

    std::ofstream(test_dir_ / (transfer_id::generate().to_string() + ".json")) << "{broken";
    std::ofstream(test_dir_ / "notes.txt") << "ignored";

    EXPECT_EQ(store.list().size(), 2u);
}

TEST_F(CheckpointStoreTest, CleanupRemovesExpiredEntries) {
    checkpoint_store_config config{test_dir_};
    config.state_ttl = std::chrono::seconds(60);
    checkpoint_store store(config);

    auto fresh = make_entry();
    auto stale = make_entry();
    stale.saved_at = std::chrono::system_clock::now() - std::chrono::hours(2);
    ASSERT_TRUE(store.save(fresh).has_value());
    ASSERT_TRUE(store.save(stale).has_value());

    EXPECT_EQ(store.cleanup_expired(), 1u);
    EXPECT_TRUE(store.contains(*fresh.request.id));
    EXPECT_FALSE(store.contains(*stale.request.id));
}

TEST_F(CheckpointStoreTest, AutoCleanupRunsOnConstruction) {
    auto stale = make_entry();
    stale.saved_at = std::chrono::system_clock::now() - std::chrono::hours(48);
    {
        checkpoint_store_config config{test_dir_};
        config.auto_cleanup = false;
        checkpoint_store store(config);
        ASSERT_TRUE(store.save(stale).has_value());
    }

    checkpoint_store store(checkpoint_store_config{test_dir_});
    EXPECT_FALSE(store.contains(*stale.request.id));
}

}  // namespace kcenon::transfer_orchestrator::test
