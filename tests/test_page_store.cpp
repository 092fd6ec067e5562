#include "indexing/page_image.hpp"
#include "storage/format.hpp"
#include "storage/page_store.hpp"
#include "test_utils.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace arbor::test {

    // ============================================================================
    // DIRECT PAGE STORE ACCESS
    // ============================================================================

    class PageStoreTest : public ::testing::Test {
      protected:
        void SetUp() override {
            path_ = (fs::temp_directory_path() / fmt::format("arbor_pagestore_{}.arb", getpid()))
                        .string();
            fs::remove(path_);
        }

        void TearDown() override {
            store_.reset();
            fs::remove(path_);
        }

        void open_store() {
            auto status = storage::PageStore::open(path_, config_, store_);
            ASSERT_TRUE(status.ok()) << status.to_string();
        }

        std::string path_;
        core::EnvConfig config_;
        std::unique_ptr<storage::PageStore> store_;
    };

    TEST_F(PageStoreTest, NewFileStartsWithTwoMetas) {
        open_store();
        EXPECT_EQ(fs::file_size(path_), 2u * core::PAGE_SIZE);

        storage::MetaRecord meta;
        ASSERT_TRUE(store_->latest_meta(meta).ok());
        EXPECT_EQ(meta.txnid, 0u);
        EXPECT_EQ(meta.next_pgno, storage::NUM_METAS);
        EXPECT_EQ(meta.main.root, core::INVALID_PAGE);
        EXPECT_EQ(store_->map_size(), config_.map_size);
    }

    TEST_F(PageStoreTest, CommitPublishesPagesAndMeta) {
        open_store();

        indexing::PageImage leaf(indexing::NodeType::Leaf);
        leaf.keys = {"foo"};
        leaf.values = {indexing::LeafValue{0, 3, "bar"}};
        std::vector<char> page(core::PAGE_SIZE);
        indexing::encode_image(leaf, 2, page.data());

        storage::MetaRecord meta;
        ASSERT_TRUE(store_->latest_meta(meta).ok());
        meta.txnid = 1;
        meta.next_pgno = 3;
        meta.main.root = 2;
        meta.main.depth = 1;
        ASSERT_TRUE(store_->commit({storage::StagedPage{2, page.data(), 1}}, meta).ok());

        storage::MetaRecord latest;
        ASSERT_TRUE(store_->latest_meta(latest).ok());
        EXPECT_EQ(latest.txnid, 1u);
        EXPECT_EQ(latest.main.root, 2u);

        auto mapping = store_->mapping();
        const char *out = nullptr;
        ASSERT_TRUE(store_->read(*mapping, 2, latest.next_pgno, out).ok());
        EXPECT_EQ(storage::node_at(out, 0).key, "foo");

        EXPECT_TRUE(store_->read(*mapping, 3, latest.next_pgno, out).is_corruption());
        EXPECT_TRUE(store_->read(*mapping, 0, latest.next_pgno, out).is_corruption());
    }

    TEST_F(PageStoreTest, FailedMetaFlushPoisonsUntilReopen) {
        open_store();
        storage::MetaRecord meta;
        ASSERT_TRUE(store_->latest_meta(meta).ok());
        meta.txnid = 1;

        store_->inject_sync_fault(1);
        EXPECT_TRUE(store_->commit({}, meta).is_io_error());
        EXPECT_TRUE(store_->poisoned());

        storage::MetaRecord latest;
        EXPECT_TRUE(store_->latest_meta(latest).is_io_error());
        meta.txnid = 2;
        EXPECT_TRUE(store_->commit({}, meta).is_io_error());

        // The slot was rolled back on disk.
        store_.reset();
        open_store();
        EXPECT_FALSE(store_->poisoned());
        ASSERT_TRUE(store_->latest_meta(latest).ok());
        EXPECT_EQ(latest.txnid, 0u);
    }

    TEST_F(PageStoreTest, FailedMetaWriteDoesNotPoison) {
        open_store();
        storage::MetaRecord meta;
        ASSERT_TRUE(store_->latest_meta(meta).ok());
        meta.txnid = 1;

        store_->inject_write_fault(0);
        EXPECT_TRUE(store_->commit({}, meta).is_io_error());
        EXPECT_FALSE(store_->poisoned());

        ASSERT_TRUE(store_->commit({}, meta).ok());
        storage::MetaRecord latest;
        ASSERT_TRUE(store_->latest_meta(latest).ok());
        EXPECT_EQ(latest.txnid, 1u);
    }

    TEST_F(PageStoreTest, AllocateExtendsUntilMapFull) {
        open_store();
        storage::FreeList free;
        uint64_t next = storage::NUM_METAS;
        core::PageId pgno = 0;

        ASSERT_TRUE(store_->allocate(free, next, 4, 2, pgno).ok());
        EXPECT_EQ(pgno, 2u);
        EXPECT_EQ(next, 4u);
        EXPECT_TRUE(store_->allocate(free, next, 4, 1, pgno).is_map_full());

        // Pooled pages are used before the file end.
        free.release(2, 1);
        ASSERT_TRUE(store_->allocate(free, next, 4, 1, pgno).ok());
        EXPECT_EQ(pgno, 2u);
    }

    TEST_F(PageStoreTest, TruncatedFileIsCorruption) {
        std::ofstream(path_, std::ios::binary) << std::string(100, '\0');
        auto status = storage::PageStore::open(path_, config_, store_);
        EXPECT_TRUE(status.is_corruption());
    }

    TEST_F(PageStoreTest, PickMetaPrefersHigherValidTxn) {
        storage::MetaRecord a, b, out;
        a.txnid = 4;
        a.checksum = storage::meta_checksum(a);
        b.txnid = 5;
        b.checksum = storage::meta_checksum(b);

        ASSERT_TRUE(storage::pick_meta(a, b, out).ok());
        EXPECT_EQ(out.txnid, 5u);

        b.checksum ^= 1;
        ASSERT_TRUE(storage::pick_meta(a, b, out).ok());
        EXPECT_EQ(out.txnid, 4u);

        a.magic = 0;
        EXPECT_TRUE(storage::pick_meta(a, b, out).is_corruption());
    }

    // ============================================================================
    // THROUGH THE ENVIRONMENT
    // ============================================================================

    class PageStoreEnvTest : public EnvTestFixture {
      protected:
        auto data_path() const -> std::string {
            return (fs::path(dir_) / "data.arb").string();
        }

        void corrupt_file_at_offset(const std::string &path, size_t offset,
                                    uint8_t xor_val = 0xFF) {
            std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
            ASSERT_TRUE(file.good());
            file.seekp(static_cast<std::streamoff>(offset));
            char byte;
            file.read(&byte, 1);
            file.seekp(static_cast<std::streamoff>(offset));
            byte ^= static_cast<char>(xor_val);
            file.write(&byte, 1);
        }

        // Offset of the next_pgno field of meta slot `slot`.
        static auto meta_offset(size_t slot) -> size_t {
            return slot * core::PAGE_SIZE + storage::PAGE_HEADER_SIZE +
                   offsetof(storage::MetaRecord, next_pgno);
        }
    };

    TEST_F(PageStoreEnvTest, CorruptNewestMetaFallsBackToPrevious) {
        auto db = main_db();
        ASSERT_TRUE(db.put("first", "1").ok());  // txn 1, slot 1
        ASSERT_TRUE(db.put("second", "2").ok()); // txn 2, slot 0
        close_env();

        corrupt_file_at_offset(data_path(), meta_offset(0));
        open_env();
        db = main_db();

        env::EnvInfo info;
        ASSERT_TRUE(env_->info(info).ok());
        EXPECT_EQ(info.last_txnid, 1u);
        EXPECT_EQ(lookup(db, "first"), "1");
        EXPECT_FALSE(lookup(db, "second").has_value());

        // The next commit overwrites the damaged slot.
        ASSERT_TRUE(db.put("third", "3").ok());
        reopen();
        db = main_db();
        EXPECT_EQ(lookup(db, "third"), "3");
    }

    TEST_F(PageStoreEnvTest, BothMetasCorruptFailsOpen) {
        auto db = main_db();
        ASSERT_TRUE(db.put("foo", "bar").ok());
        close_env();

        corrupt_file_at_offset(data_path(), meta_offset(0));
        corrupt_file_at_offset(data_path(), meta_offset(1));

        auto [status, env] = env::Environment::open(dir_, config_);
        EXPECT_TRUE(status.is_corruption()) << status.to_string();
        EXPECT_EQ(env, nullptr);
    }

    TEST_F(PageStoreEnvTest, CorruptTreePageIsReported) {
        auto db = main_db();
        ASSERT_TRUE(db.put("foo", "bar").ok());
        close_env();

        // Page 2 is the first page ever allocated: the leaf of txn 1.
        corrupt_file_at_offset(data_path(), 2 * core::PAGE_SIZE);
        open_env();
        db = main_db();

        auto txn = begin_read();
        core::Slice value;
        EXPECT_TRUE(db.get(*txn, "foo", value).is_corruption());
    }

    TEST_F(PageStoreEnvTest, MapFullFailsTransactionAndGrowthRecovers) {
        core::EnvConfig config;
        config.map_size = 16 * core::PAGE_SIZE;
        recreate(config);

        auto db = main_db();
        ASSERT_TRUE(db.put("keep", "me").ok());

        auto txn = begin_write();
        core::Status status;
        for (size_t i = 0; i < 64 && status.ok(); ++i) {
            status = db.put(*txn, generate_key(i), generate_large_value(i));
        }
        EXPECT_TRUE(status.is_map_full()) << status.to_string();
        EXPECT_EQ(db.put(*txn, "more", "x").code(), core::StatusCode::BadTransaction);
        EXPECT_EQ(txn->commit().code(), core::StatusCode::BadTransaction);
        EXPECT_EQ(lookup(db, "keep"), "me");

        ASSERT_TRUE(env_->set_map_size(4 * 1024 * 1024).ok());
        auto retry = begin_write();
        for (size_t i = 0; i < 64; ++i) {
            ASSERT_TRUE(db.put(*retry, generate_key(i), generate_large_value(i)).ok());
        }
        ASSERT_TRUE(retry->commit().ok());

        reopen();
        db = main_db();
        env::EnvInfo info;
        ASSERT_TRUE(env_->info(info).ok());
        EXPECT_GE(info.map_size, 4u * 1024 * 1024);
        EXPECT_EQ(lookup(db, generate_key(63)), generate_large_value(63));
    }

    TEST_F(PageStoreEnvTest, GrowthKeepsOpenReaderValid) {
        auto db = main_db();
        ASSERT_TRUE(db.put("foo", "bar").ok());

        auto reader = begin_read();
        ASSERT_TRUE(env_->set_map_size(32 * 1024 * 1024).ok());
        create_entries(db, 500);

        EXPECT_EQ(read_string(*reader, db, "foo"), "bar");
        EXPECT_FALSE(read_string(*reader, db, "key_000001").has_value());
        reader->abort();
        EXPECT_EQ(lookup(db, "key_000499"), "value_000499");
    }

    TEST_F(PageStoreEnvTest, MapSizeBelowUsedPagesIsRejected) {
        auto db = main_db();
        create_entries(db, 200);
        auto status = env_->set_map_size(core::PAGE_SIZE);
        EXPECT_EQ(status.code(), core::StatusCode::InvalidArgument);
    }

    TEST_F(PageStoreEnvTest, PageWriteFaultRollsBack) {
        auto db = main_db();
        ASSERT_TRUE(db.put("stable", "1").ok());

        env_->page_store().inject_write_fault(0);
        auto txn = begin_write();
        ASSERT_TRUE(db.put(*txn, "lost", "2").ok());
        EXPECT_TRUE(txn->commit().is_io_error());

        EXPECT_FALSE(lookup(db, "lost").has_value());
        EXPECT_EQ(lookup(db, "stable"), "1");

        ASSERT_TRUE(db.put("after", "3").ok());
        EXPECT_EQ(lookup(db, "after"), "3");
    }

    TEST_F(PageStoreEnvTest, MetaSyncFaultKeepsPreviousRoot) {
        auto db = main_db();
        ASSERT_TRUE(db.put("stable", "1").ok());

        // First flush covers the pages, the second one the meta page.
        env_->page_store().inject_sync_fault(1);
        auto txn = begin_write();
        ASSERT_TRUE(db.put(*txn, "lost", "2").ok());
        EXPECT_TRUE(txn->commit().is_io_error());

        // Nothing more is served until the file is reopened.
        EXPECT_TRUE(env_->page_store().poisoned());
        auto [read_status, reader] = env_->begin_read();
        EXPECT_TRUE(read_status.is_io_error()) << read_status.to_string();
        EXPECT_EQ(reader, nullptr);
        auto [write_status, writer] = env_->begin_write();
        EXPECT_TRUE(write_status.is_io_error()) << write_status.to_string();
        EXPECT_EQ(env_->active_transactions(), 0u);

        reopen();
        db = main_db();
        env::EnvInfo info;
        ASSERT_TRUE(env_->info(info).ok());
        EXPECT_EQ(info.last_txnid, 1u);
        EXPECT_EQ(lookup(db, "stable"), "1");
        EXPECT_FALSE(lookup(db, "lost").has_value());
    }

} // namespace arbor::test
