#include "test_utils.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <thread>
#include <vector>

namespace arbor::test {

    class TransactionTest : public EnvTestFixture {
      protected:
        void SetUp() override {
            EnvTestFixture::SetUp();
            db_ = main_db();
        }

        auto data_file_bytes() const -> std::string {
            std::ifstream file(std::filesystem::path(dir_) / "data.arb", std::ios::binary);
            return std::string(std::istreambuf_iterator<char>(file), {});
        }

        env::Database db_;
    };

    // ============================================================================
    // ISOLATION
    // ============================================================================

    TEST_F(TransactionTest, ReaderDoesNotSeeLaterCommit) {
        ASSERT_TRUE(db_.put("foo", "old").ok());

        auto reader = begin_read();
        auto writer = begin_write();
        ASSERT_TRUE(db_.put(*writer, "foo", "new").ok());
        ASSERT_TRUE(db_.put(*writer, "bar", "added").ok());
        EXPECT_EQ(read_string(*reader, db_, "foo"), "old");
        ASSERT_TRUE(writer->commit().ok());

        // The reads happen after the commit in wall-clock time.
        EXPECT_EQ(read_string(*reader, db_, "foo"), "old");
        EXPECT_FALSE(read_string(*reader, db_, "bar").has_value());
        reader->abort();

        EXPECT_EQ(lookup(db_, "foo"), "new");
        EXPECT_EQ(lookup(db_, "bar"), "added");
    }

    TEST_F(TransactionTest, WriterSeesItsOwnStagedChanges) {
        auto writer = begin_write();
        ASSERT_TRUE(db_.put(*writer, "foo", "bar").ok());
        EXPECT_EQ(read_string(*writer, db_, "foo"), "bar");
        ASSERT_TRUE(db_.del(*writer, "foo").ok());
        EXPECT_FALSE(read_string(*writer, db_, "foo").has_value());
    }

    TEST_F(TransactionTest, PinnedSnapshotSurvivesPageReuse) {
        create_entries(db_, 300);
        auto reader = begin_read();

        // Several generations of rewrites; none may touch pages the reader still sees.
        for (int round = 0; round < 5; ++round) {
            auto writer = begin_write();
            for (size_t i = 0; i < 300; ++i) {
                auto key = fmt::format("key_{:06d}", i);
                ASSERT_TRUE(db_.put(*writer, key, fmt::format("round_{}_{}", round, i)).ok());
            }
            ASSERT_TRUE(writer->commit().ok());
        }

        for (size_t i = 0; i < 300; i += 17) {
            EXPECT_EQ(read_string(*reader, db_, fmt::format("key_{:06d}", i)),
                      fmt::format("value_{:06d}", i));
        }
        EXPECT_EQ(collect_keys(*reader, db_).size(), 300u);
        reader->abort();
        EXPECT_EQ(lookup(db_, "key_000000"), "round_4_0");
    }

    TEST_F(TransactionTest, ConcurrentReadersSeeWholeCommits) {
        constexpr size_t batch = 25;
        std::atomic<bool> stop{false};
        std::atomic<size_t> failures{0};

        std::vector<std::thread> readers;
        for (int t = 0; t < 4; ++t) {
            readers.emplace_back([&] {
                while (!stop.load()) {
                    auto [status, txn] = env_->begin_read();
                    if (!status.ok()) {
                        failures++;
                        return;
                    }
                    size_t count = 0;
                    auto [it_status, range] = db_.iterate(*txn);
                    for (const auto &entry : range) {
                        (void)entry;
                        count++;
                    }
                    if (!it_status.ok() || !range.status().ok() || count % batch != 0) {
                        failures++;
                    }
                    txn->abort();
                }
            });
        }

        for (size_t round = 0; round < 20; ++round) {
            auto writer = begin_write();
            for (size_t i = 0; i < batch; ++i) {
                ASSERT_TRUE(db_.put(*writer, generate_key(round * batch + i), "v").ok());
            }
            ASSERT_TRUE(writer->commit().ok());
        }
        stop = true;
        for (auto &t : readers) {
            t.join();
        }
        EXPECT_EQ(failures.load(), 0u);
    }

    // ============================================================================
    // ABORT
    // ============================================================================

    TEST_F(TransactionTest, AbortLeavesCommittedStateIdentical) {
        create_entries(db_, 100);
        auto before = data_file_bytes();
        env::EnvInfo info_before;
        ASSERT_TRUE(env_->info(info_before).ok());

        auto writer = begin_write();
        for (size_t i = 0; i < 500; ++i) {
            ASSERT_TRUE(db_.put(*writer, generate_key(i), generate_large_value(i)).ok());
        }
        ASSERT_TRUE(db_.del(*writer, "key_000050").ok());
        writer->abort();

        EXPECT_EQ(data_file_bytes(), before);
        env::EnvInfo info_after;
        ASSERT_TRUE(env_->info(info_after).ok());
        EXPECT_EQ(info_after.last_txnid, info_before.last_txnid);
        EXPECT_EQ(info_after.last_pgno, info_before.last_pgno);
        EXPECT_EQ(lookup(db_, "key_000050"), "value_000050");
        EXPECT_FALSE(lookup(db_, generate_key(0)).has_value());
    }

    TEST_F(TransactionTest, DestroyingLiveWriterAborts) {
        {
            auto writer = begin_write();
            ASSERT_TRUE(db_.put(*writer, "foo", "bar").ok());
        }
        EXPECT_FALSE(lookup(db_, "foo").has_value());
        EXPECT_EQ(env_->active_transactions(), 0u);

        auto [status, writer] = env_->begin_write(txn::WriteWait::FailFast);
        EXPECT_TRUE(status.ok()) << status.to_string();
    }

    TEST_F(TransactionTest, DatabaseCreatedInAbortedTxnDisappears) {
        auto writer = begin_write();
        core::DatabaseOptions options;
        options.flags = core::DbFlags::Create;
        auto [status, db] = env_->open_database(*writer, "temp", options);
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(db.put(*writer, "k", "v").ok());
        writer->abort();

        auto [reopen_status, again] = env_->open_database("temp");
        EXPECT_TRUE(reopen_status.is_not_found()) << reopen_status.to_string();
    }

    TEST_F(TransactionTest, EmptyWriterDoesNotAdvanceTxnId) {
        ASSERT_TRUE(db_.put("foo", "bar").ok());
        env::EnvInfo before;
        ASSERT_TRUE(env_->info(before).ok());

        auto writer = begin_write();
        EXPECT_EQ(writer->id(), before.last_txnid + 1);
        ASSERT_TRUE(writer->commit().ok());

        env::EnvInfo after;
        ASSERT_TRUE(env_->info(after).ok());
        EXPECT_EQ(after.last_txnid, before.last_txnid);
    }

    // ============================================================================
    // WRITER GATE
    // ============================================================================

    TEST_F(TransactionTest, FailFastWriterGetsWriterBusy) {
        auto writer = begin_write();
        auto [status, second] = env_->begin_write(txn::WriteWait::FailFast);
        EXPECT_TRUE(status.is_writer_busy()) << status.to_string();
        EXPECT_EQ(second, nullptr);

        ASSERT_TRUE(writer->commit().ok());
        auto [retry_status, retry] = env_->begin_write(txn::WriteWait::FailFast);
        EXPECT_TRUE(retry_status.ok());
    }

    TEST_F(TransactionTest, BlockingWriterWaitsForCommit) {
        auto writer = begin_write();
        ASSERT_TRUE(db_.put(*writer, "first", "1").ok());

        std::atomic<bool> acquired{false};
        std::thread second([&] {
            auto [status, txn] = env_->begin_write();
            ASSERT_TRUE(status.ok());
            acquired = true;
            // The first writer's commit is visible to the one that waited.
            EXPECT_EQ(read_string(*txn, db_, "first"), "1");
            ASSERT_TRUE(db_.put(*txn, "second", "2").ok());
            ASSERT_TRUE(txn->commit().ok());
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(acquired.load());
        ASSERT_TRUE(writer->commit().ok());
        second.join();

        EXPECT_TRUE(acquired.load());
        EXPECT_EQ(lookup(db_, "second"), "2");
    }

    TEST_F(TransactionTest, ReadersDoNotBlockWriter) {
        auto r1 = begin_read();
        auto r2 = begin_read();
        auto [status, writer] = env_->begin_write(txn::WriteWait::FailFast);
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(db_.put(*writer, "foo", "bar").ok());
        ASSERT_TRUE(writer->commit().ok());
    }

    TEST_F(TransactionTest, ReaderTableExhaustion) {
        core::EnvConfig config;
        config.max_readers = 2;
        recreate(config);

        auto r1 = begin_read();
        auto r2 = begin_read();
        auto [status, r3] = env_->begin_read();
        EXPECT_EQ(status.code(), core::StatusCode::ReadersFull);

        r1->abort();
        auto [retry_status, r4] = env_->begin_read();
        EXPECT_TRUE(retry_status.ok());
    }

    // ============================================================================
    // RESET / RENEW
    // ============================================================================

    TEST_F(TransactionTest, ResetAndRenewPickUpLatestSnapshot) {
        ASSERT_TRUE(db_.put("foo", "v1").ok());
        auto reader = begin_read();
        EXPECT_EQ(read_string(*reader, db_, "foo"), "v1");

        ASSERT_TRUE(reader->reset().ok());
        core::Slice value;
        EXPECT_EQ(db_.get(*reader, "foo", value).code(), core::StatusCode::BadTransaction);

        ASSERT_TRUE(db_.put("foo", "v2").ok());
        ASSERT_TRUE(reader->renew().ok());
        EXPECT_EQ(read_string(*reader, db_, "foo"), "v2");
        EXPECT_EQ(reader->renew().code(), core::StatusCode::BadTransaction);
    }

    TEST_F(TransactionTest, ResetIsReadOnly) {
        auto writer = begin_write();
        EXPECT_EQ(writer->reset().code(), core::StatusCode::NotSupported);
    }

    TEST_F(TransactionTest, CursorRestartsAfterRenew) {
        create_entries(db_, 10);
        auto reader = begin_read();
        auto [status, cursor] = db_.open_cursor(*reader);
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(cursor->seek(indexing::SeekMode::Last).ok());

        ASSERT_TRUE(reader->reset().ok());
        ASSERT_TRUE(reader->renew().ok());
        // The old position is forgotten, so next() starts from the first entry.
        ASSERT_TRUE(cursor->next().ok());

        core::Slice key, value;
        ASSERT_TRUE(cursor->current(key, value).ok());
        EXPECT_EQ(key.to_string(), "key_000000");
    }

    // ============================================================================
    // LIFETIMES
    // ============================================================================

    TEST_F(TransactionTest, SliceExpiresWhenReaderEnds) {
        ASSERT_TRUE(db_.put("foo", "bar").ok());
        auto reader = begin_read();
        core::Slice value;
        ASSERT_TRUE(db_.get(*reader, "foo", value).ok());
        EXPECT_EQ(value.view(), "bar");

        ASSERT_TRUE(reader->commit().ok());
        EXPECT_FALSE(value.valid());
        EXPECT_FALSE(value.to_string().has_value());
    }

    TEST_F(TransactionTest, SliceExpiresAfterWriteInSameTransaction) {
        auto writer = begin_write();
        ASSERT_TRUE(db_.put(*writer, "foo", "bar").ok());
        core::Slice value;
        ASSERT_TRUE(db_.get(*writer, "foo", value).ok());
        EXPECT_TRUE(value.valid());

        ASSERT_TRUE(db_.put(*writer, "baz", "qux").ok());
        EXPECT_FALSE(value.valid());
    }

    TEST_F(TransactionTest, FinishedTransactionRejectsOperations) {
        auto writer = begin_write();
        ASSERT_TRUE(db_.put(*writer, "foo", "bar").ok());
        ASSERT_TRUE(writer->commit().ok());

        EXPECT_EQ(writer->commit().code(), core::StatusCode::BadTransaction);
        EXPECT_EQ(db_.put(*writer, "x", "y").code(), core::StatusCode::BadTransaction);
        core::Slice value;
        EXPECT_EQ(db_.get(*writer, "foo", value).code(), core::StatusCode::BadTransaction);
        EXPECT_FALSE(writer->live());
    }

    TEST_F(TransactionTest, ReadTransactionRejectsWrites) {
        auto reader = begin_read();
        EXPECT_EQ(db_.put(*reader, "foo", "bar").code(), core::StatusCode::NotSupported);
        EXPECT_EQ(db_.del(*reader, "foo").code(), core::StatusCode::NotSupported);
    }

} // namespace arbor::test
