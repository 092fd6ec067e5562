#include "test_utils.hpp"
#include <atomic>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace arbor::test {

    class EnvironmentTest : public EnvTestFixture {};

    // ============================================================================
    // BASIC LIFECYCLE
    // ============================================================================

    TEST_F(EnvironmentTest, GreetingRoundTrip) {
        core::EnvConfig config;
        config.map_size = 10 * 1024 * 1024;
        config.max_databases = 1;
        recreate(config);

        auto db = create_db("greeting");
        ASSERT_TRUE(db.valid());

        auto writer = begin_write();
        ASSERT_TRUE(db.put(*writer, "greeting", "Hello world").ok());
        ASSERT_TRUE(writer->commit().ok());
        EXPECT_EQ(lookup(db, "greeting"), "Hello world");

        writer = begin_write();
        ASSERT_TRUE(db.del(*writer, "greeting").ok());
        ASSERT_TRUE(writer->commit().ok());

        auto reader = begin_read();
        core::Slice value;
        EXPECT_TRUE(db.get(*reader, "greeting", value).is_not_found());
    }

    TEST_F(EnvironmentTest, DataSurvivesReopen) {
        auto db = main_db();
        create_entries(db, 50);
        auto named = create_db("named");
        ASSERT_TRUE(named.put("inner", "value").ok());

        reopen();
        db = main_db();
        EXPECT_EQ(lookup(db, "key_000049"), "value_000049");

        auto [status, again] = env_->open_database("named");
        ASSERT_TRUE(status.ok()) << status.to_string();
        EXPECT_EQ(lookup(again, "inner"), "value");
    }

    TEST_F(EnvironmentTest, SecondOpenInProcessIsBusy) {
        auto [status, other] = env::Environment::open(dir_, config_);
        EXPECT_TRUE(status.is_busy()) << status.to_string();
        EXPECT_EQ(other, nullptr);
    }

    TEST_F(EnvironmentTest, CloseWithLiveTransactionIsBusy) {
        auto reader = begin_read();
        EXPECT_TRUE(env_->close().is_busy());
        reader->abort();
        EXPECT_TRUE(env_->close().ok());
        env_.reset();
    }

    TEST_F(EnvironmentTest, CloseRacesWithBeginRead) {
        auto db = main_db();
        ASSERT_TRUE(db.put("foo", "bar").ok());

        std::atomic<bool> closed{false};
        std::atomic<size_t> unexpected{0};
        std::vector<std::thread> readers;
        for (int t = 0; t < 4; ++t) {
            readers.emplace_back([&] {
                for (int i = 0; i < 2000; ++i) {
                    auto [status, txn] = env_->begin_read();
                    if (status.code() == core::StatusCode::InvalidArgument) {
                        if (!closed.load())
                            unexpected++;
                        return;
                    }
                    if (!status.ok()) {
                        unexpected++;
                        return;
                    }
                    if (read_string(*txn, db, "foo") != "bar")
                        unexpected++;
                    txn->abort();
                }
            });
        }

        // Busy while a reader is registered, then the readers see the closed state.
        for (int attempt = 0; attempt < 100000 && !closed.load(); ++attempt) {
            auto status = env_->close();
            if (status.ok()) {
                closed.store(true);
            } else {
                EXPECT_TRUE(status.is_busy()) << status.to_string();
                std::this_thread::yield();
            }
        }
        for (auto &reader : readers) {
            reader.join();
        }
        EXPECT_EQ(unexpected.load(), 0u);

        EXPECT_TRUE(env_->close().ok());
        EXPECT_EQ(env_->active_transactions(), 0u);
        auto [status, txn] = env_->begin_read();
        EXPECT_EQ(status.code(), core::StatusCode::InvalidArgument);
        EXPECT_EQ(env_->reader_check(), 0u);
        env_.reset();
    }

    TEST_F(EnvironmentTest, CloseAfterReaderThreadEnds) {
        auto db = main_db();
        ASSERT_TRUE(db.put("foo", "bar").ok());

        std::thread reader([&] {
            auto txn = begin_read();
            ASSERT_TRUE(txn);
            EXPECT_EQ(read_string(*txn, db, "foo"), "bar");
        });
        reader.join();

        EXPECT_EQ(env_->active_transactions(), 0u);
        EXPECT_TRUE(env_->close().ok());
        env::EnvInfo info;
        EXPECT_EQ(env_->info(info).code(), core::StatusCode::InvalidArgument);
        env_.reset();
    }

    TEST_F(EnvironmentTest, InvalidConfigurationIsRejected) {
        close_env();
        core::EnvConfig config;
        config.max_key_size = core::MAX_KEY_SIZE_LIMIT + 1;
        auto [status, env] = env::Environment::open(dir_, config);
        EXPECT_EQ(status.code(), core::StatusCode::InvalidArgument);

        config = core::EnvConfig{};
        config.max_readers = 0;
        auto [readers_status, env2] = env::Environment::open(dir_, config);
        EXPECT_EQ(readers_status.code(), core::StatusCode::InvalidArgument);
    }

    // ============================================================================
    // NAMED DATABASES
    // ============================================================================

    TEST_F(EnvironmentTest, MissingDatabaseWithoutCreateIsNotFound) {
        auto [status, db] = env_->open_database("absent");
        EXPECT_TRUE(status.is_not_found());
        EXPECT_FALSE(db.valid());
    }

    TEST_F(EnvironmentTest, DatabaseHandlesRunOut) {
        core::EnvConfig config;
        config.max_databases = 2;
        recreate(config);

        create_db("one");
        create_db("two");
        core::DatabaseOptions options;
        options.flags = core::DbFlags::Create;
        auto [status, db] = env_->open_database("three", options);
        EXPECT_EQ(status.code(), core::StatusCode::DbsFull);
    }

    TEST_F(EnvironmentTest, ClosingHandleFreesSlot) {
        core::EnvConfig config;
        config.max_databases = 1;
        recreate(config);

        auto one = create_db("one");
        one.close();
        EXPECT_FALSE(one.valid());
        auto two = create_db("two");
        EXPECT_TRUE(two.valid());
    }

    TEST_F(EnvironmentTest, NamedDatabasesAreSeparate) {
        auto a = create_db("a");
        auto b = create_db("b");
        ASSERT_TRUE(a.put("k", "from a").ok());
        ASSERT_TRUE(b.put("k", "from b").ok());
        EXPECT_EQ(lookup(a, "k"), "from a");
        EXPECT_EQ(lookup(b, "k"), "from b");

        // Names show up as keys of the main database.
        auto main = main_db();
        auto reader = begin_read();
        std::vector<std::string> expected{"a", "b"};
        EXPECT_EQ(collect_keys(*reader, main), expected);
    }

    TEST_F(EnvironmentTest, DropEmptiesButKeepsDatabase) {
        auto db = create_db("data");
        create_entries(db, 40);

        auto writer = begin_write();
        ASSERT_TRUE(db.drop(*writer).ok());
        ASSERT_TRUE(writer->commit().ok());

        auto reader = begin_read();
        EXPECT_TRUE(collect_keys(*reader, db).empty());
        indexing::TreeStat stat;
        ASSERT_TRUE(db.stat(*reader, stat).ok());
        EXPECT_EQ(stat.entries, 0u);
        EXPECT_EQ(stat.leaf_pages, 0u);
    }

    TEST_F(EnvironmentTest, DropWithDeleteRemovesName) {
        auto db = create_db("data");
        create_entries(db, 40);

        auto writer = begin_write();
        ASSERT_TRUE(db.drop(*writer, true).ok());
        ASSERT_TRUE(writer->commit().ok());

        auto [status, again] = env_->open_database("data");
        EXPECT_TRUE(status.is_not_found()) << status.to_string();
    }

    TEST_F(EnvironmentTest, MainDatabaseCannotBeDropped) {
        auto db = main_db();
        auto writer = begin_write();
        EXPECT_EQ(db.drop(*writer).code(), core::StatusCode::NotSupported);
    }

    TEST_F(EnvironmentTest, MismatchedFlagsAreIncompatible) {
        create_db("dups", core::DbFlags::DupSort);
        reopen();

        core::DatabaseOptions options;
        options.flags = core::DbFlags::IntegerKey;
        auto [status, db] = env_->open_database("dups", options);
        EXPECT_EQ(status.code(), core::StatusCode::Incompatible);

        // No persistent flags requested: the stored ones are adopted.
        auto [plain_status, plain] = env_->open_database("dups");
        ASSERT_TRUE(plain_status.ok());
        auto writer = begin_write();
        ASSERT_TRUE(plain.put(*writer, "k", "2").ok());
        ASSERT_TRUE(plain.put(*writer, "k", "1").ok());
        indexing::TreeStat stat;
        ASSERT_TRUE(plain.stat(*writer, stat).ok());
        EXPECT_EQ(stat.entries, 2u);
    }

    // ============================================================================
    // KEY ORDERINGS
    // ============================================================================

    TEST_F(EnvironmentTest, ReverseKeyOrdersBySuffix) {
        auto db = create_db("rev", core::DbFlags::ReverseKey);
        auto writer = begin_write();
        for (const auto *key : {"ab", "ba", "ca", "ac"}) {
            ASSERT_TRUE(db.put(*writer, key, "v").ok());
        }
        std::vector<std::string> expected{"ba", "ca", "ab", "ac"};
        EXPECT_EQ(collect_keys(*writer, db), expected);
    }

    TEST_F(EnvironmentTest, IntegerKeyOrdersNumerically) {
        auto db = create_db("ints", core::DbFlags::IntegerKey);
        auto encode = [](uint64_t n) {
            std::string out(sizeof(n), '\0');
            std::memcpy(out.data(), &n, sizeof(n));
            return out;
        };

        auto writer = begin_write();
        for (uint64_t n : {300ULL, 2ULL, 65536ULL, 1ULL}) {
            ASSERT_TRUE(db.put(*writer, encode(n), fmt::format("{}", n)).ok());
        }

        std::vector<std::string> values;
        auto [status, range] = db.iterate(*writer);
        ASSERT_TRUE(status.ok());
        for (const auto &entry : range) {
            values.push_back(entry.value.to_string().value_or(""));
        }
        std::vector<std::string> expected{"1", "2", "300", "65536"};
        EXPECT_EQ(values, expected);
    }

    TEST_F(EnvironmentTest, CustomComparatorIsUsed) {
        core::DatabaseOptions options;
        options.flags = core::DbFlags::Create;
        options.compare = [](std::string_view a, std::string_view b) {
            return core::lexicographic_compare(b, a);
        };
        auto [status, db] = env_->open_database("desc", options);
        ASSERT_TRUE(status.ok());

        auto writer = begin_write();
        for (const auto *key : {"b", "a", "c"}) {
            ASSERT_TRUE(db.put(*writer, key, "v").ok());
        }
        std::vector<std::string> expected{"c", "b", "a"};
        EXPECT_EQ(collect_keys(*writer, db), expected);
    }

    // ============================================================================
    // INFO AND MAINTENANCE
    // ============================================================================

    TEST_F(EnvironmentTest, InfoAndStatTrackCommits) {
        env::EnvInfo info;
        ASSERT_TRUE(env_->info(info).ok());
        EXPECT_EQ(info.last_txnid, 0u);
        EXPECT_EQ(info.map_size, core::DEFAULT_MAP_SIZE);
        EXPECT_EQ(info.max_readers, core::DEFAULT_MAX_READERS);

        auto db = main_db();
        create_entries(db, 10);
        auto reader = begin_read();
        ASSERT_TRUE(env_->info(info).ok());
        EXPECT_EQ(info.last_txnid, 1u);
        EXPECT_GE(info.last_pgno, 2u);
        EXPECT_EQ(info.readers_in_use, 1u);

        indexing::TreeStat stat;
        ASSERT_TRUE(env_->stat(stat).ok());
        EXPECT_EQ(stat.entries, 10u);
        EXPECT_EQ(stat.depth, 1u);
    }

    TEST_F(EnvironmentTest, ReaderCheckLeavesLiveReaders) {
        auto reader = begin_read();
        EXPECT_EQ(env_->reader_check(), 0u);

        env::EnvInfo info;
        ASSERT_TRUE(env_->info(info).ok());
        EXPECT_EQ(info.readers_in_use, 1u);
    }

    TEST_F(EnvironmentTest, SyncSucceeds) {
        auto db = main_db();
        ASSERT_TRUE(db.put("foo", "bar").ok());
        EXPECT_TRUE(env_->sync().ok());
        EXPECT_TRUE(env_->sync(false).ok());
    }

    TEST_F(EnvironmentTest, NoSyncCommitsStayReadable) {
        core::EnvConfig config;
        config.flags = core::EnvFlags::NoSync;
        recreate(config);

        auto db = main_db();
        create_entries(db, 20);
        EXPECT_TRUE(env_->sync(false).ok());
        EXPECT_TRUE(env_->sync(true).ok());

        reopen();
        db = main_db();
        EXPECT_EQ(lookup(db, "key_000019"), "value_000019");
    }

    TEST_F(EnvironmentTest, CopyIsOpenableSnapshot) {
        auto db = main_db();
        create_entries(db, 200);
        auto copy_path = dir_ + ".copy";
        std::filesystem::remove(copy_path);

        ASSERT_TRUE(env_->copy_to(copy_path).ok());
        EXPECT_FALSE(env_->copy_to(copy_path).ok());
        ASSERT_TRUE(db.put("after", "copy").ok());

        core::EnvConfig config;
        config.flags = core::EnvFlags::NoSubdir;
        auto [status, copy] = env::Environment::open(copy_path, config);
        ASSERT_TRUE(status.ok()) << status.to_string();
        {
            auto [db_status, copied] = copy->open_database("");
            ASSERT_TRUE(db_status.ok());
            auto [txn_status, reader] = copy->begin_read();
            ASSERT_TRUE(txn_status.ok());
            EXPECT_EQ(collect_keys(*reader, copied).size(), 200u);
            EXPECT_FALSE(read_string(*reader, copied, "after").has_value());
        }
        EXPECT_TRUE(copy->close().ok());
        copy.reset();
        std::filesystem::remove(copy_path);
        std::filesystem::remove(copy_path + "-lock");
    }

    TEST_F(EnvironmentTest, NoSubdirUsesPlainFile) {
        close_env();
        cleanup_test_files();
        core::EnvConfig config;
        config.flags = core::EnvFlags::NoSubdir;
        std::filesystem::create_directories(dir_);
        auto file = dir_ + "/single.arb";
        {
            auto [status, env] = env::Environment::open(file, config);
            ASSERT_TRUE(status.ok()) << status.to_string();
            auto [db_status, db] = env->open_database("");
            ASSERT_TRUE(db.put("k", "v").ok());
            EXPECT_TRUE(env->close().ok());
        }
        EXPECT_TRUE(std::filesystem::is_regular_file(file));
        EXPECT_TRUE(std::filesystem::exists(file + "-lock"));
    }

    TEST_F(EnvironmentTest, ReadOnlyRefusesWriters) {
        auto db = main_db();
        ASSERT_TRUE(db.put("foo", "bar").ok());
        close_env();

        config_.flags = core::EnvFlags::ReadOnly;
        open_env();
        auto [status, writer] = env_->begin_write();
        EXPECT_EQ(status.code(), core::StatusCode::NotSupported);

        db = main_db();
        EXPECT_EQ(lookup(db, "foo"), "bar");
    }

    TEST_F(EnvironmentTest, ReadOnlyMissingDataFails) {
        close_env();
        cleanup_test_files();
        core::EnvConfig config;
        config.flags = core::EnvFlags::ReadOnly;
        auto [status, env] = env::Environment::open(dir_, config);
        EXPECT_FALSE(status.ok());
    }

    TEST_F(EnvironmentTest, RandomKeysIterateAscending) {
        auto db = main_db();
        uint64_t state = 0x9e3779b97f4a7c15ULL;
        std::vector<std::string> inserted;
        auto writer = begin_write();
        while (inserted.size() < 100) {
            state ^= state << 13;
            state ^= state >> 7;
            state ^= state << 17;
            auto key = fmt::format("{:016x}", state);
            ASSERT_TRUE(db.put(*writer, key, "v", core::PutFlags::NoOverwrite).ok());
            inserted.push_back(key);
        }
        ASSERT_TRUE(writer->commit().ok());

        auto reader = begin_read();
        auto keys = collect_keys(*reader, db);
        ASSERT_EQ(keys.size(), 100u);
        for (size_t i = 1; i < keys.size(); ++i) {
            EXPECT_LT(keys[i - 1], keys[i]);
        }
    }

} // namespace arbor::test
