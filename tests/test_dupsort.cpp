#include "indexing/cursor.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace arbor::test {

    class DupSortTest : public EnvTestFixture {
      protected:
        void SetUp() override {
            EnvTestFixture::SetUp();
            db_ = create_db("dups", core::DbFlags::DupSort);
        }

        // Values under `key` walked with first_duplicate / next_duplicate.
        auto duplicates(txn::Transaction &txn, std::string_view key) -> std::vector<std::string> {
            std::vector<std::string> out;
            auto [status, cursor] = db_.open_cursor(txn);
            EXPECT_TRUE(status.ok()) << status.to_string();
            if (!cursor->seek(indexing::SeekMode::Exact, key).ok())
                return out;
            EXPECT_TRUE(cursor->first_duplicate().ok());
            for (;;) {
                core::Slice k, v;
                EXPECT_TRUE(cursor->current(k, v).ok());
                out.push_back(v.to_string().value_or("<expired>"));
                if (!cursor->next_duplicate().ok())
                    break;
            }
            return out;
        }

        env::Database db_;
    };

    // ============================================================================
    // ORDERING
    // ============================================================================

    TEST_F(DupSortTest, ValuesComeBackInOrder) {
        auto txn = begin_write();
        ASSERT_TRUE(db_.put(*txn, "k", "v2").ok());
        ASSERT_TRUE(db_.put(*txn, "k", "v3").ok());
        ASSERT_TRUE(db_.put(*txn, "k", "v1").ok());
        ASSERT_TRUE(txn->commit().ok());

        auto reader = begin_read();
        std::vector<std::string> expected{"v1", "v2", "v3"};
        EXPECT_EQ(duplicates(*reader, "k"), expected);
    }

    TEST_F(DupSortTest, DeletingMiddleValueKeepsNeighboursAdjacent) {
        auto txn = begin_write();
        for (const auto *v : {"v1", "v2", "v3"}) {
            ASSERT_TRUE(db_.put(*txn, "k", v).ok());
        }
        ASSERT_TRUE(txn->commit().ok());

        txn = begin_write();
        ASSERT_TRUE(db_.del(*txn, "k", "v2").ok());
        ASSERT_TRUE(txn->commit().ok());

        auto reader = begin_read();
        std::vector<std::string> expected{"v1", "v3"};
        EXPECT_EQ(duplicates(*reader, "k"), expected);
    }

    TEST_F(DupSortTest, GetReturnsFirstValue) {
        auto txn = begin_write();
        ASSERT_TRUE(db_.put(*txn, "k", "zeta").ok());
        ASSERT_TRUE(db_.put(*txn, "k", "alpha").ok());
        EXPECT_EQ(read_string(*txn, db_, "k"), "alpha");
        ASSERT_TRUE(txn->commit().ok());
        EXPECT_EQ(lookup(db_, "k"), "alpha");
    }

    TEST_F(DupSortTest, ManyDuplicatesSpanSeveralPages) {
        auto txn = begin_write();
        for (size_t i = 0; i < 1000; ++i) {
            ASSERT_TRUE(db_.put(*txn, "k", fmt::format("value_{:05d}", (i * 7919) % 1000)).ok());
        }
        ASSERT_TRUE(txn->commit().ok());

        auto reader = begin_read();
        auto values = duplicates(*reader, "k");
        ASSERT_EQ(values.size(), 1000u);
        for (size_t i = 0; i < values.size(); ++i) {
            EXPECT_EQ(values[i], fmt::format("value_{:05d}", i));
        }

        auto [status, cursor] = db_.open_cursor(*reader);
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(cursor->seek(indexing::SeekMode::Exact, "k").ok());
        size_t count = 0;
        ASSERT_TRUE(cursor->count(count).ok());
        EXPECT_EQ(count, 1000u);

        indexing::TreeStat stat;
        ASSERT_TRUE(db_.stat(*reader, stat).ok());
        EXPECT_EQ(stat.entries, 1000u);
    }

    TEST_F(DupSortTest, CustomDuplicateComparator) {
        close_env();
        open_env();
        core::DatabaseOptions options;
        options.flags = core::DbFlags::DupSort | core::DbFlags::Create;
        options.dup_compare = [](std::string_view a, std::string_view b) {
            return -core::lexicographic_compare(a, b);
        };
        auto [status, db] = env_->open_database("reversed", options);
        ASSERT_TRUE(status.ok()) << status.to_string();
        db_ = db;

        auto txn = begin_write();
        for (const auto *v : {"b", "c", "a"}) {
            ASSERT_TRUE(db_.put(*txn, "k", v).ok());
        }
        std::vector<std::string> expected{"c", "b", "a"};
        EXPECT_EQ(duplicates(*txn, "k"), expected);
    }

    // ============================================================================
    // PUT POLICIES
    // ============================================================================

    TEST_F(DupSortTest, NoDupDataRejectsExistingPair) {
        auto txn = begin_write();
        ASSERT_TRUE(db_.put(*txn, "k", "v1").ok());

        auto status = db_.put(*txn, "k", "v1", core::PutFlags::NoDupData);
        EXPECT_TRUE(status.is_key_exists());
        ASSERT_TRUE(db_.put(*txn, "k", "v2", core::PutFlags::NoDupData).ok());

        // Without the flag an existing pair is accepted and not stored twice.
        ASSERT_TRUE(db_.put(*txn, "k", "v1").ok());
        EXPECT_EQ(duplicates(*txn, "k").size(), 2u);
    }

    TEST_F(DupSortTest, NoOverwriteRejectsExistingKey) {
        auto txn = begin_write();
        ASSERT_TRUE(db_.put(*txn, "k", "v1").ok());
        EXPECT_TRUE(db_.put(*txn, "k", "v2", core::PutFlags::NoOverwrite).is_key_exists());
        EXPECT_EQ(duplicates(*txn, "k").size(), 1u);
    }

    TEST_F(DupSortTest, DuplicateValuesObeyKeyLimit) {
        auto txn = begin_write();
        std::string at_limit(core::DEFAULT_MAX_KEY_SIZE, 'v');
        ASSERT_TRUE(db_.put(*txn, "k", at_limit).ok());
        auto status = db_.put(*txn, "k", at_limit + "v");
        EXPECT_TRUE(status.is_key_too_large()) << status.to_string();
        ASSERT_TRUE(txn->commit().ok());
    }

    // ============================================================================
    // DELETION
    // ============================================================================

    TEST_F(DupSortTest, DeleteKeyRemovesEveryValue) {
        auto txn = begin_write();
        for (size_t i = 0; i < 50; ++i) {
            ASSERT_TRUE(db_.put(*txn, "k", fmt::format("v{:02d}", i)).ok());
        }
        ASSERT_TRUE(db_.put(*txn, "other", "x").ok());
        ASSERT_TRUE(db_.del(*txn, "k").ok());

        EXPECT_FALSE(read_string(*txn, db_, "k").has_value());
        indexing::TreeStat stat;
        ASSERT_TRUE(db_.stat(*txn, stat).ok());
        EXPECT_EQ(stat.entries, 1u);
    }

    TEST_F(DupSortTest, DeletingLastValueRemovesKey) {
        auto txn = begin_write();
        ASSERT_TRUE(db_.put(*txn, "k", "only").ok());
        ASSERT_TRUE(db_.del(*txn, "k", "only").ok());
        EXPECT_FALSE(read_string(*txn, db_, "k").has_value());
        EXPECT_TRUE(db_.del(*txn, "k", "only").is_not_found());
    }

    TEST_F(DupSortTest, DeletingMissingValueIsNotFound) {
        auto txn = begin_write();
        ASSERT_TRUE(db_.put(*txn, "k", "v1").ok());
        EXPECT_TRUE(db_.del(*txn, "k", "v9").is_not_found());
        EXPECT_EQ(duplicates(*txn, "k").size(), 1u);
    }

    // ============================================================================
    // ITERATION AND PERSISTENCE
    // ============================================================================

    TEST_F(DupSortTest, IterationVisitsEveryPair) {
        auto txn = begin_write();
        ASSERT_TRUE(db_.put(*txn, "a", "1").ok());
        ASSERT_TRUE(db_.put(*txn, "a", "2").ok());
        ASSERT_TRUE(db_.put(*txn, "b", "1").ok());
        ASSERT_TRUE(txn->commit().ok());

        auto reader = begin_read();
        std::vector<std::string> pairs;
        auto [status, range] = db_.iterate(*reader);
        ASSERT_TRUE(status.ok());
        for (const auto &entry : range) {
            pairs.push_back(*entry.key.to_string() + "=" + *entry.value.to_string());
        }
        EXPECT_TRUE(range.status().ok());
        std::vector<std::string> expected{"a=1", "a=2", "b=1"};
        EXPECT_EQ(pairs, expected);
    }

    TEST_F(DupSortTest, DuplicatesSurviveReopen) {
        auto txn = begin_write();
        for (const auto *v : {"x", "y", "z"}) {
            ASSERT_TRUE(db_.put(*txn, "k", v).ok());
        }
        ASSERT_TRUE(txn->commit().ok());

        reopen();
        auto [status, db] = env_->open_database("dups");
        ASSERT_TRUE(status.ok()) << status.to_string();
        db_ = db;

        auto reader = begin_read();
        std::vector<std::string> expected{"x", "y", "z"};
        EXPECT_EQ(duplicates(*reader, "k"), expected);
    }

    TEST_F(DupSortTest, ConflictingFlagsAreIncompatible) {
        core::DatabaseOptions options;
        options.flags = core::DbFlags::ReverseKey;
        auto [status, db] = env_->open_database("dups", options);
        EXPECT_EQ(status.code(), core::StatusCode::Incompatible);
        EXPECT_FALSE(db.valid());
    }

} // namespace arbor::test
