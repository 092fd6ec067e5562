#pragma once

#include "core/common.hpp"
#include "core/options.hpp"
#include "core/status.hpp"
#include "env/database.hpp"
#include "indexing/tree_context.hpp"
#include "storage/lock_file.hpp"
#include "storage/page_store.hpp"
#include "txn/transaction.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arbor::env {

    struct EnvInfo {
        uint64_t map_size = 0;
        core::PageId last_pgno = 0;
        core::TransactionId last_txnid = 0;
        uint32_t max_readers = 0;
        size_t readers_in_use = 0;
    };

    // An open database directory (or file with EnvFlags::NoSubdir). Thread-safe; each
    // transaction must be used by one thread at a time.
    class Environment {
        struct Token {
            explicit Token() = default;
        };

      public:
        Environment(Token, std::string path, const core::EnvConfig &config);
        static auto open(const std::string &path, const core::EnvConfig &config = {})
            -> std::pair<core::Status, std::unique_ptr<Environment>>;
        ~Environment();

        Environment(const Environment &) = delete;
        Environment &operator=(const Environment &) = delete;

        // Fails with Busy while any transaction is live. Safe to race with begin_read and
        // begin_write: they either register before the check or see the closed state.
        auto close() -> core::Status;

        auto begin_read() -> std::pair<core::Status, std::unique_ptr<txn::Transaction>>;
        auto begin_write(txn::WriteWait wait = txn::WriteWait::Block)
            -> std::pair<core::Status, std::unique_ptr<txn::Transaction>>;

        // Empty name selects the main database.
        auto open_database(txn::Transaction &txn, std::string_view name,
                           const core::DatabaseOptions &options = {})
            -> std::pair<core::Status, Database>;
        auto open_database(std::string_view name, const core::DatabaseOptions &options = {})
            -> std::pair<core::Status, Database>;

        auto set_map_size(uint64_t size) -> core::Status;
        auto sync(bool force = true) -> core::Status;
        auto info(EnvInfo &out) const -> core::Status;
        auto stat(indexing::TreeStat &out) const -> core::Status;
        // Frees reader slots of dead processes; returns how many were cleared.
        auto reader_check() -> size_t;
        // Consistent copy of the latest snapshot into a new file.
        auto copy_to(const std::string &path) -> core::Status;

        [[nodiscard]] auto max_key_size() const -> uint32_t {
            return config_.max_key_size;
        }
        [[nodiscard]] auto config() const -> const core::EnvConfig & {
            return config_;
        }
        [[nodiscard]] auto path() const -> const std::string & {
            return path_;
        }
        [[nodiscard]] auto active_transactions() const -> size_t {
            return active_txns_.load();
        }
        [[nodiscard]] auto read_only() const -> bool {
            return core::has_flag(config_.flags, core::EnvFlags::ReadOnly);
        }

        // Exposed for fault-injection tests.
        [[nodiscard]] auto page_store() -> storage::PageStore & {
            return *store_;
        }

      private:
        friend class txn::Transaction;
        friend class Database;

        struct DbHandle {
            std::string name;
            uint32_t flags = 0;
            core::Comparator compare;
            core::Comparator dup_compare;
            bool open = false;
        };

        auto check_open() const -> core::Status;
        auto enlist(txn::Transaction &txn) -> core::Status;
        auto acquire_writer(bool wait) -> core::Status;
        void release_writer();

        auto handle_context(core::DbIndex dbi, std::string &name, indexing::TreeContext &ctx) const
            -> core::Status;
        auto make_context(const DbHandle &handle) const -> indexing::TreeContext;
        auto main_context() const -> indexing::TreeContext;
        void release_handle(core::DbIndex dbi);

        std::string path_;
        core::EnvConfig config_;
        std::unique_ptr<storage::LockFile> lock_;
        std::unique_ptr<storage::PageStore> store_;

        // Shared while a transaction registers or the store is used outside one;
        // exclusive for close().
        mutable std::shared_mutex state_mutex_;
        std::atomic<bool> closed_{false};

        // In-process writer gate; not tied to a thread.
        std::mutex writer_mutex_;
        std::condition_variable writer_cv_;
        bool writer_active_ = false;

        std::atomic<size_t> active_txns_{0};

        mutable std::shared_mutex handles_mutex_;
        std::vector<DbHandle> handles_;
    };

} // namespace arbor::env
