#pragma once

#include "core/common.hpp"
#include "core/status.hpp"
#include "indexing/tree_context.hpp"
#include "storage/format.hpp"
#include "storage/free_list.hpp"
#include "storage/page_store.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace arbor::env {
    class Environment;
}

namespace arbor::txn {

    enum class WriteWait { Block, FailFast };

    // One database as seen by a transaction: its tree record (mutated in place by
    // writers) and the comparators resolved from its handle.
    struct DbState {
        std::string name;
        storage::TreeRecord record;
        indexing::TreeContext context;
        bool loaded = false;
        bool dirty = false;
        bool deleted = false;
    };

    class Transaction {
        friend class env::Environment;

        struct Token {
            explicit Token() = default;
        };

      public:
        Transaction(Token, env::Environment &env, bool read_only);
        ~Transaction();

        Transaction(const Transaction &) = delete;
        Transaction &operator=(const Transaction &) = delete;

        // Publishes a writer's changes or releases a reader's snapshot. The transaction
        // is finished afterwards whatever the outcome.
        auto commit() -> core::Status;
        void abort();

        // Read-only: drop the snapshot but keep the reader slot, then pin the latest one.
        auto reset() -> core::Status;
        auto renew() -> core::Status;

        // Snapshot id for readers, id being written for writers.
        [[nodiscard]] auto id() const -> core::TransactionId {
            return id_;
        }
        [[nodiscard]] auto read_only() const -> bool {
            return read_only_;
        }
        [[nodiscard]] auto live() const -> bool {
            return live_;
        }
        [[nodiscard]] auto environment() const -> env::Environment & {
            return env_;
        }

        // -- Page access for the tree layer --

        auto check_live() const -> core::Status;
        auto check_writable() const -> core::Status;

        // Dirty buffer of this writer, else a validated view into the mapping.
        auto page(core::PageId pgno, const char *&out) const -> core::Status;
        // Writable buffer if `pgno` was allocated by this transaction, else nullptr.
        auto dirty_page(core::PageId pgno) -> char *;
        auto allocate(uint32_t count, core::PageId &pgno, char *&buffer) -> core::Status;
        void free_pages(core::PageId pgno, uint32_t count);

        auto tree(core::DbIndex dbi, DbState *&out) -> core::Status;
        void mark_dirty(core::DbIndex dbi);
        // Empties a tree; with `remove` its name record goes too and the handle closes
        // at commit.
        auto drop_tree(core::DbIndex dbi, bool remove) -> core::Status;

        // Invalidates outstanding slices and tells cursors to resynchronise.
        void note_mutation();
        // Marks a named tree dirty after a successful write; a failure that may have left
        // the write half applied poisons the transaction.
        auto record_write(core::DbIndex dbi, core::Status status) -> core::Status;

        [[nodiscard]] auto lifetime() const -> std::weak_ptr<const void> {
            return token_;
        }
        [[nodiscard]] auto epoch() const -> uint64_t {
            return epoch_;
        }
        [[nodiscard]] auto next_pgno() const -> uint64_t {
            return next_pgno_;
        }
        [[nodiscard]] auto dirty_count() const -> size_t {
            return dirty_.size();
        }

      private:
        struct DirtyPage {
            std::unique_ptr<char[]> data;
            uint32_t pages;
        };

        auto begin_read() -> core::Status;
        auto begin_write(WriteWait wait) -> core::Status;
        auto pin_snapshot() -> core::Status;
        void load_main(const storage::MetaRecord &meta);

        auto lookup_record(std::string_view name, storage::TreeRecord &out) -> core::Status;
        void install(core::DbIndex dbi, std::string name, const storage::TreeRecord &record,
                     const indexing::TreeContext &context, bool created);

        auto store_named_records() -> core::Status;
        auto save_free_list(core::PageId &head) -> core::Status;
        void finish();

        env::Environment &env_;
        const bool read_only_;
        bool live_ = false;
        bool failed_ = false;
        bool registered_ = false;
        bool has_slot_ = false;
        bool holds_gate_ = false;
        bool holds_lock_ = false;
        uint32_t slot_ = 0;

        core::TransactionId id_ = 0;
        storage::MetaRecord meta_;   // snapshot this transaction started from
        uint64_t next_pgno_ = 0;     // writer: grows with allocation
        uint64_t map_pages_ = 0;
        std::shared_ptr<const storage::Mapping> mapping_;

        std::vector<DbState> dbs_;
        std::vector<core::DbIndex> created_handles_;
        std::vector<core::DbIndex> dropped_handles_;

        // Writer state
        std::map<core::PageId, DirtyPage> dirty_;
        std::vector<core::PageId> freed_;
        std::vector<core::PageId> old_chain_;
        storage::FreeList free_;
        bool changed_ = false;

        std::shared_ptr<int> token_;
        uint64_t epoch_ = 0;
    };

} // namespace arbor::txn
