#pragma once

#include "core/common.hpp"
#include "core/options.hpp"
#include "core/slice.hpp"
#include "core/status.hpp"
#include "indexing/cursor.hpp"
#include "indexing/tree_context.hpp"
#include "txn/transaction.hpp"
#include <memory>
#include <string_view>
#include <utility>

namespace arbor::env {

    class Environment;

    // Handle naming one B+tree of an environment. Copyable; stays usable until close()
    // or until a committed drop(txn, true).
    class Database {
      public:
        Database() = default;

        [[nodiscard]] auto index() const -> core::DbIndex {
            return index_;
        }
        [[nodiscard]] auto valid() const -> bool {
            return env_ != nullptr;
        }

        auto get(txn::Transaction &txn, std::string_view key, core::Slice &value) -> core::Status;
        auto put(txn::Transaction &txn, std::string_view key, std::string_view value,
                 core::PutFlags flags = core::PutFlags::None) -> core::Status;
        auto del(txn::Transaction &txn, std::string_view key) -> core::Status;
        // Removes one duplicate (or the key if it holds exactly `value`).
        auto del(txn::Transaction &txn, std::string_view key, std::string_view value)
            -> core::Status;

        // Single-operation write transactions.
        auto put(std::string_view key, std::string_view value,
                 core::PutFlags flags = core::PutFlags::None) -> core::Status;
        auto del(std::string_view key) -> core::Status;

        auto open_cursor(txn::Transaction &txn)
            -> std::pair<core::Status, std::unique_ptr<indexing::Cursor>>;
        auto iterate(txn::Transaction &txn, const indexing::KeyRange &range = {})
            -> std::pair<core::Status, indexing::CursorRange>;

        auto stat(txn::Transaction &txn, indexing::TreeStat &out) -> core::Status;
        // Empties the tree; with `delete_db` the name goes too and the handle closes on
        // commit.
        auto drop(txn::Transaction &txn, bool delete_db = false) -> core::Status;
        void close();

      private:
        friend class Environment;

        Database(Environment *env, core::DbIndex index) : env_(env), index_(index) {}

        auto resolve(txn::Transaction &txn, txn::DbState *&state) -> core::Status;

        Environment *env_ = nullptr;
        core::DbIndex index_ = core::MAIN_DB;
    };

} // namespace arbor::env
