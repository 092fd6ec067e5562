#include "env/database.hpp"
#include "env/environment.hpp"
#include "indexing/btree.hpp"
#include "log/logger.hpp"

namespace arbor::env {

    auto Database::resolve(txn::Transaction &txn, txn::DbState *&state) -> core::Status {
        if (env_ == nullptr) {
            return core::Status::InvalidArgument("database handle is closed");
        }
        if (&txn.environment() != env_) {
            return core::Status::InvalidArgument("transaction belongs to another environment");
        }
        return txn.tree(index_, state);
    }

    auto Database::get(txn::Transaction &txn, std::string_view key, core::Slice &value)
        -> core::Status {
        txn::DbState *state = nullptr;
        auto status = resolve(txn, state);
        if (!status.ok())
            return status;
        indexing::Btree tree(txn, state->record, state->context);
        return tree.get(key, value);
    }

    auto Database::put(txn::Transaction &txn, std::string_view key, std::string_view value,
                       core::PutFlags flags) -> core::Status {
        auto status = txn.check_writable();
        if (!status.ok())
            return status;
        txn::DbState *state = nullptr;
        status = resolve(txn, state);
        if (!status.ok())
            return status;
        indexing::Btree tree(txn, state->record, state->context);
        return txn.record_write(index_, tree.put(key, value, flags));
    }

    auto Database::del(txn::Transaction &txn, std::string_view key) -> core::Status {
        auto status = txn.check_writable();
        if (!status.ok())
            return status;
        txn::DbState *state = nullptr;
        status = resolve(txn, state);
        if (!status.ok())
            return status;
        indexing::Btree tree(txn, state->record, state->context);
        return txn.record_write(index_, tree.remove(key));
    }

    auto Database::del(txn::Transaction &txn, std::string_view key, std::string_view value)
        -> core::Status {
        auto status = txn.check_writable();
        if (!status.ok())
            return status;
        txn::DbState *state = nullptr;
        status = resolve(txn, state);
        if (!status.ok())
            return status;
        indexing::Btree tree(txn, state->record, state->context);
        return txn.record_write(index_, tree.remove(key, value));
    }

    auto Database::put(std::string_view key, std::string_view value, core::PutFlags flags)
        -> core::Status {
        if (env_ == nullptr) {
            return core::Status::InvalidArgument("database handle is closed");
        }
        auto [status, txn] = env_->begin_write();
        if (!status.ok())
            return status;
        status = put(*txn, key, value, flags);
        if (!status.ok()) {
            txn->abort();
            return status;
        }
        return txn->commit();
    }

    auto Database::del(std::string_view key) -> core::Status {
        if (env_ == nullptr) {
            return core::Status::InvalidArgument("database handle is closed");
        }
        auto [status, txn] = env_->begin_write();
        if (!status.ok())
            return status;
        status = del(*txn, key);
        if (!status.ok()) {
            txn->abort();
            return status;
        }
        return txn->commit();
    }

    auto Database::open_cursor(txn::Transaction &txn)
        -> std::pair<core::Status, std::unique_ptr<indexing::Cursor>> {
        txn::DbState *state = nullptr;
        auto status = resolve(txn, state);
        if (!status.ok())
            return {status, nullptr};
        return {core::Status::Ok(), std::make_unique<indexing::Cursor>(txn, index_, *state)};
    }

    auto Database::iterate(txn::Transaction &txn, const indexing::KeyRange &range)
        -> std::pair<core::Status, indexing::CursorRange> {
        auto [status, cursor] = open_cursor(txn);
        if (!status.ok())
            return {status, indexing::CursorRange{}};
        return {core::Status::Ok(), indexing::CursorRange(std::move(cursor), range)};
    }

    auto Database::stat(txn::Transaction &txn, indexing::TreeStat &out) -> core::Status {
        txn::DbState *state = nullptr;
        auto status = resolve(txn, state);
        if (!status.ok())
            return status;
        indexing::Btree tree(txn, state->record, state->context);
        out = tree.stat();
        return core::Status::Ok();
    }

    auto Database::drop(txn::Transaction &txn, bool delete_db) -> core::Status {
        if (env_ == nullptr) {
            return core::Status::InvalidArgument("database handle is closed");
        }
        if (&txn.environment() != env_) {
            return core::Status::InvalidArgument("transaction belongs to another environment");
        }
        return txn.drop_tree(index_, delete_db);
    }

    void Database::close() {
        if (env_ == nullptr)
            return;
        ARBOR_LOG_DEBUG("Database handle {} closed", index_);
        env_->release_handle(index_);
        env_ = nullptr;
        index_ = core::MAIN_DB;
    }

} // namespace arbor::env
