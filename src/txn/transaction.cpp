#include "txn/transaction.hpp"
#include "core/common.hpp"
#include "core/status.hpp"
#include "env/environment.hpp"
#include "indexing/btree.hpp"
#include "log/logger.hpp"
#include "storage/format.hpp"
#include "storage/page_store.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <utility>

namespace arbor::txn {

    Transaction::Transaction(Token, env::Environment &env, bool read_only)
        : env_(env), read_only_(read_only) {
        dbs_.resize(static_cast<size_t>(env.config().max_databases) + 1);
    }

    Transaction::~Transaction() {
        if (registered_ || holds_gate_ || has_slot_) {
            abort();
        }
    }

    // ============================================================================
    // Begin
    // ============================================================================

    auto Transaction::begin_read() -> core::Status {
        auto status = env_.lock_->acquire_slot(slot_);
        if (!status.ok())
            return status;
        has_slot_ = true;
        return pin_snapshot();
    }

    // Pins the latest meta in the reader slot. A writer that computed its oldest snapshot
    // before the pin landed may publish in between, so retry until the pin is current.
    auto Transaction::pin_snapshot() -> core::Status {
        auto &store = *env_.store_;
        storage::MetaRecord meta;
        for (;;) {
            auto status = store.latest_meta(meta);
            if (!status.ok())
                return status;
            env_.lock_->pin(slot_, meta.txnid);

            storage::MetaRecord check;
            status = store.latest_meta(check);
            if (!status.ok())
                return status;
            if (check.txnid == meta.txnid)
                break;
        }

        auto status =
            store.ensure_mapped(std::max(meta.map_size, meta.next_pgno * core::PAGE_SIZE));
        if (!status.ok())
            return status;
        mapping_ = store.mapping();

        meta_ = meta;
        id_ = meta.txnid;
        next_pgno_ = meta.next_pgno;
        map_pages_ = mapping_->pages();
        load_main(meta);
        token_ = std::make_shared<int>(0);
        epoch_++;
        live_ = true;
        return core::Status::Ok();
    }

    auto Transaction::begin_write(WriteWait wait) -> core::Status {
        const bool block = wait == WriteWait::Block;
        auto status = env_.acquire_writer(block);
        if (!status.ok())
            return status;
        holds_gate_ = true;

        status = env_.lock_->lock_writer(block);
        if (!status.ok())
            return status;
        holds_lock_ = true;

        auto &store = *env_.store_;
        status = store.latest_meta(meta_);
        if (!status.ok())
            return status;
        status = store.ensure_mapped(std::max(meta_.map_size, meta_.next_pgno * core::PAGE_SIZE));
        if (!status.ok())
            return status;
        mapping_ = store.mapping();

        id_ = meta_.txnid + 1;
        next_pgno_ = meta_.next_pgno;
        map_pages_ = mapping_->pages();

        status = store.read_free_chain(*mapping_, meta_, free_, old_chain_);
        if (!status.ok()) {
            ARBOR_LOG_ERROR("Free list of txn {} is unreadable: {}", meta_.txnid,
                            status.to_string());
            return status;
        }
        auto oldest = env_.lock_->oldest_snapshot(meta_.txnid);
        auto reclaimed = free_.reclaim(oldest);

        load_main(meta_);
        token_ = std::make_shared<int>(0);
        live_ = true;
        ARBOR_LOG_TRACE("Write txn {} begins: oldest reader {}, reclaimed {}, pool {}, pending {}",
                        id_, oldest, reclaimed, free_.pool_size(), free_.pending_size());
        return core::Status::Ok();
    }

    void Transaction::load_main(const storage::MetaRecord &meta) {
        for (auto &state : dbs_) {
            state = DbState{};
        }
        dbs_[core::MAIN_DB].record = meta.main;
        dbs_[core::MAIN_DB].context = env_.main_context();
        dbs_[core::MAIN_DB].loaded = true;
    }

    // ============================================================================
    // End
    // ============================================================================

    void Transaction::finish() {
        token_.reset();
        mapping_.reset();
        dirty_.clear();
        freed_.clear();
        live_ = false;

        if (has_slot_) {
            env_.lock_->release_slot(slot_);
            has_slot_ = false;
        }
        if (holds_lock_) {
            env_.lock_->unlock_writer();
            holds_lock_ = false;
        }
        if (holds_gate_) {
            env_.release_writer();
            holds_gate_ = false;
        }
        if (registered_) {
            env_.active_txns_--;
            registered_ = false;
        }
    }

    void Transaction::abort() {
        if (!registered_ && !holds_gate_ && !has_slot_)
            return;
        for (auto dbi : created_handles_) {
            env_.release_handle(dbi);
        }
        created_handles_.clear();
        dropped_handles_.clear();
        if (!read_only_ && live_) {
            ARBOR_LOG_DEBUG("Write txn {} aborted, {} staged page run(s) discarded", id_,
                            dirty_.size());
        }
        finish();
    }

    auto Transaction::commit() -> core::Status {
        if (!registered_) {
            return core::Status::BadTransaction("transaction already finished");
        }
        if (read_only_) {
            created_handles_.clear();
            finish();
            return core::Status::Ok();
        }
        if (failed_) {
            abort();
            return core::Status::BadTransaction(
                "transaction failed earlier and was aborted instead of committed");
        }
        if (!changed_) {
            created_handles_.clear();
            finish();
            return core::Status::Ok();
        }

        auto status = store_named_records();
        core::PageId free_head = core::INVALID_PAGE;
        if (status.ok()) {
            status = save_free_list(free_head);
        }
        if (status.ok()) {
            storage::MetaRecord meta = meta_;
            meta.txnid = id_;
            meta.next_pgno = next_pgno_;
            meta.map_size = mapping_->size();
            meta.free_head = free_head;
            meta.main = dbs_[core::MAIN_DB].record;

            std::vector<storage::StagedPage> staged;
            staged.reserve(dirty_.size());
            for (const auto &[pgno, page] : dirty_) {
                staged.push_back(storage::StagedPage{pgno, page.data.get(), page.pages});
            }
            status = env_.store_->commit(staged, meta);
        }
        if (!status.ok()) {
            ARBOR_LOG_WARN("Write txn {} rolled back: {}", id_, status.to_string());
            abort();
            return status;
        }

        for (auto dbi : dropped_handles_) {
            env_.release_handle(dbi);
        }
        dropped_handles_.clear();
        created_handles_.clear();
        ARBOR_LOG_DEBUG("Write txn {} committed: {} page run(s), {} pages in use, pool {}", id_,
                        dirty_.size(), next_pgno_, free_.pool_size());
        finish();
        return core::Status::Ok();
    }

    auto Transaction::reset() -> core::Status {
        if (!read_only_) {
            return core::Status::NotSupported("only read-only transactions can be reset");
        }
        if (!live_) {
            return core::Status::BadTransaction("transaction is not active");
        }
        env_.lock_->unpin(slot_);
        token_.reset();
        mapping_.reset();
        live_ = false;
        return core::Status::Ok();
    }

    auto Transaction::renew() -> core::Status {
        if (!read_only_ || live_ || !has_slot_) {
            return core::Status::BadTransaction("only a reset read-only transaction can be renewed");
        }
        return pin_snapshot();
    }

    // ============================================================================
    // Page access
    // ============================================================================

    auto Transaction::check_live() const -> core::Status {
        if (!live_) {
            return core::Status::BadTransaction("transaction is not active");
        }
        return core::Status::Ok();
    }

    auto Transaction::check_writable() const -> core::Status {
        auto status = check_live();
        if (!status.ok())
            return status;
        if (read_only_) {
            return core::Status::NotSupported("write in a read-only transaction");
        }
        if (failed_) {
            return core::Status::BadTransaction("transaction failed earlier and must be aborted");
        }
        return core::Status::Ok();
    }

    auto Transaction::page(core::PageId pgno, const char *&out) const -> core::Status {
        if (!mapping_) {
            return core::Status::BadTransaction("transaction is not active");
        }
        if (!read_only_) {
            auto it = dirty_.find(pgno);
            if (it != dirty_.end()) {
                out = it->second.data.get();
                return core::Status::Ok();
            }
        }
        auto status = env_.store_->read(*mapping_, pgno, meta_.next_pgno, out);
        if (status.is_corruption()) {
            ARBOR_LOG_ERROR("Corrupt page in snapshot {}: {}", meta_.txnid, status.message());
        }
        return status;
    }

    auto Transaction::dirty_page(core::PageId pgno) -> char * {
        auto it = dirty_.find(pgno);
        if (it == dirty_.end())
            return nullptr;
        note_mutation();
        return it->second.data.get();
    }

    auto Transaction::allocate(uint32_t count, core::PageId &pgno, char *&buffer)
        -> core::Status {
        auto status = env_.store_->allocate(free_, next_pgno_, map_pages_, count, pgno);
        if (!status.ok()) {
            failed_ = true;
            ARBOR_LOG_WARN("Write txn {}: {}", id_, status.message());
            return status;
        }
        DirtyPage page{std::make_unique<char[]>(static_cast<size_t>(count) * core::PAGE_SIZE),
                       count};
        buffer = page.data.get();
        dirty_.emplace(pgno, std::move(page));
        changed_ = true;
        note_mutation();
        return core::Status::Ok();
    }

    // Pages this transaction allocated go straight back to the pool; committed pages
    // join this transaction's generation.
    void Transaction::free_pages(core::PageId pgno, uint32_t count) {
        changed_ = true;
        note_mutation();
        auto it = dirty_.find(pgno);
        if (it != dirty_.end()) {
            dirty_.erase(it);
            free_.release(pgno, count);
            return;
        }
        for (uint32_t i = 0; i < count; i++) {
            freed_.push_back(pgno + i);
        }
    }

    void Transaction::note_mutation() {
        if (read_only_)
            return;
        token_ = std::make_shared<int>(0);
        epoch_++;
    }

    // ============================================================================
    // Trees
    // ============================================================================

    auto Transaction::tree(core::DbIndex dbi, DbState *&out) -> core::Status {
        auto status = check_live();
        if (!status.ok())
            return status;
        if (dbi >= dbs_.size()) {
            return core::Status::InvalidArgument(fmt::format("database index {} out of range", dbi));
        }

        auto &state = dbs_[dbi];
        if (state.deleted) {
            return core::Status::NotFound(
                fmt::format("database '{}' was dropped in this transaction", state.name));
        }
        if (!state.loaded) {
            std::string name;
            indexing::TreeContext context;
            status = env_.handle_context(dbi, name, context);
            if (!status.ok())
                return status;

            storage::TreeRecord record;
            status = lookup_record(name, record);
            if (!status.ok())
                return status;
            context.dupsort = record.flags & static_cast<uint32_t>(core::DbFlags::DupSort);
            install(dbi, std::move(name), record, context, false);
        }
        out = &state;
        return core::Status::Ok();
    }

    auto Transaction::lookup_record(std::string_view name, storage::TreeRecord &out)
        -> core::Status {
        auto &main = dbs_[core::MAIN_DB];
        indexing::Btree tree(*this, main.record, main.context);
        storage::NodeView node;
        auto status = tree.find_node(name, node);
        if (status.is_not_found()) {
            return core::Status::NotFound(fmt::format("database '{}' does not exist", name));
        }
        if (!status.ok())
            return status;
        if (!(node.flags & storage::NODE_SUBDB)) {
            return core::Status::Incompatible(
                fmt::format("main database key '{}' is not a database", name));
        }
        out = storage::decode_tree_record(node.payload);
        return core::Status::Ok();
    }

    void Transaction::install(core::DbIndex dbi, std::string name,
                              const storage::TreeRecord &record,
                              const indexing::TreeContext &context, bool created) {
        auto &state = dbs_[dbi];
        state.name = std::move(name);
        state.record = record;
        state.context = context;
        state.loaded = true;
        state.dirty = created;
        state.deleted = false;
        if (created) {
            changed_ = true;
        }
    }

    void Transaction::mark_dirty(core::DbIndex dbi) {
        if (dbi != core::MAIN_DB && dbi < dbs_.size()) {
            dbs_[dbi].dirty = true;
        }
    }

    auto Transaction::record_write(core::DbIndex dbi, core::Status status) -> core::Status {
        if (status.ok()) {
            mark_dirty(dbi);
        } else if (status.is_map_full() || status.is_io_error() || status.is_corruption()) {
            failed_ = true;
        }
        return status;
    }

    auto Transaction::drop_tree(core::DbIndex dbi, bool remove) -> core::Status {
        auto status = check_writable();
        if (!status.ok())
            return status;
        if (dbi == core::MAIN_DB) {
            return core::Status::NotSupported("the main database cannot be dropped");
        }
        DbState *state = nullptr;
        status = tree(dbi, state);
        if (!status.ok())
            return status;

        indexing::Btree btree(*this, state->record, state->context);
        status = record_write(dbi, btree.drop());
        if (!status.ok())
            return status;
        if (!remove)
            return core::Status::Ok();

        auto &main = dbs_[core::MAIN_DB];
        indexing::Btree main_tree(*this, main.record, main.context);
        status = main_tree.remove_record(state->name);
        if (!status.ok() && !status.is_not_found()) {
            return record_write(core::MAIN_DB, status);
        }
        state->deleted = true;
        state->dirty = false;
        changed_ = true;
        dropped_handles_.push_back(dbi);
        ARBOR_LOG_DEBUG("Write txn {} deletes database '{}'", id_, state->name);
        return core::Status::Ok();
    }

    // ============================================================================
    // Commit helpers
    // ============================================================================

    auto Transaction::store_named_records() -> core::Status {
        auto &main = dbs_[core::MAIN_DB];
        for (size_t dbi = 1; dbi < dbs_.size(); dbi++) {
            auto &state = dbs_[dbi];
            if (!state.loaded || !state.dirty || state.deleted)
                continue;
            indexing::Btree tree(*this, main.record, main.context);
            auto status = tree.put_record(state.name, state.record);
            if (!status.ok())
                return status;
            state.dirty = false;
        }
        return core::Status::Ok();
    }

    // Serialises the free list into a fresh chain. Taking chain pages from the pool
    // shrinks the list, so allocation repeats until the chain holds every word.
    auto Transaction::save_free_list(core::PageId &head) -> core::Status {
        free_.add_pending(id_, freed_);
        freed_.clear();
        free_.add_pending(id_, old_chain_);
        old_chain_.clear();

        std::vector<core::PageId> chain;
        std::vector<uint64_t> words;
        for (;;) {
            words = free_.serialize();
            size_t needed = (words.size() + storage::FREE_CHAIN_WORDS - 1) /
                            storage::FREE_CHAIN_WORDS;
            if (chain.size() >= needed)
                break;
            core::PageId pgno = core::INVALID_PAGE;
            char *buffer = nullptr;
            auto status = allocate(1, pgno, buffer);
            if (!status.ok())
                return status;
            chain.push_back(pgno);
        }

        for (size_t i = 0; i < chain.size(); i++) {
            size_t offset = std::min(i * storage::FREE_CHAIN_WORDS, words.size());
            size_t count = std::min(storage::FREE_CHAIN_WORDS, words.size() - offset);
            core::PageId next = i + 1 < chain.size() ? chain[i + 1] : core::INVALID_PAGE;
            storage::format_free_chain_page(dirty_.at(chain[i]).data.get(), chain[i], next,
                                            words.data() + offset, count);
        }
        head = chain.empty() ? core::INVALID_PAGE : chain.front();
        return core::Status::Ok();
    }

} // namespace arbor::txn
