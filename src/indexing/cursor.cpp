#include "indexing/cursor.hpp"
#include "indexing/btree.hpp"
#include "log/logger.hpp"
#include <fmt/core.h>
#include <utility>

namespace arbor::indexing {

    // ============================================================================
    // TreeCursor
    // ============================================================================

    void TreeCursor::attach(const txn::Transaction &txn, core::PageId root, uint32_t depth,
                            const core::Comparator &compare) {
        txn_ = &txn;
        compare_ = &compare;
        root_ = root;
        depth_ = depth;
        stack_.clear();
    }

    auto TreeCursor::descend_edge(core::PageId pgno, bool leftmost) -> core::Status {
        for (;;) {
            if (stack_.size() >= depth_) {
                return core::Status::Corruption(fmt::format(
                    "tree rooted at {} is deeper than its recorded depth {}", root_, depth_));
            }
            const char *page = nullptr;
            auto status = txn_->page(pgno, page);
            if (!status.ok())
                return status;

            auto hdr = storage::page_header(page);
            size_t n = storage::page_entries(hdr);
            const bool branch = hdr.flags & storage::PAGE_BRANCH;
            if (!branch && !(hdr.flags & storage::PAGE_LEAF)) {
                return core::Status::Corruption(
                    fmt::format("page {} in tree is neither branch nor leaf", pgno));
            }
            if (n == 0) {
                return core::Status::Corruption(fmt::format("tree page {} is empty", pgno));
            }

            size_t idx = leftmost ? 0 : n - 1;
            stack_.push_back(Frame{pgno, idx, n});
            if (!branch) {
                if (stack_.size() != depth_) {
                    return core::Status::Corruption(
                        fmt::format("leaf {} at level {} of a tree of depth {}", pgno,
                                    stack_.size(), depth_));
                }
                return core::Status::Ok();
            }
            pgno = storage::branch_child(storage::node_at(page, idx));
        }
    }

    auto TreeCursor::first() -> core::Status {
        stack_.clear();
        if (root_ == core::INVALID_PAGE) {
            return core::Status::NotFound("tree is empty");
        }
        return descend_edge(root_, true);
    }

    auto TreeCursor::last() -> core::Status {
        stack_.clear();
        if (root_ == core::INVALID_PAGE) {
            return core::Status::NotFound("tree is empty");
        }
        return descend_edge(root_, false);
    }

    auto TreeCursor::seek(std::string_view key, bool &exact) -> core::Status {
        stack_.clear();
        exact = false;
        if (root_ == core::INVALID_PAGE) {
            return core::Status::NotFound("tree is empty");
        }

        core::PageId pgno = root_;
        for (;;) {
            if (stack_.size() >= depth_) {
                return core::Status::Corruption(fmt::format(
                    "tree rooted at {} is deeper than its recorded depth {}", root_, depth_));
            }
            const char *page = nullptr;
            auto status = txn_->page(pgno, page);
            if (!status.ok())
                return status;

            auto hdr = storage::page_header(page);
            size_t n = storage::page_entries(hdr);
            if (n == 0) {
                return core::Status::Corruption(fmt::format("tree page {} is empty", pgno));
            }

            if (hdr.flags & storage::PAGE_BRANCH) {
                size_t lo = 1, hi = n;
                while (lo < hi) {
                    size_t mid = lo + (hi - lo) / 2;
                    if ((*compare_)(key, storage::node_at(page, mid).key) < 0) {
                        hi = mid;
                    } else {
                        lo = mid + 1;
                    }
                }
                stack_.push_back(Frame{pgno, lo - 1, n});
                pgno = storage::branch_child(storage::node_at(page, lo - 1));
                continue;
            }
            if (!(hdr.flags & storage::PAGE_LEAF)) {
                return core::Status::Corruption(
                    fmt::format("page {} in tree is neither branch nor leaf", pgno));
            }

            size_t lo = 0, hi = n;
            while (lo < hi) {
                size_t mid = lo + (hi - lo) / 2;
                if ((*compare_)(storage::node_at(page, mid).key, key) < 0) {
                    lo = mid + 1;
                } else {
                    hi = mid;
                }
            }
            if (lo < n) {
                stack_.push_back(Frame{pgno, lo, n});
                exact = (*compare_)(storage::node_at(page, lo).key, key) == 0;
                return core::Status::Ok();
            }

            // Every key of this leaf is smaller; the answer is the next leaf's first entry.
            stack_.push_back(Frame{pgno, n - 1, n});
            status = next();
            if (status.is_not_found()) {
                stack_.clear();
            }
            return status;
        }
    }

    auto TreeCursor::step(bool forward) -> core::Status {
        if (stack_.empty()) {
            return core::Status::NotFound("cursor is not positioned");
        }
        const size_t leaf = stack_.size() - 1;
        for (size_t level = stack_.size(); level-- > 0;) {
            auto &frame = stack_[level];
            const bool can_move = forward ? frame.idx + 1 < frame.count : frame.idx > 0;
            if (!can_move)
                continue;

            frame.idx = forward ? frame.idx + 1 : frame.idx - 1;
            if (level == leaf)
                return core::Status::Ok();

            const char *page = nullptr;
            auto status = txn_->page(frame.pgno, page);
            if (!status.ok())
                return status;
            auto child = storage::branch_child(storage::node_at(page, frame.idx));
            stack_.resize(level + 1);
            return descend_edge(child, forward);
        }
        return core::Status::NotFound(forward ? "no entry after the cursor"
                                              : "no entry before the cursor");
    }

    auto TreeCursor::next() -> core::Status {
        return step(true);
    }

    auto TreeCursor::prev() -> core::Status {
        return step(false);
    }

    auto TreeCursor::node(storage::NodeView &out) const -> core::Status {
        if (stack_.empty()) {
            return core::Status::NotFound("cursor is not positioned");
        }
        const auto &frame = stack_.back();
        const char *page = nullptr;
        auto status = txn_->page(frame.pgno, page);
        if (!status.ok())
            return status;
        if (frame.idx >= storage::page_entries(storage::page_header(page))) {
            return core::Status::Corruption(
                fmt::format("cursor slot {} is past the end of page {}", frame.idx, frame.pgno));
        }
        out = storage::node_at(page, frame.idx);
        return core::Status::Ok();
    }

    // ============================================================================
    // Cursor: positioning
    // ============================================================================

    Cursor::Cursor(txn::Transaction &txn, core::DbIndex dbi, txn::DbState &state)
        : txn_(txn), dbi_(dbi), state_(&state), epoch_(txn.epoch()) {}

    auto Cursor::compare_keys(std::string_view a, std::string_view b) const -> int {
        return state_->context.compare(a, b);
    }

    auto Cursor::compare_values(std::string_view a, std::string_view b) const -> int {
        if (state_->context.dup_compare)
            return state_->context.dup_compare(a, b);
        return core::lexicographic_compare(a, b);
    }

    auto Cursor::reset_main() -> void {
        main_.attach(txn_, state_->record.root, state_->record.depth, state_->context.compare);
        sub_.clear();
        after_delete_ = false;
    }

    // Re-validates the handle and, after a mutation elsewhere in the transaction,
    // returns to the remembered pair.
    auto Cursor::sync() -> core::Status {
        auto status = txn_.tree(dbi_, state_);
        if (!status.ok())
            return status;
        if (epoch_ == txn_.epoch())
            return core::Status::Ok();

        epoch_ = txn_.epoch();
        if (txn_.read_only()) {
            // renewed snapshot: old page positions mean nothing
            main_.clear();
            sub_.clear();
            position_ = CursorPosition::Unset;
            return core::Status::Ok();
        }
        if (position_ != CursorPosition::Valid)
            return core::Status::Ok();

        const bool was_after_delete = after_delete_;
        std::string key = saved_key_;
        std::string value = saved_value_;
        bool exact = false;
        status = land(key, value, state_->context.dupsort, exact);
        if (status.is_not_found()) {
            after_delete_ = true;
            return core::Status::Ok();
        }
        if (!status.ok())
            return status;
        after_delete_ = was_after_delete || !exact;
        return core::Status::Ok();
    }

    auto Cursor::require_valid() const -> core::Status {
        if (position_ != CursorPosition::Valid) {
            return core::Status::NotFound("cursor is not positioned on an entry");
        }
        return core::Status::Ok();
    }

    // Enters the duplicate set of the current main entry, if it has one.
    auto Cursor::enter(bool last) -> core::Status {
        storage::NodeView node;
        auto status = main_.node(node);
        if (!status.ok())
            return status;

        if (node.flags & storage::NODE_DUPTREE) {
            auto sub = storage::decode_tree_record(node.payload);
            sub_.attach(txn_, sub.root, sub.depth, state_->context.dup_compare);
            status = last ? sub_.last() : sub_.first();
            if (status.is_not_found()) {
                return core::Status::Corruption("duplicate set without values");
            }
            if (!status.ok())
                return status;
        } else {
            sub_.clear();
        }
        position_ = CursorPosition::Valid;
        return remember();
    }

    // Positions on the first pair >= (key, value); `exact` reports whether that pair
    // (or just the key when use_value is false) was found.
    auto Cursor::land(std::string_view key, std::string_view value, bool use_value, bool &exact)
        -> core::Status {
        reset_main();
        exact = false;
        bool key_exact = false;
        auto status = main_.seek(key, key_exact);
        if (status.is_not_found()) {
            position_ = CursorPosition::AfterLast;
            return status;
        }
        if (!status.ok())
            return status;

        if (!key_exact || !use_value) {
            exact = key_exact;
            return enter(false);
        }

        storage::NodeView node;
        status = main_.node(node);
        if (!status.ok())
            return status;
        if (!(node.flags & storage::NODE_DUPTREE)) {
            exact = true;
            return enter(false);
        }

        auto sub = storage::decode_tree_record(node.payload);
        sub_.attach(txn_, sub.root, sub.depth, state_->context.dup_compare);
        bool value_exact = false;
        status = sub_.seek(value, value_exact);
        if (status.is_not_found()) {
            status = main_.next();
            if (status.is_not_found()) {
                position_ = CursorPosition::AfterLast;
                sub_.clear();
                return status;
            }
            if (!status.ok())
                return status;
            return enter(false);
        }
        if (!status.ok())
            return status;
        exact = value_exact;
        position_ = CursorPosition::Valid;
        return remember();
    }

    auto Cursor::current_pair(std::string_view &key, std::string_view &value) -> core::Status {
        storage::NodeView node;
        auto status = main_.node(node);
        if (!status.ok())
            return status;
        key = node.key;
        if (sub_.positioned()) {
            storage::NodeView dup;
            status = sub_.node(dup);
            if (!status.ok())
                return status;
            value = dup.key;
            return core::Status::Ok();
        }
        return read_value(txn_, node, value);
    }

    // Copies the current pair so a write transaction can find its way back.
    auto Cursor::remember() -> core::Status {
        if (txn_.read_only())
            return core::Status::Ok();
        std::string_view key, value;
        auto status = current_pair(key, value);
        if (!status.ok())
            return status;
        saved_key_.assign(key);
        if (sub_.positioned()) {
            saved_value_.assign(value);
        } else {
            saved_value_.clear();
        }
        return core::Status::Ok();
    }

    auto Cursor::seek(SeekMode mode, std::string_view key) -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        reset_main();

        bool exact = false;
        switch (mode) {
        case SeekMode::First:
            status = main_.first();
            if (!status.ok()) {
                position_ = CursorPosition::Unset;
                return status;
            }
            return enter(false);

        case SeekMode::Last:
            status = main_.last();
            if (!status.ok()) {
                position_ = CursorPosition::Unset;
                return status;
            }
            return enter(true);

        case SeekMode::Exact:
            status = main_.seek(key, exact);
            if (status.ok() && !exact) {
                status = core::Status::NotFound(
                    fmt::format("key of {} bytes not found", key.size()));
            }
            if (!status.ok()) {
                main_.clear();
                position_ = CursorPosition::Unset;
                return status;
            }
            return enter(false);

        case SeekMode::GreaterOrEqual:
            status = main_.seek(key, exact);
            if (status.is_not_found()) {
                position_ = CursorPosition::AfterLast;
                return status;
            }
            if (!status.ok())
                return status;
            return enter(false);

        case SeekMode::LessOrEqual:
            status = main_.seek(key, exact);
            if (status.is_not_found()) {
                // every key is smaller
                status = main_.last();
                if (!status.ok()) {
                    position_ = CursorPosition::Unset;
                    return status;
                }
                return enter(true);
            }
            if (!status.ok())
                return status;
            if (exact)
                return enter(false);
            status = main_.prev();
            if (status.is_not_found()) {
                position_ = CursorPosition::BeforeFirst;
                return status;
            }
            if (!status.ok())
                return status;
            return enter(true);
        }
        return core::Status::InvalidArgument("unknown seek mode");
    }

    auto Cursor::seek_both(std::string_view key, std::string_view value) -> core::Status {
        auto status = seek(SeekMode::Exact, key);
        if (!status.ok())
            return status;

        if (!sub_.positioned()) {
            std::string_view k, v;
            status = current_pair(k, v);
            if (!status.ok())
                return status;
            if (compare_values(v, value) != 0) {
                return core::Status::NotFound("key does not hold the given value");
            }
            return core::Status::Ok();
        }

        bool exact = false;
        status = sub_.seek(value, exact);
        if (status.ok() && !exact) {
            status = core::Status::NotFound("value not in the duplicate set");
        }
        if (!status.ok()) {
            // stay on the key's first value
            if (!status.is_not_found())
                return status;
            auto first = sub_.first();
            if (!first.ok())
                return first;
            auto saved = remember();
            if (!saved.ok())
                return saved;
            return status;
        }
        return remember();
    }

    auto Cursor::seek_both_range(std::string_view key, std::string_view value) -> core::Status {
        auto status = seek(SeekMode::Exact, key);
        if (!status.ok())
            return status;

        if (!sub_.positioned()) {
            std::string_view k, v;
            status = current_pair(k, v);
            if (!status.ok())
                return status;
            if (compare_values(v, value) < 0) {
                return core::Status::NotFound("stored value is below the given value");
            }
            return core::Status::Ok();
        }

        bool exact = false;
        status = sub_.seek(value, exact);
        if (status.is_not_found()) {
            auto first = sub_.first();
            if (!first.ok())
                return first;
            auto saved = remember();
            if (!saved.ok())
                return saved;
            return core::Status::NotFound("no duplicate value >= the given value");
        }
        if (!status.ok())
            return status;
        return remember();
    }

    // ============================================================================
    // Cursor: movement
    // ============================================================================

    auto Cursor::next() -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;

        if (position_ == CursorPosition::Unset || position_ == CursorPosition::BeforeFirst) {
            return seek(SeekMode::First);
        }
        if (position_ == CursorPosition::AfterLast) {
            after_delete_ = false;
            return core::Status::NotFound("cursor is past the last entry");
        }
        if (after_delete_) {
            after_delete_ = false;
            return core::Status::Ok();
        }

        if (sub_.positioned()) {
            status = sub_.next();
            if (status.ok())
                return remember();
            if (!status.is_not_found())
                return status;
        }
        status = main_.next();
        if (status.is_not_found()) {
            position_ = CursorPosition::AfterLast;
            return core::Status::NotFound("cursor is past the last entry");
        }
        if (!status.ok())
            return status;
        return enter(false);
    }

    auto Cursor::prev() -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;

        if (position_ == CursorPosition::Unset || position_ == CursorPosition::AfterLast) {
            return seek(SeekMode::Last);
        }
        if (position_ == CursorPosition::BeforeFirst) {
            return core::Status::NotFound("cursor is before the first entry");
        }
        after_delete_ = false;

        if (sub_.positioned()) {
            status = sub_.prev();
            if (status.ok())
                return remember();
            if (!status.is_not_found())
                return status;
        }
        status = main_.prev();
        if (status.is_not_found()) {
            position_ = CursorPosition::BeforeFirst;
            return core::Status::NotFound("cursor is before the first entry");
        }
        if (!status.ok())
            return status;
        return enter(true);
    }

    auto Cursor::next_duplicate() -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        status = require_valid();
        if (!status.ok())
            return status;

        if (after_delete_) {
            after_delete_ = false;
            std::string_view key, value;
            status = current_pair(key, value);
            if (!status.ok())
                return status;
            if (compare_keys(key, deleted_key_) == 0)
                return core::Status::Ok();
            return core::Status::NotFound("no more duplicates");
        }
        if (!sub_.positioned()) {
            return core::Status::NotFound("no more duplicates");
        }
        status = sub_.next();
        if (!status.ok())
            return status;
        return remember();
    }

    auto Cursor::prev_duplicate() -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        status = require_valid();
        if (!status.ok())
            return status;
        after_delete_ = false;
        if (!sub_.positioned()) {
            return core::Status::NotFound("no earlier duplicates");
        }
        status = sub_.prev();
        if (!status.ok())
            return status;
        return remember();
    }

    // A key without a duplicate set counts as a set of one.
    auto Cursor::first_duplicate() -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        status = require_valid();
        if (!status.ok())
            return status;
        after_delete_ = false;
        if (!sub_.positioned())
            return core::Status::Ok();
        status = sub_.first();
        if (!status.ok())
            return status;
        return remember();
    }

    auto Cursor::last_duplicate() -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        status = require_valid();
        if (!status.ok())
            return status;
        after_delete_ = false;
        if (!sub_.positioned())
            return core::Status::Ok();
        status = sub_.last();
        if (!status.ok())
            return status;
        return remember();
    }

    auto Cursor::next_no_duplicate() -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        if (position_ != CursorPosition::Valid) {
            return next();
        }
        if (after_delete_) {
            after_delete_ = false;
            std::string_view key, value;
            status = current_pair(key, value);
            if (!status.ok())
                return status;
            if (compare_keys(key, deleted_key_) != 0)
                return core::Status::Ok();
        }
        status = main_.next();
        if (status.is_not_found()) {
            position_ = CursorPosition::AfterLast;
            return core::Status::NotFound("cursor is past the last entry");
        }
        if (!status.ok())
            return status;
        return enter(false);
    }

    auto Cursor::prev_no_duplicate() -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        if (position_ != CursorPosition::Valid) {
            return prev();
        }
        after_delete_ = false;
        status = main_.prev();
        if (status.is_not_found()) {
            position_ = CursorPosition::BeforeFirst;
            return core::Status::NotFound("cursor is before the first entry");
        }
        if (!status.ok())
            return status;
        return enter(true);
    }

    // ============================================================================
    // Cursor: access and writes
    // ============================================================================

    auto Cursor::current(core::Slice &key, core::Slice &value) -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        status = require_valid();
        if (!status.ok())
            return status;

        std::string_view k, v;
        status = current_pair(k, v);
        if (!status.ok())
            return status;
        key = core::Slice(k, txn_.lifetime());
        value = core::Slice(v, txn_.lifetime());
        return core::Status::Ok();
    }

    auto Cursor::count(size_t &out) -> core::Status {
        auto status = sync();
        if (!status.ok())
            return status;
        status = require_valid();
        if (!status.ok())
            return status;

        storage::NodeView node;
        status = main_.node(node);
        if (!status.ok())
            return status;
        if (node.flags & storage::NODE_DUPTREE) {
            out = storage::decode_tree_record(node.payload).entries;
        } else {
            out = 1;
        }
        return core::Status::Ok();
    }

    auto Cursor::put(std::string_view key, std::string_view value, core::PutFlags flags)
        -> core::Status {
        auto status = txn_.check_writable();
        if (!status.ok())
            return status;
        status = sync();
        if (!status.ok())
            return status;

        // The caller's views may point into pages the write is about to move.
        std::string k(key), v(value);
        Btree tree(txn_, state_->record, state_->context);
        status = txn_.record_write(dbi_, tree.put(k, v, flags));
        if (!status.ok())
            return status;

        bool exact = false;
        status = land(k, v, state_->context.dupsort, exact);
        epoch_ = txn_.epoch();
        if (status.is_not_found()) {
            return core::Status::Corruption("entry vanished right after it was written");
        }
        return status;
    }

    auto Cursor::del(core::PutFlags flags) -> core::Status {
        auto status = txn_.check_writable();
        if (!status.ok())
            return status;
        status = sync();
        if (!status.ok())
            return status;
        status = require_valid();
        if (!status.ok())
            return status;

        std::string_view k, v;
        status = current_pair(k, v);
        if (!status.ok())
            return status;
        std::string key(k);
        std::string value(v);
        const bool whole =
            !sub_.positioned() || core::has_flag(flags, core::PutFlags::NoDupData);

        Btree tree(txn_, state_->record, state_->context);
        status = txn_.record_write(dbi_, whole ? tree.remove(key) : tree.remove(key, value));
        if (!status.ok())
            return status;

        bool exact = false;
        status = land(key, value, !whole, exact);
        epoch_ = txn_.epoch();
        after_delete_ = true;
        deleted_key_ = std::move(key);
        if (status.is_not_found())
            return core::Status::Ok();
        return status;
    }

    auto Cursor::range(const KeyRange &range) -> CursorRange {
        return CursorRange(*this, range);
    }

    // ============================================================================
    // CursorRange
    // ============================================================================

    CursorRange::CursorRange(Cursor &cursor, KeyRange range)
        : cursor_(&cursor), range_(std::move(range)), done_(false) {}

    CursorRange::CursorRange(std::unique_ptr<Cursor> cursor, KeyRange range)
        : owned_(std::move(cursor)), range_(std::move(range)), done_(false) {
        cursor_ = owned_.get();
    }

    auto CursorRange::begin() -> iterator {
        if (!started_) {
            started_ = true;
            start();
        }
        return iterator(this);
    }

    void CursorRange::start() {
        if (cursor_ == nullptr) {
            done_ = true;
            return;
        }
        if (range_.direction == KeyRange::Direction::Forward) {
            load(range_.lower ? cursor_->seek(SeekMode::GreaterOrEqual, *range_.lower)
                              : cursor_->seek(SeekMode::First));
            return;
        }

        if (!range_.upper) {
            load(cursor_->seek(SeekMode::Last));
            return;
        }
        // last entry strictly below the upper bound
        auto status = cursor_->seek(SeekMode::GreaterOrEqual, *range_.upper);
        if (status.ok()) {
            status = cursor_->prev();
        } else if (status.is_not_found()) {
            status = cursor_->seek(SeekMode::Last);
        }
        load(status);
    }

    void CursorRange::advance() {
        if (done_)
            return;
        load(range_.direction == KeyRange::Direction::Forward ? cursor_->next()
                                                              : cursor_->prev());
    }

    void CursorRange::load(core::Status status) {
        if (status.is_not_found()) {
            done_ = true;
            return;
        }
        if (status.ok()) {
            status = cursor_->current(current_.key, current_.value);
        }
        if (!status.ok()) {
            ARBOR_LOG_WARN("Range iteration stopped: {}", status.to_string());
            status_ = status;
            done_ = true;
            return;
        }

        auto key = current_.key.view();
        if (!key) {
            status_ = core::Status::BadTransaction("transaction ended during iteration");
            done_ = true;
            return;
        }
        if (range_.direction == KeyRange::Direction::Forward) {
            if (range_.upper && cursor_->compare_keys(*key, *range_.upper) >= 0) {
                done_ = true;
            }
        } else if (range_.lower && cursor_->compare_keys(*key, *range_.lower) < 0) {
            done_ = true;
        }
    }

} // namespace arbor::indexing
