#pragma once

#include "core/common.hpp"
#include "core/options.hpp"
#include "core/slice.hpp"
#include "core/status.hpp"
#include "storage/format.hpp"
#include "txn/transaction.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arbor::indexing {

    enum class SeekMode { First, Last, Exact, GreaterOrEqual, LessOrEqual };

    enum class CursorPosition {
        Unset,       // never positioned, or the snapshot was renewed
        Valid,       // on an entry
        BeforeFirst, // prev() ran off the start
        AfterLast    // next() ran off the end
    };

    // Stack of (page, slot) pairs from the root to a leaf of one tree. Pages are
    // re-fetched on every access so that a writer's in-place rewrites are seen.
    class TreeCursor {
      public:
        void attach(const txn::Transaction &txn, core::PageId root, uint32_t depth,
                    const core::Comparator &compare);
        void clear() {
            stack_.clear();
        }
        [[nodiscard]] auto positioned() const -> bool {
            return !stack_.empty();
        }

        auto first() -> core::Status;
        auto last() -> core::Status;
        // First entry >= key.
        auto seek(std::string_view key, bool &exact) -> core::Status;
        // On NotFound the position is unchanged.
        auto next() -> core::Status;
        auto prev() -> core::Status;

        auto node(storage::NodeView &out) const -> core::Status;

      private:
        struct Frame {
            core::PageId pgno;
            size_t idx;
            size_t count;
        };

        auto descend_edge(core::PageId pgno, bool leftmost) -> core::Status;
        auto step(bool forward) -> core::Status;

        const txn::Transaction *txn_ = nullptr;
        const core::Comparator *compare_ = nullptr;
        core::PageId root_ = core::INVALID_PAGE;
        uint32_t depth_ = 0;
        std::vector<Frame> stack_;
    };

    struct Entry {
        core::Slice key;
        core::Slice value;
    };

    // Half-open key interval [lower, upper) walked in one direction.
    struct KeyRange {
        enum class Direction { Forward, Backward };

        std::optional<std::string> lower;
        std::optional<std::string> upper;
        Direction direction = Direction::Forward;

        static auto all() -> KeyRange {
            return KeyRange{};
        }
        static auto all_backward() -> KeyRange {
            return KeyRange{std::nullopt, std::nullopt, Direction::Backward};
        }
        static auto at_least(std::string_view lower) -> KeyRange {
            return KeyRange{std::string(lower), std::nullopt, Direction::Forward};
        }
        static auto less_than(std::string_view upper) -> KeyRange {
            return KeyRange{std::nullopt, std::string(upper), Direction::Forward};
        }
        static auto closed_open(std::string_view lower, std::string_view upper) -> KeyRange {
            return KeyRange{std::string(lower), std::string(upper), Direction::Forward};
        }
        static auto closed_open_backward(std::string_view lower, std::string_view upper)
            -> KeyRange {
            return KeyRange{std::string(lower), std::string(upper), Direction::Backward};
        }
    };

    class CursorRange;

    // Positional access to one database inside one transaction. In a write transaction
    // the cursor notices other mutations and re-seeks to the entry it was on (or the
    // one after it if that entry is gone).
    class Cursor {
      public:
        Cursor(txn::Transaction &txn, core::DbIndex dbi, txn::DbState &state);

        Cursor(const Cursor &) = delete;
        Cursor &operator=(const Cursor &) = delete;

        auto seek(SeekMode mode, std::string_view key = {}) -> core::Status;
        // Duplicate sets: exact pair, or the first value >= `value` under `key`.
        auto seek_both(std::string_view key, std::string_view value) -> core::Status;
        auto seek_both_range(std::string_view key, std::string_view value) -> core::Status;

        auto next() -> core::Status;
        auto prev() -> core::Status;
        auto next_duplicate() -> core::Status;
        auto prev_duplicate() -> core::Status;
        auto first_duplicate() -> core::Status;
        auto last_duplicate() -> core::Status;
        auto next_no_duplicate() -> core::Status;
        auto prev_no_duplicate() -> core::Status;

        auto current(core::Slice &key, core::Slice &value) -> core::Status;
        // Number of values under the current key.
        auto count(size_t &out) -> core::Status;

        // Writes through the tree, then rests on the written pair.
        auto put(std::string_view key, std::string_view value,
                 core::PutFlags flags = core::PutFlags::None) -> core::Status;
        // Deletes the current pair (NoDupData: the whole duplicate set) and rests on its
        // successor; the following next() returns that successor.
        auto del(core::PutFlags flags = core::PutFlags::None) -> core::Status;

        // Lazy walk over `range` driven by this cursor.
        auto range(const KeyRange &range) -> CursorRange;

        [[nodiscard]] auto position() const -> CursorPosition {
            return position_;
        }
        [[nodiscard]] auto compare_keys(std::string_view a, std::string_view b) const -> int;

      private:
        auto sync() -> core::Status;
        auto compare_values(std::string_view a, std::string_view b) const -> int;
        auto reset_main() -> void;
        auto enter(bool last) -> core::Status;
        auto land(std::string_view key, std::string_view value, bool use_value, bool &exact)
            -> core::Status;
        auto current_pair(std::string_view &key, std::string_view &value) -> core::Status;
        auto remember() -> core::Status;
        auto require_valid() const -> core::Status;

        txn::Transaction &txn_;
        core::DbIndex dbi_;
        txn::DbState *state_;

        TreeCursor main_;
        TreeCursor sub_; // positioned only while on a duplicate set
        CursorPosition position_ = CursorPosition::Unset;

        bool after_delete_ = false;
        std::string deleted_key_;

        uint64_t epoch_;
        std::string saved_key_;
        std::string saved_value_;
    };

    // Single-pass sequence of entries, usable in a range-for. Iteration stops at the
    // range bound or at the first error, which status() then reports.
    class CursorRange {
      public:
        class iterator {
          public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Entry;
            using difference_type = std::ptrdiff_t;
            using pointer = const Entry *;
            using reference = const Entry &;

            iterator() = default;
            explicit iterator(CursorRange *range) : range_(range) {}

            auto operator*() const -> reference {
                return range_->current_;
            }
            auto operator->() const -> pointer {
                return &range_->current_;
            }
            auto operator++() -> iterator & {
                range_->advance();
                return *this;
            }
            void operator++(int) {
                range_->advance();
            }
            friend auto operator==(const iterator &it, std::default_sentinel_t) -> bool {
                return it.at_end();
            }

          private:
            [[nodiscard]] auto at_end() const -> bool {
                return range_ == nullptr || range_->done_;
            }

            CursorRange *range_ = nullptr;
        };

        CursorRange() = default;
        CursorRange(Cursor &cursor, KeyRange range);
        CursorRange(std::unique_ptr<Cursor> cursor, KeyRange range);

        CursorRange(CursorRange &&) = default;
        CursorRange &operator=(CursorRange &&) = default;

        auto begin() -> iterator;
        auto end() -> std::default_sentinel_t {
            return std::default_sentinel;
        }

        [[nodiscard]] auto status() const -> const core::Status & {
            return status_;
        }

      private:
        void start();
        void advance();
        void load(core::Status status);

        std::unique_ptr<Cursor> owned_;
        Cursor *cursor_ = nullptr;
        KeyRange range_;
        Entry current_;
        core::Status status_ = core::Status::Ok();
        bool started_ = false;
        bool done_ = true;
    };

} // namespace arbor::indexing
