#pragma once

#include "core/common.hpp"
#include "core/options.hpp"
#include "core/slice.hpp"
#include "core/status.hpp"
#include "indexing/page_image.hpp"
#include "indexing/tree_context.hpp"
#include "storage/format.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace arbor::txn {
    class Transaction;
}

namespace arbor::indexing {

    // Copy-on-write B+tree bound to one transaction and one tree record. The record is
    // updated in place (root, depth, counters); the owner persists it.
    class Btree {
      public:
        Btree(txn::Transaction &txn, storage::TreeRecord &tree, const TreeContext &ctx);

        // CORE OPS
        [[nodiscard]] auto get(std::string_view key, core::Slice &value) -> core::Status;
        [[nodiscard]] auto put(std::string_view key, std::string_view value,
                               core::PutFlags flags = core::PutFlags::None) -> core::Status;
        [[nodiscard]] auto remove(std::string_view key) -> core::Status;
        [[nodiscard]] auto remove(std::string_view key, std::string_view value) -> core::Status;

        // Exact-match leaf node, pointing into the page.
        [[nodiscard]] auto find_node(std::string_view key, storage::NodeView &node)
            -> core::Status;

        // Named-database records in the main tree.
        [[nodiscard]] auto put_record(std::string_view name, const storage::TreeRecord &record)
            -> core::Status;
        [[nodiscard]] auto remove_record(std::string_view name) -> core::Status;

        // Frees every page and leaves an empty tree.
        [[nodiscard]] auto drop() -> core::Status;

        [[nodiscard]] auto stat() const -> TreeStat;

        // DEBUG
        auto print_tree() -> void;

      private:
        struct PathFrame {
            core::PageId pgno;
            PageImage image;
            size_t child_idx; // position in the parent's children
        };

        // A page produced by store_node(); `separator` is empty for the first piece.
        struct Piece {
            core::Key separator;
            core::PageId pgno;
        };

        txn::Transaction &txn_;
        storage::TreeRecord &tree_;
        const TreeContext &ctx_;
        TreeContext dup_ctx_;

        [[nodiscard]] auto compare(std::string_view a, std::string_view b) const -> int {
            return ctx_.compare(a, b);
        }

        auto load_image(core::PageId pgno, PageImage &out) -> core::Status;
        auto descend(std::string_view key, std::vector<PathFrame> &path) -> core::Status;
        auto child_index(const PageImage &branch, std::string_view key) const -> size_t;
        auto search_leaf(const PageImage &leaf, std::string_view key, bool &exact) const
            -> size_t;

        auto make_value(std::string_view key, std::string_view value, LeafValue &out)
            -> core::Status;
        auto free_value(const LeafValue &value) -> core::Status;
        auto dup_insert(LeafValue &slot, std::string_view value, core::PutFlags flags,
                        bool &inserted) -> core::Status;
        auto remove_entry(std::string_view key, bool records) -> core::Status;

        auto rewrite_path(std::vector<PathFrame> &path) -> core::Status;
        auto store_node(PageImage &image, core::PageId old_pgno, std::vector<Piece> &out)
            -> core::Status;
        auto write_image(const PageImage &image, core::PageId old_pgno, core::PageId &pgno)
            -> core::Status;
        auto split(PageImage &image, PageImage &right, core::Key &separator) -> void;
        auto insert_into_parent(PageImage &parent, size_t idx, const std::vector<Piece> &pieces)
            -> void;

        auto rebalance(std::vector<PathFrame> &path, size_t level) -> core::Status;
        auto borrow_from_left(PageImage &node, PageImage &left, core::Key &separator) -> void;
        auto borrow_from_right(PageImage &node, PageImage &right, core::Key &separator) -> void;
        auto merge_into(PageImage &dst, PageImage &src, const core::Key &separator) -> void;

        auto count_page(NodeType type, int delta) -> void;
        auto free_subtree(core::PageId pgno) -> core::Status;
    };

    // Value bytes of a leaf node: inline payload or a view into its overflow run.
    auto read_value(const txn::Transaction &txn, const storage::NodeView &node,
                    std::string_view &out) -> core::Status;

} // namespace arbor::indexing
