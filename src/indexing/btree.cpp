#include "indexing/btree.hpp"
#include "core/common.hpp"
#include "core/status.hpp"
#include "indexing/page_image.hpp"
#include "log/logger.hpp"
#include "storage/format.hpp"
#include "txn/transaction.hpp"
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <fmt/core.h>
#include <fmt/format.h>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor::indexing {

    Btree::Btree(txn::Transaction &txn, storage::TreeRecord &tree, const TreeContext &ctx)
        : txn_(txn), tree_(tree), ctx_(ctx) {
        dup_ctx_.compare = ctx.dup_compare ? ctx.dup_compare : core::lexicographic_compare;
        dup_ctx_.max_key_size = ctx.max_key_size;
    }

    auto read_value(const txn::Transaction &txn, const storage::NodeView &node,
                    std::string_view &out) -> core::Status {
        if (!(node.flags & storage::NODE_BIGDATA)) {
            out = node.payload;
            return core::Status::Ok();
        }

        auto pgno = storage::load<core::PageId>(node.payload.data());
        const char *page = nullptr;
        auto status = txn.page(pgno, page);
        if (!status.ok())
            return status;

        auto hdr = storage::page_header(page);
        if (!(hdr.flags & storage::PAGE_OVERFLOW) ||
            storage::PAGE_HEADER_SIZE + node.dsize >
                static_cast<uint64_t>(hdr.overflow_pages) * core::PAGE_SIZE ||
            pgno + hdr.overflow_pages > txn.next_pgno()) {
            return core::Status::Corruption(
                fmt::format("overflow run at page {} does not hold {} bytes", pgno, node.dsize));
        }
        out = std::string_view(page + storage::PAGE_HEADER_SIZE, node.dsize);
        return core::Status::Ok();
    }

    // ============================================================================
    // Read path
    // ============================================================================

    auto Btree::find_node(std::string_view key, storage::NodeView &node) -> core::Status {
        if (tree_.root == core::INVALID_PAGE) {
            return core::Status::NotFound("tree is empty");
        }

        core::PageId pgno = tree_.root;
        for (uint32_t level = 0;; level++) {
            if (level >= tree_.depth) {
                return core::Status::Corruption(
                    fmt::format("tree rooted at {} is deeper than its recorded depth {}",
                                tree_.root, tree_.depth));
            }
            const char *page = nullptr;
            auto status = txn_.page(pgno, page);
            if (!status.ok())
                return status;

            auto hdr = storage::page_header(page);
            size_t n = storage::page_entries(hdr);

            if (hdr.flags & storage::PAGE_BRANCH) {
                // Last child whose separator is <= key; entry 0 has no separator.
                size_t lo = 1, hi = n;
                while (lo < hi) {
                    size_t mid = lo + (hi - lo) / 2;
                    if (compare(key, storage::node_at(page, mid).key) < 0) {
                        hi = mid;
                    } else {
                        lo = mid + 1;
                    }
                }
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
                if (compare(storage::node_at(page, mid).key, key) < 0) {
                    lo = mid + 1;
                } else {
                    hi = mid;
                }
            }
            if (lo < n) {
                auto candidate = storage::node_at(page, lo);
                if (compare(candidate.key, key) == 0) {
                    node = candidate;
                    return core::Status::Ok();
                }
            }
            return core::Status::NotFound(fmt::format("key of {} bytes not found", key.size()));
        }
    }

    auto Btree::get(std::string_view key, core::Slice &value) -> core::Status {
        storage::NodeView node;
        auto status = find_node(key, node);
        if (!status.ok())
            return status;

        if (node.flags & storage::NODE_DUPTREE) {
            // First duplicate: leftmost key of the nested tree.
            auto sub = storage::decode_tree_record(node.payload);
            core::PageId pgno = sub.root;
            for (uint32_t level = 0; pgno != core::INVALID_PAGE; level++) {
                const char *page = nullptr;
                status = txn_.page(pgno, page);
                if (!status.ok())
                    return status;
                auto hdr = storage::page_header(page);
                if (level >= sub.depth || storage::page_entries(hdr) == 0) {
                    break;
                }
                if (hdr.flags & storage::PAGE_BRANCH) {
                    pgno = storage::branch_child(storage::node_at(page, 0));
                    continue;
                }
                value = core::Slice(storage::node_at(page, 0).key, txn_.lifetime());
                return core::Status::Ok();
            }
            return core::Status::Corruption("duplicate set without values");
        }

        std::string_view bytes;
        status = read_value(txn_, node, bytes);
        if (!status.ok())
            return status;
        value = core::Slice(bytes, txn_.lifetime());
        return core::Status::Ok();
    }

    auto Btree::load_image(core::PageId pgno, PageImage &out) -> core::Status {
        const char *page = nullptr;
        auto status = txn_.page(pgno, page);
        if (!status.ok())
            return status;
        if (!(storage::page_header(page).flags & (storage::PAGE_BRANCH | storage::PAGE_LEAF))) {
            return core::Status::Corruption(
                fmt::format("page {} in tree is neither branch nor leaf", pgno));
        }
        out = decode_image(page);
        return core::Status::Ok();
    }

    auto Btree::child_index(const PageImage &branch, std::string_view key) const -> size_t {
        // upper_bound over the separators
        size_t lo = 0, hi = branch.keys.size();
        while (lo < hi) {
            size_t mid = lo + (hi - lo) / 2;
            if (compare(key, branch.keys[mid]) < 0) {
                hi = mid;
            } else {
                lo = mid + 1;
            }
        }
        return lo;
    }

    auto Btree::search_leaf(const PageImage &leaf, std::string_view key, bool &exact) const
        -> size_t {
        size_t lo = 0, hi = leaf.keys.size();
        while (lo < hi) {
            size_t mid = lo + (hi - lo) / 2;
            if (compare(leaf.keys[mid], key) < 0) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        exact = lo < leaf.keys.size() && compare(leaf.keys[lo], key) == 0;
        return lo;
    }

    auto Btree::descend(std::string_view key, std::vector<PathFrame> &path) -> core::Status {
        path.clear();
        core::PageId pgno = tree_.root;
        size_t child_idx = 0;

        for (;;) {
            if (path.size() >= tree_.depth) {
                return core::Status::Corruption(
                    fmt::format("tree rooted at {} is deeper than its recorded depth {}",
                                tree_.root, tree_.depth));
            }
            PathFrame frame{pgno, PageImage{}, child_idx};
            auto status = load_image(pgno, frame.image);
            if (!status.ok())
                return status;

            if (frame.image.is_leaf()) {
                path.push_back(std::move(frame));
                return core::Status::Ok();
            }
            child_idx = child_index(frame.image, key);
            pgno = frame.image.children[child_idx];
            path.push_back(std::move(frame));
        }
    }

    // ============================================================================
    // Values
    // ============================================================================

    auto Btree::make_value(std::string_view key, std::string_view value, LeafValue &out)
        -> core::Status {
        if (leaf_entry_size(key.size(), value.size()) <= storage::NODE_MAX) {
            out = LeafValue{0, static_cast<uint32_t>(value.size()), std::string(value)};
            return core::Status::Ok();
        }

        uint32_t run = storage::overflow_run(value.size());
        core::PageId pgno = core::INVALID_PAGE;
        char *buffer = nullptr;
        auto status = txn_.allocate(run, pgno, buffer);
        if (!status.ok())
            return status;

        storage::PageHeader hdr{};
        hdr.pgno = pgno;
        hdr.flags = storage::PAGE_OVERFLOW;
        hdr.overflow_pages = run;
        storage::store(buffer, hdr);
        std::memcpy(buffer + storage::PAGE_HEADER_SIZE, value.data(), value.size());
        tree_.overflow_pages += run;

        std::string ref(sizeof(core::PageId), '\0');
        storage::store(ref.data(), pgno);
        out = LeafValue{storage::NODE_BIGDATA, static_cast<uint32_t>(value.size()),
                        std::move(ref)};
        return core::Status::Ok();
    }

    auto Btree::free_value(const LeafValue &value) -> core::Status {
        if (value.flags & storage::NODE_BIGDATA) {
            auto pgno = storage::load<core::PageId>(value.payload.data());
            const char *page = nullptr;
            auto status = txn_.page(pgno, page);
            if (!status.ok())
                return status;
            uint32_t run = storage::page_header(page).overflow_pages;
            txn_.free_pages(pgno, run);
            tree_.overflow_pages -= run;
            return core::Status::Ok();
        }
        if (value.flags & storage::NODE_DUPTREE) {
            auto sub = storage::decode_tree_record(value.payload);
            Btree subtree(txn_, sub, dup_ctx_);
            return subtree.drop();
        }
        return core::Status::Ok();
    }

    auto Btree::dup_insert(LeafValue &slot, std::string_view value, core::PutFlags flags,
                           bool &inserted) -> core::Status {
        inserted = false;
        auto sub = storage::decode_tree_record(slot.payload);
        Btree subtree(txn_, sub, dup_ctx_);

        storage::NodeView existing;
        auto status = subtree.find_node(value, existing);
        if (status.ok()) {
            if (core::has_flag(flags, core::PutFlags::NoDupData)) {
                return core::Status::KeyExists("duplicate value already present");
            }
            return core::Status::Ok();
        }
        if (!status.is_not_found())
            return status;

        status = subtree.put(value, {});
        if (!status.ok())
            return status;
        slot.payload = storage::encode_tree_record(sub);
        inserted = true;
        return core::Status::Ok();
    }

    // ============================================================================
    // Write path
    // ============================================================================

    auto Btree::put(std::string_view key, std::string_view value, core::PutFlags flags)
        -> core::Status {
        if (key.size() > ctx_.max_key_size) {
            return core::Status::KeyTooLarge(fmt::format(
                "key of {} bytes exceeds the {}-byte limit", key.size(), ctx_.max_key_size));
        }
        if (ctx_.dupsort && value.size() > ctx_.max_key_size) {
            return core::Status::KeyTooLarge(
                fmt::format("duplicate value of {} bytes exceeds the {}-byte limit", value.size(),
                            ctx_.max_key_size));
        }
        if (value.size() > std::numeric_limits<uint32_t>::max()) {
            return core::Status::InvalidArgument(
                fmt::format("value of {} bytes is too large", value.size()));
        }

        auto new_slot = [&](LeafValue &slot) -> core::Status {
            if (!ctx_.dupsort)
                return make_value(key, value, slot);
            storage::TreeRecord sub;
            Btree subtree(txn_, sub, dup_ctx_);
            auto status = subtree.put(value, {});
            if (!status.ok())
                return status;
            slot = LeafValue{storage::NODE_DUPTREE, sizeof(storage::TreeRecord),
                             storage::encode_tree_record(sub)};
            return core::Status::Ok();
        };

        if (tree_.root == core::INVALID_PAGE) {
            PageImage leaf(NodeType::Leaf);
            LeafValue slot;
            auto status = new_slot(slot);
            if (!status.ok())
                return status;
            leaf.keys.emplace_back(key);
            leaf.values.push_back(std::move(slot));

            core::PageId pgno = core::INVALID_PAGE;
            status = write_image(leaf, core::INVALID_PAGE, pgno);
            if (!status.ok())
                return status;
            tree_.root = pgno;
            tree_.depth = 1;
            count_page(NodeType::Leaf, 1);
            tree_.entries++;
            return core::Status::Ok();
        }

        std::vector<PathFrame> path;
        auto status = descend(key, path);
        if (!status.ok())
            return status;

        auto &leaf = path.back().image;
        bool exact = false;
        size_t idx = search_leaf(leaf, key, exact);

        if (exact) {
            auto &slot = leaf.values[idx];
            if (slot.flags & storage::NODE_SUBDB) {
                return core::Status::Incompatible("key names a database");
            }
            if (core::has_flag(flags, core::PutFlags::NoOverwrite)) {
                return core::Status::KeyExists("key already present");
            }
            if (ctx_.dupsort) {
                bool inserted = false;
                status = dup_insert(slot, value, flags, inserted);
                if (!status.ok() || !inserted)
                    return status;
                tree_.entries++;
            } else {
                status = free_value(slot);
                if (!status.ok())
                    return status;
                status = make_value(key, value, slot);
                if (!status.ok())
                    return status;
            }
        } else {
            LeafValue slot;
            status = new_slot(slot);
            if (!status.ok())
                return status;
            leaf.keys.emplace(leaf.keys.begin() + static_cast<std::ptrdiff_t>(idx), key);
            leaf.values.insert(leaf.values.begin() + static_cast<std::ptrdiff_t>(idx),
                               std::move(slot));
            tree_.entries++;
        }

        return rewrite_path(path);
    }

    auto Btree::put_record(std::string_view name, const storage::TreeRecord &record)
        -> core::Status {
        LeafValue slot{storage::NODE_SUBDB, sizeof(storage::TreeRecord),
                       storage::encode_tree_record(record)};

        if (tree_.root == core::INVALID_PAGE) {
            PageImage leaf(NodeType::Leaf);
            leaf.keys.emplace_back(name);
            leaf.values.push_back(std::move(slot));
            core::PageId pgno = core::INVALID_PAGE;
            auto status = write_image(leaf, core::INVALID_PAGE, pgno);
            if (!status.ok())
                return status;
            tree_.root = pgno;
            tree_.depth = 1;
            count_page(NodeType::Leaf, 1);
            tree_.entries++;
            return core::Status::Ok();
        }

        std::vector<PathFrame> path;
        auto status = descend(name, path);
        if (!status.ok())
            return status;

        auto &leaf = path.back().image;
        bool exact = false;
        size_t idx = search_leaf(leaf, name, exact);
        if (exact) {
            if (!(leaf.values[idx].flags & storage::NODE_SUBDB)) {
                return core::Status::Incompatible(
                    fmt::format("main database key '{}' is not a database record", name));
            }
            leaf.values[idx] = std::move(slot);
        } else {
            leaf.keys.emplace(leaf.keys.begin() + static_cast<std::ptrdiff_t>(idx), name);
            leaf.values.insert(leaf.values.begin() + static_cast<std::ptrdiff_t>(idx),
                               std::move(slot));
            tree_.entries++;
        }
        return rewrite_path(path);
    }

    auto Btree::remove(std::string_view key) -> core::Status {
        return remove_entry(key, false);
    }

    auto Btree::remove_record(std::string_view name) -> core::Status {
        return remove_entry(name, true);
    }

    auto Btree::remove_entry(std::string_view key, bool records) -> core::Status {
        if (tree_.root == core::INVALID_PAGE) {
            return core::Status::NotFound("tree is empty");
        }

        std::vector<PathFrame> path;
        auto status = descend(key, path);
        if (!status.ok())
            return status;

        auto &leaf = path.back().image;
        bool exact = false;
        size_t idx = search_leaf(leaf, key, exact);
        if (!exact) {
            return core::Status::NotFound(
                fmt::format("key of {} bytes not found for deletion", key.size()));
        }

        const auto &slot = leaf.values[idx];
        const bool is_record = slot.flags & storage::NODE_SUBDB;
        if (is_record != records) {
            return core::Status::Incompatible(is_record ? "key names a database"
                                                        : "key is not a database record");
        }

        if (slot.flags & storage::NODE_DUPTREE) {
            tree_.entries -= storage::decode_tree_record(slot.payload).entries;
        } else {
            tree_.entries--;
        }
        if (!is_record) {
            status = free_value(slot);
            if (!status.ok())
                return status;
        }

        leaf.keys.erase(leaf.keys.begin() + static_cast<std::ptrdiff_t>(idx));
        leaf.values.erase(leaf.values.begin() + static_cast<std::ptrdiff_t>(idx));
        return rewrite_path(path);
    }

    auto Btree::remove(std::string_view key, std::string_view value) -> core::Status {
        if (!ctx_.dupsort) {
            storage::NodeView node;
            auto status = find_node(key, node);
            if (!status.ok())
                return status;
            std::string_view current;
            status = read_value(txn_, node, current);
            if (!status.ok())
                return status;
            if (current != value) {
                return core::Status::NotFound("key does not hold the given value");
            }
            return remove_entry(key, false);
        }

        if (tree_.root == core::INVALID_PAGE) {
            return core::Status::NotFound("tree is empty");
        }

        std::vector<PathFrame> path;
        auto status = descend(key, path);
        if (!status.ok())
            return status;

        auto &leaf = path.back().image;
        bool exact = false;
        size_t idx = search_leaf(leaf, key, exact);
        if (!exact) {
            return core::Status::NotFound(
                fmt::format("key of {} bytes not found for deletion", key.size()));
        }

        auto &slot = leaf.values[idx];
        auto sub = storage::decode_tree_record(slot.payload);
        Btree subtree(txn_, sub, dup_ctx_);
        status = subtree.remove(value);
        if (!status.ok())
            return status;
        tree_.entries--;

        if (sub.entries == 0) {
            leaf.keys.erase(leaf.keys.begin() + static_cast<std::ptrdiff_t>(idx));
            leaf.values.erase(leaf.values.begin() + static_cast<std::ptrdiff_t>(idx));
        } else {
            slot.payload = storage::encode_tree_record(sub);
        }
        return rewrite_path(path);
    }

    // Re-encodes the path bottom-up. Each level is rebalanced or split as needed and the
    // resulting page numbers are patched into its parent image.
    auto Btree::rewrite_path(std::vector<PathFrame> &path) -> core::Status {
        for (size_t level = path.size(); level-- > 0;) {
            auto &frame = path[level];

            if (level > 0 && frame.image.underfilled()) {
                auto status = rebalance(path, level);
                if (!status.ok())
                    return status;
            }

            if (level == 0) {
                if (frame.image.is_leaf() && frame.image.keys.empty()) {
                    txn_.free_pages(frame.pgno, 1);
                    count_page(NodeType::Leaf, -1);
                    tree_.root = core::INVALID_PAGE;
                    tree_.depth = 0;
                    return core::Status::Ok();
                }
                if (!frame.image.is_leaf() && frame.image.children.size() == 1) {
                    // Lower levels were stored already; drop every single-child branch
                    // at the top of the path.
                    core::PageId pgno = frame.pgno;
                    size_t top = 0;
                    while (top < path.size() && !path[top].image.is_leaf() &&
                           path[top].image.children.size() == 1) {
                        txn_.free_pages(pgno, 1);
                        count_page(NodeType::Branch, -1);
                        tree_.depth--;
                        pgno = path[top].image.children[0];
                        top++;
                    }
                    if (top < path.size() && path[top].image.is_leaf() &&
                        path[top].image.keys.empty()) {
                        txn_.free_pages(pgno, 1);
                        count_page(NodeType::Leaf, -1);
                        pgno = core::INVALID_PAGE;
                        tree_.depth = 0;
                    }
                    tree_.root = pgno;
                    return core::Status::Ok();
                }
            }

            std::vector<Piece> pieces;
            auto status = store_node(frame.image, frame.pgno, pieces);
            if (!status.ok())
                return status;

            if (level > 0) {
                insert_into_parent(path[level - 1].image, frame.child_idx, pieces);
                continue;
            }

            // Root split: grow the tree by one level until a single root remains.
            while (pieces.size() > 1) {
                PageImage root(NodeType::Branch);
                for (size_t i = 0; i < pieces.size(); i++) {
                    if (i > 0)
                        root.keys.push_back(std::move(pieces[i].separator));
                    root.children.push_back(pieces[i].pgno);
                }
                count_page(NodeType::Branch, 1);
                tree_.depth++;

                std::vector<Piece> upper;
                status = store_node(root, core::INVALID_PAGE, upper);
                if (!status.ok())
                    return status;
                pieces = std::move(upper);
            }
            tree_.root = pieces.front().pgno;
        }
        return core::Status::Ok();
    }

    auto Btree::store_node(PageImage &image, core::PageId old_pgno, std::vector<Piece> &out)
        -> core::Status {
        if (image.fits()) {
            core::PageId pgno = core::INVALID_PAGE;
            auto status = write_image(image, old_pgno, pgno);
            if (!status.ok())
                return status;
            out.push_back(Piece{core::Key{}, pgno});
            return core::Status::Ok();
        }

        PageImage right(image.type);
        core::Key separator;
        split(image, right, separator);
        count_page(image.type, 1);

        auto status = store_node(image, old_pgno, out);
        if (!status.ok())
            return status;
        size_t first_right = out.size();
        status = store_node(right, core::INVALID_PAGE, out);
        if (!status.ok())
            return status;
        out[first_right].separator = std::move(separator);
        return core::Status::Ok();
    }

    auto Btree::write_image(const PageImage &image, core::PageId old_pgno, core::PageId &pgno)
        -> core::Status {
        if (old_pgno != core::INVALID_PAGE) {
            if (char *buffer = txn_.dirty_page(old_pgno)) {
                encode_image(image, old_pgno, buffer);
                pgno = old_pgno;
                return core::Status::Ok();
            }
        }

        char *buffer = nullptr;
        auto status = txn_.allocate(1, pgno, buffer);
        if (!status.ok())
            return status;
        encode_image(image, pgno, buffer);
        if (old_pgno != core::INVALID_PAGE) {
            txn_.free_pages(old_pgno, 1);
        }
        return core::Status::Ok();
    }

    // Splits at the byte median. Leaves promote a copy of the right half's first key;
    // branches move the separator between the halves up.
    auto Btree::split(PageImage &image, PageImage &right, core::Key &separator) -> void {
        const size_t n = image.count();
        const size_t total = image.encoded_size();

        size_t at = n - 1;
        size_t acc = 0;
        for (size_t i = 0; i < n; i++) {
            acc += image.entry_size(i);
            if (acc >= total / 2) {
                at = i + 1;
                break;
            }
        }

        if (image.is_leaf()) {
            at = std::clamp<size_t>(at, 1, n - 1);
            auto split_at = static_cast<std::ptrdiff_t>(at);
            right.keys.assign(std::make_move_iterator(image.keys.begin() + split_at),
                              std::make_move_iterator(image.keys.end()));
            right.values.assign(std::make_move_iterator(image.values.begin() + split_at),
                                std::make_move_iterator(image.values.end()));
            image.keys.resize(at);
            image.values.resize(at);
            separator = right.keys.front();
            return;
        }

        // `at` is the first child of the right half; both halves keep two children.
        at = std::clamp<size_t>(at, 2, n - 2);
        auto child_at = static_cast<std::ptrdiff_t>(at);
        separator = std::move(image.keys[at - 1]);
        right.keys.assign(std::make_move_iterator(image.keys.begin() + child_at),
                          std::make_move_iterator(image.keys.end()));
        right.children.assign(image.children.begin() + child_at, image.children.end());
        image.keys.resize(at - 1);
        image.children.resize(at);
    }

    auto Btree::insert_into_parent(PageImage &parent, size_t idx,
                                   const std::vector<Piece> &pieces) -> void {
        parent.children[idx] = pieces.front().pgno;
        for (size_t i = 1; i < pieces.size(); i++) {
            parent.keys.insert(parent.keys.begin() + static_cast<std::ptrdiff_t>(idx + i - 1),
                               pieces[i].separator);
            parent.children.insert(
                parent.children.begin() + static_cast<std::ptrdiff_t>(idx + i), pieces[i].pgno);
        }
    }

    // ============================================================================
    // Rebalancing
    // ============================================================================

    auto Btree::rebalance(std::vector<PathFrame> &path, size_t level) -> core::Status {
        auto &frame = path[level];
        auto &parent = path[level - 1].image;
        const size_t idx = frame.child_idx;

        std::optional<PageImage> left;
        std::optional<PageImage> right;
        core::PageId left_pgno = core::INVALID_PAGE;
        core::PageId right_pgno = core::INVALID_PAGE;

        if (idx > 0) {
            left_pgno = parent.children[idx - 1];
            left.emplace();
            auto status = load_image(left_pgno, *left);
            if (!status.ok())
                return status;
        }
        if (idx + 1 < parent.children.size()) {
            right_pgno = parent.children[idx + 1];
            right.emplace();
            auto status = load_image(right_pgno, *right);
            if (!status.ok())
                return status;
        }

        // Borrow one entry from a sibling that stays above the fill threshold.
        if (right) {
            PageImage node = frame.image;
            PageImage sibling = *right;
            core::Key separator = parent.keys[idx];
            borrow_from_right(node, sibling, separator);
            if (node.fits() && !sibling.underfilled()) {
                core::PageId pgno = core::INVALID_PAGE;
                auto status = write_image(sibling, right_pgno, pgno);
                if (!status.ok())
                    return status;
                parent.children[idx + 1] = pgno;
                parent.keys[idx] = std::move(separator);
                frame.image = std::move(node);
                return core::Status::Ok();
            }
        }
        if (left) {
            PageImage node = frame.image;
            PageImage sibling = *left;
            core::Key separator = parent.keys[idx - 1];
            borrow_from_left(node, sibling, separator);
            if (node.fits() && !sibling.underfilled()) {
                core::PageId pgno = core::INVALID_PAGE;
                auto status = write_image(sibling, left_pgno, pgno);
                if (!status.ok())
                    return status;
                parent.children[idx - 1] = pgno;
                parent.keys[idx - 1] = std::move(separator);
                frame.image = std::move(node);
                return core::Status::Ok();
            }
        }

        // Otherwise merge when the combined page fits.
        if (left) {
            PageImage merged = std::move(*left);
            merge_into(merged, frame.image, parent.keys[idx - 1]);
            if (merged.fits()) {
                txn_.free_pages(frame.pgno, 1);
                count_page(frame.image.type, -1);
                parent.keys.erase(parent.keys.begin() + static_cast<std::ptrdiff_t>(idx - 1));
                parent.children.erase(parent.children.begin() + static_cast<std::ptrdiff_t>(idx));
                frame.pgno = left_pgno;
                frame.image = std::move(merged);
                frame.child_idx = idx - 1;
                return core::Status::Ok();
            }
        }
        if (right) {
            PageImage merged = frame.image;
            merge_into(merged, *right, parent.keys[idx]);
            if (merged.fits()) {
                txn_.free_pages(right_pgno, 1);
                count_page(frame.image.type, -1);
                parent.keys.erase(parent.keys.begin() + static_cast<std::ptrdiff_t>(idx));
                parent.children.erase(parent.children.begin() +
                                      static_cast<std::ptrdiff_t>(idx + 1));
                frame.image = std::move(merged);
                return core::Status::Ok();
            }
        }

        ARBOR_LOG_TRACE("Page {} stays underfilled: siblings can neither lend nor merge",
                        frame.pgno);
        return core::Status::Ok();
    }

    auto Btree::borrow_from_left(PageImage &node, PageImage &left, core::Key &separator)
        -> void {
        if (node.is_leaf()) {
            node.keys.insert(node.keys.begin(), std::move(left.keys.back()));
            node.values.insert(node.values.begin(), std::move(left.values.back()));
            left.keys.pop_back();
            left.values.pop_back();
            separator = node.keys.front();
            return;
        }
        node.keys.insert(node.keys.begin(), std::move(separator));
        node.children.insert(node.children.begin(), left.children.back());
        separator = std::move(left.keys.back());
        left.keys.pop_back();
        left.children.pop_back();
    }

    auto Btree::borrow_from_right(PageImage &node, PageImage &right, core::Key &separator)
        -> void {
        if (node.is_leaf()) {
            node.keys.push_back(std::move(right.keys.front()));
            node.values.push_back(std::move(right.values.front()));
            right.keys.erase(right.keys.begin());
            right.values.erase(right.values.begin());
            separator = right.keys.empty() ? core::Key{} : right.keys.front();
            return;
        }
        node.keys.push_back(std::move(separator));
        node.children.push_back(right.children.front());
        separator = std::move(right.keys.front());
        right.keys.erase(right.keys.begin());
        right.children.erase(right.children.begin());
    }

    // Appends `src` to `dst`; branch halves are joined by their parent separator.
    auto Btree::merge_into(PageImage &dst, PageImage &src, const core::Key &separator) -> void {
        if (dst.is_leaf()) {
            dst.keys.insert(dst.keys.end(), src.keys.begin(), src.keys.end());
            dst.values.insert(dst.values.end(), src.values.begin(), src.values.end());
            return;
        }
        dst.keys.push_back(separator);
        dst.keys.insert(dst.keys.end(), src.keys.begin(), src.keys.end());
        dst.children.insert(dst.children.end(), src.children.begin(), src.children.end());
    }

    auto Btree::count_page(NodeType type, int delta) -> void {
        auto &counter = type == NodeType::Leaf ? tree_.leaf_pages : tree_.branch_pages;
        counter += static_cast<uint64_t>(static_cast<int64_t>(delta));
    }

    // ============================================================================
    // Drop / stat
    // ============================================================================

    auto Btree::drop() -> core::Status {
        if (tree_.root != core::INVALID_PAGE) {
            auto status = free_subtree(tree_.root);
            if (!status.ok())
                return status;
        }
        uint32_t flags = tree_.flags;
        tree_ = storage::TreeRecord{};
        tree_.flags = flags;
        return core::Status::Ok();
    }

    auto Btree::free_subtree(core::PageId pgno) -> core::Status {
        const char *page = nullptr;
        auto status = txn_.page(pgno, page);
        if (!status.ok())
            return status;

        auto hdr = storage::page_header(page);
        size_t n = storage::page_entries(hdr);
        for (size_t i = 0; i < n; i++) {
            auto node = storage::node_at(page, i);
            if (hdr.flags & storage::PAGE_BRANCH) {
                status = free_subtree(storage::branch_child(node));
            } else if (node.flags & storage::NODE_BIGDATA) {
                status = free_value(LeafValue{node.flags, node.dsize, std::string(node.payload)});
            } else if (node.flags & storage::NODE_DUPTREE) {
                auto sub = storage::decode_tree_record(node.payload);
                if (sub.root != core::INVALID_PAGE)
                    status = free_subtree(sub.root);
            }
            if (!status.ok())
                return status;
        }
        txn_.free_pages(pgno, 1);
        return core::Status::Ok();
    }

    auto Btree::stat() const -> TreeStat {
        TreeStat stat;
        stat.depth = tree_.depth;
        stat.branch_pages = tree_.branch_pages;
        stat.leaf_pages = tree_.leaf_pages;
        stat.overflow_pages = tree_.overflow_pages;
        stat.entries = tree_.entries;
        return stat;
    }

    auto Btree::print_tree() -> void {
        if (tree_.root == core::INVALID_PAGE) {
            ARBOR_LOG_DEBUG("B+tree structure: <empty>");
            return;
        }
        std::vector<core::PageId> current_level{tree_.root};
        std::string tree_output;

        while (!current_level.empty()) {
            std::vector<core::PageId> next_level;
            fmt::memory_buffer level_buf;

            for (auto pgno : current_level) {
                PageImage image;
                auto status = load_image(pgno, image);
                if (!status.ok()) {
                    ARBOR_LOG_ERROR("B+tree dump stopped at page {}: {}", pgno,
                                    status.to_string());
                    return;
                }
                fmt::format_to(std::back_inserter(level_buf), "[{}{}:{}] ", image.is_leaf() ? "L" : "B",
                               pgno, image.count());
                next_level.insert(next_level.end(), image.children.begin(), image.children.end());
            }
            fmt::format_to(std::back_inserter(level_buf), "\n");
            tree_output.append(level_buf.begin(), level_buf.end());
            current_level = std::move(next_level);
        }
        ARBOR_LOG_DEBUG("B+tree structure (depth {}, {} entries):\n{}", tree_.depth,
                        tree_.entries, tree_output);
    }

} // namespace arbor::indexing
