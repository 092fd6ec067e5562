#pragma once

#include "core/common.hpp"
#include "storage/format.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace arbor::indexing {

    enum class NodeType { Branch, Leaf };

    struct LeafValue {
        uint16_t flags = 0;   // storage::NodeFlags
        uint32_t size = 0;    // logical value size
        std::string payload;  // inline bytes, overflow page number or tree record
    };

    // Decoded, mutable copy of one tree page. Writers edit images and encode them back
    // into freshly allocated (or already dirty) pages.
    //
    // Branch layout: children.size() == keys.size() + 1, and keys[i] is the smallest key
    // reachable through children[i + 1].
    struct PageImage {
        NodeType type;
        std::vector<core::Key> keys;
        std::vector<LeafValue> values;       // leaf only
        std::vector<core::PageId> children;  // branch only

        explicit PageImage(NodeType t = NodeType::Leaf) : type(t) {}

        [[nodiscard]] auto is_leaf() const -> bool {
            return type == NodeType::Leaf;
        }

        // Number of page entries: leaf items or branch children.
        [[nodiscard]] auto count() const -> size_t {
            return is_leaf() ? keys.size() : children.size();
        }

        // Bytes entry `idx` takes on the page, slot included.
        [[nodiscard]] auto entry_size(size_t idx) const -> size_t;
        [[nodiscard]] auto encoded_size() const -> size_t;

        [[nodiscard]] auto fits() const -> bool {
            return encoded_size() <= storage::PAGE_USABLE;
        }

        // Non-root pages in this state get merged or topped up from a sibling.
        [[nodiscard]] auto underfilled() const -> bool;
    };

    // On-page size of a leaf item with the given key and payload lengths.
    inline auto leaf_entry_size(size_t ksize, size_t payload) -> size_t {
        return storage::SLOT_SIZE + storage::NODE_HEADER_SIZE + ksize + payload;
    }

    // Caller guarantees `page` passed storage::validate_page().
    auto decode_image(const char *page) -> PageImage;

    // Writes `image` as page `pgno` into a PAGE_SIZE buffer; the image must fit.
    void encode_image(const PageImage &image, core::PageId pgno, char *page);

} // namespace arbor::indexing
