#include "indexing/page_image.hpp"
#include "core/common.hpp"
#include "storage/format.hpp"
#include <cstring>

namespace arbor::indexing {

    auto PageImage::entry_size(size_t idx) const -> size_t {
        if (is_leaf()) {
            return leaf_entry_size(keys[idx].size(), values[idx].payload.size());
        }
        size_t ksize = idx == 0 ? 0 : keys[idx - 1].size();
        return storage::SLOT_SIZE + storage::NODE_HEADER_SIZE + ksize + sizeof(core::PageId);
    }

    auto PageImage::encoded_size() const -> size_t {
        size_t total = 0;
        for (size_t i = 0; i < count(); i++) {
            total += entry_size(i);
        }
        return total;
    }

    auto PageImage::underfilled() const -> bool {
        if (is_leaf() ? keys.empty() : children.size() < 2)
            return true;
        return encoded_size() < storage::FILL_THRESHOLD;
    }

    auto decode_image(const char *page) -> PageImage {
        auto hdr = storage::page_header(page);
        size_t n = storage::page_entries(hdr);

        if (hdr.flags & storage::PAGE_BRANCH) {
            PageImage image(NodeType::Branch);
            image.children.reserve(n);
            image.keys.reserve(n ? n - 1 : 0);
            for (size_t i = 0; i < n; i++) {
                auto node = storage::node_at(page, i);
                if (i > 0) {
                    image.keys.emplace_back(node.key);
                }
                image.children.push_back(storage::branch_child(node));
            }
            return image;
        }

        PageImage image(NodeType::Leaf);
        image.keys.reserve(n);
        image.values.reserve(n);
        for (size_t i = 0; i < n; i++) {
            auto node = storage::node_at(page, i);
            image.keys.emplace_back(node.key);
            image.values.push_back(LeafValue{node.flags, node.dsize, std::string(node.payload)});
        }
        return image;
    }

    void encode_image(const PageImage &image, core::PageId pgno, char *page) {
        std::memset(page, 0, core::PAGE_SIZE);

        const size_t n = image.count();
        size_t upper = core::PAGE_SIZE;

        for (size_t i = 0; i < n; i++) {
            storage::NodeHeader node{};
            std::string_view key;
            std::string_view payload;
            std::string child_bytes;

            if (image.is_leaf()) {
                key = image.keys[i];
                payload = image.values[i].payload;
                node.flags = image.values[i].flags;
                node.dsize = image.values[i].size;
            } else {
                if (i > 0)
                    key = image.keys[i - 1];
                child_bytes.resize(sizeof(core::PageId));
                storage::store(child_bytes.data(), image.children[i]);
                payload = child_bytes;
            }
            node.ksize = static_cast<uint16_t>(key.size());

            upper -= storage::NODE_HEADER_SIZE + key.size() + payload.size();
            storage::store(page + upper, node);
            // The leftmost branch key is empty and may have no storage behind it.
            if (!key.empty()) {
                std::memcpy(page + upper + storage::NODE_HEADER_SIZE, key.data(), key.size());
            }
            if (!payload.empty()) {
                std::memcpy(page + upper + storage::NODE_HEADER_SIZE + key.size(), payload.data(),
                            payload.size());
            }
            storage::store(page + storage::PAGE_HEADER_SIZE + i * storage::SLOT_SIZE,
                           static_cast<uint16_t>(upper));
        }

        storage::PageHeader hdr{};
        hdr.pgno = pgno;
        hdr.flags = image.is_leaf() ? storage::PAGE_LEAF : storage::PAGE_BRANCH;
        hdr.lower = static_cast<uint16_t>(storage::PAGE_HEADER_SIZE + n * storage::SLOT_SIZE);
        hdr.upper = static_cast<uint16_t>(upper);
        storage::store(page, hdr);
    }

} // namespace arbor::indexing
