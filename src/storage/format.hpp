#pragma once

#include "core/common.hpp"
#include "core/status.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace arbor::storage {

    constexpr uint32_t META_MAGIC = 0x41524230; // "ARB0"
    constexpr uint32_t FORMAT_VERSION = 1;
    constexpr uint32_t NUM_METAS = 2;

    constexpr size_t PAGE_HEADER_SIZE = 24;
    constexpr size_t NODE_HEADER_SIZE = 8;
    constexpr size_t SLOT_SIZE = 2;
    constexpr size_t PAGE_USABLE = core::PAGE_SIZE - PAGE_HEADER_SIZE;

    // A node (slot included) never exceeds a quarter of the usable area, so every
    // page holds at least four entries and a median split always fits.
    constexpr size_t NODE_MAX = PAGE_USABLE / 4;

    // Non-root pages below this encoded size are rebalanced.
    constexpr size_t FILL_THRESHOLD = PAGE_USABLE / 4;

    enum PageFlags : uint16_t {
        PAGE_BRANCH = 0x01,
        PAGE_LEAF = 0x02,
        PAGE_OVERFLOW = 0x04,
        PAGE_META = 0x08,
        PAGE_FREE_CHAIN = 0x10
    };

    enum NodeFlags : uint16_t {
        NODE_BIGDATA = 0x01, // payload is the first page of an overflow run
        NODE_SUBDB = 0x02,   // payload is a TreeRecord of a named database
        NODE_DUPTREE = 0x04  // payload is a TreeRecord of a nested duplicate tree
    };

    struct PageHeader {
        core::PageId pgno;
        uint16_t flags;
        uint16_t lower; // end of the slot array
        uint16_t upper; // start of node data
        uint16_t reserved;
        uint32_t overflow_pages; // run length of an overflow page
        uint32_t reserved2;
    };
    static_assert(sizeof(PageHeader) == PAGE_HEADER_SIZE);

    struct NodeHeader {
        uint16_t flags;
        uint16_t ksize;
        uint32_t dsize; // logical value size; payload is 8 bytes for BIGDATA and branches
    };
    static_assert(sizeof(NodeHeader) == NODE_HEADER_SIZE);

    // Root and counters of one B+tree.
    struct TreeRecord {
        uint32_t flags = 0; // persisted DbFlags bits
        uint32_t depth = 0;
        uint64_t branch_pages = 0;
        uint64_t leaf_pages = 0;
        uint64_t overflow_pages = 0;
        uint64_t entries = 0;
        core::PageId root = core::INVALID_PAGE;
    };
    static_assert(sizeof(TreeRecord) == 48);

    struct MetaRecord {
        uint32_t magic = META_MAGIC;
        uint32_t version = FORMAT_VERSION;
        uint32_t page_size = core::PAGE_SIZE;
        uint32_t reserved = 0;
        uint64_t map_size = 0;
        uint64_t next_pgno = NUM_METAS; // first page never handed out
        core::TransactionId txnid = 0;
        core::PageId free_head = core::INVALID_PAGE;
        TreeRecord main;
        uint32_t checksum = 0;
        uint32_t reserved2 = 0;
    };
    static_assert(sizeof(MetaRecord) == 104);

    constexpr size_t META_CHECKSUM_OFFSET = offsetof(MetaRecord, checksum);

    // Free-chain page: header, next chain page, word count, then 64-bit words.
    constexpr size_t FREE_CHAIN_PREFIX = PAGE_HEADER_SIZE + 16;
    constexpr size_t FREE_CHAIN_WORDS = (core::PAGE_SIZE - FREE_CHAIN_PREFIX) / sizeof(uint64_t);

    template <typename T> inline auto load(const char *src) -> T {
        T out;
        std::memcpy(&out, src, sizeof(T));
        return out;
    }

    template <typename T> inline void store(char *dst, const T &value) {
        std::memcpy(dst, &value, sizeof(T));
    }

    inline auto page_header(const char *page) -> PageHeader {
        return load<PageHeader>(page);
    }

    inline auto page_entries(const PageHeader &hdr) -> size_t {
        return (hdr.lower - PAGE_HEADER_SIZE) / SLOT_SIZE;
    }

    inline auto overflow_run(size_t value_size) -> uint32_t {
        return static_cast<uint32_t>((PAGE_HEADER_SIZE + value_size + core::PAGE_SIZE - 1) /
                                     core::PAGE_SIZE);
    }

    // Decoded node of a branch or leaf page; views point into the page.
    struct NodeView {
        uint16_t flags = 0;
        uint32_t dsize = 0;
        std::string_view key;
        std::string_view payload;
    };

    // Caller guarantees the page passed validate_page() and idx < page_entries().
    inline auto node_at(const char *page, size_t idx) -> NodeView {
        auto offset = load<uint16_t>(page + PAGE_HEADER_SIZE + idx * SLOT_SIZE);
        auto hdr = load<NodeHeader>(page + offset);
        const char *key = page + offset + NODE_HEADER_SIZE;

        auto hdr_flags = page_header(page).flags;
        size_t payload = (hdr_flags & PAGE_BRANCH) || (hdr.flags & NODE_BIGDATA)
                             ? sizeof(core::PageId)
                             : hdr.dsize;
        return NodeView{hdr.flags, hdr.dsize, std::string_view(key, hdr.ksize),
                        std::string_view(key + hdr.ksize, payload)};
    }

    inline auto branch_child(const NodeView &node) -> core::PageId {
        return load<core::PageId>(node.payload.data());
    }

    inline auto decode_tree_record(std::string_view bytes) -> TreeRecord {
        return load<TreeRecord>(bytes.data());
    }

    inline auto encode_tree_record(const TreeRecord &record) -> std::string {
        return std::string(reinterpret_cast<const char *>(&record), sizeof(record));
    }

    // Structural checks: self page number, kind, slot and node bounds.
    auto validate_page(const char *page, core::PageId expected) -> core::Status;

    auto meta_checksum(const MetaRecord &meta) -> uint32_t;

    // Magic, version, page size and checksum.
    auto validate_meta(const MetaRecord &meta) -> core::Status;

} // namespace arbor::storage
