#pragma once

#include "core/options.hpp"
#include <cstdint>

namespace arbor::indexing {

    // Per-tree behaviour resolved once when a database is opened in a transaction.
    struct TreeContext {
        core::Comparator compare;
        core::Comparator dup_compare;
        bool dupsort = false;
        bool main = false; // main tree: named-database records live here
        uint32_t max_key_size = core::DEFAULT_MAX_KEY_SIZE;
    };

    struct TreeStat {
        uint32_t page_size = core::PAGE_SIZE;
        uint32_t depth = 0;
        uint64_t branch_pages = 0;
        uint64_t leaf_pages = 0;
        uint64_t overflow_pages = 0;
        uint64_t entries = 0;
    };

} // namespace arbor::indexing
