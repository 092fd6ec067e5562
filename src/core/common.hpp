#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace arbor::core {

    // Constants
    constexpr uint32_t PAGE_SIZE = 4096;
    constexpr uint32_t DEFAULT_MAX_KEY_SIZE = 511;
    constexpr uint32_t MAX_KEY_SIZE_LIMIT = 960; // largest key a node of the page format admits
    constexpr uint64_t DEFAULT_MAP_SIZE = 10ULL * 1024 * 1024;
    constexpr uint32_t DEFAULT_MAX_DATABASES = 8;
    constexpr uint32_t DEFAULT_MAX_READERS = 126;

    using PageId = uint64_t;
    using TransactionId = uint64_t;
    using DbIndex = uint32_t;

    constexpr PageId INVALID_PAGE = ~PageId{0};
    constexpr DbIndex MAIN_DB = 0;

    using Key = std::string;
    using Value = std::string;
    using Bytes = std::string_view;

} // namespace arbor::core
