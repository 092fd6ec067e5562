#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace arbor::storage {
    // CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320), used for meta records.
    auto compute_crc32(const void *data, size_t len) -> uint32_t;

    // Continues a running checksum; extend_crc32(0, ...) == compute_crc32(...).
    auto extend_crc32(uint32_t crc, const void *data, size_t len) -> uint32_t;

    inline auto compute_crc32(std::string_view bytes) -> uint32_t {
        return compute_crc32(bytes.data(), bytes.size());
    }
} // namespace arbor::storage
