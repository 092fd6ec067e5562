#include "storage/checksum.hpp"
#include <array>

namespace arbor::storage {

    static constexpr auto make_table() -> std::array<uint32_t, 256> {
        std::array<uint32_t, 256> table{};
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t crc = i;
            for (uint32_t j = 0; j < 8; j++) {
                crc = (crc >> 1) ^ ((crc & 1) ? 0xEDB88320u : 0u);
            }
            table[i] = crc;
        }
        return table;
    }

    static constexpr auto CRC32_TABLE = make_table();

    auto extend_crc32(uint32_t crc, const void *data, size_t len) -> uint32_t {
        const auto *bytes = static_cast<const uint8_t *>(data);
        crc = ~crc;
        for (size_t i = 0; i < len; i++) {
            crc = CRC32_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
        }
        return ~crc;
    }

    auto compute_crc32(const void *data, size_t len) -> uint32_t {
        return extend_crc32(0, data, len);
    }
} // namespace arbor::storage
