#include "core/options.hpp"
#include "core/common.hpp"
#include "core/status.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fmt/core.h>

namespace arbor::core {

    auto validate_config(const EnvConfig &config) -> Status {
        if (config.map_size < 4ULL * PAGE_SIZE) {
            return Status::InvalidArgument(
                fmt::format("map_size {} is below the minimum of {} bytes", config.map_size,
                            4ULL * PAGE_SIZE));
        }
        if (config.max_readers == 0) {
            return Status::InvalidArgument("max_readers must be at least 1");
        }
        if (config.max_key_size == 0 || config.max_key_size > MAX_KEY_SIZE_LIMIT) {
            return Status::InvalidArgument(fmt::format("max_key_size {} outside [1, {}]",
                                                       config.max_key_size, MAX_KEY_SIZE_LIMIT));
        }
        return Status::Ok();
    }

    auto lexicographic_compare(std::string_view a, std::string_view b) -> int {
        size_t n = std::min(a.size(), b.size());
        int diff = n ? std::memcmp(a.data(), b.data(), n) : 0;
        if (diff != 0)
            return diff;
        if (a.size() == b.size())
            return 0;
        return a.size() < b.size() ? -1 : 1;
    }

    auto reverse_compare(std::string_view a, std::string_view b) -> int {
        auto ia = a.rbegin();
        auto ib = b.rbegin();
        for (; ia != a.rend() && ib != b.rend(); ++ia, ++ib) {
            auto ca = static_cast<unsigned char>(*ia);
            auto cb = static_cast<unsigned char>(*ib);
            if (ca != cb)
                return ca < cb ? -1 : 1;
        }
        if (a.size() == b.size())
            return 0;
        return a.size() < b.size() ? -1 : 1;
    }

    // Keys are native unsigned integers of 4 or 8 bytes; shorter keys sort first.
    auto integer_compare(std::string_view a, std::string_view b) -> int {
        if (a.size() != b.size())
            return a.size() < b.size() ? -1 : 1;

        if (a.size() == sizeof(uint64_t)) {
            uint64_t x, y;
            std::memcpy(&x, a.data(), sizeof(x));
            std::memcpy(&y, b.data(), sizeof(y));
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        if (a.size() == sizeof(uint32_t)) {
            uint32_t x, y;
            std::memcpy(&x, a.data(), sizeof(x));
            std::memcpy(&y, b.data(), sizeof(y));
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        return lexicographic_compare(a, b);
    }

    auto resolve_comparator(uint32_t persisted_flags, const Comparator &custom) -> Comparator {
        if (custom)
            return custom;
        if (persisted_flags & static_cast<uint32_t>(DbFlags::IntegerKey))
            return integer_compare;
        if (persisted_flags & static_cast<uint32_t>(DbFlags::ReverseKey))
            return reverse_compare;
        return lexicographic_compare;
    }

} // namespace arbor::core
