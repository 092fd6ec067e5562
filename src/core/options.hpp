#pragma once

#include "core/common.hpp"
#include "core/status.hpp"
#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>

namespace arbor::core {

    enum class EnvFlags : uint32_t { None = 0, NoSubdir = 0x1, ReadOnly = 0x2, NoSync = 0x4 };

    // Persisted bits (DupSort, ReverseKey, IntegerKey) live in the tree record.
    enum class DbFlags : uint32_t {
        None = 0,
        DupSort = 0x04,
        ReverseKey = 0x02,
        IntegerKey = 0x08,
        Create = 0x40000
    };

    enum class PutFlags : uint32_t { None = 0, NoOverwrite = 0x10, NoDupData = 0x20 };

    template <typename E>
        requires std::is_enum_v<E>
    constexpr auto operator|(E a, E b) -> E {
        return static_cast<E>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
    }

    template <typename E>
        requires std::is_enum_v<E>
    constexpr auto has_flag(E value, E flag) -> bool {
        return (static_cast<uint32_t>(value) & static_cast<uint32_t>(flag)) != 0;
    }

    constexpr uint32_t PERSISTENT_DB_FLAGS = static_cast<uint32_t>(DbFlags::DupSort) |
                                             static_cast<uint32_t>(DbFlags::ReverseKey) |
                                             static_cast<uint32_t>(DbFlags::IntegerKey);

    // Three-way comparison: negative, zero or positive.
    using Comparator = std::function<int(std::string_view, std::string_view)>;

    struct EnvConfig {
        uint64_t map_size = DEFAULT_MAP_SIZE;
        uint32_t max_databases = DEFAULT_MAX_DATABASES;
        uint32_t max_readers = DEFAULT_MAX_READERS;
        uint32_t max_key_size = DEFAULT_MAX_KEY_SIZE;
        EnvFlags flags = EnvFlags::None;
    };

    struct DatabaseOptions {
        DbFlags flags = DbFlags::None;
        Comparator compare;     // keys; empty selects the flag-based default
        Comparator dup_compare; // duplicate values (DupSort only)
    };

    auto validate_config(const EnvConfig &config) -> Status;

    auto lexicographic_compare(std::string_view a, std::string_view b) -> int;
    auto reverse_compare(std::string_view a, std::string_view b) -> int;
    auto integer_compare(std::string_view a, std::string_view b) -> int;

    // Picks the comparator for a tree given its persisted flags and an optional override.
    auto resolve_comparator(uint32_t persisted_flags, const Comparator &custom) -> Comparator;

} // namespace arbor::core
