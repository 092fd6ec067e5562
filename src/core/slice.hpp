#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace arbor::core {

    // Borrowed view into transaction-owned memory (the mapping or a dirty page).
    // The view is only readable while the owner token is alive: the token dies when the
    // transaction ends, and in a write transaction on every mutation.
    class Slice {
      public:
        Slice() = default;
        Slice(std::string_view bytes, std::weak_ptr<const void> owner)
            : bytes_(bytes), owner_(std::move(owner)) {}

        [[nodiscard]] auto valid() const -> bool {
            return !owner_.expired();
        }

        [[nodiscard]] auto view() const -> std::optional<std::string_view> {
            if (!valid())
                return std::nullopt;
            return bytes_;
        }

        [[nodiscard]] auto to_string() const -> std::optional<std::string> {
            if (!valid())
                return std::nullopt;
            return std::string(bytes_);
        }

        [[nodiscard]] auto size() const -> size_t {
            return bytes_.size();
        }

      private:
        std::string_view bytes_;
        std::weak_ptr<const void> owner_;
    };

} // namespace arbor::core
