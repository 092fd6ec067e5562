#pragma once

#include "core/common.hpp"
#include "core/status.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace arbor::storage {

    // Page bookkeeping carried from commit to commit.
    //
    // Pages freed by write transaction T form generation T. They may still be reachable
    // from snapshots older than T, so they stay pending until every reader's snapshot id
    // is >= T; reclaim() then moves them into the pool that allocation draws from.
    class FreeList {
      public:
        void add_pending(core::TransactionId generation, const std::vector<core::PageId> &pages);

        // Moves every generation <= oldest_snapshot into the pool; returns pages moved.
        auto reclaim(core::TransactionId oldest_snapshot) -> size_t;

        // Returns pages straight to the pool (never part of a committed snapshot).
        void release(core::PageId first, uint32_t count);

        // Lowest run of `count` consecutive pooled pages.
        auto take(uint32_t count) -> std::optional<core::PageId>;

        [[nodiscard]] auto pool_size() const -> size_t {
            return pool_.size();
        }
        [[nodiscard]] auto pending_size() const -> size_t;
        [[nodiscard]] auto pending_generations() const -> size_t {
            return pending_.size();
        }
        [[nodiscard]] auto contains(core::PageId pgno) const -> bool;

        // [pool count, pool..., generation count, (txnid, count, pages...)...]
        [[nodiscard]] auto serialize() const -> std::vector<uint64_t>;
        static auto deserialize(const std::vector<uint64_t> &words, FreeList &out) -> core::Status;

      private:
        std::map<core::TransactionId, std::vector<core::PageId>> pending_;
        std::vector<core::PageId> pool_; // sorted ascending
    };

} // namespace arbor::storage
