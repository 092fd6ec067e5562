#include "storage/free_list.hpp"
#include "core/common.hpp"
#include "core/status.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <iterator>

namespace arbor::storage {

    void FreeList::add_pending(core::TransactionId generation,
                               const std::vector<core::PageId> &pages) {
        if (pages.empty())
            return;
        auto &bucket = pending_[generation];
        bucket.insert(bucket.end(), pages.begin(), pages.end());
    }

    auto FreeList::reclaim(core::TransactionId oldest_snapshot) -> size_t {
        size_t moved = 0;
        auto it = pending_.begin();
        while (it != pending_.end() && it->first <= oldest_snapshot) {
            pool_.insert(pool_.end(), it->second.begin(), it->second.end());
            moved += it->second.size();
            it = pending_.erase(it);
        }
        if (moved) {
            std::sort(pool_.begin(), pool_.end());
        }
        return moved;
    }

    void FreeList::release(core::PageId first, uint32_t count) {
        std::vector<core::PageId> run;
        run.reserve(count);
        for (uint32_t i = 0; i < count; i++) {
            run.push_back(first + i);
        }
        std::vector<core::PageId> merged;
        merged.reserve(pool_.size() + run.size());
        std::merge(pool_.begin(), pool_.end(), run.begin(), run.end(), std::back_inserter(merged));
        pool_.swap(merged);
    }

    auto FreeList::take(uint32_t count) -> std::optional<core::PageId> {
        if (count == 0 || pool_.size() < count)
            return std::nullopt;

        for (size_t i = 0; i + count <= pool_.size(); i++) {
            if (pool_[i + count - 1] - pool_[i] == count - 1) {
                core::PageId first = pool_[i];
                auto begin = pool_.begin() + static_cast<std::ptrdiff_t>(i);
                pool_.erase(begin, begin + static_cast<std::ptrdiff_t>(count));
                return first;
            }
        }
        return std::nullopt;
    }

    auto FreeList::pending_size() const -> size_t {
        size_t total = 0;
        for (const auto &[generation, pages] : pending_) {
            total += pages.size();
        }
        return total;
    }

    auto FreeList::contains(core::PageId pgno) const -> bool {
        if (std::binary_search(pool_.begin(), pool_.end(), pgno))
            return true;
        for (const auto &[generation, pages] : pending_) {
            if (std::find(pages.begin(), pages.end(), pgno) != pages.end())
                return true;
        }
        return false;
    }

    auto FreeList::serialize() const -> std::vector<uint64_t> {
        std::vector<uint64_t> words;
        words.reserve(2 + pool_.size() + pending_size() + 2 * pending_.size());

        words.push_back(pool_.size());
        words.insert(words.end(), pool_.begin(), pool_.end());

        words.push_back(pending_.size());
        for (const auto &[generation, pages] : pending_) {
            words.push_back(generation);
            words.push_back(pages.size());
            words.insert(words.end(), pages.begin(), pages.end());
        }
        return words;
    }

    auto FreeList::deserialize(const std::vector<uint64_t> &words, FreeList &out) -> core::Status {
        FreeList list;
        size_t pos = 0;
        auto next = [&](uint64_t &value) -> bool {
            if (pos >= words.size())
                return false;
            value = words[pos++];
            return true;
        };

        uint64_t count = 0;
        if (!next(count) || count > words.size()) {
            return core::Status::Corruption("free list: truncated pool");
        }
        for (uint64_t i = 0; i < count; i++) {
            uint64_t pgno;
            if (!next(pgno))
                return core::Status::Corruption("free list: truncated pool");
            list.pool_.push_back(pgno);
        }
        if (!std::is_sorted(list.pool_.begin(), list.pool_.end())) {
            return core::Status::Corruption("free list: pool is not sorted");
        }

        uint64_t generations = 0;
        if (!next(generations) || generations > words.size()) {
            return core::Status::Corruption("free list: truncated generation table");
        }
        for (uint64_t g = 0; g < generations; g++) {
            uint64_t txnid, n;
            if (!next(txnid) || !next(n) || n > words.size()) {
                return core::Status::Corruption(
                    fmt::format("free list: truncated generation header {}", g));
            }
            auto &bucket = list.pending_[txnid];
            for (uint64_t i = 0; i < n; i++) {
                uint64_t pgno;
                if (!next(pgno)) {
                    return core::Status::Corruption(
                        fmt::format("free list: truncated generation {}", txnid));
                }
                bucket.push_back(pgno);
            }
        }

        out = std::move(list);
        return core::Status::Ok();
    }

} // namespace arbor::storage
