#pragma once

#include "core/common.hpp"
#include "core/status.hpp"
#include "storage/file_io.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>

namespace arbor::storage {

    constexpr uint32_t LOCK_MAGIC = 0x41524C4B; // "ARLK"
    constexpr uint32_t LOCK_VERSION = 1;
    constexpr core::TransactionId IDLE_SLOT = ~core::TransactionId{0};

    struct LockHeader {
        uint32_t magic;
        uint32_t version;
        uint32_t max_readers;
        uint32_t reserved;
        char pad[48];
    };
    static_assert(sizeof(LockHeader) == 64);

    // One cache line per reader: owning pid and pinned snapshot id.
    struct ReaderSlot {
        std::atomic<int32_t> pid;
        uint32_t reserved;
        std::atomic<core::TransactionId> txnid;
        char pad[48];
    };
    static_assert(sizeof(ReaderSlot) == 64);
    static_assert(std::atomic<core::TransactionId>::is_always_lock_free);
    static_assert(std::atomic<int32_t>::is_always_lock_free);

    // Shared state of every process that has the environment open: the reader table
    // (page-generation pins) and the inter-process writer lock.
    class LockFile {
        struct Token {
            explicit Token() = default;
        };

      public:
        LockFile(Token, FileHandle fd, std::string path, dev_t dev, ino_t ino);
        static auto open(const std::string &path, uint32_t max_readers,
                         std::unique_ptr<LockFile> &out) -> core::Status;
        ~LockFile();

        LockFile(const LockFile &) = delete;
        LockFile &operator=(const LockFile &) = delete;

        auto acquire_slot(uint32_t &slot) -> core::Status;
        void pin(uint32_t slot, core::TransactionId txnid);
        void unpin(uint32_t slot);
        void release_slot(uint32_t slot);

        // Smallest pinned snapshot id, or `fallback` when nothing is pinned.
        [[nodiscard]] auto oldest_snapshot(core::TransactionId fallback) const
            -> core::TransactionId;
        // Number of readers pinning exactly this page generation.
        [[nodiscard]] auto pin_count(core::TransactionId txnid) const -> size_t;
        [[nodiscard]] auto readers_in_use() const -> size_t;
        [[nodiscard]] auto max_readers() const -> uint32_t {
            return max_readers_;
        }

        // Inter-process writer exclusion; `wait == false` maps contention to WriterBusy.
        auto lock_writer(bool wait) -> core::Status;
        void unlock_writer();

        // Frees slots owned by processes that no longer exist; returns the number cleared.
        auto clear_stale_readers() -> size_t;

      private:
        auto slot_at(uint32_t idx) const -> ReaderSlot *;

        FileHandle fd_;
        std::string path_;
        dev_t dev_;
        ino_t ino_;
        char *map_ = nullptr;
        size_t map_len_ = 0;
        uint32_t max_readers_ = 0;
    };

} // namespace arbor::storage
