#pragma once

#include "core/common.hpp"
#include "core/options.hpp"
#include "core/status.hpp"
#include "storage/file_io.hpp"
#include "storage/format.hpp"
#include "storage/free_list.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace arbor::storage {

    // Read-only shared view of the data file. Transactions hold a reference for their
    // whole lifetime, so a remap never pulls memory out from under a reader.
    class Mapping {
        struct Token {
            explicit Token() = default;
        };

      public:
        Mapping(Token, const char *data, uint64_t size) : data_(data), size_(size) {}
        static auto create(int fd, uint64_t size, std::shared_ptr<const Mapping> &out)
            -> core::Status;
        ~Mapping();

        Mapping(const Mapping &) = delete;
        Mapping &operator=(const Mapping &) = delete;

        [[nodiscard]] auto data() const -> const char * {
            return data_;
        }
        [[nodiscard]] auto size() const -> uint64_t {
            return size_;
        }
        [[nodiscard]] auto pages() const -> uint64_t {
            return size_ / core::PAGE_SIZE;
        }

      private:
        const char *data_;
        uint64_t size_;
    };

    // A page (or overflow run) staged by a write transaction.
    struct StagedPage {
        core::PageId pgno;
        const char *data;
        uint32_t pages;
    };

    class PageStore {
        struct Token {
            explicit Token() = default;
        };

      public:
        PageStore(Token, FileHandle fd, std::string path, const core::EnvConfig &config);
        static auto open(const std::string &path, const core::EnvConfig &config,
                         std::unique_ptr<PageStore> &out) -> core::Status;
        ~PageStore() = default;

        PageStore(const PageStore &) = delete;
        PageStore &operator=(const PageStore &) = delete;

        [[nodiscard]] auto mapping() const -> std::shared_ptr<const Mapping>;
        [[nodiscard]] auto map_size() const -> uint64_t;
        [[nodiscard]] auto path() const -> const std::string & {
            return path_;
        }
        [[nodiscard]] auto read_only() const -> bool {
            return read_only_;
        }

        // Valid meta with the highest transaction id. Fails once the store is poisoned.
        auto latest_meta(MetaRecord &out) const -> core::Status;

        // Zero-copy page read with structural validation.
        auto read(const Mapping &mapping, core::PageId pgno, uint64_t next_pgno,
                  const char *&out) const -> core::Status;

        // Contiguous run from the pool, else from the file end within `map_pages`.
        auto allocate(FreeList &free, uint64_t &next_pgno, uint64_t map_pages, uint32_t count,
                      core::PageId &out) const -> core::Status;

        // Loads the serialised free list of `meta` and the pages of its chain.
        auto read_free_chain(const Mapping &mapping, const MetaRecord &meta, FreeList &out,
                             std::vector<core::PageId> &chain) const -> core::Status;

        // Writes staged pages, flushes, then publishes `meta` in slot txnid % 2 and
        // flushes again. On failure the previous meta stays authoritative. A failed meta
        // flush poisons the store: the slot is restored, but every later meta read and
        // commit fails until the file is reopened.
        auto commit(const std::vector<StagedPage> &pages, const MetaRecord &meta) -> core::Status;

        // Remaps at `new_size` bytes (rounded to pages); `used_pages` must still fit.
        auto grow(uint64_t new_size, uint64_t used_pages) -> core::Status;

        // Remaps when another process published a larger map.
        auto ensure_mapped(uint64_t required_size) -> core::Status;

        auto sync(bool force) -> core::Status;

        // Writes the snapshot described by `meta` into a new file at `dest`.
        auto copy_to(const std::string &dest, const Mapping &mapping, const MetaRecord &meta) const
            -> core::Status;

        [[nodiscard]] auto poisoned() const -> bool {
            return poisoned_.load();
        }

        // Fails the n-th following page/meta write or data sync with IOError (tests).
        void inject_write_fault(int64_t after_writes) {
            write_fault_.store(after_writes);
        }
        void inject_sync_fault(int64_t after_syncs) {
            sync_fault_.store(after_syncs);
        }

      private:
        auto initialise(uint64_t map_size) -> core::Status;
        auto remap(uint64_t size) -> core::Status;
        auto write(const void *src, size_t len, uint64_t offset) -> core::Status;
        auto flush() -> core::Status;
        auto check_poisoned() const -> core::Status;

        FileHandle fd_;
        std::string path_;
        bool read_only_;
        bool no_sync_;

        mutable std::mutex mutex_;
        std::shared_ptr<const Mapping> mapping_;

        // Exclusive while a new meta is written, flushed or rolled back.
        mutable std::shared_mutex meta_mutex_;
        std::atomic<bool> poisoned_{false};

        std::atomic<int64_t> write_fault_{-1};
        std::atomic<int64_t> sync_fault_{-1};
    };

    auto pick_meta(const MetaRecord &a, const MetaRecord &b, MetaRecord &out) -> core::Status;

    void format_free_chain_page(char *page, core::PageId pgno, core::PageId next,
                                const uint64_t *words, size_t count);

} // namespace arbor::storage
