#include "storage/page_store.hpp"
#include "core/common.hpp"
#include "core/status.hpp"
#include "log/logger.hpp"
#include "storage/file_io.hpp"
#include "storage/format.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/core.h>
#include <sys/mman.h>
#include <unistd.h>
#include <vector>

namespace arbor::storage {

    namespace {
        auto round_to_pages(uint64_t bytes) -> uint64_t {
            return (bytes + core::PAGE_SIZE - 1) / core::PAGE_SIZE * core::PAGE_SIZE;
        }

        void format_meta_page(char *page, core::PageId slot, MetaRecord meta) {
            std::memset(page, 0, core::PAGE_SIZE);
            PageHeader hdr{};
            hdr.pgno = slot;
            hdr.flags = PAGE_META;
            store(page, hdr);
            meta.checksum = meta_checksum(meta);
            store(page + PAGE_HEADER_SIZE, meta);
        }

        auto meta_at(const char *base, core::PageId slot) -> MetaRecord {
            return load<MetaRecord>(base + slot * core::PAGE_SIZE + PAGE_HEADER_SIZE);
        }
    } // namespace

    // ============================================================================
    // Mapping
    // ============================================================================

    auto Mapping::create(int fd, uint64_t size, std::shared_ptr<const Mapping> &out)
        -> core::Status {
        void *addr = ::mmap(nullptr, size, PROT_READ, MAP_SHARED, fd, 0);
        if (addr == MAP_FAILED) {
            return core::Status::IOError(
                fmt::format("mmap of {} bytes failed: {}", size, strerror(errno)));
        }
        out = std::make_shared<const Mapping>(Token{}, static_cast<const char *>(addr), size);
        return core::Status::Ok();
    }

    Mapping::~Mapping() {
        ::munmap(const_cast<char *>(data_), size_);
    }

    // ============================================================================
    // Meta selection
    // ============================================================================

    auto pick_meta(const MetaRecord &a, const MetaRecord &b, MetaRecord &out) -> core::Status {
        auto sa = validate_meta(a);
        auto sb = validate_meta(b);
        if (!sa.ok() && !sb.ok()) {
            // Prefer reporting a format mismatch over plain corruption.
            if (sa.code() == core::StatusCode::Incompatible)
                return sa;
            if (sb.code() == core::StatusCode::Incompatible)
                return sb;
            return core::Status::Corruption(
                fmt::format("no valid meta page ({}; {})", sa.message(), sb.message()));
        }
        if (!sb.ok() || (sa.ok() && a.txnid >= b.txnid)) {
            out = a;
        } else {
            out = b;
        }
        return core::Status::Ok();
    }

    void format_free_chain_page(char *page, core::PageId pgno, core::PageId next,
                                const uint64_t *words, size_t count) {
        std::memset(page, 0, core::PAGE_SIZE);
        PageHeader hdr{};
        hdr.pgno = pgno;
        hdr.flags = PAGE_FREE_CHAIN;
        store(page, hdr);
        store(page + PAGE_HEADER_SIZE, next);
        store(page + PAGE_HEADER_SIZE + 8, static_cast<uint64_t>(count));
        if (count) {
            std::memcpy(page + FREE_CHAIN_PREFIX, words, count * sizeof(uint64_t));
        }
    }

    // ============================================================================
    // PageStore
    // ============================================================================

    PageStore::PageStore(Token, FileHandle fd, std::string path, const core::EnvConfig &config)
        : fd_(std::move(fd)), path_(std::move(path)),
          read_only_(core::has_flag(config.flags, core::EnvFlags::ReadOnly)),
          no_sync_(core::has_flag(config.flags, core::EnvFlags::NoSync)) {}

    auto PageStore::open(const std::string &path, const core::EnvConfig &config,
                         std::unique_ptr<PageStore> &out) -> core::Status {
        const bool read_only = core::has_flag(config.flags, core::EnvFlags::ReadOnly);

        FileHandle fd;
        auto status = open_file(path, read_only ? O_RDONLY : (O_RDWR | O_CREAT), fd);
        if (!status.ok())
            return status;

        uint64_t size = 0;
        status = file_size(fd.get(), size);
        if (!status.ok())
            return status;

        auto store = std::make_unique<PageStore>(Token{}, std::move(fd), path, config);
        uint64_t map_size = round_to_pages(config.map_size);

        if (size == 0) {
            if (read_only) {
                return core::Status::InvalidArgument(
                    fmt::format("data file '{}' is empty and the environment is read-only", path));
            }
            status = store->initialise(map_size);
            if (!status.ok())
                return status;
            size = NUM_METAS * core::PAGE_SIZE;
        } else if (size < NUM_METAS * core::PAGE_SIZE) {
            return core::Status::Corruption(
                fmt::format("data file '{}' is truncated ({} bytes)", path, size));
        }

        std::vector<char> metas(NUM_METAS * core::PAGE_SIZE);
        status = read_at(store->fd_.get(), metas.data(), metas.size(), 0);
        if (!status.ok())
            return status;

        MetaRecord meta;
        status = pick_meta(meta_at(metas.data(), 0), meta_at(metas.data(), 1), meta);
        if (!status.ok()) {
            ARBOR_LOG_ERROR("Opening '{}' failed: {}", path, status.to_string());
            return status;
        }

        if (size < meta.next_pgno * core::PAGE_SIZE) {
            return core::Status::Corruption(
                fmt::format("data file '{}' holds {} bytes but txn {} uses {} pages", path, size,
                            meta.txnid, meta.next_pgno));
        }

        map_size = std::max({map_size, meta.map_size, round_to_pages(size),
                             meta.next_pgno * core::PAGE_SIZE});
        status = store->remap(map_size);
        if (!status.ok())
            return status;

        ARBOR_LOG_INFO("Opened data file '{}': txn={}, pages={}, map_size={}", path, meta.txnid,
                       meta.next_pgno, map_size);
        out = std::move(store);
        return core::Status::Ok();
    }

    auto PageStore::initialise(uint64_t map_size) -> core::Status {
        MetaRecord meta;
        meta.map_size = map_size;

        std::vector<char> pages(NUM_METAS * core::PAGE_SIZE);
        for (core::PageId slot = 0; slot < NUM_METAS; slot++) {
            format_meta_page(pages.data() + slot * core::PAGE_SIZE, slot, meta);
        }
        auto status = write_at(fd_.get(), pages.data(), pages.size(), 0);
        if (!status.ok())
            return status;
        ARBOR_LOG_INFO("Initialised new data file '{}'", path_);
        return sync_data(fd_.get());
    }

    auto PageStore::remap(uint64_t size) -> core::Status {
        std::shared_ptr<const Mapping> mapping;
        auto status = Mapping::create(fd_.get(), size, mapping);
        if (!status.ok())
            return status;
        std::lock_guard<std::mutex> lock(mutex_);
        mapping_ = std::move(mapping);
        return core::Status::Ok();
    }

    auto PageStore::mapping() const -> std::shared_ptr<const Mapping> {
        std::lock_guard<std::mutex> lock(mutex_);
        return mapping_;
    }

    auto PageStore::map_size() const -> uint64_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return mapping_ ? mapping_->size() : 0;
    }

    auto PageStore::check_poisoned() const -> core::Status {
        if (poisoned_.load()) {
            return core::Status::IOError(fmt::format(
                "data file '{}' is unusable after a failed meta flush; reopen it", path_));
        }
        return core::Status::Ok();
    }

    auto PageStore::latest_meta(MetaRecord &out) const -> core::Status {
        std::shared_lock<std::shared_mutex> lock(meta_mutex_);
        auto status = check_poisoned();
        if (!status.ok())
            return status;
        auto map = mapping();
        return pick_meta(meta_at(map->data(), 0), meta_at(map->data(), 1), out);
    }

    auto PageStore::read(const Mapping &mapping, core::PageId pgno, uint64_t next_pgno,
                         const char *&out) const -> core::Status {
        if (pgno < NUM_METAS || pgno >= next_pgno) {
            return core::Status::Corruption(
                fmt::format("page {} is outside the snapshot (next page {})", pgno, next_pgno));
        }
        if ((pgno + 1) * core::PAGE_SIZE > mapping.size()) {
            return core::Status::Corruption(
                fmt::format("page {} lies beyond the {}-byte map", pgno, mapping.size()));
        }
        const char *page = mapping.data() + pgno * core::PAGE_SIZE;
        auto status = validate_page(page, pgno);
        if (!status.ok())
            return status;
        out = page;
        return core::Status::Ok();
    }

    auto PageStore::allocate(FreeList &free, uint64_t &next_pgno, uint64_t map_pages,
                             uint32_t count, core::PageId &out) const -> core::Status {
        if (auto pgno = free.take(count)) {
            out = *pgno;
            return core::Status::Ok();
        }
        if (next_pgno + count > map_pages) {
            return core::Status::MapFull(fmt::format(
                "cannot allocate {} page(s): {} of {} pages in use", count, next_pgno, map_pages));
        }
        out = next_pgno;
        next_pgno += count;
        return core::Status::Ok();
    }

    auto PageStore::read_free_chain(const Mapping &mapping, const MetaRecord &meta, FreeList &out,
                                    std::vector<core::PageId> &chain) const -> core::Status {
        chain.clear();
        std::vector<uint64_t> words;
        core::PageId pgno = meta.free_head;

        while (pgno != core::INVALID_PAGE) {
            if (pgno < NUM_METAS || pgno >= meta.next_pgno ||
                (pgno + 1) * core::PAGE_SIZE > mapping.size() || chain.size() >= meta.next_pgno) {
                return core::Status::Corruption(
                    fmt::format("free chain references invalid page {}", pgno));
            }
            const char *page = mapping.data() + pgno * core::PAGE_SIZE;
            auto hdr = page_header(page);
            auto count = load<uint64_t>(page + PAGE_HEADER_SIZE + 8);
            if (hdr.pgno != pgno || hdr.flags != PAGE_FREE_CHAIN || count > FREE_CHAIN_WORDS) {
                return core::Status::Corruption(
                    fmt::format("page {} is not a valid free chain page", pgno));
            }
            const char *first = page + FREE_CHAIN_PREFIX;
            for (uint64_t i = 0; i < count; i++) {
                words.push_back(load<uint64_t>(first + i * sizeof(uint64_t)));
            }
            chain.push_back(pgno);
            pgno = load<core::PageId>(page + PAGE_HEADER_SIZE);
        }

        if (words.empty()) {
            out = FreeList{};
            return core::Status::Ok();
        }
        return FreeList::deserialize(words, out);
    }

    auto PageStore::write(const void *src, size_t len, uint64_t offset) -> core::Status {
        if (write_fault_.load() >= 0 && write_fault_.fetch_sub(1) == 0) {
            return core::Status::IOError(fmt::format("injected write fault at offset {}", offset));
        }
        return write_at(fd_.get(), src, len, offset);
    }

    auto PageStore::flush() -> core::Status {
        if (sync_fault_.load() >= 0 && sync_fault_.fetch_sub(1) == 0) {
            return core::Status::IOError("injected sync fault");
        }
        if (no_sync_)
            return core::Status::Ok();
        return sync_data(fd_.get());
    }

    auto PageStore::commit(const std::vector<StagedPage> &pages, const MetaRecord &meta)
        -> core::Status {
        if (read_only_) {
            return core::Status::NotSupported("environment is read-only");
        }
        auto status = check_poisoned();
        if (!status.ok())
            return status;

        for (const auto &page : pages) {
            status = write(page.data, static_cast<size_t>(page.pages) * core::PAGE_SIZE,
                           page.pgno * core::PAGE_SIZE);
            if (!status.ok()) {
                ARBOR_LOG_ERROR("Commit of txn {} failed writing page {}: {}", meta.txnid,
                                page.pgno, status.to_string());
                return status;
            }
        }

        // Pages handed out but never written still have to be readable.
        uint64_t size = 0;
        status = file_size(fd_.get(), size);
        if (!status.ok())
            return status;
        if (size < meta.next_pgno * core::PAGE_SIZE &&
            ::ftruncate(fd_.get(), static_cast<off_t>(meta.next_pgno * core::PAGE_SIZE)) != 0) {
            return core::Status::IOError(
                fmt::format("extending '{}' failed: {}", path_, strerror(errno)));
        }

        status = flush();
        if (!status.ok())
            return status;

        const core::PageId slot = meta.txnid % NUM_METAS;
        std::vector<char> previous(core::PAGE_SIZE);
        status = read_at(fd_.get(), previous.data(), previous.size(), slot * core::PAGE_SIZE);
        if (!status.ok())
            return status;

        std::vector<char> page(core::PAGE_SIZE);
        format_meta_page(page.data(), slot, meta);

        // Readers must never pin the new meta before its flush has succeeded.
        std::unique_lock<std::shared_mutex> lock(meta_mutex_);
        status = write(page.data(), page.size(), slot * core::PAGE_SIZE);
        const bool written = status.ok();
        if (written) {
            status = flush();
        }
        if (!status.ok()) {
            auto restore = write_at(fd_.get(), previous.data(), previous.size(),
                                    slot * core::PAGE_SIZE);
            if (!restore.ok()) {
                ARBOR_LOG_FATAL("Restoring meta slot {} of '{}' failed: {}", slot, path_,
                                restore.to_string());
            }
            if (written || !restore.ok()) {
                poisoned_.store(true);
                ARBOR_LOG_FATAL("Data file '{}' poisoned by failed publish of txn {}", path_,
                                meta.txnid);
            }
            ARBOR_LOG_ERROR("Commit of txn {} failed publishing meta: {}", meta.txnid,
                            status.to_string());
            return core::Status::IOError(
                fmt::format("commit of txn {} failed: {}", meta.txnid, status.message()));
        }

        ARBOR_LOG_DEBUG("Committed txn {}: {} page run(s), next page {}", meta.txnid,
                        pages.size(), meta.next_pgno);
        return core::Status::Ok();
    }

    auto PageStore::grow(uint64_t new_size, uint64_t used_pages) -> core::Status {
        uint64_t size = round_to_pages(new_size);
        if (size < used_pages * core::PAGE_SIZE) {
            return core::Status::InvalidArgument(fmt::format(
                "map size {} is smaller than the {} bytes in use", size,
                used_pages * core::PAGE_SIZE));
        }
        auto status = remap(size);
        if (status.ok()) {
            ARBOR_LOG_INFO("Remapped '{}' to {} bytes", path_, size);
        }
        return status;
    }

    auto PageStore::ensure_mapped(uint64_t required_size) -> core::Status {
        uint64_t size = round_to_pages(required_size);
        if (map_size() >= size)
            return core::Status::Ok();
        ARBOR_LOG_DEBUG("Map of '{}' grew elsewhere, remapping to {} bytes", path_, size);
        return remap(size);
    }

    auto PageStore::sync(bool force) -> core::Status {
        if (read_only_)
            return core::Status::Ok();
        if (no_sync_ && !force)
            return core::Status::Ok();
        return sync_data(fd_.get());
    }

    auto PageStore::copy_to(const std::string &dest, const Mapping &mapping,
                            const MetaRecord &meta) const -> core::Status {
        FileHandle out;
        auto status = open_file(dest, O_WRONLY | O_CREAT | O_EXCL, out);
        if (!status.ok())
            return status;

        std::vector<char> page(core::PAGE_SIZE);
        for (core::PageId slot = 0; slot < NUM_METAS; slot++) {
            format_meta_page(page.data(), slot, meta);
            status = write_at(out.get(), page.data(), page.size(), slot * core::PAGE_SIZE);
            if (!status.ok())
                return status;
        }

        uint64_t bytes = (meta.next_pgno - NUM_METAS) * core::PAGE_SIZE;
        if (meta.next_pgno * core::PAGE_SIZE > mapping.size()) {
            return core::Status::Corruption("snapshot extends beyond the current map");
        }
        if (bytes) {
            status = write_at(out.get(), mapping.data() + NUM_METAS * core::PAGE_SIZE, bytes,
                              NUM_METAS * core::PAGE_SIZE);
            if (!status.ok())
                return status;
        }

        status = sync_data(out.get());
        if (status.ok()) {
            ARBOR_LOG_INFO("Copied snapshot {} of '{}' to '{}' ({} pages)", meta.txnid, path_,
                           dest, meta.next_pgno);
        }
        return status;
    }

} // namespace arbor::storage
