#include "storage/lock_file.hpp"
#include "core/status.hpp"
#include "log/logger.hpp"
#include "storage/file_io.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fmt/core.h>
#include <mutex>
#include <new>
#include <set>
#include <sys/file.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace arbor::storage {

    namespace {
        // Lock files this process has open, keyed by inode. A second open of the same
        // environment within one process would share fcntl locks and is refused.
        std::mutex registry_mutex;
        std::set<std::pair<dev_t, ino_t>> open_registry;

        auto lock_file_size(uint32_t max_readers) -> size_t {
            return sizeof(LockHeader) + static_cast<size_t>(max_readers) * sizeof(ReaderSlot);
        }

        auto flock_retry(int fd, int op) -> int {
            int rc;
            do {
                rc = ::flock(fd, op);
            } while (rc != 0 && errno == EINTR);
            return rc;
        }
    } // namespace

    LockFile::LockFile(Token, FileHandle fd, std::string path, dev_t dev, ino_t ino)
        : fd_(std::move(fd)), path_(std::move(path)), dev_(dev), ino_(ino) {}

    auto LockFile::open(const std::string &path, uint32_t max_readers,
                        std::unique_ptr<LockFile> &out) -> core::Status {
        FileHandle fd;
        auto status = open_file(path, O_RDWR | O_CREAT, fd);
        if (!status.ok())
            return status;

        struct stat st;
        if (::fstat(fd.get(), &st) != 0) {
            return core::Status::IOError(
                fmt::format("fstat '{}' failed: {}", path, strerror(errno)));
        }

        {
            std::lock_guard<std::mutex> lock(registry_mutex);
            if (!open_registry.insert({st.st_dev, st.st_ino}).second) {
                return core::Status::Busy(
                    fmt::format("environment '{}' is already open in this process", path));
            }
        }

        auto lock = std::make_unique<LockFile>(Token{}, std::move(fd), path, st.st_dev, st.st_ino);
        int lfd = lock->fd_.get();

        // Sole opener (exclusive flock granted): reset the reader table.
        bool initialise = flock_retry(lfd, LOCK_EX | LOCK_NB) == 0;
        if (initialise) {
            size_t len = lock_file_size(max_readers);
            if (::ftruncate(lfd, static_cast<off_t>(len)) != 0) {
                return core::Status::IOError(
                    fmt::format("ftruncate '{}' failed: {}", path, strerror(errno)));
            }
            LockHeader header{};
            header.magic = LOCK_MAGIC;
            header.version = LOCK_VERSION;
            header.max_readers = max_readers;
            status = write_at(lfd, &header, sizeof(header), 0);
            if (!status.ok())
                return status;
            if (flock_retry(lfd, LOCK_SH) != 0) {
                return core::Status::IOError(
                    fmt::format("flock '{}' failed: {}", path, strerror(errno)));
            }
        } else if (flock_retry(lfd, LOCK_SH) != 0) {
            return core::Status::IOError(
                fmt::format("flock '{}' failed: {}", path, strerror(errno)));
        }

        LockHeader header{};
        status = read_at(lfd, &header, sizeof(header), 0);
        if (!status.ok() || header.magic != LOCK_MAGIC || header.version != LOCK_VERSION ||
            header.max_readers == 0) {
            return core::Status::Corruption(fmt::format("lock file '{}' is malformed", path));
        }
        if (header.max_readers != max_readers) {
            ARBOR_LOG_INFO("Lock file '{}' was sized for {} readers by another process",
                           path, header.max_readers);
        }
        lock->max_readers_ = header.max_readers;
        lock->map_len_ = lock_file_size(header.max_readers);

        void *map = ::mmap(nullptr, lock->map_len_, PROT_READ | PROT_WRITE, MAP_SHARED, lfd, 0);
        if (map == MAP_FAILED) {
            return core::Status::IOError(
                fmt::format("mmap of lock file '{}' failed: {}", path, strerror(errno)));
        }
        lock->map_ = static_cast<char *>(map);

        if (initialise) {
            for (uint32_t i = 0; i < lock->max_readers_; i++) {
                auto *slot = new (lock->map_ + sizeof(LockHeader) + i * sizeof(ReaderSlot))
                    ReaderSlot{};
                slot->pid.store(0, std::memory_order_relaxed);
                slot->txnid.store(IDLE_SLOT, std::memory_order_relaxed);
            }
            std::atomic_thread_fence(std::memory_order_seq_cst);
        }

        ARBOR_LOG_DEBUG("Lock file '{}' mapped: readers={}, initialised={}", path,
                        lock->max_readers_, initialise);
        out = std::move(lock);
        return core::Status::Ok();
    }

    LockFile::~LockFile() {
        if (map_) {
            ::munmap(map_, map_len_);
        }
        if (fd_.valid()) {
            flock_retry(fd_.get(), LOCK_UN);
        }
        std::lock_guard<std::mutex> lock(registry_mutex);
        open_registry.erase({dev_, ino_});
    }

    auto LockFile::slot_at(uint32_t idx) const -> ReaderSlot * {
        return std::launder(
            reinterpret_cast<ReaderSlot *>(map_ + sizeof(LockHeader) + idx * sizeof(ReaderSlot)));
    }

    auto LockFile::acquire_slot(uint32_t &slot) -> core::Status {
        const int32_t self = static_cast<int32_t>(::getpid());
        for (uint32_t i = 0; i < max_readers_; i++) {
            int32_t expected = 0;
            if (slot_at(i)->pid.compare_exchange_strong(expected, self)) {
                slot_at(i)->txnid.store(IDLE_SLOT, std::memory_order_seq_cst);
                slot = i;
                return core::Status::Ok();
            }
        }
        return core::Status::ReadersFull(
            fmt::format("all {} reader slots are in use", max_readers_));
    }

    void LockFile::pin(uint32_t slot, core::TransactionId txnid) {
        slot_at(slot)->txnid.store(txnid, std::memory_order_seq_cst);
    }

    void LockFile::unpin(uint32_t slot) {
        slot_at(slot)->txnid.store(IDLE_SLOT, std::memory_order_release);
    }

    void LockFile::release_slot(uint32_t slot) {
        unpin(slot);
        slot_at(slot)->pid.store(0, std::memory_order_release);
    }

    auto LockFile::oldest_snapshot(core::TransactionId fallback) const -> core::TransactionId {
        core::TransactionId oldest = fallback;
        for (uint32_t i = 0; i < max_readers_; i++) {
            if (slot_at(i)->pid.load(std::memory_order_acquire) == 0)
                continue;
            oldest = std::min(oldest, slot_at(i)->txnid.load(std::memory_order_seq_cst));
        }
        return oldest;
    }

    auto LockFile::pin_count(core::TransactionId txnid) const -> size_t {
        size_t count = 0;
        for (uint32_t i = 0; i < max_readers_; i++) {
            if (slot_at(i)->pid.load(std::memory_order_acquire) != 0 &&
                slot_at(i)->txnid.load(std::memory_order_acquire) == txnid) {
                count++;
            }
        }
        return count;
    }

    auto LockFile::readers_in_use() const -> size_t {
        size_t count = 0;
        for (uint32_t i = 0; i < max_readers_; i++) {
            if (slot_at(i)->pid.load(std::memory_order_acquire) != 0)
                count++;
        }
        return count;
    }

    auto LockFile::lock_writer(bool wait) -> core::Status {
        struct flock fl {};
        fl.l_type = F_WRLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 1;

        int rc;
        do {
            rc = ::fcntl(fd_.get(), wait ? F_SETLKW : F_SETLK, &fl);
        } while (rc != 0 && errno == EINTR);

        if (rc != 0) {
            if (!wait && (errno == EAGAIN || errno == EACCES)) {
                return core::Status::WriterBusy("another process holds the write lock");
            }
            return core::Status::IOError(
                fmt::format("write lock on '{}' failed: {}", path_, strerror(errno)));
        }
        return core::Status::Ok();
    }

    void LockFile::unlock_writer() {
        struct flock fl {};
        fl.l_type = F_UNLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 1;
        if (::fcntl(fd_.get(), F_SETLK, &fl) != 0) {
            ARBOR_LOG_ERROR("Releasing write lock on '{}' failed: {}", path_, strerror(errno));
        }
    }

    auto LockFile::clear_stale_readers() -> size_t {
        const int32_t self = static_cast<int32_t>(::getpid());
        size_t cleared = 0;
        for (uint32_t i = 0; i < max_readers_; i++) {
            int32_t pid = slot_at(i)->pid.load(std::memory_order_acquire);
            if (pid == 0 || pid == self)
                continue;
            if (::kill(pid, 0) != 0 && errno == ESRCH) {
                slot_at(i)->txnid.store(IDLE_SLOT, std::memory_order_release);
                if (slot_at(i)->pid.compare_exchange_strong(pid, 0)) {
                    cleared++;
                }
            }
        }
        if (cleared) {
            ARBOR_LOG_INFO("Cleared {} stale reader slot(s) in '{}'", cleared, path_);
        }
        return cleared;
    }

} // namespace arbor::storage
