#include "storage/file_io.hpp"
#include "core/status.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/core.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace arbor::storage {

    auto open_file(const std::string &path, int flags, FileHandle &out) -> core::Status {
        int fd;
        do {
            fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
        } while (fd < 0 && errno == EINTR);

        if (fd < 0) {
            return core::Status::IOError(
                fmt::format("Failed to open '{}': {}", path, strerror(errno)));
        }
        out = FileHandle(fd);
        return core::Status::Ok();
    }

    auto read_at(int fd, void *dst, size_t len, uint64_t offset) -> core::Status {
        auto *out = static_cast<char *>(dst);
        size_t total = 0;

        while (total < len) {
            ssize_t n = ::pread(fd, out + total, len - total, static_cast<off_t>(offset + total));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return core::Status::IOError(
                    fmt::format("pread at offset {} failed: {}", offset + total, strerror(errno)));
            }
            if (n == 0) {
                return core::Status::NotFound(
                    fmt::format("short read: {} of {} bytes at offset {}", total, len, offset));
            }
            total += static_cast<size_t>(n);
        }
        return core::Status::Ok();
    }

    auto write_at(int fd, const void *src, size_t len, uint64_t offset) -> core::Status {
        const auto *in = static_cast<const char *>(src);
        size_t total = 0;

        while (total < len) {
            ssize_t n = ::pwrite(fd, in + total, len - total, static_cast<off_t>(offset + total));
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return core::Status::IOError(
                    fmt::format("pwrite at offset {} failed: {}", offset + total, strerror(errno)));
            }
            if (n == 0) {
                return core::Status::IOError("Short write (wrote 0 bytes)");
            }
            total += static_cast<size_t>(n);
        }
        return core::Status::Ok();
    }

    auto sync_data(int fd) -> core::Status {
        if (::fdatasync(fd) != 0) {
            return core::Status::IOError(fmt::format("fdatasync failed: {}", strerror(errno)));
        }
        return core::Status::Ok();
    }

    auto file_size(int fd, uint64_t &size) -> core::Status {
        struct stat st;
        if (::fstat(fd, &st) != 0) {
            return core::Status::IOError(fmt::format("fstat failed: {}", strerror(errno)));
        }
        size = static_cast<uint64_t>(st.st_size);
        return core::Status::Ok();
    }

} // namespace arbor::storage
