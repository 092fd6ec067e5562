#pragma once

#include "core/status.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unistd.h>
#include <utility>

namespace arbor::storage {

    class FileHandle {
      public:
        FileHandle() = default;
        explicit FileHandle(int fd) : fd_(fd) {}
        ~FileHandle() {
            reset();
        }

        FileHandle(const FileHandle &) = delete;
        FileHandle &operator=(const FileHandle &) = delete;

        FileHandle(FileHandle &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
        FileHandle &operator=(FileHandle &&other) noexcept {
            if (this != &other) {
                reset();
                fd_ = std::exchange(other.fd_, -1);
            }
            return *this;
        }

        [[nodiscard]] auto get() const -> int {
            return fd_;
        }
        [[nodiscard]] auto valid() const -> bool {
            return fd_ >= 0;
        }

        void reset() {
            if (fd_ >= 0)
                ::close(fd_);
            fd_ = -1;
        }

      private:
        int fd_ = -1;
    };

    auto open_file(const std::string &path, int flags, FileHandle &out) -> core::Status;

    // Positional I/O looping over short transfers and EINTR.
    auto read_at(int fd, void *dst, size_t len, uint64_t offset) -> core::Status;
    auto write_at(int fd, const void *src, size_t len, uint64_t offset) -> core::Status;

    auto sync_data(int fd) -> core::Status;
    auto file_size(int fd, uint64_t &size) -> core::Status;

} // namespace arbor::storage
