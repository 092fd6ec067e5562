#pragma once

#include <fmt/core.h>
#include <string>
#include <utility>

namespace arbor::core {

    enum class StatusCode {
        Ok = 0,
        NotFound = 1,
        Corruption = 2,
        NotSupported = 3,
        InvalidArgument = 4,
        IOError = 5,
        MapFull = 6,
        KeyTooLarge = 7,
        KeyExists = 8,
        WriterBusy = 9,
        Busy = 10,
        ReadersFull = 11,
        DbsFull = 12,
        BadTransaction = 13,
        Incompatible = 14
    };

    class Status {
      public:
        // default constructor : OK status (fast path)
        Status() : code_(StatusCode::Ok) {}
        Status(StatusCode code, std::string msg) : code_(code), msg_(std::move(msg)) {}

        static auto Ok() -> Status {
            return Status();
        }
        static auto NotFound(const std::string &msg) -> Status {
            return Status(StatusCode::NotFound, msg);
        }
        static auto Corruption(const std::string &msg) -> Status {
            return Status(StatusCode::Corruption, msg);
        }
        static auto NotSupported(const std::string &msg) -> Status {
            return Status(StatusCode::NotSupported, msg);
        }
        static auto InvalidArgument(const std::string &msg) -> Status {
            return Status(StatusCode::InvalidArgument, msg);
        }
        static auto IOError(const std::string &msg) -> Status {
            return Status(StatusCode::IOError, msg);
        }
        static auto MapFull(const std::string &msg) -> Status {
            return Status(StatusCode::MapFull, msg);
        }
        static auto KeyTooLarge(const std::string &msg) -> Status {
            return Status(StatusCode::KeyTooLarge, msg);
        }
        static auto KeyExists(const std::string &msg) -> Status {
            return Status(StatusCode::KeyExists, msg);
        }
        static auto WriterBusy(const std::string &msg) -> Status {
            return Status(StatusCode::WriterBusy, msg);
        }
        static auto Busy(const std::string &msg) -> Status {
            return Status(StatusCode::Busy, msg);
        }
        static auto ReadersFull(const std::string &msg) -> Status {
            return Status(StatusCode::ReadersFull, msg);
        }
        static auto DbsFull(const std::string &msg) -> Status {
            return Status(StatusCode::DbsFull, msg);
        }
        static auto BadTransaction(const std::string &msg) -> Status {
            return Status(StatusCode::BadTransaction, msg);
        }
        static auto Incompatible(const std::string &msg) -> Status {
            return Status(StatusCode::Incompatible, msg);
        }

        // checkers
        [[nodiscard]] auto ok() const -> bool {
            return code_ == StatusCode::Ok;
        }
        [[nodiscard]] auto code() const -> StatusCode {
            return code_;
        }
        [[nodiscard]] auto message() const -> const std::string & {
            return msg_;
        }
        [[nodiscard]] auto is_not_found() const -> bool {
            return code_ == StatusCode::NotFound;
        }
        [[nodiscard]] auto is_corruption() const -> bool {
            return code_ == StatusCode::Corruption;
        }
        [[nodiscard]] auto is_io_error() const -> bool {
            return code_ == StatusCode::IOError;
        }
        [[nodiscard]] auto is_map_full() const -> bool {
            return code_ == StatusCode::MapFull;
        }
        [[nodiscard]] auto is_key_too_large() const -> bool {
            return code_ == StatusCode::KeyTooLarge;
        }
        [[nodiscard]] auto is_key_exists() const -> bool {
            return code_ == StatusCode::KeyExists;
        }
        [[nodiscard]] auto is_writer_busy() const -> bool {
            return code_ == StatusCode::WriterBusy;
        }
        [[nodiscard]] auto is_busy() const -> bool {
            return code_ == StatusCode::Busy;
        }

        // formatting for logging
        [[nodiscard]] auto to_string() const -> std::string {
            if (ok())
                return "OK";
            return fmt::format("{}: {}", code_to_string(code_), msg_);
        }

      private:
        StatusCode code_;
        std::string msg_;

        static auto code_to_string(StatusCode code) -> std::string {
            switch (code) {
            case StatusCode::Ok:
                return "Ok";
            case StatusCode::NotFound:
                return "NotFound";
            case StatusCode::Corruption:
                return "Corruption";
            case StatusCode::NotSupported:
                return "NotSupported";
            case StatusCode::InvalidArgument:
                return "InvalidArgument";
            case StatusCode::IOError:
                return "IOError";
            case StatusCode::MapFull:
                return "MapFull";
            case StatusCode::KeyTooLarge:
                return "KeyTooLarge";
            case StatusCode::KeyExists:
                return "KeyExists";
            case StatusCode::WriterBusy:
                return "WriterBusy";
            case StatusCode::Busy:
                return "Busy";
            case StatusCode::ReadersFull:
                return "ReadersFull";
            case StatusCode::DbsFull:
                return "DbsFull";
            case StatusCode::BadTransaction:
                return "BadTransaction";
            case StatusCode::Incompatible:
                return "Incompatible";
            default:
                return "Unknown";
            }
        }
    };
} // namespace arbor::core
