#pragma once

#include <atomic>
#include <chrono>
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace arbor::log {

    enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5, Off = 6 };

    struct LogConfig {
        Level level = Level::Info;
        bool console_output = true; // Must not be modified after init()
        std::string file_path = ""; // empty for no file output
    };

    // "trace", "debug", "info", "warn", "error", "fatal", "off"
    auto parse_level(std::string_view name) -> std::optional<Level>;

    class Logger {
      public:
        static auto instance() -> Logger &;

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        void init(const LogConfig &config);
        void shutdown();

        // Blocks until every entry queued so far has been written.
        void flush();

        template <typename... Args>
        void log(Level level, const std::source_location &loc,
                 fmt::format_string<Args...> format_str, Args &&...args) {
            if (level < current_level_.load(std::memory_order_relaxed))
                return;

            try {
                enqueue(level, loc, fmt::format(format_str, std::forward<Args>(args)...));
            } catch (const std::exception &e) {
                enqueue(Level::Error, loc, fmt::format("LOG FORMAT ERROR: {}", e.what()));
            }
        }

        void set_level(Level level) {
            current_level_.store(level, std::memory_order_relaxed);
            config_.level = level;
        }

        [[nodiscard]] auto level() const -> Level {
            return current_level_.load(std::memory_order_relaxed);
        }

        bool is_initialized() const {
            return static_cast<bool>(impl_);
        }

      private:
        Logger() = default;
        ~Logger();

        struct Entry {
            Level level;
            std::string file_name;
            int line;
            std::string message;
            std::chrono::system_clock::time_point timestamp;
        };

        void enqueue(Level level, const std::source_location &loc, std::string &&msg);
        void worker_loop();
        void write_entry(const Entry &entry);

        struct Impl;
        std::shared_ptr<Impl> impl_;
        std::atomic<Level> current_level_{Level::Info};
        LogConfig config_;
    };
} // namespace arbor::log

// Level guidance for the engine:
// - Trace: per-page events (splits, merges, page reuse).
// - Debug: per-transaction events (begin, commit sizes, free-list state).
// - Info: environment lifecycle (open, close, map growth, stale reader cleanup).
// - Warn: tolerated anomalies (an invalid meta slot skipped on open).
// - Error: a commit or flush failed and was rolled back.
// - Fatal: unrecoverable corruption detected.

#define ARBOR_LOG_AT(lvl, ...)                                                                     \
    do {                                                                                           \
        auto &arbor_logger_ = ::arbor::log::Logger::instance();                                    \
        if (arbor_logger_.is_initialized()) {                                                      \
            arbor_logger_.log(lvl, std::source_location::current(), __VA_ARGS__);                  \
        }                                                                                          \
    } while (0)

#define ARBOR_LOG_TRACE(...) ARBOR_LOG_AT(::arbor::log::Level::Trace, __VA_ARGS__)
#define ARBOR_LOG_DEBUG(...) ARBOR_LOG_AT(::arbor::log::Level::Debug, __VA_ARGS__)
#define ARBOR_LOG_INFO(...) ARBOR_LOG_AT(::arbor::log::Level::Info, __VA_ARGS__)
#define ARBOR_LOG_WARN(...) ARBOR_LOG_AT(::arbor::log::Level::Warn, __VA_ARGS__)
#define ARBOR_LOG_ERROR(...) ARBOR_LOG_AT(::arbor::log::Level::Error, __VA_ARGS__)
#define ARBOR_LOG_FATAL(...) ARBOR_LOG_AT(::arbor::log::Level::Fatal, __VA_ARGS__)
