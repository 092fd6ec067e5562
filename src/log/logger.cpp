#include "log/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <source_location>
#include <thread>
#include <unistd.h>
#include <vector>

namespace arbor::log {
    struct Logger::Impl {
        std::mutex queue_mutex;
        std::condition_variable cv;
        std::condition_variable drained_cv;
        std::deque<Entry> queue;
        std::thread worker_thread;
        bool exit_flag = false;
        uint64_t enqueued = 0;
        uint64_t written = 0;
        std::ofstream log_file;
    };

    auto parse_level(std::string_view name) -> std::optional<Level> {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "trace")
            return Level::Trace;
        if (lower == "debug")
            return Level::Debug;
        if (lower == "info")
            return Level::Info;
        if (lower == "warn" || lower == "warning")
            return Level::Warn;
        if (lower == "error")
            return Level::Error;
        if (lower == "fatal")
            return Level::Fatal;
        if (lower == "off")
            return Level::Off;
        return std::nullopt;
    }

    auto Logger::instance() -> Logger & {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        shutdown();
    }

    void Logger::init(const LogConfig &config) {
        if (impl_) {
            ARBOR_LOG_WARN("Logger already initialized, ignoring duplicate init() call");
            return;
        }
        config_ = config;
        current_level_.store(config.level, std::memory_order_relaxed);
        impl_ = std::make_shared<Impl>();
        if (!config_.file_path.empty()) {
            impl_->log_file.open(config_.file_path, std::ios::out | std::ios::app);
            if (!impl_->log_file.is_open()) {
                std::fprintf(stderr, "arbor: failed to open log file: %s\n",
                             config_.file_path.c_str());
            }
        }
        impl_->worker_thread = std::thread(&Logger::worker_loop, this);
    }

    void Logger::shutdown() {
        if (impl_ && impl_->worker_thread.joinable()) {
            {
                std::lock_guard<std::mutex> lock(impl_->queue_mutex);
                impl_->exit_flag = true;
            }
            impl_->cv.notify_one();
            impl_->worker_thread.join();
        }

        if (impl_ && impl_->log_file.is_open()) {
            impl_->log_file.close();
        }
        impl_.reset();
    }

    void Logger::flush() {
        auto impl = impl_;
        if (!impl)
            return;
        std::unique_lock<std::mutex> lock(impl->queue_mutex);
        const uint64_t target = impl->enqueued;
        impl->drained_cv.wait(lock, [&] { return impl->written >= target || impl->exit_flag; });
    }

    void Logger::enqueue(Level level, const std::source_location &loc, std::string &&msg) {
        auto impl = impl_;
        if (!impl)
            return;

        std::string filename = std::filesystem::path(loc.file_name()).filename().string();
        {
            std::lock_guard<std::mutex> lock(impl->queue_mutex);
            impl->queue.push_back(Entry{level, std::move(filename), static_cast<int>(loc.line()),
                                        std::move(msg), std::chrono::system_clock::now()});
            impl->enqueued++;
        }
        impl->cv.notify_one();
    }

    static auto level_style(Level level) -> fmt::text_style {
        switch (level) {
        case Level::Trace:
            return fmt::fg(fmt::color::gray);
        case Level::Debug:
            return fmt::fg(fmt::color::cyan);
        case Level::Info:
            return fmt::fg(fmt::color::green);
        case Level::Warn:
            return fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
        case Level::Error:
            return fmt::fg(fmt::color::red) | fmt::emphasis::bold;
        case Level::Fatal:
            return fmt::bg(fmt::color::red) | fmt::fg(fmt::color::white) | fmt::emphasis::bold;
        default:
            return fmt::fg(fmt::color::white);
        }
    }

    static auto level_name(Level level) -> std::string_view {
        switch (level) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return " INFO";
        case Level::Warn:
            return " WARN";
        case Level::Error:
            return "ERROR";
        case Level::Fatal:
            return "FATAL";
        default:
            return "UNKNOWN";
        }
    }

    // [YYYY-MM-DD HH:MM:SS] [LEVEL] [pid] [file:line] message
    void Logger::write_entry(const Entry &entry) {
        auto time_t_val = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto stamp = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(time_t_val));

        if (config_.console_output) {
            fmt::print(stderr, "{} {} {} {}\n", fmt::format(fmt::fg(fmt::color::dim_gray), "[{}]", stamp),
                       fmt::format(level_style(entry.level), "[{}]", level_name(entry.level)),
                       fmt::format(fmt::fg(fmt::color::steel_blue), "[{}:{}]", entry.file_name,
                                   entry.line),
                       entry.message);
        }

        if (impl_->log_file.is_open()) {
            impl_->log_file << fmt::format("[{}] [{}] [{}] [{}:{}] {}\n", stamp,
                                           level_name(entry.level), ::getpid(), entry.file_name,
                                           entry.line, entry.message);
        }
    }

    void Logger::worker_loop() {
        while (true) {
            std::vector<Entry> batch;

            {
                std::unique_lock<std::mutex> lock(impl_->queue_mutex);
                impl_->cv.wait(lock, [this] { return !impl_->queue.empty() || impl_->exit_flag; });

                if (impl_->exit_flag && impl_->queue.empty()) {
                    break;
                }
                std::move(impl_->queue.begin(), impl_->queue.end(), std::back_inserter(batch));
                impl_->queue.clear();
            }

            for (const auto &entry : batch) {
                write_entry(entry);
            }
            if (impl_->log_file.is_open()) {
                impl_->log_file.flush();
            }

            {
                std::lock_guard<std::mutex> lock(impl_->queue_mutex);
                impl_->written += batch.size();
            }
            impl_->drained_cv.notify_all();
        }
        impl_->drained_cv.notify_all();
    }
} // namespace arbor::log
