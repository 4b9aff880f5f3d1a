/*
 * StrideDB
 * Copyright (C) 2026 Swift Storm Studio
 *
 * This file is part of StrideDB.
 *
 * StrideDB is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * StrideDB is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with StrideDB.  If not, see <https://www.gnu.org/licenses/>.
 */

// internal/include/core/Logging.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string_view>

namespace stridedb::core {
    /**
     * Log levels, ordered from most verbose (DEBUG) to silent (OFF).
     */
    enum class LogLevel : uint8_t {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3,
        OFF = 4
    };

    [[nodiscard]] inline const char* log_level_name(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::OFF: return "OFF";
        }
        return "UNKNOWN";
    }

    /**
     * Parses an all-upper or all-lower case level name.
     * Unknown names map to WARN.
     */
    [[nodiscard]] inline LogLevel parse_log_level(std::string_view name) noexcept {
        if (name == "DEBUG" || name == "debug") { return LogLevel::DEBUG; }
        if (name == "INFO" || name == "info") { return LogLevel::INFO; }
        if (name == "WARN" || name == "warn" || name == "WARNING" || name == "warning") { return LogLevel::WARN; }
        if (name == "ERROR" || name == "error") { return LogLevel::ERROR; }
        if (name == "OFF" || name == "off") { return LogLevel::OFF; }
        return LogLevel::WARN;
    }

    /**
     * Logger - process-wide leveled logger writing to stderr.
     *
     * The initial level is WARN, or the value of the STRIDEDB_LOG_LEVEL
     * environment variable when set.
     *
     * Thread-safety: all methods are thread-safe; output lines never interleave.
     */
    class Logger {
        public:
            [[nodiscard]] static Logger& instance() {
                static Logger logger;
                return logger;
            }

            void set_level(LogLevel level) noexcept { level_.store(level, std::memory_order_relaxed); }

            [[nodiscard]] LogLevel level() const noexcept { return level_.load(std::memory_order_relaxed); }

            [[nodiscard]] bool is_enabled(LogLevel level) const noexcept {
                return level != LogLevel::OFF && level >= level_.load(std::memory_order_relaxed);
            }

            void set_show_timestamp(bool show) noexcept { show_timestamp_.store(show, std::memory_order_relaxed); }

            template <typename... Args>
            void log(LogLevel level, const char* component, Args&&... args) {
                if (!is_enabled(level)) { return; }

                std::ostringstream oss;

                if (show_timestamp_.load(std::memory_order_relaxed)) {
                    const auto now = std::chrono::system_clock::now();
                    const auto time = std::chrono::system_clock::to_time_t(now);
                    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
                    std::tm tm_buf{};
#if defined(_WIN32)
                    localtime_s(&tm_buf, &time);
#else
                    localtime_r(&time, &tm_buf);
#endif
                    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
                        << '.' << std::setfill('0') << std::setw(3) << ms.count() << ' ';
                }

                oss << '[' << log_level_name(level) << ']';
                if (component && component[0] != '\0') { oss << '[' << component << ']'; }
                oss << ' ';
                ((oss << args), ...);

                std::lock_guard<std::mutex> lock{mutex_};
                std::cerr << oss.str() << '\n';
            }

            Logger(const Logger&) = delete;
            Logger& operator=(const Logger&) = delete;

        private:
            Logger() : level_{LogLevel::WARN}, show_timestamp_{false} {
                if (const char* env = std::getenv("STRIDEDB_LOG_LEVEL"); env != nullptr) { level_.store(parse_log_level(env)); }
            }

            std::atomic<LogLevel> level_;
            std::atomic<bool> show_timestamp_;
            std::mutex mutex_;
    };

    inline void set_log_level(LogLevel level) noexcept { Logger::instance().set_level(level); }
} // namespace stridedb::core

#define STRIDEDB_LOG(level, component, ...) \
    do { \
        if (::stridedb::core::Logger::instance().is_enabled(level)) { \
            ::stridedb::core::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while (0)

#define STRIDEDB_LOG_DEBUG(component, ...) STRIDEDB_LOG(::stridedb::core::LogLevel::DEBUG, component, __VA_ARGS__)
#define STRIDEDB_LOG_INFO(component, ...) STRIDEDB_LOG(::stridedb::core::LogLevel::INFO, component, __VA_ARGS__)
#define STRIDEDB_LOG_WARN(component, ...) STRIDEDB_LOG(::stridedb::core::LogLevel::WARN, component, __VA_ARGS__)
#define STRIDEDB_LOG_ERROR(component, ...) STRIDEDB_LOG(::stridedb::core::LogLevel::ERROR, component, __VA_ARGS__)
