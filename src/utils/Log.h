// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file Log.h
 * @brief Leveled logging with compile-time checked format strings
 *
 * Lightweight logging built on std::format and std::source_location.
 * Entries are written as a single line:
 *
 *     [YYYY-MM-DD HH:MM:SS.mmm] LEVEL: message (file:line)
 *
 * The default sink writes to std::cerr. A replacement sink can be installed
 * with set_sink(), which the test suites use to inspect what the core logs.
 *
 * @warning Never pass secrets, derived keys or record fields to these
 *          functions. Log record ids and counts only.
 *
 * @code
 * ZeroVault::Log::set_level(ZeroVault::Log::Level::Debug);
 * ZeroVault::Log::info("Session unlocked for {}", user_id);
 * ZeroVault::Log::warning("Skipped {} undecryptable records", skipped);
 * @endcode
 */

#ifndef ZEROVAULT_LOG_H
#define ZEROVAULT_LOG_H

#include <chrono>
#include <ctime>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace ZeroVault::Log {

/**
 * @brief Log severity levels, lowest first
 */
enum class Level {
    Debug,     ///< Detailed debugging information
    Info,      ///< State transitions and normal operation
    Warning,   ///< Recoverable problems (skipped records, clamped values)
    Error      ///< Operation failures
};

/// Receives the level and the fully formatted line (without trailing newline)
using Sink = std::function<void(Level, std::string_view)>;

/**
 * @brief Current minimum log level (default Info)
 */
inline Level current_level = Level::Info;

namespace detail {
    inline constexpr std::string_view level_to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug:   return "DEBUG";
            case Level::Info:    return "INFO ";
            case Level::Warning: return "WARN ";
            case Level::Error:   return "ERROR";
        }
        return "UNKNOWN";
    }

    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t, &tm);

        return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
    }

    inline std::mutex& sink_mutex() {
        static std::mutex mutex;
        return mutex;
    }

    inline Sink& sink() {
        static Sink active;
        return active;
    }

    inline void write(Level level, const std::string& line) {
        std::lock_guard lock(sink_mutex());
        if (sink()) {
            sink()(level, line);
        } else {
            std::cerr << line << '\n';
        }
    }

    /**
     * @brief Format string bundled with the caller's source location
     *
     * Implicitly constructed from a string literal at the call site, so the
     * default argument captures the location of the logging statement rather
     * than of this header.
     */
    template<typename... Args>
    struct FormatWithLocation {
        std::format_string<Args...> fmt;
        std::source_location loc;

        template<typename T>
        consteval FormatWithLocation(const T& s,
                                     std::source_location l = std::source_location::current())
            : fmt(s), loc(l) {}
    };
}

template<typename... Args>
using format_with_location = detail::FormatWithLocation<std::type_identity_t<Args>...>;

/**
 * @brief Emit one entry if @p level passes the current filter
 */
template<typename... Args>
void log(Level level, format_with_location<Args...> fmt, Args&&... args) {
    if (level < current_level) {
        return;
    }

    auto message = std::format(fmt.fmt, std::forward<Args>(args)...);
    detail::write(level, std::format("[{}] {}: {} ({}:{})",
        detail::get_timestamp(), detail::level_to_string(level), message,
        fmt.loc.file_name(), fmt.loc.line()));
}

template<typename... Args>
void debug(format_with_location<Args...> fmt, Args&&... args) {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(format_with_location<Args...> fmt, Args&&... args) {
    log(Level::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(format_with_location<Args...> fmt, Args&&... args) {
    log(Level::Warning, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(format_with_location<Args...> fmt, Args&&... args) {
    log(Level::Error, fmt, std::forward<Args>(args)...);
}

/**
 * @brief Set minimum log level at runtime
 */
inline void set_level(Level level) {
    current_level = level;
}

/**
 * @brief Replace the output sink; pass an empty Sink to restore std::cerr
 */
inline void set_sink(Sink sink) {
    std::lock_guard lock(detail::sink_mutex());
    detail::sink() = std::move(sink);
}

} // namespace ZeroVault::Log

#endif // ZEROVAULT_LOG_H
