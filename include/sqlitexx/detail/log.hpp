/*

log.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Header-only logging for sqlitexx. Every entry records the thread it was
emitted from, so output from actor threads can be told apart.

The initial level comes from the SQLITEXX_LOG_LEVEL environment variable
(trace, debug, info, warn, error, fatal, off) and defaults to info.

*/

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

namespace sqlitexx::log
{

/// Log severity levels
enum class level : std::uint8_t
{
    trace = 0,   ///< Per-job tracing (very verbose)
    debug = 1,   ///< Actor and connection lifecycle details
    info = 2,    ///< Opens and closes
    warn = 3,    ///< Failed opens, failed closes, failed joins
    error = 4,   ///< Panicking jobs
    fatal = 5,
    off = 6      ///< Logging disabled
};

/// A single log record handed to callbacks
struct entry
{
    level lvl;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread;
    std::string message;
    std::source_location location;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info:  return "INFO";
        case level::warn:  return "WARN";
        case level::error: return "ERROR";
        case level::fatal: return "FATAL";
        case level::off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name, case-insensitive; nullopt for anything unknown
[[nodiscard]] inline std::optional<level> level_from_string(std::string_view name)
{
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lowered == "trace") return level::trace;
    if (lowered == "debug") return level::debug;
    if (lowered == "info") return level::info;
    if (lowered == "warn" || lowered == "warning") return level::warn;
    if (lowered == "error") return level::error;
    if (lowered == "fatal") return level::fatal;
    if (lowered == "off" || lowered == "none") return level::off;
    return std::nullopt;
}

/**
 * Process-wide logger (thread-safe singleton).
 *
 * Messages below the configured level are dropped before formatting. With no
 * callback installed, entries go to stderr as
 * "[HH:MM:SS.mmm] [LEVEL] [thread] message".
 */
class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        min_level_.store(static_cast<std::uint8_t>(lvl), std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return static_cast<level>(min_level_.load(std::memory_order_relaxed));
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off &&
            static_cast<std::uint8_t>(lvl) >= min_level_.load(std::memory_order_relaxed);
    }

    /// Re-read SQLITEXX_LOG_LEVEL; returns false (level unchanged) if unset or invalid
    bool configure_from_env()
    {
        const char* value = std::getenv("SQLITEXX_LOG_LEVEL");
        if (value == nullptr)
            return false;
        auto parsed = level_from_string(value);
        if (!parsed)
            return false;
        set_level(*parsed);
        return true;
    }

    /// Route entries to a callback instead of stderr
    void set_callback(callback_t cb)
    {
        std::lock_guard lock(mutex_);
        callback_ = std::move(cb);
    }

    void clear_callback()
    {
        std::lock_guard lock(mutex_);
        callback_ = nullptr;
    }

    void log(level lvl, std::string_view message,
             std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;

        entry e{
            .lvl = lvl,
            .timestamp = std::chrono::system_clock::now(),
            .thread = std::this_thread::get_id(),
            .message = std::string(message),
            .location = loc
        };

        std::lock_guard lock(mutex_);
        if (callback_)
            callback_(e);
        else
            write_stderr(e);
    }

private:
    logger()
    {
        configure_from_env();
    }

    static void write_stderr(const entry& e)
    {
        auto time = std::chrono::system_clock::to_time_t(e.timestamp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            e.timestamp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        std::ostringstream line;
        line << '[' << std::put_time(&tm_buf, "%H:%M:%S") << '.'
             << std::setw(3) << std::setfill('0') << ms.count() << "] ["
             << level_to_string(e.lvl) << "] [" << e.thread << "] " << e.message << '\n';
        std::cerr << line.str();
    }

    std::atomic<std::uint8_t> min_level_{static_cast<std::uint8_t>(level::info)};
    std::mutex mutex_;
    callback_t callback_;
};

// Tagged stream macros: SQLITEXX_LOG_INFO("POOL", "opened " << n << " actors")
#define SQLITEXX_LOG_STREAM(lvl, tag, expr) \
    do { \
        auto& _logger = ::sqlitexx::log::logger::instance(); \
        if (_logger.is_enabled(lvl)) \
        { \
            std::ostringstream _stream; \
            _stream << tag << ": " << expr; \
            _logger.log(lvl, _stream.str(), std::source_location::current()); \
        } \
    } while (0)

#define SQLITEXX_LOG_TRACE(tag, expr) SQLITEXX_LOG_STREAM(::sqlitexx::log::level::trace, tag, expr)
#define SQLITEXX_LOG_DEBUG(tag, expr) SQLITEXX_LOG_STREAM(::sqlitexx::log::level::debug, tag, expr)
#define SQLITEXX_LOG_INFO(tag, expr)  SQLITEXX_LOG_STREAM(::sqlitexx::log::level::info, tag, expr)
#define SQLITEXX_LOG_WARN(tag, expr)  SQLITEXX_LOG_STREAM(::sqlitexx::log::level::warn, tag, expr)
#define SQLITEXX_LOG_ERROR(tag, expr) SQLITEXX_LOG_STREAM(::sqlitexx::log::level::error, tag, expr)

} // namespace sqlitexx::log
