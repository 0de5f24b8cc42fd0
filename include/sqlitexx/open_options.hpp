/*

open_options.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <sqlite3.h>

namespace sqlitexx
{

/**
 * SQLite journal modes, as accepted and reported by PRAGMA journal_mode.
 */
enum class journal_mode
{
    delete_,
    truncate,
    persist,
    memory,
    wal,
    off
};

/// Lowercase name reported by SQLite for the mode
[[nodiscard]] constexpr std::string_view to_string(journal_mode mode) noexcept
{
    switch (mode)
    {
        case journal_mode::delete_: return "delete";
        case journal_mode::truncate: return "truncate";
        case journal_mode::persist: return "persist";
        case journal_mode::memory: return "memory";
        case journal_mode::wal: return "wal";
        case journal_mode::off: return "off";
    }
    return "delete";
}


/**
 * Flags forwarded to sqlite3_open_v2.
 */
enum class open_flags : int
{
    none = 0,
    read_only = SQLITE_OPEN_READONLY,
    read_write = SQLITE_OPEN_READWRITE,
    create = SQLITE_OPEN_CREATE,
    uri = SQLITE_OPEN_URI,
    memory = SQLITE_OPEN_MEMORY,
    no_mutex = SQLITE_OPEN_NOMUTEX,
    full_mutex = SQLITE_OPEN_FULLMUTEX,
    shared_cache = SQLITE_OPEN_SHAREDCACHE,
    private_cache = SQLITE_OPEN_PRIVATECACHE,
};

[[nodiscard]] constexpr open_flags operator|(open_flags lhs, open_flags rhs) noexcept
{
    return static_cast<open_flags>(static_cast<int>(lhs) | static_cast<int>(rhs));
}

[[nodiscard]] constexpr open_flags operator&(open_flags lhs, open_flags rhs) noexcept
{
    return static_cast<open_flags>(static_cast<int>(lhs) & static_cast<int>(rhs));
}

[[nodiscard]] constexpr bool has_flag(open_flags flags, open_flags flag) noexcept
{
    return (flags & flag) == flag;
}

/// Same defaults as the engine's own bindings: read-write, create, URI filenames, no mutex
inline constexpr open_flags default_open_flags =
    open_flags::read_write | open_flags::create | open_flags::uri | open_flags::no_mutex;


/**
 * Configuration forwarded verbatim to every connection opened by a client or pool.
 */
struct open_options
{
    /// Database file; empty opens a private in-memory database
    std::filesystem::path path;

    /// Flags passed to sqlite3_open_v2
    open_flags flags = default_open_flags;

    /// Journal mode applied and verified after open (unset = leave as is)
    std::optional<sqlitexx::journal_mode> journal_mode;

    /// Pragma statements executed in order after the journal mode, e.g. "PRAGMA foreign_keys = ON"
    std::vector<std::string> pragmas;

    /// Busy handler timeout (0 = fail immediately with SQLITE_BUSY)
    std::chrono::milliseconds busy_timeout{5000};

    /// Name of the VFS module to use (empty = default VFS)
    std::string vfs;

    // ==================== Factory Methods ====================

    /// Private in-memory database
    static open_options in_memory()
    {
        return open_options{};
    }

    /// Database file with default settings
    static open_options file(std::filesystem::path db_path)
    {
        open_options opts;
        opts.path = std::move(db_path);
        return opts;
    }

    /// Database file in write-ahead-log mode (readers do not block the writer)
    static open_options wal(std::filesystem::path db_path)
    {
        open_options opts = file(std::move(db_path));
        opts.journal_mode = sqlitexx::journal_mode::wal;
        return opts;
    }

    /// Filename handed to sqlite3_open_v2
    [[nodiscard]] std::string target() const
    {
        return path.empty() ? std::string(":memory:") : path.string();
    }
};

} // namespace sqlitexx
