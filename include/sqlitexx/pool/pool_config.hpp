/*

pool/pool_config.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace sqlitexx::pool
{

/// One connection per hardware thread, at least one
[[nodiscard]] inline std::size_t default_num_conns() noexcept
{
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

/**
 * Configuration for connection pools.
 */
struct pool_config
{
    /// Number of connections (one writer, the rest readers); must be at least 1
    std::size_t num_conns = default_num_conns();

    // ==================== Factory Methods ====================

    /// A single connection serving both reads and writes
    static pool_config single()
    {
        pool_config cfg;
        cfg.num_conns = 1;
        return cfg;
    }
};


/**
 * Pool statistics for monitoring.
 */
struct pool_stats
{
    std::size_t actors = 0;                ///< Actors owned by the pool
    std::size_t readers = 0;               ///< Actors serving reads (the writer when alone)

    std::uint64_t reads_dispatched = 0;    ///< Read jobs queued on a reader
    std::uint64_t writes_dispatched = 0;   ///< Write jobs queued on the writer
    std::uint64_t rejected = 0;            ///< Submissions refused because an actor was closed

    /// Share of dispatched jobs that were writes
    [[nodiscard]] double write_ratio() const noexcept
    {
        const auto total = reads_dispatched + writes_dispatched;
        return total > 0
            ? static_cast<double>(writes_dispatched) / static_cast<double>(total)
            : 0.0;
    }
};

} // namespace sqlitexx::pool
