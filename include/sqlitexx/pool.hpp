/*

pool.hpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Connection pooling for sqlitexx.

*/

#pragma once

#include <sqlitexx/pool/pool_config.hpp>
#include <sqlitexx/pool/connection_pool.hpp>

/**
 * @file pool.hpp
 * @brief One writer, many readers over the same database.
 *
 * @section Overview
 *
 * A pool owns num_conns connection actors opened on the same storage with
 * the same options. The first one is the writer and receives every write;
 * the others take reads in turn. SQLite allows a single writer at a time,
 * so funnelling writes through one actor removes SQLITE_BUSY between
 * writers of the same pool.
 *
 * @section Usage
 *
 * @code
 * #include <sqlitexx/pool.hpp>
 *
 * asio::io_context ctx;
 *
 * asio::co_spawn(ctx, []() -> asio::awaitable<void>
 * {
 *     auto pool = co_await sqlitexx::pool::pool_builder()
 *         .path("app.db")
 *         .journal_mode(sqlitexx::journal_mode::wal)
 *         .num_conns(4)
 *         .open();
 *     if (!pool)
 *         co_return;
 *
 *     co_await pool->write([](sqlitexx::connection& conn) {
 *         return conn.execute("INSERT INTO t(v) VALUES (?)", 1);
 *     });
 *
 *     auto rows = co_await pool->read([](const sqlitexx::connection& conn) {
 *         return conn.query_row<std::int64_t>("SELECT count(*) FROM t");
 *     });
 *
 *     co_await pool->close();
 * }, asio::detached);
 *
 * ctx.run();
 * @endcode
 *
 * @subsection Monitoring Monitoring
 *
 * @code
 * auto stats = pool->stats();
 * std::cout << "Write ratio: " << (stats.write_ratio() * 100) << "%\n";
 * std::cout << "Rejected: " << stats.rejected << "\n";
 * @endcode
 *
 * @section Visibility Visibility
 *
 * The pool does not order a read after a write that completed on another
 * actor. With journal_mode::wal a reader sees every transaction committed
 * before its own read transaction began. Pools on in-memory databases give
 * every connection its own private database.
 *
 * @section ThreadSafety Thread Safety
 *
 * - Submissions may come from any thread or coroutine
 * - Closures run on actor threads and must not capture the pool's connections
 * - Statistics access is thread-safe
 */

namespace sqlitexx::pool
{

/**
 * @brief Pool module version.
 */
inline constexpr struct
{
    int major = 1;
    int minor = 0;
    int patch = 0;
} version;

} // namespace sqlitexx::pool
