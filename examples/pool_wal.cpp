/*

pool_wal.cpp
------------

Opens a WAL-mode pool on a file, funnels concurrent inserts through the
writer and counts the rows from the readers.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "example_util.hpp"
#include <sqlitexx/pool.hpp>


using sqlitexx::connection;
using sqlitexx::journal_mode;
using sqlitexx::pool::pool_builder;
using std::cout;
using std::endl;


int main()
{
    boost::asio::io_context io_ctx;
    const auto path = std::filesystem::temp_directory_path() / "sqlitexx_pool_wal.db";

    sqlitexx::log::logger::instance().set_level(sqlitexx::log::level::debug);

    auto pool = pool_builder()
        .path(path)
        .journal_mode(journal_mode::wal)
        .num_conns(4)
        .open_blocking();
    if (!pool)
    {
        print_error(pool.error());
        return 1;
    }

    auto created = pool->write_blocking([](connection& conn)
    {
        return conn.execute_batch("CREATE TABLE IF NOT EXISTS event(id INTEGER PRIMARY KEY, payload TEXT)");
    });
    if (!created)
    {
        print_error(created.error());
        return 1;
    }

    for (int i = 0; i < 16; ++i)
    {
        boost::asio::co_spawn(io_ctx,
            [i, db = *pool]() mutable -> boost::asio::awaitable<void>
            {
                auto inserted = co_await db.write([i](connection& conn)
                {
                    return conn.execute("INSERT INTO event(payload) VALUES (?)", "event " + std::to_string(i));
                });
                if (!inserted)
                    print_error(inserted.error());
            },
            boost::asio::detached);
    }
    io_ctx.run();

    auto rows = pool->read_blocking([](const connection& conn)
    {
        return conn.query_row<std::int64_t>("SELECT count(*) FROM event");
    });
    if (rows)
        cout << *rows << " events" << endl;
    else
        print_error(rows.error());

    const auto stats = pool->stats();
    cout << "Writes: " << stats.writes_dispatched << ", reads: " << stats.reads_dispatched
         << ", write ratio: " << (stats.write_ratio() * 100) << "%" << endl;

    if (auto closed = pool->close_blocking(); !closed)
    {
        print_error(closed.error());
        return 1;
    }
    return 0;
}
