/*

client_basic.cpp
----------------

Opens an in-memory database through a client, creates a table, inserts a
few rows and reads them back from a coroutine.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdint>
#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "example_util.hpp"
#include <sqlitexx/client.hpp>


using sqlitexx::client_builder;
using sqlitexx::connection;
using sqlitexx::statement;
using std::cout;
using std::endl;


int main()
{
    boost::asio::io_context io_ctx;

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            auto db = co_await client_builder()
                .pragma("foreign_keys", "ON")
                .open();
            if (!db)
            {
                print_error(db.error());
                co_return;
            }

            auto created = co_await db->conn_mut([](connection& conn)
            {
                return conn.execute_batch(
                    "CREATE TABLE person(id INTEGER PRIMARY KEY, name TEXT NOT NULL);"
                    "INSERT INTO person(name) VALUES ('Ada'), ('Grace'), ('Linus');");
            });
            if (!created)
            {
                print_error(created.error());
                co_return;
            }

            auto listed = co_await db->conn([](const connection& conn)
            {
                return conn.query_each("SELECT id, name FROM person ORDER BY id",
                    [](const statement& row)
                    {
                        cout << row.column<std::int64_t>(0) << ": " << row.column<std::string>(1) << endl;
                    });
            });
            if (!listed)
                print_error(listed.error());
            else
                cout << *listed << " rows" << endl;

            if (auto closed = co_await db->close(); !closed)
                print_error(closed.error());
        },
        boost::asio::detached);

    io_ctx.run();
    return 0;
}
