/*

blocking_throwing.cpp
---------------------

Uses the blocking client API from plain threads, turning errors into
exceptions with sqlitexx::unwrap.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdint>
#include <iostream>
#include <thread>
#include <vector>
#include <sqlitexx/sqlitexx.hpp>


using sqlitexx::client;
using sqlitexx::connection;
using sqlitexx::open_options;
using sqlitexx::unwrap;
using std::cout;
using std::endl;


int main()
{
    try
    {
        client db = unwrap(client::open_blocking(open_options::in_memory()));
        unwrap(db.conn_mut_blocking([](connection& conn)
        {
            return conn.execute_batch("CREATE TABLE counter(n INTEGER)");
        }));

        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t)
        {
            workers.emplace_back([db, t]
            {
                for (int i = 0; i < 10; ++i)
                {
                    auto res = db.conn_mut_blocking([t](connection& conn)
                    {
                        return conn.execute("INSERT INTO counter VALUES (?)", t);
                    });
                    if (!res)
                        cout << res.error().to_string() << endl;
                }
            });
        }
        for (auto& worker : workers)
            worker.join();

        auto total = unwrap(db.conn_blocking([](const connection& conn)
        {
            return conn.query_row<std::int64_t>("SELECT count(*) FROM counter");
        }));
        cout << total << " rows" << endl;

        // Throws: the table does not exist
        cout << unwrap(db.conn_blocking([](const connection& conn)
        {
            return conn.query_row<std::int64_t>("SELECT count(*) FROM missing");
        })) << endl;
    }
    catch (const sqlitexx::exception& exc)
    {
        cout << exc.what() << endl;
        return 1;
    }
    return 0;
}
