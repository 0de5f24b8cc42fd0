/*

test_client.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE client_test

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include <sqlitexx/sqlitexx.hpp>

#include "test_util.hpp"

BOOST_TEST_DONT_PRINT_LOG_VALUE(sqlitexx::errc)

using namespace sqlitexx;


BOOST_AUTO_TEST_CASE(builder_opens_wal_file)
{
    asio::io_context ctx;
    temp_db db("client_wal");
    std::string mode;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto cli = co_await client_builder()
                .path(db.path())
                .journal_mode(journal_mode::wal)
                .busy_timeout(std::chrono::milliseconds(1000))
                .open();
            BOOST_TEST_REQUIRE(cli.has_value());

            auto reported = co_await cli->conn([](const connection& conn)
            {
                return conn.query_row<std::string>("PRAGMA journal_mode");
            });
            mode = reported.value_or("");

            auto closed = co_await cli->close();
            BOOST_TEST(closed.has_value());
        },
        asio::detached);

    ctx.run();
    BOOST_TEST(mode == "wal");
}

BOOST_AUTO_TEST_CASE(ten_concurrent_calls)
{
    asio::io_context ctx;
    int finished = 0;
    std::int64_t total = 0;

    auto cli = client::open_blocking(open_options::in_memory());
    BOOST_TEST_REQUIRE(cli.has_value());

    auto created = cli->conn_mut_blocking([](connection& conn) { return conn.execute_batch("CREATE TABLE t(v INTEGER)"); });
    BOOST_TEST_REQUIRE(created.has_value());

    for (int i = 0; i < 10; ++i)
    {
        asio::co_spawn(ctx,
            [&, i, db = *cli]() -> asio::awaitable<void>
            {
                auto inserted = co_await db.conn_mut([i](connection& conn)
                {
                    return conn.execute("INSERT INTO t VALUES (?)", i);
                });
                if (inserted)
                    ++finished;
            },
            asio::detached);
    }

    ctx.run();

    auto sum = cli->conn_blocking([](const connection& conn) { return conn.query_row<std::int64_t>("SELECT sum(v) FROM t"); });
    total = sum.value_or(-1);

    BOOST_TEST(finished == 10);
    BOOST_TEST(total == 45);
    BOOST_TEST(cli->actor().submitted() == 12u);
    BOOST_TEST(cli->close_blocking().has_value());
}

BOOST_AUTO_TEST_CASE(copies_share_the_connection)
{
    auto cli = client_builder()
        .pragma("user_version", "3")
        .open_blocking();
    BOOST_TEST_REQUIRE(cli.has_value());

    client copy = *cli;
    BOOST_TEST((&copy.actor() == &cli->actor()));

    auto version = copy.conn_blocking([](const connection& conn) { return conn.query_row<int>("PRAGMA user_version"); });
    BOOST_TEST(version.value_or(0) == 3);

    BOOST_TEST(cli->close_blocking().has_value());
    BOOST_TEST(copy.is_closed());

    auto after = copy.conn_blocking([](const connection&) { return 1; });
    BOOST_TEST_REQUIRE(!after.has_value());
    BOOST_TEST(after.error().code() == errc::closed);
}

BOOST_AUTO_TEST_CASE(concurrent_close_waits_for_termination)
{
    asio::io_context ctx;
    std::atomic<bool> job_done{false};
    bool first_saw_done = false;
    bool second_saw_done = false;
    int closes = 0;

    auto cli = client::open_blocking(open_options::in_memory());
    BOOST_TEST_REQUIRE(cli.has_value());

    auto slow = cli->submit([&job_done](connection&)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        job_done = true;
        return 1;
    });
    BOOST_TEST_REQUIRE(slow.has_value());

    asio::co_spawn(ctx,
        [&, db = *cli]() -> asio::awaitable<void>
        {
            auto closed = co_await db.close();
            BOOST_TEST(closed.has_value());
            first_saw_done = job_done.load();
            ++closes;
        },
        asio::detached);

    asio::co_spawn(ctx,
        [&, db = *cli]() -> asio::awaitable<void>
        {
            auto closed = co_await db.close();
            BOOST_TEST(closed.has_value());
            second_saw_done = job_done.load();
            ++closes;
        },
        asio::detached);

    ctx.run();

    BOOST_TEST(closes == 2);
    BOOST_TEST(first_saw_done);
    BOOST_TEST(second_saw_done);
    BOOST_TEST(cli->close_blocking().has_value());
    BOOST_TEST(slow->get().value_or(0) == 1);
}

BOOST_AUTO_TEST_CASE(unwrapped_errors_keep_their_code)
{
    auto cli = client::open_blocking(open_options::in_memory());
    BOOST_TEST_REQUIRE(cli.has_value());

    auto outcome = cli->conn_mut_blocking([](connection& conn)
    {
        return unwrap(conn.execute("UPDATE missing SET v = 1"));
    });
    BOOST_TEST_REQUIRE(!outcome.has_value());
    BOOST_TEST(outcome.error().code() == errc::execution_failed);
    BOOST_TEST(outcome.error().engine_code() != 0);

    BOOST_TEST(cli->close_blocking().has_value());
}

BOOST_AUTO_TEST_CASE(submit_returns_future)
{
    asio::io_context ctx;
    std::int64_t rowid = 0;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto cli = co_await client::open(open_options::in_memory());
            BOOST_TEST_REQUIRE(cli.has_value());

            auto pending = cli->submit([](connection& conn) -> result<std::int64_t>
            {
                if (auto res = conn.execute_batch("CREATE TABLE t(v); INSERT INTO t VALUES (1), (2);"); !res)
                    return std::unexpected(std::move(res).error());
                return conn.last_insert_rowid();
            });
            BOOST_TEST_REQUIRE(pending.has_value());
            rowid = (co_await pending->wait()).value_or(0);

            auto closed = co_await cli->close();
            BOOST_TEST(closed.has_value());
        },
        asio::detached);

    ctx.run();
    BOOST_TEST(rowid == 2);
}

BOOST_AUTO_TEST_CASE(open_error_surfaces)
{
    auto cli = client_builder()
        .journal_mode(journal_mode::wal)
        .open_blocking();
    BOOST_TEST_REQUIRE(!cli.has_value());
    BOOST_TEST(cli.error().code() == errc::pragma_update);
}
