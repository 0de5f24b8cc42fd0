/*

test_actor.cpp
--------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE actor_test

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include <sqlitexx/actor.hpp>
#include <sqlitexx/detail/asio_decl.hpp>

#include "test_util.hpp"

BOOST_TEST_DONT_PRINT_LOG_VALUE(sqlitexx::errc)

using namespace sqlitexx;


BOOST_AUTO_TEST_CASE(jobs_complete_in_submission_order)
{
    asio::io_context ctx;
    std::vector<int> order;
    std::vector<int> results;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto actor = co_await connection_actor::open(open_options::in_memory());
            BOOST_TEST_REQUIRE(actor.has_value());

            std::vector<job_future<int>> futures;
            for (int i = 0; i < 50; ++i)
            {
                auto pending = (*actor)->submit([i, &order](connection&) { order.push_back(i); return i; });
                BOOST_TEST_REQUIRE(pending.has_value());
                futures.push_back(std::move(*pending));
            }
            BOOST_TEST((*actor)->submitted() == 50u);

            for (auto& future : futures)
            {
                auto value = co_await future.wait();
                results.push_back(value.value_or(-1));
            }

            auto closed = co_await (*actor)->close();

            BOOST_TEST(closed.has_value());
        },
        asio::detached);

    ctx.run();

    BOOST_TEST_REQUIRE(order.size() == 50u);
    for (int i = 0; i < 50; ++i)
    {
        BOOST_TEST(order[i] == i);
        BOOST_TEST(results[i] == i);
    }
}

BOOST_AUTO_TEST_CASE(at_most_one_job_at_a_time)
{
    asio::io_context ctx;
    overlap_guard guard;
    int completed = 0;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto actor = co_await connection_actor::open(open_options::in_memory());
            BOOST_TEST_REQUIRE(actor.has_value());

            std::vector<job_future<void>> futures;
            for (int i = 0; i < 20; ++i)
            {
                auto pending = (*actor)->submit([&guard](connection&)
                {
                    overlap_guard::scope running(guard);
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                });
                BOOST_TEST_REQUIRE(pending.has_value());
                futures.push_back(std::move(*pending));
            }

            for (auto& future : futures)
            {
                if ((co_await future.wait()).has_value())
                    ++completed;
            }
            auto closed = co_await (*actor)->close();
            BOOST_TEST(closed.has_value());
        },
        asio::detached);

    ctx.run();

    BOOST_TEST(completed == 20);
    BOOST_TEST(guard.peak() == 1);
}

BOOST_AUTO_TEST_CASE(jobs_run_on_the_actor_thread)
{
    auto actor = connection_actor::open_blocking(open_options::in_memory());
    BOOST_TEST_REQUIRE(actor.has_value());

    auto pending = (*actor)->submit([](connection&) { return std::this_thread::get_id(); });
    BOOST_TEST_REQUIRE(pending.has_value());
    auto ran_on = pending->get();
    BOOST_TEST_REQUIRE(ran_on.has_value());
    BOOST_TEST((*ran_on == (*actor)->thread_id()));
    BOOST_TEST((*ran_on != std::this_thread::get_id()));

    BOOST_TEST((*actor)->close_blocking().has_value());
}

BOOST_AUTO_TEST_CASE(submit_after_close_is_rejected)
{
    asio::io_context ctx;
    bool rejected = false;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto actor = co_await connection_actor::open(open_options::in_memory());
            BOOST_TEST_REQUIRE(actor.has_value());

            auto closed = co_await (*actor)->close();
            BOOST_TEST(closed.has_value());
            BOOST_TEST((*actor)->is_closed());

            auto pending = (*actor)->submit([](connection&) { return 1; });
            rejected = !pending.has_value() && pending.error().code() == errc::closed;

            // A second close reports the outcome of the first
            auto closed_again = co_await (*actor)->close();
            BOOST_TEST(closed_again.has_value());
        },
        asio::detached);

    ctx.run();
    BOOST_TEST(rejected);
}

BOOST_AUTO_TEST_CASE(queued_jobs_drain_before_close_returns)
{
    asio::io_context ctx;
    int succeeded = 0;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto actor = co_await connection_actor::open(open_options::in_memory());
            BOOST_TEST_REQUIRE(actor.has_value());

            std::vector<job_future<void>> futures;
            for (int i = 0; i < 5; ++i)
            {
                auto pending = (*actor)->submit([](connection&)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                });
                BOOST_TEST_REQUIRE(pending.has_value());
                futures.push_back(std::move(*pending));
            }

            auto closed = co_await (*actor)->close();

            BOOST_TEST(closed.has_value());

            for (auto& future : futures)
            {
                BOOST_TEST(future.is_ready());
                if ((co_await future.wait()).has_value())
                    ++succeeded;
            }
        },
        asio::detached);

    ctx.run();
    BOOST_TEST(succeeded == 5);
}

BOOST_AUTO_TEST_CASE(throwing_job_is_contained)
{
    asio::io_context ctx;
    errc panic_code = errc::success;
    std::int64_t after = 0;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto actor = co_await connection_actor::open(open_options::in_memory());
            BOOST_TEST_REQUIRE(actor.has_value());

            auto boom = (*actor)->submit([](connection&) -> int { throw std::runtime_error("boom"); });
            BOOST_TEST_REQUIRE(boom.has_value());
            auto outcome = co_await boom->wait();
            if (!outcome)
                panic_code = outcome.error().code();

            auto next = (*actor)->submit([](connection& conn) { return conn.query_row<std::int64_t>("SELECT 41 + 1"); });
            BOOST_TEST_REQUIRE(next.has_value());
            after = (co_await next->wait()).value_or(0);

            auto closed = co_await (*actor)->close();

            BOOST_TEST(closed.has_value());
        },
        asio::detached);

    ctx.run();
    BOOST_TEST(panic_code == errc::panic);
    BOOST_TEST(after == 42);
}

BOOST_AUTO_TEST_CASE(closure_errors_pass_through)
{
    auto actor = connection_actor::open_blocking(open_options::in_memory());
    BOOST_TEST_REQUIRE(actor.has_value());

    auto pending = (*actor)->submit([](connection& conn) { return conn.execute("INSERT INTO missing VALUES (1)"); });
    BOOST_TEST_REQUIRE(pending.has_value());
    auto outcome = pending->get();
    BOOST_TEST_REQUIRE(!outcome.has_value());
    BOOST_TEST(outcome.error().code() == errc::execution_failed);
    BOOST_TEST(outcome.error().engine_code() == SQLITE_ERROR);

    BOOST_TEST((*actor)->close_blocking().has_value());
}

BOOST_AUTO_TEST_CASE(dropped_future_leaves_actor_usable)
{
    asio::io_context ctx;
    std::int64_t rows = 0;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto actor = co_await connection_actor::open(open_options::in_memory());
            BOOST_TEST_REQUIRE(actor.has_value());

            auto setup = (*actor)->submit([](connection& conn) { return conn.execute_batch("CREATE TABLE t(v)"); });
            BOOST_TEST_REQUIRE(setup.has_value());
            auto done = co_await setup->wait();
            BOOST_TEST(done.has_value());

            {
                auto abandoned = (*actor)->submit([](connection& conn)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                    return conn.execute("INSERT INTO t VALUES (?)", 1);
                });
                BOOST_TEST_REQUIRE(abandoned.has_value());
            }

            auto count = (*actor)->submit([](connection& conn) { return conn.query_row<std::int64_t>("SELECT count(*) FROM t"); });
            BOOST_TEST_REQUIRE(count.has_value());
            rows = (co_await count->wait()).value_or(-1);

            auto closed = co_await (*actor)->close();

            BOOST_TEST(closed.has_value());
        },
        asio::detached);

    ctx.run();
    BOOST_TEST(rows == 1);
}

BOOST_AUTO_TEST_CASE(close_blocking_from_actor_thread_fails)
{
    auto actor = connection_actor::open_blocking(open_options::in_memory());
    BOOST_TEST_REQUIRE(actor.has_value());

    connection_actor* self = actor->get();
    auto pending = self->submit([self](connection&) { return self->close_blocking(); });
    BOOST_TEST_REQUIRE(pending.has_value());

    auto outcome = pending->get();
    BOOST_TEST_REQUIRE(!outcome.has_value());
    BOOST_TEST(outcome.error().code() == errc::join_failed);
    BOOST_TEST(self->is_closed());

    auto again = self->close_blocking();
    BOOST_TEST_REQUIRE(!again.has_value());
    BOOST_TEST(again.error().code() == errc::join_failed);
}

BOOST_AUTO_TEST_CASE(concurrent_close_blocking_waits_for_drain)
{
    auto actor = connection_actor::open_blocking(open_options::in_memory());
    BOOST_TEST_REQUIRE(actor.has_value());

    std::atomic<bool> job_done{false};
    auto slow = (*actor)->submit([&job_done](connection&)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        job_done = true;
        return 1;
    });
    BOOST_TEST_REQUIRE(slow.has_value());

    bool other_saw_done = false;
    bool other_closed = false;
    std::thread other([&]
    {
        auto closed = (*actor)->close_blocking();
        other_closed = closed.has_value();
        other_saw_done = job_done.load();
    });

    auto closed = (*actor)->close_blocking();
    const bool saw_done = job_done.load();
    other.join();

    BOOST_TEST(closed.has_value());
    BOOST_TEST(saw_done);
    BOOST_TEST(other_closed);
    BOOST_TEST(other_saw_done);
}

BOOST_AUTO_TEST_CASE(open_failure_is_reported)
{
    asio::io_context ctx;
    errc code = errc::success;

    asio::co_spawn(ctx,
        [&]() -> asio::awaitable<void>
        {
            auto actor = co_await connection_actor::open(open_options::file("/nonexistent-sqlitexx-dir/sub/test.db"));
            if (!actor)
                code = actor.error().code();
        },
        asio::detached);

    ctx.run();
    BOOST_TEST(code == errc::open_failed);

    auto blocking = connection_actor::open_blocking(open_options::file("/nonexistent-sqlitexx-dir/sub/test.db"));
    BOOST_TEST_REQUIRE(!blocking.has_value());
    BOOST_TEST(blocking.error().is_open_error());
}
