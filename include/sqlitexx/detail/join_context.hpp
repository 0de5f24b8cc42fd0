/*

join_context.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Blocking thread joins performed off the caller's executor.

*/

#pragma once

#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include <sqlitexx/detail/asio_decl.hpp>
#include <sqlitexx/detail/completion.hpp>
#include <sqlitexx/detail/result.hpp>

namespace sqlitexx::detail
{

/// Single-threaded context dedicated to std::thread::join calls
inline asio::thread_pool& join_context()
{
    static asio::thread_pool context(1);
    return context;
}

/// Join a thread, reporting failure instead of throwing
[[nodiscard]] inline result_void join_thread(std::thread& thread)
{
    if (!thread.joinable())
        return ok();

    if (thread.get_id() == std::this_thread::get_id())
    {
        thread.detach();
        return fail(errc::join_failed, "thread cannot join itself; detached");
    }

    try
    {
        thread.join();
    }
    catch (const std::system_error& exc)
    {
        return fail(errc::join_failed, exc.what(), exc.code().value());
    }
    return ok();
}

/// Join on join_context() and resume the awaiting coroutine on its own executor
inline asio::awaitable<result_void> async_join(std::thread thread)
{
    if (!thread.joinable())
        co_return ok();

    auto [slot, joined] = make_completion<void>();
    asio::post(join_context(),
        [thread = std::move(thread), slot = std::move(slot)]() mutable
        {
            slot->fulfill(join_thread(thread));
        });
    co_return co_await joined.wait();
}

} // namespace sqlitexx::detail
