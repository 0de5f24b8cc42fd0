/*

exception_bridge.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Helpers to bridge exception-based code into sqlitexx::result.

*/

#pragma once

#include <exception>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

#include <sqlitexx/config.hpp>
#include <sqlitexx/detail/result.hpp>

#if SQLITEXX_THROWING_ENABLED
#include <sqlitexx/throwing.hpp>
#endif

namespace sqlitexx
{

/**
 * Convert an in-flight exception into an error value.
 *
 * A sqlitexx::exception keeps the error it was built from, so a closure that
 * unwraps an engine failure still reports that failure. Anything else maps to
 * the fallback code with the exception text as the message.
 */
[[nodiscard]] inline error from_exception(std::exception_ptr eptr, errc fallback)
{
    if (!eptr)
        return error(fallback, "unknown exception");

    try
    {
        std::rethrow_exception(eptr);
    }
#if SQLITEXX_THROWING_ENABLED
    catch (const sqlitexx::exception& exc)
    {
        return exc.error();
    }
#endif
    catch (const std::system_error& exc)
    {
        return error(fallback, exc.what(), exc.code().value());
    }
    catch (const std::exception& exc)
    {
        return error(fallback, exc.what());
    }
    catch (...)
    {
        return error(fallback, "unknown exception");
    }
}

template<class F>
[[nodiscard]] auto protect(F&& f, errc fallback) -> result<std::invoke_result_t<F>>
{
    using ret_t = std::invoke_result_t<F>;
    try
    {
        if constexpr (std::is_void_v<ret_t>)
        {
            std::invoke(std::forward<F>(f));
            return ok();
        }
        else
        {
            return result<ret_t>(std::invoke(std::forward<F>(f)));
        }
    }
    catch (...)
    {
        return std::unexpected(from_exception(std::current_exception(), fallback));
    }
}

namespace detail
{

/// Value type produced by a job closure: R for result<R>, the return type otherwise
template<class R>
struct job_value
{
    using type = R;
};

template<class T>
struct job_value<std::expected<T, error>>
{
    using type = T;
};

template<class F, class Conn>
using job_value_t = typename job_value<std::remove_cvref_t<std::invoke_result_t<F&, Conn&>>>::type;

/**
 * Run a job closure against a connection and flatten its outcome.
 *
 * Errors returned by the closure pass through unchanged; exceptions thrown by
 * it become errc::panic.
 */
template<class F, class Conn>
[[nodiscard]] result<job_value_t<F, Conn>> protect_job(F& f, Conn& conn)
{
    using ret_t = std::remove_cvref_t<std::invoke_result_t<F&, Conn&>>;
    using value_t = job_value_t<F, Conn>;
    try
    {
        if constexpr (is_result_v<ret_t>)
        {
            return std::invoke(f, conn);
        }
        else if constexpr (std::is_void_v<ret_t>)
        {
            std::invoke(f, conn);
            return ok();
        }
        else
        {
            return result<value_t>(std::invoke(f, conn));
        }
    }
    catch (...)
    {
        return std::unexpected(from_exception(std::current_exception(), errc::panic));
    }
}

} // namespace detail

} // namespace sqlitexx
