/*

asio_decl.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Centralized Boost.Asio / standalone Asio declarations for sqlitexx.
This header simplifies async notation throughout the library.

*/

#pragma once

#include <chrono>

// Check for standalone Asio first
#if defined(SQLITEXX_USE_STANDALONE_ASIO)

#include <asio/version.hpp>
#if ASIO_VERSION < 101800 // Asio 1.18.0
#error "Asio version 1.18.0 or higher is required"
#endif

#include <asio.hpp>

#if defined(ASIO_HAS_CO_AWAIT)

namespace sqlitexx::asio
{
    // Core types
    using ::asio::awaitable;
    using ::asio::co_spawn;
    using ::asio::detached;
    using ::asio::use_awaitable;
    using ::asio::io_context;
    using ::asio::any_io_executor;
    using ::asio::steady_timer;
    using ::asio::thread_pool;

    // Completion plumbing
    using ::asio::async_initiate;
    using ::asio::bind_executor;
    using ::asio::associated_executor_t;
    using ::asio::get_associated_executor;
    using ::asio::executor_work_guard;
    using ::asio::make_work_guard;
    using ::asio::system_executor;
    using ::asio::post;
    using ::asio::dispatch;

    namespace error = ::asio::error;

    using error_code = ::asio::error_code;
    using system_error = ::asio::system_error;

} // namespace sqlitexx::asio

#else
#error "sqlitexx requires coroutine support (C++20) and Asio 1.18+"
#endif

#else // Use Boost.Asio (default)

#include <boost/asio/version.hpp>
#if BOOST_ASIO_VERSION < 101800 // Boost.Asio 1.18.0
#error "Boost.Asio version 1.18.0 or higher is required (Boost 1.74+)"
#endif

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>

#if defined(BOOST_ASIO_HAS_CO_AWAIT)
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace sqlitexx::asio
{
    // Core types
    using boost::asio::awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;
    using boost::asio::use_awaitable;
    using boost::asio::io_context;
    using boost::asio::any_io_executor;
    using boost::asio::steady_timer;
    using boost::asio::thread_pool;

    // Completion plumbing
    using boost::asio::async_initiate;
    using boost::asio::bind_executor;
    using boost::asio::associated_executor_t;
    using boost::asio::get_associated_executor;
    using boost::asio::executor_work_guard;
    using boost::asio::make_work_guard;
    using boost::asio::system_executor;
    using boost::asio::post;
    using boost::asio::dispatch;

    namespace error = boost::asio::error;

    using error_code = boost::system::error_code;
    using system_error = boost::system::system_error;

} // namespace sqlitexx::asio

#else
#error "sqlitexx requires coroutine support (C++20) and Boost.Asio 1.18+ (Boost 1.74+)"
#endif

#endif // SQLITEXX_USE_STANDALONE_ASIO

// Common chrono literals
namespace sqlitexx
{
    using namespace std::literals::chrono_literals;
    using std::chrono::steady_clock;
}
