/*

client.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <sqlitexx/actor.hpp>
#include <sqlitexx/connection.hpp>
#include <sqlitexx/detail/asio_decl.hpp>
#include <sqlitexx/detail/completion.hpp>
#include <sqlitexx/detail/result.hpp>
#include <sqlitexx/open_options.hpp>

namespace sqlitexx
{

/**
 * A single SQLite connection usable from coroutines.
 *
 * Copies share the same actor. Once the last copy is gone the actor thread
 * drains its queue and exits; call close() to do that without blocking.
 */
class client
{
public:
    template<class F>
    using const_value_t = detail::job_value_t<std::decay_t<F>, const connection>;

    template<class F>
    using mut_value_t = detail::job_value_t<std::decay_t<F>, connection>;

    static asio::awaitable<result<client>> open(open_options options)
    {
        auto actor = co_await connection_actor::open(std::move(options));
        if (!actor)
            co_return std::unexpected(std::move(actor).error());
        co_return client(std::move(*actor));
    }

    static result<client> open_blocking(open_options options)
    {
        auto actor = connection_actor::open_blocking(std::move(options));
        if (!actor)
            return fail<client>(std::move(actor).error());
        return client(std::move(*actor));
    }

    /// Invoke a closure with a const connection&
    template<class F>
    asio::awaitable<result<const_value_t<F>>> conn(F func) const
    {
        auto pending = actor_->template submit<const connection>(std::move(func));
        if (!pending)
            co_return std::unexpected(std::move(pending).error());
        co_return co_await pending->wait();
    }

    /// Invoke a closure with a mutable connection&
    template<class F>
    asio::awaitable<result<mut_value_t<F>>> conn_mut(F func) const
    {
        auto pending = actor_->template submit<connection>(std::move(func));
        if (!pending)
            co_return std::unexpected(std::move(pending).error());
        co_return co_await pending->wait();
    }

    template<class F>
    result<const_value_t<F>> conn_blocking(F func) const
    {
        auto pending = actor_->template submit<const connection>(std::move(func));
        if (!pending)
            return fail<const_value_t<F>>(std::move(pending).error());
        return pending->get();
    }

    template<class F>
    result<mut_value_t<F>> conn_mut_blocking(F func) const
    {
        auto pending = actor_->template submit<connection>(std::move(func));
        if (!pending)
            return fail<mut_value_t<F>>(std::move(pending).error());
        return pending->get();
    }

    /// Queue a closure now and return its future without waiting
    template<class F>
    auto submit(F&& func) const
    {
        return actor_->template submit<connection>(std::forward<F>(func));
    }

    /**
     * Close the underlying connection.
     * Afterwards every conn() / conn_mut() call fails with errc::closed.
     */
    asio::awaitable<result_void> close() const
    {
        co_return co_await actor_->close();
    }

    result_void close_blocking() const
    {
        return actor_->close_blocking();
    }

    [[nodiscard]] bool is_closed() const
    {
        return actor_->is_closed();
    }

    [[nodiscard]] connection_actor& actor() const noexcept
    {
        return *actor_;
    }

private:
    explicit client(connection_actor::pointer actor) noexcept
        : actor_(std::move(actor))
    {
    }

    connection_actor::pointer actor_;
};


/**
 * Fluent construction of open_options for a client.
 *
 * @code
 * auto db = co_await client_builder()
 *     .path("app.db")
 *     .journal_mode(journal_mode::wal)
 *     .open();
 * @endcode
 */
class client_builder
{
public:
    client_builder() = default;

    explicit client_builder(open_options options)
        : options_(std::move(options))
    {
    }

    client_builder& path(std::filesystem::path db_path)
    {
        options_.path = std::move(db_path);
        return *this;
    }

    client_builder& flags(open_flags value)
    {
        options_.flags = value;
        return *this;
    }

    client_builder& journal_mode(sqlitexx::journal_mode mode)
    {
        options_.journal_mode = mode;
        return *this;
    }

    client_builder& vfs(std::string name)
    {
        options_.vfs = std::move(name);
        return *this;
    }

    /// Append "PRAGMA name = value", applied in order after open
    client_builder& pragma(std::string_view name, std::string_view value)
    {
        std::string statement = "PRAGMA ";
        statement.append(name);
        statement.append(" = ");
        statement.append(value);
        options_.pragmas.push_back(std::move(statement));
        return *this;
    }

    client_builder& busy_timeout(std::chrono::milliseconds timeout)
    {
        options_.busy_timeout = timeout;
        return *this;
    }

    [[nodiscard]] const open_options& options() const noexcept
    {
        return options_;
    }

    [[nodiscard]] asio::awaitable<result<client>> open() const
    {
        return client::open(options_);
    }

    [[nodiscard]] result<client> open_blocking() const
    {
        return client::open_blocking(options_);
    }

private:
    open_options options_;
};

} // namespace sqlitexx
