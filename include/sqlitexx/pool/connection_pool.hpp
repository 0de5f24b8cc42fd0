/*

pool/connection_pool.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <sqlitexx/actor.hpp>
#include <sqlitexx/connection.hpp>
#include <sqlitexx/detail/asio_decl.hpp>
#include <sqlitexx/detail/completion.hpp>
#include <sqlitexx/detail/log.hpp>
#include <sqlitexx/detail/result.hpp>
#include <sqlitexx/open_options.hpp>
#include <sqlitexx/pool/pool_config.hpp>

namespace sqlitexx::pool
{

/**
 * Pool of connection actors with one writer and N readers.
 *
 * Every write goes to the single writer actor, so writes never contend for
 * SQLite's write lock. Reads rotate over the readers and may run in
 * parallel. With one connection the writer also serves reads.
 *
 * The pool adds no synchronization between the writer and the readers:
 * whether a reader sees a committed write depends on the journal mode
 * (use journal_mode::wal for concurrent readers).
 *
 * Copies share the same actors.
 */
class connection_pool
{
public:
    template<class F>
    using read_value_t = detail::job_value_t<std::decay_t<F>, const connection>;

    template<class F>
    using write_value_t = detail::job_value_t<std::decay_t<F>, connection>;

    /**
     * Open config.num_conns actors on the same storage with identical options.
     * The writer is opened first. If any actor fails, those already opened
     * are closed before the error is returned.
     */
    static asio::awaitable<result<connection_pool>> open(open_options options, pool_config config = {})
    {
        if (config.num_conns == 0)
            co_return fail<connection_pool>(errc::open_failed, "pool requires at least one connection");

        auto st = std::make_shared<state>();
        st->actors.reserve(config.num_conns);
        for (std::size_t i = 0; i < config.num_conns; ++i)
        {
            auto actor = co_await connection_actor::open(options);
            if (!actor)
            {
                SQLITEXX_LOG_WARN("POOL", "connection " << (i + 1) << "/" << config.num_conns
                    << " failed to open, closing " << st->actors.size() << " opened");
                if (auto closed = co_await close_actors(st->actors); !closed)
                    SQLITEXX_LOG_WARN("POOL", "rollback close failed: " << closed.error().to_string());
                co_return std::unexpected(std::move(actor).error());
            }
            st->actors.push_back(std::move(*actor));
        }

        SQLITEXX_LOG_INFO("POOL", "opened " << config.num_conns << " connections to " << options.target());
        co_return connection_pool(std::move(st));
    }

    /// Synchronous variant of open()
    static result<connection_pool> open_blocking(open_options options, pool_config config = {})
    {
        if (config.num_conns == 0)
            return fail<connection_pool>(errc::open_failed, "pool requires at least one connection");

        auto st = std::make_shared<state>();
        st->actors.reserve(config.num_conns);
        for (std::size_t i = 0; i < config.num_conns; ++i)
        {
            auto actor = connection_actor::open_blocking(options);
            if (!actor)
            {
                SQLITEXX_LOG_WARN("POOL", "connection " << (i + 1) << "/" << config.num_conns
                    << " failed to open, closing " << st->actors.size() << " opened");
                for (auto& opened : st->actors)
                {
                    if (auto closed = opened->close_blocking(); !closed)
                        SQLITEXX_LOG_WARN("POOL", "rollback close failed: " << closed.error().to_string());
                }
                return fail<connection_pool>(std::move(actor).error());
            }
            st->actors.push_back(std::move(*actor));
        }

        SQLITEXX_LOG_INFO("POOL", "opened " << config.num_conns << " connections to " << options.target());
        return connection_pool(std::move(st));
    }

    // ==================== Dispatch ====================

    /// Queue a read-only closure on the next reader (round-robin)
    template<class F>
    auto submit_read(F&& func) -> result<job_future<read_value_t<F>>>
    {
        auto pending = next_reader().template submit<const connection>(std::forward<F>(func));
        count(pending, state_->reads);
        return pending;
    }

    /// Queue a closure on the writer; all writes are serialized there
    template<class F>
    auto submit_write(F&& func) -> result<job_future<write_value_t<F>>>
    {
        auto pending = writer().template submit<connection>(std::forward<F>(func));
        count(pending, state_->writes);
        return pending;
    }

    template<class F>
    asio::awaitable<result<read_value_t<F>>> read(F func)
    {
        auto pending = submit_read(std::move(func));
        if (!pending)
            co_return std::unexpected(std::move(pending).error());
        co_return co_await pending->wait();
    }

    template<class F>
    asio::awaitable<result<write_value_t<F>>> write(F func)
    {
        auto pending = submit_write(std::move(func));
        if (!pending)
            co_return std::unexpected(std::move(pending).error());
        co_return co_await pending->wait();
    }

    /// Round-robin over every actor, writer included, with a const connection&
    template<class F>
    asio::awaitable<result<read_value_t<F>>> conn(F func)
    {
        auto pending = next_any().template submit<const connection>(std::move(func));
        if (!pending)
            co_return std::unexpected(std::move(pending).error());
        co_return co_await pending->wait();
    }

    /// Round-robin over every actor, writer included, with a mutable connection&
    template<class F>
    asio::awaitable<result<write_value_t<F>>> conn_mut(F func)
    {
        auto pending = next_any().template submit<connection>(std::move(func));
        if (!pending)
            co_return std::unexpected(std::move(pending).error());
        co_return co_await pending->wait();
    }

    template<class F>
    result<read_value_t<F>> read_blocking(F func)
    {
        auto pending = submit_read(std::move(func));
        if (!pending)
            return fail<read_value_t<F>>(std::move(pending).error());
        return pending->get();
    }

    template<class F>
    result<write_value_t<F>> write_blocking(F func)
    {
        auto pending = submit_write(std::move(func));
        if (!pending)
            return fail<write_value_t<F>>(std::move(pending).error());
        return pending->get();
    }

    // ==================== Lifecycle ====================

    /**
     * Close every actor and wait until all have terminated.
     * Every actor is closed even if an earlier one fails; the first error is returned.
     */
    asio::awaitable<result_void> close()
    {
        auto closed = co_await close_actors(state_->actors);
        SQLITEXX_LOG_INFO("POOL", "closed " << state_->actors.size() << " connections");
        co_return closed;
    }

    result_void close_blocking()
    {
        result_void first = ok();
        for (auto& actor : state_->actors)
        {
            auto closed = actor->close_blocking();
            if (!closed && first)
                first = std::move(closed);
        }
        SQLITEXX_LOG_INFO("POOL", "closed " << state_->actors.size() << " connections");
        return first;
    }

    /// True once every actor has stopped accepting jobs
    [[nodiscard]] bool is_closed() const
    {
        for (const auto& actor : state_->actors)
        {
            if (!actor->is_closed())
                return false;
        }
        return true;
    }

    // ==================== Introspection ====================

    /// Number of actors
    [[nodiscard]] std::size_t size() const noexcept
    {
        return state_->actors.size();
    }

    /// Number of actors serving reads
    [[nodiscard]] std::size_t reader_count() const noexcept
    {
        return state_->actors.size() == 1 ? 1 : state_->actors.size() - 1;
    }

    [[nodiscard]] connection_actor& writer() const noexcept
    {
        return *state_->actors.front();
    }

    /// Reader by position; throws std::out_of_range unless index < reader_count()
    [[nodiscard]] connection_actor& reader(std::size_t index) const
    {
        if (index >= reader_count())
            throw std::out_of_range("reader index " + std::to_string(index) + " out of range");
        if (state_->actors.size() == 1)
            return writer();
        return *state_->actors[1 + index];
    }

    [[nodiscard]] pool_stats stats() const noexcept
    {
        pool_stats out;
        out.actors = size();
        out.readers = reader_count();
        out.reads_dispatched = state_->reads.load(std::memory_order_relaxed);
        out.writes_dispatched = state_->writes.load(std::memory_order_relaxed);
        out.rejected = state_->rejected.load(std::memory_order_relaxed);
        return out;
    }

private:
    struct state
    {
        std::vector<connection_actor::pointer> actors;   // front() is the writer
        std::atomic<std::uint64_t> read_cursor{0};
        std::atomic<std::uint64_t> any_cursor{0};
        std::atomic<std::uint64_t> reads{0};
        std::atomic<std::uint64_t> writes{0};
        std::atomic<std::uint64_t> rejected{0};
    };

    explicit connection_pool(std::shared_ptr<state> st) noexcept
        : state_(std::move(st))
    {
    }

    connection_actor& next_reader()
    {
        const auto& actors = state_->actors;
        if (actors.size() == 1)
            return *actors.front();
        const auto n = state_->read_cursor.fetch_add(1, std::memory_order_relaxed);
        return *actors[1 + n % (actors.size() - 1)];
    }

    connection_actor& next_any()
    {
        const auto& actors = state_->actors;
        const auto n = state_->any_cursor.fetch_add(1, std::memory_order_relaxed);
        return *actors[n % actors.size()];
    }

    template<class Pending>
    void count(const Pending& pending, std::atomic<std::uint64_t>& dispatched)
    {
        if (pending)
            dispatched.fetch_add(1, std::memory_order_relaxed);
        else
            state_->rejected.fetch_add(1, std::memory_order_relaxed);
    }

    static asio::awaitable<result_void> close_actors(const std::vector<connection_actor::pointer>& actors)
    {
        result_void first = ok();
        for (const auto& actor : actors)
        {
            auto closed = co_await actor->close();
            if (!closed && first)
                first = std::move(closed);
        }
        co_return first;
    }

    std::shared_ptr<state> state_;
};


/**
 * Fluent construction of open_options and pool_config.
 *
 * @code
 * auto pool = co_await pool_builder()
 *     .path("app.db")
 *     .journal_mode(journal_mode::wal)
 *     .num_conns(4)
 *     .open();
 * @endcode
 */
class pool_builder
{
public:
    pool_builder() = default;

    pool_builder& path(std::filesystem::path db_path)
    {
        options_.path = std::move(db_path);
        return *this;
    }

    pool_builder& flags(open_flags value)
    {
        options_.flags = value;
        return *this;
    }

    pool_builder& journal_mode(sqlitexx::journal_mode mode)
    {
        options_.journal_mode = mode;
        return *this;
    }

    pool_builder& vfs(std::string name)
    {
        options_.vfs = std::move(name);
        return *this;
    }

    /// Append "PRAGMA name = value", applied on every connection after open
    pool_builder& pragma(std::string_view name, std::string_view value)
    {
        std::string statement = "PRAGMA ";
        statement.append(name);
        statement.append(" = ");
        statement.append(value);
        options_.pragmas.push_back(std::move(statement));
        return *this;
    }

    pool_builder& busy_timeout(std::chrono::milliseconds timeout)
    {
        options_.busy_timeout = timeout;
        return *this;
    }

    pool_builder& num_conns(std::size_t count)
    {
        config_.num_conns = count;
        return *this;
    }

    [[nodiscard]] const open_options& options() const noexcept { return options_; }
    [[nodiscard]] const pool_config& config() const noexcept { return config_; }

    [[nodiscard]] asio::awaitable<result<connection_pool>> open() const
    {
        return connection_pool::open(options_, config_);
    }

    [[nodiscard]] result<connection_pool> open_blocking() const
    {
        return connection_pool::open_blocking(options_, config_);
    }

private:
    open_options options_;
    pool_config config_;
};

} // namespace sqlitexx::pool
