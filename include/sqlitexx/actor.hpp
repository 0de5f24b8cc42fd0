/*

actor.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include <sqlitexx/connection.hpp>
#include <sqlitexx/detail/asio_decl.hpp>
#include <sqlitexx/detail/completion.hpp>
#include <sqlitexx/detail/job.hpp>
#include <sqlitexx/detail/job_queue.hpp>
#include <sqlitexx/detail/join_context.hpp>
#include <sqlitexx/detail/log.hpp>
#include <sqlitexx/detail/result.hpp>
#include <sqlitexx/open_options.hpp>

namespace sqlitexx
{

/**
 * One connection owned by one dedicated thread.
 *
 * Jobs are executed strictly one at a time, in the order they were queued.
 * The connection lives on the actor thread's stack and is never touched by
 * any other thread.
 *
 * Usage:
 * @code
 * auto actor = co_await connection_actor::open(open_options::wal("app.db"));
 * if (!actor)
 *     co_return;
 *
 * auto pending = (*actor)->submit([](connection& conn) {
 *     return conn.execute("INSERT INTO t VALUES (?)", 42);
 * });
 * if (pending)
 *     auto changed = co_await pending->wait();
 *
 * co_await (*actor)->close();
 * @endcode
 */
class connection_actor
{
    struct private_tag
    {
        explicit private_tag() = default;
    };

public:
    using pointer = std::shared_ptr<connection_actor>;

    /**
     * Spawn the actor thread and open its connection.
     * Resolves once the connection is open; on failure the thread has been joined.
     */
    static asio::awaitable<result<pointer>> open(open_options options)
    {
        auto actor = std::make_shared<connection_actor>(private_tag{});
        auto opened = actor->start(std::move(options));
        if (!opened)
            co_return std::unexpected(std::move(opened).error());

        auto status = co_await opened->wait();
        if (!status)
        {
            SQLITEXX_LOG_WARN("ACTOR", actor->name_ << " failed to open: " << status.error().to_string());
            if (auto closed = co_await actor->close(); !closed)
                SQLITEXX_LOG_WARN("ACTOR", actor->name_ << " cleanup after failed open: " << closed.error().to_string());
            co_return std::unexpected(std::move(status).error());
        }

        SQLITEXX_LOG_INFO("ACTOR", actor->name_ << " running");
        co_return actor;
    }

    /// Synchronous variant of open() for callers outside a coroutine
    static result<pointer> open_blocking(open_options options)
    {
        auto actor = std::make_shared<connection_actor>(private_tag{});
        auto opened = actor->start(std::move(options));
        if (!opened)
            return fail<pointer>(std::move(opened).error());

        auto status = opened->get();
        if (!status)
        {
            SQLITEXX_LOG_WARN("ACTOR", actor->name_ << " failed to open: " << status.error().to_string());
            if (auto closed = actor->close_blocking(); !closed)
                SQLITEXX_LOG_WARN("ACTOR", actor->name_ << " cleanup after failed open: " << closed.error().to_string());
            return fail<pointer>(std::move(status).error());
        }

        SQLITEXX_LOG_INFO("ACTOR", actor->name_ << " running");
        return actor;
    }

    explicit connection_actor(private_tag)
        : queue_(std::make_shared<detail::job_queue>())
        , name_("actor#" + std::to_string(next_id()))
    {
    }

    connection_actor(const connection_actor&) = delete;
    connection_actor& operator=(const connection_actor&) = delete;

    /// Stops accepting jobs and waits for the queue to drain; prefer close() from async code
    ~connection_actor()
    {
        queue_->close();
        if (thread_.joinable())
        {
            if (auto joined = detail::join_thread(thread_); !joined)
                SQLITEXX_LOG_WARN("ACTOR", name_ << " " << joined.error().to_string());
        }
    }

    /**
     * Queue a closure for execution on the actor thread.
     *
     * Never blocks. Fails with errc::closed, without creating a future, once
     * close() has started or the thread has exited.
     *
     * @tparam Access connection (default) or const connection, as passed to the closure
     * @param func Callable taking Access&, returning result<T> or T
     */
    template<class Access = connection, class F>
    auto submit(F&& func) -> result<job_future<detail::job_value_t<std::decay_t<F>, Access>>>
    {
        static_assert(std::is_same_v<std::remove_const_t<Access>, connection>,
            "jobs receive a connection or a const connection");
        using future_t = job_future<detail::job_value_t<std::decay_t<F>, Access>>;

        auto [job, future] = detail::make_job<Access>(std::forward<F>(func));
        if (!queue_->push(job))
            return fail<future_t>(errc::closed, "connection actor " + name_ + " is closed");

        submitted_.fetch_add(1, std::memory_order_relaxed);
        return std::move(future);
    }

    /**
     * Stop accepting jobs, let the queued ones finish, then join the thread.
     *
     * The join runs on a dedicated context, so the awaiting executor keeps
     * running. A concurrent or repeated call waits for the first one to
     * finish and returns the same outcome.
     *
     * @return the connection's close error, or errc::join_failed
     */
    asio::awaitable<result_void> close()
    {
        if (close_started_.exchange(true, std::memory_order_acq_rel))
            co_return co_await closed_.async_wait(asio::use_awaitable);

        SQLITEXX_LOG_DEBUG("ACTOR", name_ << " closing with " << queue_->size() << " queued jobs");
        queue_->close();

        auto terminated = co_await terminated_.wait();
        auto joined = co_await detail::async_join(std::move(thread_));
        co_return finish_close(std::move(terminated), std::move(joined));
    }

    /// Synchronous variant of close(); fails with errc::join_failed when called from the actor thread
    result_void close_blocking()
    {
        const bool on_actor_thread = thread_id_ == std::this_thread::get_id();
        if (close_started_.exchange(true, std::memory_order_acq_rel))
        {
            if (on_actor_thread && !closed_.is_fulfilled())
                return fail(errc::join_failed, name_ + " cannot wait for its own termination");
            return closed_.wait_blocking();
        }

        queue_->close();

        if (on_actor_thread)
            return finish_close(ok(), detail::join_thread(thread_));

        auto terminated = terminated_.get();
        auto joined = detail::join_thread(thread_);
        return finish_close(std::move(terminated), std::move(joined));
    }

    /// True once close() has started or the thread refused further jobs
    [[nodiscard]] bool is_closed() const
    {
        return close_started_.load(std::memory_order_acquire) || queue_->is_closed();
    }

    /// Jobs queued but not yet started
    [[nodiscard]] std::size_t pending() const
    {
        return queue_->size();
    }

    /// Jobs accepted since open
    [[nodiscard]] std::uint64_t submitted() const noexcept
    {
        return submitted_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::thread::id thread_id() const noexcept
    {
        return thread_id_;
    }

    [[nodiscard]] const std::string& name() const noexcept
    {
        return name_;
    }

private:
    static std::uint64_t next_id() noexcept
    {
        static std::atomic<std::uint64_t> counter{0};
        return counter.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    /// Spawn the thread; returns the future resolved once the connection is open
    result<job_future<void>> start(open_options options)
    {
        auto [opened_slot, opened] = make_completion<void>();
        auto [terminated_slot, terminated] = make_completion<void>();
        terminated_ = std::move(terminated);

        try
        {
            thread_ = std::thread(&connection_actor::run, queue_, std::move(options),
                std::move(opened_slot), std::move(terminated_slot), name_);
        }
        catch (const std::system_error& exc)
        {
            queue_->close();
            close_started_.store(true, std::memory_order_release);
            closed_.fulfill(ok());
            return fail<job_future<void>>(errc::open_failed,
                "spawning thread for " + name_ + ": " + exc.what(), exc.code().value());
        }

        thread_id_ = thread_.get_id();
        return std::move(opened);
    }

    /// Thread body: open, then receive and execute until the queue is closed and drained
    static void run(std::shared_ptr<detail::job_queue> queue, open_options options,
        std::shared_ptr<detail::completion_state<void>> opened,
        std::shared_ptr<detail::completion_state<void>> terminated,
        std::string name)
    {
        auto conn = connection::open(options);
        if (!conn)
        {
            queue->close();
            opened->fulfill(std::unexpected(std::move(conn).error()));
            terminated->fulfill(ok());
            return;
        }
        opened->fulfill(ok());

        std::uint64_t executed = 0;
        while (auto job = queue->pop())
        {
            job->run(*conn);
            ++executed;
        }

        auto closed = conn->close();
        SQLITEXX_LOG_DEBUG("ACTOR", name << " exiting after " << executed << " jobs");
        terminated->fulfill(std::move(closed));
    }

    /// Report the close outcome and publish it to concurrent closers
    result_void finish_close(result_void terminated, result_void joined)
    {
        result_void outcome = ok();
        if (!joined)
            outcome = std::move(joined);
        else if (!terminated)
            outcome = std::move(terminated);

        if (outcome)
            SQLITEXX_LOG_INFO("ACTOR", name_ << " closed");
        else
            SQLITEXX_LOG_WARN("ACTOR", name_ << " " << outcome.error().to_string());
        closed_.fulfill(outcome);
        return outcome;
    }

    std::shared_ptr<detail::job_queue> queue_;
    std::thread thread_;
    std::thread::id thread_id_;
    job_future<void> terminated_;
    detail::shared_completion<void> closed_;
    std::atomic<bool> close_started_{false};
    std::atomic<std::uint64_t> submitted_{0};
    std::string name_;
};

} // namespace sqlitexx
