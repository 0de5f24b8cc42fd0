/*

completion.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Single-use completion slot shared between an actor thread (producer) and the
caller that submitted the job (consumer).

*/

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include <sqlitexx/detail/asio_decl.hpp>
#include <sqlitexx/detail/result.hpp>

namespace sqlitexx::detail
{

template<typename T>
struct result_waiter
{
    virtual ~result_waiter() = default;
    virtual void complete(result<T> value) = 0;
};

/// Holds a completion handler and resumes it on its associated executor
template<typename T, class Handler>
class result_waiter_impl final : public result_waiter<T>
{
public:
    using executor_type = asio::associated_executor_t<Handler>;

    explicit result_waiter_impl(Handler handler)
        : handler_(std::move(handler))
        , work_(asio::get_associated_executor(handler_))
    {
    }

    void complete(result<T> value) override
    {
        auto executor = work_.get_executor();
        asio::post(executor,
            [handler = std::move(handler_), value = std::move(value)]() mutable
            {
                handler(std::move(value));
            });
        work_.reset();
    }

private:
    Handler handler_;
    asio::executor_work_guard<executor_type> work_;
};

/**
 * Producer/consumer handshake for one job outcome.
 *
 * fulfill() succeeds once; later calls are ignored. The outcome is either
 * handed to a registered waiter (posted to the waiter's executor), stored
 * until someone waits for it, or discarded when the consumer abandoned the
 * slot.
 */
template<typename T>
class completion_state
{
public:
    using value_type = result<T>;

    completion_state() = default;

    completion_state(const completion_state&) = delete;
    completion_state& operator=(const completion_state&) = delete;

    /// Deliver the outcome; false when the slot was already fulfilled or nobody is listening
    bool fulfill(value_type value)
    {
        std::unique_ptr<result_waiter<T>> waiter;
        {
            std::lock_guard lock(mutex_);
            if (fulfilled_)
                return false;
            fulfilled_ = true;

            if (!waiter_)
            {
                if (abandoned_)
                    return false;
                value_.emplace(std::move(value));
                ready_.notify_all();
                return true;
            }
            waiter = std::move(waiter_);
        }

        waiter->complete(std::move(value));
        return true;
    }

    /// Consumer went away; a later outcome is dropped
    void abandon() noexcept
    {
        std::lock_guard lock(mutex_);
        // A pending waiter still owns a claim on the outcome
        if (waiter_)
            return;
        abandoned_ = true;
        value_.reset();
    }

    [[nodiscard]] bool is_fulfilled() const
    {
        std::lock_guard lock(mutex_);
        return fulfilled_;
    }

    /// Block the calling thread until the outcome is available
    value_type wait_blocking()
    {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this] { return fulfilled_; });
        if (!value_)
            return fail<T>(errc::internal_error, "completion already consumed");
        value_type out = std::move(*value_);
        value_.reset();
        return out;
    }

    /// Register a completion handler; invoked through its associated executor
    template<class Handler>
    void async_wait(Handler&& handler)
    {
        using handler_t = std::decay_t<Handler>;

        std::unique_lock lock(mutex_);
        if (value_)
        {
            value_type out = std::move(*value_);
            value_.reset();
            lock.unlock();
            result_waiter_impl<T, handler_t>(std::forward<Handler>(handler)).complete(std::move(out));
            return;
        }
        if (fulfilled_ || waiter_)
        {
            lock.unlock();
            result_waiter_impl<T, handler_t>(std::forward<Handler>(handler)).complete(
                fail<T>(errc::internal_error, "completion already consumed"));
            return;
        }
        waiter_ = std::make_unique<result_waiter_impl<T, handler_t>>(std::forward<Handler>(handler));
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::optional<value_type> value_;
    std::unique_ptr<result_waiter<T>> waiter_;
    bool fulfilled_ = false;
    bool abandoned_ = false;
};

/**
 * Outcome published once and handed to any number of waiters.
 *
 * Waiters registered before fulfill() are resumed with a copy of the
 * outcome; later waiters receive it immediately.
 */
template<typename T>
class shared_completion
{
public:
    using value_type = result<T>;

    shared_completion() = default;

    shared_completion(const shared_completion&) = delete;
    shared_completion& operator=(const shared_completion&) = delete;

    /// Publish the outcome; false when it was already published
    bool fulfill(value_type value)
    {
        std::vector<std::unique_ptr<result_waiter<T>>> waiters;
        {
            std::lock_guard lock(mutex_);
            if (value_)
                return false;
            value_.emplace(std::move(value));
            waiters.swap(waiters_);
            ready_.notify_all();
        }

        for (auto& waiter : waiters)
            waiter->complete(*value_);
        return true;
    }

    [[nodiscard]] bool is_fulfilled() const
    {
        std::lock_guard lock(mutex_);
        return value_.has_value();
    }

    value_type wait_blocking() const
    {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this] { return value_.has_value(); });
        return *value_;
    }

    /// Wait with any Asio completion token; signature void(result<T>)
    template<class CompletionToken>
    auto async_wait(CompletionToken&& token)
    {
        return asio::async_initiate<CompletionToken, void(value_type)>(
            [this](auto handler)
            {
                using handler_t = decltype(handler);
                std::unique_lock lock(mutex_);
                if (value_)
                {
                    value_type out = *value_;
                    lock.unlock();
                    result_waiter_impl<T, handler_t>(std::move(handler)).complete(std::move(out));
                    return;
                }
                waiters_.push_back(std::make_unique<result_waiter_impl<T, handler_t>>(std::move(handler)));
            },
            token);
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable ready_;
    std::optional<value_type> value_;
    std::vector<std::unique_ptr<result_waiter<T>>> waiters_;
};

} // namespace sqlitexx::detail


namespace sqlitexx
{

/**
 * Caller side of a submitted job.
 *
 * Move-only. Await it with wait() (or async_wait() for any Asio completion
 * token), or block with get(). Dropping it before the job finishes does not
 * cancel the job; the outcome is discarded when it arrives.
 */
template<typename T>
class job_future
{
public:
    using value_type = result<T>;
    using state_type = detail::completion_state<T>;

    job_future() = default;

    explicit job_future(std::shared_ptr<state_type> state) noexcept
        : state_(std::move(state))
    {
    }

    job_future(job_future&& other) noexcept = default;

    job_future& operator=(job_future&& other) noexcept
    {
        if (this != &other)
        {
            release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    job_future(const job_future&) = delete;
    job_future& operator=(const job_future&) = delete;

    ~job_future()
    {
        release();
    }

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

    /// True once the actor has delivered the outcome
    [[nodiscard]] bool is_ready() const
    {
        return state_ && state_->is_fulfilled();
    }

    /// Initiate a wait with any Asio completion token; signature void(result<T>)
    template<class CompletionToken>
    auto async_wait(CompletionToken&& token)
    {
        return asio::async_initiate<CompletionToken, void(value_type)>(
            [state = state_](auto handler)
            {
                if (!state)
                {
                    detail::completion_state<T> empty;
                    empty.fulfill(fail<T>(errc::internal_error, "job_future has no state"));
                    empty.async_wait(std::move(handler));
                    return;
                }
                state->async_wait(std::move(handler));
            },
            token);
    }

    /// Suspend the calling coroutine until the job has run
    asio::awaitable<value_type> wait()
    {
        co_return co_await async_wait(asio::use_awaitable);
    }

    /// Block the calling thread until the job has run
    value_type get()
    {
        if (!state_)
            return fail<T>(errc::internal_error, "job_future has no state");
        return state_->wait_blocking();
    }

private:
    void release() noexcept
    {
        if (state_)
        {
            state_->abandon();
            state_.reset();
        }
    }

    std::shared_ptr<state_type> state_;
};

/// Create a connected slot / future pair
template<typename T>
[[nodiscard]] std::pair<std::shared_ptr<detail::completion_state<T>>, job_future<T>> make_completion()
{
    auto state = std::make_shared<detail::completion_state<T>>();
    job_future<T> future(state);
    return {std::move(state), std::move(future)};
}

} // namespace sqlitexx
