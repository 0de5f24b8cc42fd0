/*

job.hpp
-------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Type-erased unit of work carried by an actor's queue. The closure and its
result type are erased for transport; the completion slot keeps the caller's
concrete result<T>.

*/

#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include <sqlitexx/connection.hpp>
#include <sqlitexx/detail/completion.hpp>
#include <sqlitexx/detail/exception_bridge.hpp>
#include <sqlitexx/detail/log.hpp>
#include <sqlitexx/detail/result.hpp>

namespace sqlitexx::detail
{

class job_base
{
public:
    virtual ~job_base() = default;

    /// Run on the actor thread with exclusive access to the connection
    virtual void run(connection& conn) = 0;
};


/**
 * @tparam Access connection or const connection, as seen by the closure
 */
template<class T, class F, class Access>
class typed_job final : public job_base
{
public:
    typed_job(F func, std::shared_ptr<completion_state<T>> slot)
        : func_(std::move(func))
        , slot_(std::move(slot))
    {
    }

    // A job that never ran still resolves its caller
    ~typed_job() override
    {
        slot_->fulfill(fail<T>(errc::closed, "job discarded before it ran"));
    }

    void run(connection& conn) override
    {
        Access& access = conn;
        auto outcome = protect_job(func_, access);
        if (!outcome && outcome.error().is(errc::panic))
            SQLITEXX_LOG_ERROR("ACTOR", "job panicked: " << outcome.error().message());
        slot_->fulfill(std::move(outcome));
    }

private:
    F func_;
    std::shared_ptr<completion_state<T>> slot_;
};


/// Package a closure as a queued job plus the future its caller awaits
template<class Access, class F>
[[nodiscard]] auto make_job(F&& func)
    -> std::pair<std::unique_ptr<job_base>, job_future<job_value_t<std::decay_t<F>, Access>>>
{
    using func_t = std::decay_t<F>;
    using value_t = job_value_t<func_t, Access>;

    auto [slot, future] = make_completion<value_t>();
    std::unique_ptr<job_base> job =
        std::make_unique<typed_job<value_t, func_t, Access>>(std::forward<F>(func), std::move(slot));
    return {std::move(job), std::move(future)};
}

} // namespace sqlitexx::detail
