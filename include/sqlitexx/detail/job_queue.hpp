/*

job_queue.hpp
-------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include <sqlitexx/detail/job.hpp>

namespace sqlitexx::detail
{

/**
 * Unbounded multi-producer, single-consumer FIFO feeding one actor thread.
 *
 * push() never blocks. Once closed, push() is refused but pop() keeps
 * handing out the jobs already queued and returns nullptr when drained.
 */
class job_queue
{
public:
    job_queue() = default;

    job_queue(const job_queue&) = delete;
    job_queue& operator=(const job_queue&) = delete;

    /// Enqueue a job; false (job left untouched) when the queue is closed
    bool push(std::unique_ptr<job_base>& job)
    {
        {
            std::lock_guard lock(mutex_);
            if (closed_)
                return false;
            jobs_.push_back(std::move(job));
        }
        available_.notify_one();
        return true;
    }

    /// Block until a job is available; nullptr once closed and drained
    std::unique_ptr<job_base> pop()
    {
        std::unique_lock lock(mutex_);
        available_.wait(lock, [this] { return closed_ || !jobs_.empty(); });
        if (jobs_.empty())
            return nullptr;

        auto job = std::move(jobs_.front());
        jobs_.pop_front();
        return job;
    }

    void close()
    {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        available_.notify_all();
    }

    [[nodiscard]] bool is_closed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard lock(mutex_);
        return jobs_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<std::unique_ptr<job_base>> jobs_;
    bool closed_ = false;
};

} // namespace sqlitexx::detail
