#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>

/**
 * @file StepFuture.hpp
 * @brief Completion handle returned by :cpp:func:`Simulation::async_step`.
 *
 * @details
 * The future observes a small completion record that the worker thread marks when it exits.
 * It does not own the thread (the execution guard does), so holding or dropping a future has
 * no effect on the background work.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto fut = sim.async_step(10000);
 *   while (!fut.wait(std::chrono::milliseconds(200)))
 *     LOGI("step %lld\n", (long long) sim.current_step());
 *   fut.get(); // rethrows a SchedulerFault if the run failed
 * @endrst
 */

namespace asim::sim
{

namespace detail
{

class StepOutcome
{
  public:
    void finish(std::exception_ptr error)
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            error_ = std::move(error);
            done_ = true;
        }
        cv_.notify_all();
    }

    bool done() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return done_;
    }

    bool wait(std::optional<std::chrono::milliseconds> timeout) const
    {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!timeout)
        {
            cv_.wait(lk, [&] { return done_; });
            return true;
        }
        return cv_.wait_for(lk, *timeout, [&] { return done_; });
    }

    std::exception_ptr error() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return error_;
    }

  private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    bool done_{false};
    std::exception_ptr error_;
};

} // namespace detail

class StepFuture
{
  public:
    StepFuture() = default;
    explicit StepFuture(std::shared_ptr<const detail::StepOutcome> outcome)
        : outcome_(std::move(outcome))
    {
    }

    /// Non-blocking. True once the worker has exited, or if no work is referenced.
    bool is_complete() const { return !outcome_ || outcome_->done(); }

    /// Block until complete or `timeout` elapses; returns is_complete().
    bool wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const
    {
        return !outcome_ || outcome_->wait(timeout);
    }

    /// True if the run completed with an exception.
    bool faulted() const { return is_complete() && outcome_ && outcome_->error() != nullptr; }

    /// Wait, then rethrow the captured fault (if any).
    void get() const
    {
        if (!outcome_)
            return;
        outcome_->wait(std::nullopt);
        if (auto e = outcome_->error())
            std::rethrow_exception(e);
    }

  private:
    std::shared_ptr<const detail::StepOutcome> outcome_;
};

} // namespace asim::sim
