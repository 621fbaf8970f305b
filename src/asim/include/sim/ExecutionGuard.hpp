#pragma once
#include "sim/Errors.hpp"
#include "sim/StepFuture.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

/**
 * @file ExecutionGuard.hpp
 * @brief Single-flight admission for operations that own the engine.
 *
 * @details
 * One atomic busy flag decides who may touch the engine. Admission is a compare-and-swap:
 *
 * - :cpp:func:`run` (synchronous) fails immediately with :cpp:class:`AlreadyBusyError`.
 * - :cpp:func:`launch` (asynchronous) logs a warning and blocks until the holder releases,
 *   then spawns one worker thread. The flag is taken on the *calling* thread, so a
 *   synchronous call issued right after ``launch`` returns is rejected deterministically.
 *
 * The worker runs the body, then the completion callback (on success and on fault), releases
 * the flag and finally marks the returned :cpp:class:`StepFuture` complete. The destructor
 * joins the worker.
 *
 * Concurrent callers of :cpp:func:`launch` are serialized by a dedicated mutex covering admission,
 * the join of the previous worker and the spawn of the next one.
 *
 * @warning The completion callback runs on the worker while the flag is still held. Calling
 * :cpp:func:`launch` or :cpp:func:`wait` from it throws :cpp:class:`AlreadyBusyError`, as does
 * :cpp:func:`run` since the flag is taken.
 */

namespace asim::sim
{

class ExecutionGuard
{
  public:
    ExecutionGuard() = default;
    ~ExecutionGuard();
    ExecutionGuard(const ExecutionGuard&) = delete;
    ExecutionGuard& operator=(const ExecutionGuard&) = delete;

    bool is_busy() const noexcept { return busy_.load(); }

    /// Atomic false->true transition; true if admitted.
    bool try_acquire() noexcept;
    void release() noexcept;

    /// Run `body` on the calling thread, or throw AlreadyBusyError.
    template <class Body> void run(const char* what, Body&& body)
    {
        if (!try_acquire())
            throw AlreadyBusyError(std::string(what) +
                                   ": simulation is already engaged in a stepping operation");
        Release r{*this};
        std::forward<Body>(body)();
    }

    /// Admit (blocking with a warning if busy) and run `body` then `on_complete` on a worker.
    StepFuture launch(std::function<void()> body, std::function<void()> on_complete);

    /// Block until the tracked worker (if any) completes or `timeout` elapses.
    /// Throws AlreadyBusyError when called from that worker.
    bool wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  private:
    struct Release
    {
        ExecutionGuard& g;
        ~Release() { g.release(); }
    };

    std::atomic<bool> busy_{false};
    mutable std::mutex mtx_;
    std::mutex launch_mtx_;
    std::condition_variable idle_cv_;
    std::thread worker_;
    std::shared_ptr<detail::StepOutcome> current_;

    void join_worker_();
};

} // namespace asim::sim
