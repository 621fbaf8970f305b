#include "sim/ExecutionGuard.hpp"
#include "sim/Log.hpp"

#include <exception>
#include <string>

namespace asim::sim
{

namespace
{
// Guard whose worker is the current thread, if any.
thread_local const ExecutionGuard* t_worker_of = nullptr;
} // namespace

static std::string describe(const std::exception_ptr& e)
{
    try
    {
        std::rethrow_exception(e);
    }
    catch (const std::exception& ex)
    {
        return ex.what();
    }
    catch (...)
    {
        return "non-standard exception";
    }
}

ExecutionGuard::~ExecutionGuard()
{
    join_worker_();
}

bool ExecutionGuard::try_acquire() noexcept
{
    bool expected = false;
    return busy_.compare_exchange_strong(expected, true);
}

void ExecutionGuard::release() noexcept
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        busy_.store(false);
    }
    idle_cv_.notify_all();
}

void ExecutionGuard::join_worker_()
{
    if (worker_.joinable())
        worker_.join();
}

StepFuture ExecutionGuard::launch(std::function<void()> body, std::function<void()> on_complete)
{
    if (t_worker_of == this)
        throw AlreadyBusyError("cannot start a step from its own completion callback");

    // Concurrent launchers are admitted one at a time; worker_ is only touched under this lock.
    std::lock_guard<std::mutex> serial(launch_mtx_);

    if (!try_acquire())
    {
        LOGW("[guard] cannot run more than one stepping operation at a time; waiting for the "
             "previous one to finish (this might take a while)...\n");
        std::unique_lock<std::mutex> lk(mtx_);
        idle_cv_.wait(lk, [&] { return try_acquire(); });
    }

    // The previous worker has released the flag; only its tail is left.
    join_worker_();

    auto outcome = std::make_shared<detail::StepOutcome>();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        current_ = outcome;
    }

    try
    {
        worker_ = std::thread(
            [this, outcome, body = std::move(body), cb = std::move(on_complete)]
            {
                t_worker_of = this;
                std::exception_ptr err;
                try
                {
                    body();
                }
                catch (...)
                {
                    err = std::current_exception();
                }
                if (cb)
                {
                    try
                    {
                        cb();
                    }
                    catch (...)
                    {
                        if (err)
                            LOGE("[guard] on_complete failed after a faulted run: %s\n",
                                 describe(std::current_exception()).c_str());
                        else
                            err = std::current_exception();
                    }
                }
                if (err)
                    LOGE("[guard] async step failed: %s\n", describe(err).c_str());
                release();
                outcome->finish(err);
            });
    }
    catch (...)
    {
        // Thread creation failed: nothing runs, unblock waiters and report to the caller.
        outcome->finish(std::current_exception());
        release();
        throw;
    }

    return StepFuture(outcome);
}

bool ExecutionGuard::wait(std::optional<std::chrono::milliseconds> timeout) const
{
    if (t_worker_of == this)
        throw AlreadyBusyError("cannot wait for a step from its own completion callback");
    std::shared_ptr<detail::StepOutcome> cur;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        cur = current_;
    }
    if (!cur)
        return true;
    return cur->wait(timeout);
}

} // namespace asim::sim
