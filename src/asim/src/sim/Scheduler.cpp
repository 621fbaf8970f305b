#include "sim/Scheduler.hpp"
#include "engine/IEngine.hpp"
#include "sim/Errors.hpp"
#include "sim/Log.hpp"
#include "sim/SnapshotRequest.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace asim::sim
{

namespace
{

// Engine and reporter failures leave the scheduler as SchedulerFault, tagged with the step.
template <class F> decltype(auto) guarded(const char* what, std::int64_t step, F&& f)
{
    try
    {
        return f();
    }
    catch (const SchedulerFault&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw SchedulerFault(std::string(what) + " failed at step " + std::to_string(step) +
                                 ": " + e.what(),
                             step);
    }
}

} // namespace

Scheduler::Scheduler(const Simulation& sim, engine::IEngine& engine,
                     const std::vector<std::shared_ptr<IReporter>>& reporters,
                     std::atomic<std::int64_t>& current_step, StepControls controls)
    : sim_(sim), engine_(engine), reporters_(reporters), step_(current_step), ctl_(controls)
{
    if (ctl_.chunk < 1)
        throw std::invalid_argument("[sched] chunk size must be >= 1");
}

void Scheduler::run(std::int64_t steps)
{
    if (steps < 0)
        throw std::invalid_argument("[sched] step count must be non-negative");

    const std::int64_t target = step_.load() + steps;
    std::vector<NextReport> next(reporters_.size());

    while (step_.load() < target)
    {
        const std::int64_t remaining = target - step_.load();

        // Nearest checkpoint across reporters (never past the target)
        std::int64_t checkpoint = remaining;
        for (std::size_t i = 0; i < reporters_.size(); ++i)
        {
            next[i] = guarded("describe_next_report", step_.load(),
                              [&] { return reporters_[i]->describe_next_report(sim_); });
            if (next[i].steps && *next[i].steps <= 0)
                throw SchedulerFault("reporter #" + std::to_string(i) +
                                         " returned a non-positive step count (" +
                                         std::to_string(*next[i].steps) + ")",
                                     step_.load());
            if (next[i].due_within(checkpoint))
                checkpoint = *next[i].steps;
        }

        advance_(checkpoint);

        SnapshotRequest req;
        for (const auto& n : next)
            if (n.steps == checkpoint)
                req.include(n);
        if (!req.any_due())
            continue;

        LOGD("[sched] checkpoint step=%lld due=%d\n", static_cast<long long>(step_.load()),
             req.due_count());

        // One snapshot shared by every reporter due at this checkpoint
        const engine::State state =
            guarded("get_state", step_.load(),
                    [&] { return engine_.get_state(req.build(engine_.has_periodic_box())); });

        for (std::size_t i = 0; i < reporters_.size(); ++i)
            if (next[i].steps == checkpoint)
                guarded("report", step_.load(), [&] { reporters_[i]->report(sim_, state); });
    }
}

void Scheduler::advance_(std::int64_t steps)
{
    while (steps > 0)
    {
        if (ctl_.stop && ctl_.stop->load())
            throw StepInterrupted(step_.load());

        const std::int64_t n = std::min(steps, ctl_.chunk);
        guarded("advance", step_.load(), [&] { engine_.advance(n); });
        step_.fetch_add(n);
        steps -= n;
    }
}

} // namespace asim::sim
