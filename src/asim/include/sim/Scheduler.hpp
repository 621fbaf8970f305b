#pragma once
#include "sim/Reporter.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

/**
 * @file Scheduler.hpp
 * @brief Checkpoint loop that interleaves engine advancement with reporter dispatch.
 *
 * @details
 * Each round the scheduler asks every reporter for its next due distance, advances the engine
 * to the nearest one (in chunks, checking the stop flag between chunks), fetches **one**
 * snapshot covering the union of the due reporters' needs, and hands that same snapshot to
 * every due reporter in registration order.
 *
 * @rst
 * .. graphviz::
 *
 *    digraph S {
 *      rankdir=LR;
 *      node [shape=box];
 *      query [label="describe_next_report() x N"];
 *      advance [label="engine.advance(<= chunk) ..."];
 *      snap [label="engine.get_state(OR of needs)"];
 *      dispatch [label="report() for due, in order"];
 *      query -> advance -> snap -> dispatch -> query;
 *    }
 * @endrst
 *
 * The scheduler is built per call by :cpp:class:`Simulation` while the execution guard is
 * held; it does not lock anything itself.
 */

namespace asim::engine
{
class IEngine;
}

namespace asim::sim
{

class Simulation;

struct StepControls
{
    std::int64_t chunk{10};                      // max steps per engine call
    const std::atomic<bool>* stop{nullptr};      // checked before every chunk
};

class Scheduler
{
  public:
    Scheduler(const Simulation& sim, engine::IEngine& engine,
              const std::vector<std::shared_ptr<IReporter>>& reporters,
              std::atomic<std::int64_t>& current_step, StepControls controls = {});

    /// Advance by `steps` (>= 0). Throws SchedulerFault / StepInterrupted; progress is kept.
    void run(std::int64_t steps);

  private:
    const Simulation& sim_;
    engine::IEngine& engine_;
    const std::vector<std::shared_ptr<IReporter>>& reporters_;
    std::atomic<std::int64_t>& step_;
    StepControls ctl_;

    void advance_(std::int64_t steps);
};

} // namespace asim::sim
