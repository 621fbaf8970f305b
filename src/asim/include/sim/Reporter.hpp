#pragma once
#include "engine/State.hpp"
#include <cstdint>
#include <optional>

/**
 * @file Reporter.hpp
 * @brief Observer interface invoked by the scheduler at report checkpoints.
 *
 * @details
 * Before every round the scheduler asks each reporter how many steps remain until it is next
 * due and which state components it will need then. Reporters are re-queried every round; the
 * answer may depend on :cpp:func:`Simulation::current_step` or on the reporter's own state.
 *
 * A reporter that does not want to participate in the coming round returns
 * :cpp:func:`NextReport::never`. A present step count must be positive: ``0`` would mean
 * "already due" and is rejected as a contract violation.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   struct EnergyPrinter : asim::sim::IReporter {
 *     NextReport describe_next_report(const Simulation& s) const override {
 *       return NextReport::every(100, s.current_step()).with_energy();
 *     }
 *     void report(const Simulation&, const engine::State& st) override {
 *       std::printf("%g\n", *st.potential_energy);
 *     }
 *   };
 * @endrst
 */

namespace asim::sim
{

class Simulation;

/// Steps until the next multiple of `interval` strictly after `current`.
inline std::int64_t steps_until_multiple(std::int64_t current, std::int64_t interval)
{
    return interval - current % interval;
}

struct NextReport
{
    std::optional<std::int64_t> steps; // nullopt = not due this round
    bool positions{false};
    bool velocities{false};
    bool forces{false};
    bool energy{false};

    static NextReport never() { return {}; }
    static NextReport in(std::int64_t steps)
    {
        NextReport r;
        r.steps = steps;
        return r;
    }
    static NextReport every(std::int64_t interval, std::int64_t current)
    {
        return in(steps_until_multiple(current, interval));
    }

    NextReport& with_positions(bool on = true) { positions = on; return *this; }
    NextReport& with_velocities(bool on = true) { velocities = on; return *this; }
    NextReport& with_forces(bool on = true) { forces = on; return *this; }
    NextReport& with_energy(bool on = true) { energy = on; return *this; }

    bool due_within(std::int64_t remaining) const noexcept
    {
        return steps.has_value() && *steps <= remaining;
    }
};

class IReporter
{
  public:
    virtual ~IReporter() = default;

    /// Side-effect free; called once per round.
    virtual NextReport describe_next_report(const Simulation& sim) const = 0;
    /// Called with a snapshot holding at least the requested components.
    virtual void report(const Simulation& sim, const engine::State& state) = 0;
};

} // namespace asim::sim
