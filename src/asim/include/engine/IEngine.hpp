#pragma once
#include "engine/State.hpp"
#include "engine/System.hpp"
#include <cstdint>

/**
 * @file IEngine.hpp
 * @brief Capability set the scheduler consumes from a physics engine.
 *
 * @details
 * The core never integrates anything itself: it only decides *when* to call ``advance`` and
 * *what* to ask ``get_state`` for. Implementations are not required to be thread-safe; the
 * :cpp:class:`asim::sim::Simulation` that owns an engine lends it to one thread at a time.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   struct NullEngine : asim::engine::IEngine {
 *     SystemInfo sys;
 *     std::int64_t n = 0;
 *     void advance(std::int64_t steps) override { n += steps; }
 *     void minimize(double, int) override {}
 *     State get_state(const StateRequest&) const override { return State{n}; }
 *     bool has_periodic_box() const override { return false; }
 *     const SystemInfo& system() const override { return sys; }
 *   };
 * @endrst
 */

namespace asim::engine
{

class IEngine
{
  public:
    virtual ~IEngine() = default;

    /// Integrate forward by exactly `steps` steps.
    virtual void advance(std::int64_t steps) = 0;
    /// Local energy minimization; `max_iterations == 0` means "until converged".
    virtual void minimize(double tolerance, int max_iterations) = 0;
    virtual State get_state(const StateRequest& req) const = 0;
    virtual bool has_periodic_box() const = 0;
    virtual const SystemInfo& system() const = 0;
};

} // namespace asim::engine
