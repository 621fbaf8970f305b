#pragma once
#include "engine/State.hpp"
#include "sim/Reporter.hpp"

namespace asim::sim
{

/// Per-round union of the state components needed by all due reporters.
class SnapshotRequest
{
  public:
    void include(const NextReport& r) noexcept
    {
        req_.positions |= r.positions;
        req_.velocities |= r.velocities;
        req_.forces |= r.forces;
        req_.energy |= r.energy;
        ++due_;
    }

    bool any_due() const noexcept { return due_ > 0; }
    int due_count() const noexcept { return due_; }

    /// Engine request; positions are wrapped whenever the system is periodic.
    engine::StateRequest build(bool periodic) const noexcept
    {
        auto r = req_;
        r.wrap_positions = periodic;
        return r;
    }

  private:
    engine::StateRequest req_{};
    int due_{0};
};

} // namespace asim::sim
