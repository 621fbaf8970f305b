#pragma once
#include "engine/State.hpp"
#include <cstddef>
#include <optional>
#include <vector>

/**
 * @file System.hpp
 * @brief Immutable description of the simulated system (the "topology").
 *
 * @details
 * `SystemInfo` is what reporters may read through the facade while a run is in flight: it
 * never changes after the engine is built, so sharing it across threads is safe.
 */

namespace asim::engine
{

struct SystemInfo
{
    std::vector<double> masses;  // dalton, one per particle
    std::optional<Vec3> box;     // periodic box edges (nm); nullopt = non-periodic
    int num_constraints{0};
    bool removes_cm_motion{false};

    std::size_t size() const noexcept { return masses.size(); }
    bool periodic() const noexcept { return box.has_value(); }

    /// 3 per massive particle, minus constraints, minus 3 if CM motion is removed.
    int degrees_of_freedom() const noexcept
    {
        int dof = 0;
        for (double m : masses)
            if (m > 0.0)
                dof += 3;
        dof -= num_constraints;
        if (removes_cm_motion)
            dof -= 3;
        return dof;
    }

    double total_mass() const noexcept
    {
        double sum = 0.0;
        for (double m : masses)
            sum += m;
        return sum;
    }
};

} // namespace asim::engine
