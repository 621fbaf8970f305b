#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

/**
 * @file State.hpp
 * @brief Snapshot of engine state and the request that selects its components.
 *
 * @details
 * A :cpp:struct:`StateRequest` names which components the engine must compute. The returned
 * :cpp:struct:`State` carries exactly those; components that were not requested are
 * ``std::nullopt``. Step, time and the periodic box are always present (cheap to provide).
 *
 * Units: nm, ps, kJ/mol.
 */

namespace asim::engine
{

using Vec3 = std::array<double, 3>;

struct StateRequest
{
    bool positions{false};
    bool velocities{false};
    bool forces{false};
    bool energy{false};
    bool wrap_positions{false}; // wrap into the periodic box (ignored if non-periodic)
};

struct State
{
    std::int64_t step{0};
    double time{0.0}; // ps

    std::optional<std::vector<Vec3>> positions;
    std::optional<std::vector<Vec3>> velocities;
    std::optional<std::vector<Vec3>> forces;

    std::optional<double> kinetic_energy;
    std::optional<double> potential_energy;

    std::optional<Vec3> box; // rectangular box edge lengths, if periodic
};

} // namespace asim::engine
