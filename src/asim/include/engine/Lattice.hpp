#pragma once
#include "engine/ParticleEngine.hpp"
#include <cstdint>
#include <memory>
#include <optional>

namespace asim::engine
{

/// Parameters for a cubic-lattice test system.
struct LatticeSpec
{
    int particles{64};        // rounded up to the next cube
    double spacing{0.38};     // nm
    double mass{39.948};      // dalton
    bool periodic{true};
    std::optional<Vec3> box;  // default: n_side * spacing per edge
    double temperature{0.0};  // K, initial Maxwell-Boltzmann velocities
    std::uint32_t seed{1};
    bool remove_cm_motion{true};
    ForceField ff{0.996, 0.3405, 0.7, {}};
    double dt{0.002};         // ps
};

inline constexpr double kBoltzmann = 0.0083144626; // kJ/mol/K

std::unique_ptr<ParticleEngine> make_lattice(const LatticeSpec& spec);

} // namespace asim::engine
