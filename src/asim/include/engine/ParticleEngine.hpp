#pragma once
#include "engine/IEngine.hpp"
#include <cstdint>
#include <vector>

/**
 * @file ParticleEngine.hpp
 * @brief Reference engine: Lennard-Jones + harmonic bonds, velocity Verlet, steepest descent.
 *
 * @details
 * Serial O(N^2) pair loop, sized for tests and the demo app. Lets the scheduler and reporters be
 * driven end to end. Pair forces use a truncated-and-shifted LJ potential and the minimum
 * image convention when the system has a periodic box. Positions are stored unwrapped;
 * :cpp:func:`get_state` wraps them only when the request asks for it.
 */

namespace asim::engine
{

struct Bond
{
    std::size_t i{0}, j{0};
    double r0{0.1}; // nm
    double k{1000.0}; // kJ/mol/nm^2
};

struct ForceField
{
    double epsilon{0.996}; // kJ/mol (argon)
    double sigma{0.3405};  // nm
    double cutoff{1.0};    // nm; 0 = no pair interactions
    std::vector<Bond> bonds;
};

class ParticleEngine final : public IEngine
{
  public:
    ParticleEngine(SystemInfo system, ForceField ff, std::vector<Vec3> positions,
                   std::vector<Vec3> velocities, double dt);

    void advance(std::int64_t steps) override;
    void minimize(double tolerance, int max_iterations) override;
    State get_state(const StateRequest& req) const override;
    bool has_periodic_box() const override { return system_.periodic(); }
    const SystemInfo& system() const override { return system_; }

    double dt() const noexcept { return dt_; }
    std::int64_t steps_taken() const noexcept { return step_; }

    double potential_energy() const { return potential_(x_); }
    double kinetic_energy() const;

  private:
    SystemInfo system_;
    ForceField ff_;
    std::vector<Vec3> x_, v_, f_;
    double dt_;
    double shift_{0.0}; // LJ energy at the cutoff
    std::int64_t step_{0};

    Vec3 delta_(const Vec3& a, const Vec3& b) const;
    double potential_(const std::vector<Vec3>& x) const;
    void forces_(const std::vector<Vec3>& x, std::vector<Vec3>& f) const;
};

} // namespace asim::engine
