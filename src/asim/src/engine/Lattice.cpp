#include "engine/Lattice.hpp"
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

namespace asim::engine
{

std::unique_ptr<ParticleEngine> make_lattice(const LatticeSpec& spec)
{
    if (spec.particles < 1)
        throw std::invalid_argument("[lattice] particles must be >= 1");
    if (!(spec.spacing > 0.0))
        throw std::invalid_argument("[lattice] spacing must be positive");

    int side = 1;
    while (side * side * side < spec.particles)
        ++side;
    const std::size_t n = std::size_t(side) * side * side;

    SystemInfo sys;
    sys.masses.assign(n, spec.mass);
    sys.removes_cm_motion = spec.remove_cm_motion;
    if (spec.periodic)
    {
        const double edge = side * spec.spacing;
        sys.box = spec.box.value_or(Vec3{edge, edge, edge});
    }

    std::vector<Vec3> x;
    x.reserve(n);
    const double off = 0.5 * spec.spacing; // keep particles off the box faces
    for (int k = 0; k < side; ++k)
        for (int j = 0; j < side; ++j)
            for (int i = 0; i < side; ++i)
                x.push_back({off + i * spec.spacing, off + j * spec.spacing,
                             off + k * spec.spacing});

    std::vector<Vec3> v(n, Vec3{0.0, 0.0, 0.0});
    if (spec.temperature > 0.0 && spec.mass > 0.0)
    {
        std::mt19937 rng(spec.seed);
        std::normal_distribution<double> g(0.0, std::sqrt(kBoltzmann * spec.temperature / spec.mass));
        for (auto& vi : v)
            for (auto& c : vi)
                c = g(rng);

        if (spec.remove_cm_motion)
        {
            Vec3 mean{0.0, 0.0, 0.0};
            for (const auto& vi : v)
                for (int c = 0; c < 3; ++c)
                    mean[c] += vi[c] / double(n);
            for (auto& vi : v)
                for (int c = 0; c < 3; ++c)
                    vi[c] -= mean[c];
        }
    }

    return std::make_unique<ParticleEngine>(std::move(sys), spec.ff, std::move(x), std::move(v),
                                            spec.dt);
}

} // namespace asim::engine
