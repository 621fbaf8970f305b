#include "engine/Lattice.hpp"
#include "engine/ParticleEngine.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>

using namespace asim::engine;

static ParticleEngine stretched_dimer()
{
    SystemInfo sys;
    sys.masses = {12.0, 16.0};
    ForceField ff;
    ff.cutoff = 0.0;
    ff.bonds.push_back({0, 1, 0.15, 1000.0});
    return ParticleEngine(sys, ff, {{0.0, 0.0, 0.0}, {0.2, 0.0, 0.0}}, {}, 0.001);
}

static double bond_length(const ParticleEngine& e)
{
    StateRequest rq;
    rq.positions = true;
    const auto x = *e.get_state(rq).positions;
    double r2 = 0.0;
    for (int k = 0; k < 3; ++k)
        r2 += (x[1][k] - x[0][k]) * (x[1][k] - x[0][k]);
    return std::sqrt(r2);
}

TEST_CASE("Minimizer relaxes a stretched bond to its rest length", "[engine][minimize]")
{
    auto e = stretched_dimer();
    const double e0 = e.potential_energy();
    e.minimize(1e-6, 0); // until converged
    CHECK(e.potential_energy() < e0);
    CHECK(bond_length(e) == Catch::Approx(0.15).margin(1e-3));
    CHECK(e.steps_taken() == 0);
}

TEST_CASE("Minimizer honours an iteration cap", "[engine][minimize]")
{
    auto capped = stretched_dimer();
    auto full = stretched_dimer();
    const double e0 = capped.potential_energy();

    capped.minimize(1e-9, 1);
    full.minimize(1e-9, 0);

    CHECK(capped.potential_energy() <= e0);
    CHECK(full.potential_energy() <= capped.potential_energy());
    CHECK(bond_length(capped) > bond_length(full));
}

TEST_CASE("Minimization never raises the energy of a lattice", "[engine][minimize]")
{
    LatticeSpec s;
    s.particles = 27;
    s.spacing = 0.36; // compressed
    s.ff.cutoff = 0.5;
    auto e = make_lattice(s);
    e->advance(20);
    const double before = e->potential_energy();
    e->minimize(1.0, 0);
    CHECK(e->potential_energy() <= before);
}
