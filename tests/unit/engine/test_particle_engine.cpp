#include "engine/Lattice.hpp"
#include "engine/ParticleEngine.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace asim::engine;
using Catch::Approx;

static LatticeSpec small_argon()
{
    LatticeSpec s;
    s.particles = 27;
    s.spacing = 0.38;
    s.temperature = 50.0;
    s.seed = 3;
    s.ff.cutoff = 0.5; // box 1.14
    s.dt = 0.002;
    return s;
}

TEST_CASE("Lattice builder rounds up to a cube and fills the box", "[engine][lattice]")
{
    LatticeSpec s;
    s.particles = 10;
    s.ff.cutoff = 0.5;
    auto e = make_lattice(s);
    REQUIRE(e->system().size() == 27);
    REQUIRE(e->has_periodic_box());
    CHECK((*e->system().box)[0] == Approx(3 * s.spacing));

    SECTION("non-periodic")
    {
        s.periodic = false;
        auto np = make_lattice(s);
        CHECK_FALSE(np->has_periodic_box());
        CHECK_FALSE(np->get_state({}).box.has_value());
    }
    SECTION("invalid")
    {
        s.particles = 0;
        CHECK_THROWS_AS(make_lattice(s), std::invalid_argument);
    }
}

TEST_CASE("Initial velocities are seeded and have no net momentum", "[engine][lattice]")
{
    auto a = make_lattice(small_argon());
    auto b = make_lattice(small_argon());
    StateRequest rq;
    rq.velocities = true;
    const auto va = *a->get_state(rq).velocities;
    const auto vb = *b->get_state(rq).velocities;
    REQUIRE(va.size() == vb.size());
    CHECK(va[5][1] == vb[5][1]);

    double p[3] = {0, 0, 0};
    for (const auto& v : va)
        for (int k = 0; k < 3; ++k)
            p[k] += v[k];
    for (double c : p)
        CHECK(std::abs(c) < 1e-9);
    CHECK(a->kinetic_energy() > 0.0);
}

TEST_CASE("Velocity Verlet conserves total energy", "[engine][md]")
{
    auto e = make_lattice(small_argon());
    const double e0 = e->kinetic_energy() + e->potential_energy();
    e->advance(500);
    const double e1 = e->kinetic_energy() + e->potential_energy();
    CAPTURE(e0, e1);
    CHECK(e->steps_taken() == 500);
    CHECK(std::abs(e1 - e0) < 1.0);

    const auto st = e->get_state({});
    CHECK(st.step == 500);
    CHECK(st.time == Approx(1.0));
}

TEST_CASE("advance(a) then advance(b) equals advance(a + b)", "[engine][md]")
{
    auto one = make_lattice(small_argon());
    auto two = make_lattice(small_argon());
    one->advance(30);
    two->advance(10);
    two->advance(20);
    StateRequest rq;
    rq.positions = true;
    const auto xa = *one->get_state(rq).positions;
    const auto xb = *two->get_state(rq).positions;
    for (std::size_t i = 0; i < xa.size(); ++i)
        for (int k = 0; k < 3; ++k)
            CHECK(xa[i][k] == xb[i][k]);
}

TEST_CASE("Wrapped positions lie inside the periodic box", "[engine][pbc]")
{
    SystemInfo sys;
    sys.masses = {1.0};
    sys.box = Vec3{1.0, 1.0, 1.0};
    ForceField ff;
    ff.cutoff = 0.0;
    // exact binary steps of 0.5 nm
    ParticleEngine e(sys, ff, {{0.5, 0.5, 0.5}}, {{8.0, -8.0, 0.0}}, 0.0625);
    e.advance(3);

    StateRequest rq;
    rq.positions = true;
    const auto raw = (*e.get_state(rq).positions)[0];
    CHECK(raw[0] == Approx(2.0));
    CHECK(raw[1] == Approx(-1.0));

    rq.wrap_positions = true;
    const auto w = (*e.get_state(rq).positions)[0];
    for (int k = 0; k < 3; ++k)
    {
        CHECK(w[k] >= 0.0);
        CHECK(w[k] < 1.0);
    }
    CHECK(w[0] == Approx(0.0).margin(1e-9));
    CHECK(w[2] == Approx(0.5));
}

TEST_CASE("Snapshot contains only what was requested", "[engine][state]")
{
    auto e = make_lattice(small_argon());
    auto none = e->get_state({});
    CHECK_FALSE(none.positions);
    CHECK_FALSE(none.velocities);
    CHECK_FALSE(none.forces);
    CHECK_FALSE(none.kinetic_energy);

    StateRequest rq;
    rq.forces = true;
    rq.energy = true;
    auto s = e->get_state(rq);
    REQUIRE(s.forces);
    CHECK(s.forces->size() == 27);
    REQUIRE(s.potential_energy);
    CHECK(*s.potential_energy == Approx(e->potential_energy()));
    CHECK(*s.kinetic_energy == Approx(e->kinetic_energy()));
}

TEST_CASE("ParticleEngine validates its inputs", "[engine][validate]")
{
    SystemInfo sys;
    sys.masses = {1.0, 1.0};
    ForceField ff;
    const std::vector<Vec3> x = {{0, 0, 0}, {0.5, 0, 0}};

    CHECK_THROWS_AS(ParticleEngine(sys, ff, {{0, 0, 0}}, {}, 0.002), std::invalid_argument);
    CHECK_THROWS_AS(ParticleEngine(sys, ff, x, {}, 0.0), std::invalid_argument);

    ForceField bad_bond = ff;
    bad_bond.bonds.push_back({0, 2, 0.1, 100.0});
    CHECK_THROWS_AS(ParticleEngine(sys, bad_bond, x, {}, 0.002), std::invalid_argument);

    SystemInfo boxed = sys;
    boxed.box = Vec3{1.0, 1.0, 1.0};
    ForceField long_cut = ff;
    long_cut.cutoff = 0.6;
    CHECK_THROWS_AS(ParticleEngine(boxed, long_cut, x, {}, 0.002), std::invalid_argument);
}
