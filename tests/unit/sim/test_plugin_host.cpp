#include "sim/Errors.hpp"
#include "sim/PluginHost.hpp"
#include "sim/report/StateDataReporter.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <stdexcept>

using namespace asim::sim;
namespace fs = std::filesystem;

TEST_CASE("PluginHost provides the builtin reporters", "[plugin][builtin]")
{
    PluginHost host;
    const auto& reg = host.registry();
    CHECK(reg.has_reporter("state_data"));
    CHECK(reg.has_reporter("hdf5"));
    CHECK(reg.has_reporter("progress"));

    plugin::ReporterConfig c;
    c.type = "state_data";
    c.every = 10;
    c.observables = {"KE", "temperature"};
    c.path = "-";
    auto r = host.make_reporter(c);
    REQUIRE(r != nullptr);
    CHECK(dynamic_cast<report::StateDataReporter*>(r.get()) != nullptr);
}

TEST_CASE("Unknown reporter type is a configuration error", "[plugin][registry]")
{
    PluginHost host;
    plugin::ReporterConfig c;
    c.type = "webserver";
    REQUIRE_THROWS_AS(host.make_reporter(c), ConfigurationError);
}

TEST_CASE("Builtin factories validate their parameters", "[plugin][builtin]")
{
    PluginHost host;
    plugin::ReporterConfig c;

    SECTION("unknown observable")
    {
        c.type = "state_data";
        c.observables = {"nope"};
        REQUIRE_THROWS_AS(host.make_reporter(c), ConfigurationError);
    }
    SECTION("bad separator")
    {
        c.type = "state_data";
        c.params["separator"] = ";;";
        REQUIRE_THROWS_AS(host.make_reporter(c), ConfigurationError);
    }
    SECTION("hdf5 needs a path")
    {
        c.type = "hdf5";
        REQUIRE_THROWS_AS(host.make_reporter(c), ConfigurationError);
    }
    SECTION("hdf5 boolean params")
    {
        c.type = "hdf5";
        c.path = (fs::temp_directory_path() / "asim_plugin_host.h5").string();
        c.params["velocities"] = "maybe";
        REQUIRE_THROWS_AS(host.make_reporter(c), ConfigurationError);
    }
    SECTION("progress needs a total")
    {
        c.type = "progress";
        REQUIRE_THROWS_AS(host.make_reporter(c), ConfigurationError);
        c.params["total"] = "ten";
        REQUIRE_THROWS_AS(host.make_reporter(c), ConfigurationError);
        c.params["total"] = "10";
        REQUIRE(host.make_reporter(c) != nullptr);
    }
}

TEST_CASE("parse_bool accepts the usual spellings", "[plugin][params]")
{
    CHECK(parse_bool("k", "TRUE"));
    CHECK(parse_bool("k", "on"));
    CHECK_FALSE(parse_bool("k", "0"));
    CHECK_FALSE(parse_bool("k", "No"));
    CHECK_THROWS_AS(parse_bool("k", ""), ConfigurationError);
}

TEST_CASE("Loading a missing library throws", "[plugin][dl]")
{
    PluginHost host;
    REQUIRE_THROWS_AS(host.load_library("/nonexistent/libnothing.so"), std::runtime_error);
}

TEST_CASE("A plugin registers reporters and observables", "[plugin][dl]")
{
    PluginHost host;
    host.load_library(ASIM_TEST_PLUGIN_PATH);

    CHECK(host.registry().has_reporter("tick"));
    CHECK(host.registry().observables().contains("particle_count"));

    plugin::ReporterConfig c;
    c.type = "tick";
    c.every = 3;
    REQUIRE(host.make_reporter(c) != nullptr);

    // plugin observables are usable by builtin reporters
    c.type = "state_data";
    c.observables = {"particle_count"};
    REQUIRE(host.make_reporter(c) != nullptr);
}
