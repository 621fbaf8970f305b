#include "sim/Log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>

using asim::sim::logx::Level;
using asim::sim::logx::level_from_env;

namespace
{
struct EnvLevel
{
    explicit EnvLevel(const char* v) { ::setenv("ASIM_LOG", v, 1); }
    ~EnvLevel() { ::unsetenv("ASIM_LOG"); }
};
} // namespace

TEST_CASE("ASIM_LOG is matched case-insensitively", "[log]")
{
    {
        EnvLevel e("DEBUG");
        CHECK(level_from_env() == Level::Debug);
    }
    {
        EnvLevel e("Warning");
        CHECK(level_from_env() == Level::Warn);
    }
    {
        EnvLevel e("quiet");
        CHECK(level_from_env() == Level::Quiet);
    }
}

TEST_CASE("ASIM_LOG with bytes outside ASCII falls back to info", "[log]")
{
    {
        EnvLevel e("d\xC3\xA9""bug");
        CHECK(level_from_env() == Level::Info);
    }
    {
        EnvLevel e("\xFF\xFE");
        CHECK(level_from_env() == Level::Info);
    }
    ::unsetenv("ASIM_LOG");
    CHECK(level_from_env() == Level::Info);
}
