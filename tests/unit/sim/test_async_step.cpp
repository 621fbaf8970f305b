#include "fakes.hpp"
#include "sim/Errors.hpp"
#include "sim/StepFuture.hpp"
#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace fakes;
using asim::sim::AlreadyBusyError;
using asim::sim::InvalidCallbackError;
using asim::sim::SchedulerFault;
using asim::sim::StepFuture;
using namespace std::chrono_literals;

TEST_CASE("async_step completes and the future reports it", "[async]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);
    auto r = std::make_shared<IntervalReporter>(10);
    sim.add_reporter(r);
    eng->hold = true;

    StepFuture fut = sim.async_step(50);
    CHECK_FALSE(fut.is_complete());
    CHECK_FALSE(fut.wait(20ms));
    CHECK(sim.is_busy());

    eng->hold = false;
    REQUIRE(fut.wait(5s));
    CHECK(fut.is_complete());
    CHECK_FALSE(fut.faulted());
    REQUIRE_NOTHROW(fut.get());
    CHECK(sim.current_step() == 50);
    CHECK(r->seen.size() == 5);
    CHECK_FALSE(sim.is_busy());
}

TEST_CASE("A default StepFuture is complete", "[async]")
{
    StepFuture f;
    CHECK(f.is_complete());
    CHECK(f.wait(0ms));
    CHECK_FALSE(f.faulted());
    REQUIRE_NOTHROW(f.get());
}

TEST_CASE("on_complete runs once on the worker after the last report", "[async][callback]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);
    auto r = std::make_shared<IntervalReporter>(5);
    sim.add_reporter(r);

    std::atomic<int> calls{0};
    std::atomic<std::int64_t> step_at_callback{-1};
    std::atomic<bool> busy_in_callback{false};
    std::thread::id cb_thread;
    const auto main_thread = std::this_thread::get_id();

    auto fut = sim.async_step(20,
                              [&]
                              {
                                  ++calls;
                                  step_at_callback = sim.current_step();
                                  busy_in_callback = sim.is_busy();
                                  cb_thread = std::this_thread::get_id();
                              });
    fut.get();

    CHECK(calls == 1);
    CHECK(step_at_callback == 20);
    CHECK(busy_in_callback);
    CHECK(cb_thread != main_thread);
    CHECK(r->seen.back() == 20);
}

TEST_CASE("Non-callable on_complete is rejected before any work", "[async][callback]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);

    REQUIRE_THROWS_AS(sim.async_step(10, 42), InvalidCallbackError);
    REQUIRE_THROWS_AS(sim.async_step(10, [](int) {}), InvalidCallbackError);
    CHECK_FALSE(sim.is_busy());
    CHECK(sim.current_step() == 0);
    CHECK(eng->chunk_log().empty());
}

TEST_CASE("Faults in an async step are delivered through the future", "[async][fault]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);
    auto r = std::make_shared<IntervalReporter>(10);
    r->fail_at = 20;
    sim.add_reporter(r);

    std::atomic<bool> called{false};
    auto fut = sim.async_step(100, [&] { called = true; });
    REQUIRE(fut.wait(5s));
    CHECK(fut.faulted());
    CHECK_THROWS_AS(fut.get(), SchedulerFault);
    CHECK(called); // on_complete runs even when the step faulted
    CHECK(sim.current_step() == 20);
    CHECK_FALSE(sim.is_busy());
}

TEST_CASE("A throwing callback faults the future", "[async][callback]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);
    auto fut = sim.async_step(5, [] { throw std::runtime_error("callback failed"); });
    CHECK_THROWS_AS(fut.get(), std::runtime_error);
    CHECK(sim.current_step() == 5);
    CHECK_FALSE(sim.is_busy());
}

TEST_CASE("A second async_step waits for the first to finish", "[async][admission]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);
    eng->delay = 5ms;

    auto first = sim.async_step(30);
    auto t0 = std::chrono::steady_clock::now();
    auto second = sim.async_step(30);
    auto t1 = std::chrono::steady_clock::now();

    // admission of the second blocked until the first released the guard (3 chunks x 5 ms)
    CHECK(first.is_complete());
    CHECK(std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count() >= 10);

    second.get();
    CHECK(sim.current_step() == 60);
    auto chunks = eng->chunk_log();
    CHECK(chunks.size() == 6);
}

TEST_CASE("Simulation::wait blocks until the in-flight step lands", "[async]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);
    CHECK(sim.wait(0ms)); // nothing in flight

    eng->hold = true;
    auto fut = sim.async_step(10);
    CHECK_FALSE(sim.wait(10ms));
    eng->hold = false;
    CHECK(sim.wait());
    CHECK(fut.is_complete());
}

TEST_CASE("Destroying a simulation joins the worker", "[async]")
{
    std::shared_ptr<IntervalReporter> r = std::make_shared<IntervalReporter>(10);
    StepFuture fut;
    {
        CountingEngine* eng = nullptr;
        auto sim = make_sim(eng);
        eng->delay = 2ms;
        sim.add_reporter(r);
        fut = sim.async_step(40);
    }
    CHECK(fut.is_complete());
    CHECK(r->seen.size() == 4);
}

TEST_CASE("async_step from two threads at once admits every call", "[async][admission]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);

    constexpr int kCalls = 500;
    auto launcher = [&]
    {
        for (int i = 0; i < kCalls; ++i)
            sim.async_step(i % 5 == 0 ? 1 : 0);
    };
    std::vector<std::thread> threads;
    threads.emplace_back(launcher);
    threads.emplace_back(launcher);
    for (auto& t : threads)
        t.join();

    REQUIRE(sim.wait(5s));
    CHECK_FALSE(sim.is_busy());
    CHECK(sim.current_step() == 2 * kCalls / 5);
}

TEST_CASE("Starting a step from its own callback faults the future", "[async][callback]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);

    auto fut = sim.async_step(10, [&] { sim.async_step(10); });
    REQUIRE(fut.wait(5s));
    CHECK(fut.faulted());
    CHECK_THROWS_AS(fut.get(), AlreadyBusyError);
    CHECK(sim.current_step() == 10);
    CHECK_FALSE(sim.is_busy());

    // the guard is usable again afterwards
    sim.async_step(5).get();
    CHECK(sim.current_step() == 15);
}

TEST_CASE("Waiting on the simulation from a callback faults the future", "[async][callback]")
{
    CountingEngine* eng = nullptr;
    auto sim = make_sim(eng);

    SECTION("wait")
    {
        auto fut = sim.async_step(10, [&] { sim.wait(); });
        REQUIRE(fut.wait(5s));
        CHECK_THROWS_AS(fut.get(), AlreadyBusyError);
    }
    SECTION("synchronous step")
    {
        auto fut = sim.async_step(10, [&] { sim.step(1); });
        REQUIRE(fut.wait(5s));
        CHECK_THROWS_AS(fut.get(), AlreadyBusyError);
    }
    CHECK(sim.current_step() == 10);
    CHECK_FALSE(sim.is_busy());
}
