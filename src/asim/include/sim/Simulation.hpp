#pragma once
#include "engine/IEngine.hpp"
#include "sim/Errors.hpp"
#include "sim/ExecutionGuard.hpp"
#include "sim/Reporter.hpp"
#include "sim/Scheduler.hpp"
#include "sim/StepFuture.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file Simulation.hpp
 * @brief Application façade owning the engine and its reporters.
 *
 * @details
 * Typical usage:
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto eng = asim::engine::make_lattice(spec);
 *   asim::sim::Simulation sim(std::move(eng));
 *
 *   sim.add_reporter(std::make_shared<StateDataReporter>(std::cout, 100, obs));
 *   sim.minimize_energy(1.0, 0);      // until converged
 *
 *   sim.step(1000);                   // blocking
 *   auto fut = sim.async_step(5000, [] { LOGI("done\n"); });
 *   // ... other work ...
 *   fut.get();
 * @endrst
 *
 * Every operation that touches the engine goes through one :cpp:class:`ExecutionGuard`.
 * While a step is in flight, :cpp:func:`step`, :cpp:func:`minimize_energy`,
 * :cpp:func:`engine`, :cpp:func:`add_reporter` and :cpp:func:`clear_reporters` throw
 * :cpp:class:`AlreadyBusyError`; :cpp:func:`async_step` waits for the flight to land.
 *
 * @note Destroying a Simulation blocks until an in-flight asynchronous step finishes.
 */

namespace asim::sim
{

class Simulation;

/// Scoped, exclusive borrow of the engine. Holds the execution guard until destroyed.
class EngineLease
{
  public:
    EngineLease(EngineLease&& o) noexcept : guard_(std::exchange(o.guard_, nullptr)), eng_(o.eng_)
    {
    }
    EngineLease& operator=(EngineLease&&) = delete;
    EngineLease(const EngineLease&) = delete;
    EngineLease& operator=(const EngineLease&) = delete;
    ~EngineLease()
    {
        if (guard_)
            guard_->release();
    }

    engine::IEngine& operator*() const noexcept { return *eng_; }
    engine::IEngine* operator->() const noexcept { return eng_; }

  private:
    friend class Simulation;
    EngineLease(ExecutionGuard& g, engine::IEngine& e) : guard_(&g), eng_(&e) {}

    ExecutionGuard* guard_;
    engine::IEngine* eng_;
};

class Simulation
{
  public:
    explicit Simulation(std::unique_ptr<engine::IEngine> engine);
    ~Simulation();
    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    std::int64_t current_step() const noexcept { return step_.load(); }
    const engine::SystemInfo& system() const noexcept { return engine_->system(); }

    // Reporters (registration order = dispatch order at tied checkpoints)
    void add_reporter(std::shared_ptr<IReporter> r);
    void clear_reporters();
    const std::vector<std::shared_ptr<IReporter>>& reporters() const noexcept
    {
        return reporters_;
    }

    // Stepping
    void step(std::int64_t steps);
    StepFuture async_step(std::int64_t steps) { return launch_(steps, {}); }

    /// `on_complete` must be callable with no arguments, else InvalidCallbackError.
    /// It runs on the worker before the step is released: calling async_step, wait or step
    /// from it throws AlreadyBusyError, which then faults the returned future.
    template <class F> StepFuture async_step(std::int64_t steps, F&& on_complete)
    {
        if constexpr (std::is_invocable_v<std::decay_t<F>&>)
            return launch_(steps, std::function<void()>(std::forward<F>(on_complete)));
        else
            throw InvalidCallbackError("async_step: on_complete must be callable with 0 "
                                       "arguments");
    }

    bool is_busy() const noexcept { return guard_.is_busy(); }
    bool wait(std::optional<std::chrono::milliseconds> timeout = std::nullopt) const
    {
        return guard_.wait(timeout);
    }

    /// Local minimization; `max_iterations == 0` runs until converged.
    void minimize_energy(double tolerance = 1.0, int max_iterations = 0);

    /// Exclusive access to the engine; throws AlreadyBusyError while stepping.
    EngineLease engine();

    void set_chunk_size(std::int64_t n);
    std::int64_t chunk_size() const noexcept { return controls_.chunk; }
    /// External interrupt flag checked between chunks (e.g. set from a SIGINT handler).
    void set_stop_flag(const std::atomic<bool>* flag);

  private:
    std::unique_ptr<engine::IEngine> engine_;
    std::vector<std::shared_ptr<IReporter>> reporters_;
    std::atomic<std::int64_t> step_{0};
    StepControls controls_{};
    ExecutionGuard guard_; // last: joins the worker before the members above go away

    void run_(std::int64_t steps, StepControls ctl);
    StepFuture launch_(std::int64_t steps, std::function<void()> on_complete);
};

} // namespace asim::sim
