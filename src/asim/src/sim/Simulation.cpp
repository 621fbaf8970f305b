#include "sim/Simulation.hpp"
#include "sim/Log.hpp"

#include <stdexcept>
#include <string>

namespace asim::sim
{

Simulation::Simulation(std::unique_ptr<engine::IEngine> engine) : engine_(std::move(engine))
{
    if (!engine_)
        throw std::invalid_argument("Simulation requires an engine");
}

Simulation::~Simulation()
{
    // the worker still uses engine_ and reporters_
    guard_.wait();
}

void Simulation::add_reporter(std::shared_ptr<IReporter> r)
{
    if (!r)
        throw ConfigurationError("add_reporter: null reporter");
    guard_.run("add_reporter", [&] { reporters_.push_back(std::move(r)); });
}

void Simulation::clear_reporters()
{
    guard_.run("clear_reporters", [&] { reporters_.clear(); });
}

void Simulation::set_chunk_size(std::int64_t n)
{
    if (n < 1)
        throw std::invalid_argument("chunk size must be >= 1");
    guard_.run("set_chunk_size", [&] { controls_.chunk = n; });
}

void Simulation::set_stop_flag(const std::atomic<bool>* flag)
{
    guard_.run("set_stop_flag", [&] { controls_.stop = flag; });
}

void Simulation::run_(std::int64_t steps, StepControls ctl)
{
    Scheduler sched(*this, *engine_, reporters_, step_, ctl);
    sched.run(steps);
}

void Simulation::step(std::int64_t steps)
{
    if (steps < 0)
        throw std::invalid_argument("step: step count must be non-negative");
    guard_.run("step", [&] { run_(steps, controls_); });
}

StepFuture Simulation::launch_(std::int64_t steps, std::function<void()> on_complete)
{
    if (steps < 0)
        throw std::invalid_argument("async_step: step count must be non-negative");
    return guard_.launch(
        [this, steps]
        {
            // controls_ can only change while the guard is free, and the worker holds it
            run_(steps, controls_);
        },
        std::move(on_complete));
}

void Simulation::minimize_energy(double tolerance, int max_iterations)
{
    if (max_iterations < 0)
        throw std::invalid_argument("minimize_energy: max_iterations must be >= 0");
    guard_.run("minimize_energy",
               [&]
               {
                   LOGI("[sim] minimizing (tolerance=%g kJ/mol, max_iterations=%d%s)\n",
                        tolerance, max_iterations, max_iterations == 0 ? " = until converged" : "");
                   engine_->minimize(tolerance, max_iterations);
               });
}

EngineLease Simulation::engine()
{
    if (!guard_.try_acquire())
        throw AlreadyBusyError("engine: modification of the engine before the in-flight step "
                               "completes is not allowed");
    return EngineLease(guard_, *engine_);
}

} // namespace asim::sim
