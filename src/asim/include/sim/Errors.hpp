#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Exception types raised by the simulation core.
 *
 * @details
 * - :cpp:class:`AlreadyBusyError`: a synchronous operation found another one in flight.
 * - :cpp:class:`InvalidCallbackError`: ``async_step`` got a callback that cannot be called
 *   with zero arguments. Raised before any work starts.
 * - :cpp:class:`SchedulerFault`: the engine or a reporter failed during a round. Carries the
 *   step counter value at the time of the failure.
 * - :cpp:class:`StepInterrupted`: the external stop flag was raised between chunks.
 * - :cpp:class:`ConfigurationError`: bad reporter/observable registration or config value.
 */

namespace asim::sim
{

struct AlreadyBusyError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct InvalidCallbackError : std::invalid_argument
{
    using std::invalid_argument::invalid_argument;
};

struct ConfigurationError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

class SchedulerFault : public std::runtime_error
{
  public:
    SchedulerFault(const std::string& what, std::int64_t step)
        : std::runtime_error(what), step_(step)
    {
    }

    /// Step counter when the fault was raised (progress already made is kept).
    std::int64_t step() const noexcept { return step_; }

  private:
    std::int64_t step_;
};

class StepInterrupted : public SchedulerFault
{
  public:
    explicit StepInterrupted(std::int64_t step)
        : SchedulerFault("stepping interrupted at step " + std::to_string(step), step)
    {
    }
};

} // namespace asim::sim
