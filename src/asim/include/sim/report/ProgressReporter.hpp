#pragma once
#include "sim/Progress.hpp"
#include "sim/Reporter.hpp"
#include <cstdint>

namespace asim::sim::report
{

/// Terminal progress bar toward `start + total` steps. Requests no snapshot data.
class ProgressReporter final : public IReporter
{
  public:
    ProgressReporter(std::int64_t every, std::int64_t total, std::int64_t start = 0);

    NextReport describe_next_report(const Simulation& sim) const override;
    void report(const Simulation& sim, const engine::State& state) override;

    std::int64_t last_step() const noexcept { return last_; }

  private:
    std::int64_t every_;
    std::int64_t start_;
    std::int64_t total_;
    std::int64_t last_{-1};
    prog::Bar bar_;
};

} // namespace asim::sim::report
