#include "sim/report/ProgressReporter.hpp"
#include "sim/Errors.hpp"
#include "sim/Simulation.hpp"

namespace asim::sim::report
{

ProgressReporter::ProgressReporter(std::int64_t every, std::int64_t total, std::int64_t start)
    : every_(every), start_(start), total_(total)
{
    if (every_ < 1)
        throw ConfigurationError("progress: report interval must be >= 1");
    if (total_ < 0)
        throw ConfigurationError("progress: total steps must be >= 0");
    bar_.start(total_);
}

NextReport ProgressReporter::describe_next_report(const Simulation& sim) const
{
    if (sim.current_step() >= start_ + total_)
        return NextReport::never();
    return NextReport::every(every_, sim.current_step());
}

void ProgressReporter::report(const Simulation& sim, const engine::State&)
{
    last_ = sim.current_step();
    bar_.update(last_ - start_);
    if (last_ >= start_ + total_)
        bar_.finish();
}

} // namespace asim::sim::report
