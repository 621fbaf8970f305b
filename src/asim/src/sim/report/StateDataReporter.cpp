#include "sim/report/StateDataReporter.hpp"
#include "sim/Errors.hpp"
#include "sim/Log.hpp"
#include "sim/Simulation.hpp"

#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace asim::sim::report
{

namespace fs = std::filesystem;

StateDataReporter::StateDataReporter(std::ostream& out, std::int64_t every, ObservableSet obs,
                                     char separator)
    : out_(&out), every_(every), obs_(std::move(obs)), sep_(separator)
{
    if (every_ < 1)
        throw ConfigurationError("state_data: report interval must be >= 1");
}

StateDataReporter::StateDataReporter(const std::string& path, std::int64_t every,
                                     ObservableSet obs, char separator)
    : StateDataReporter(std::cout, every, std::move(obs), separator)
{
    const fs::path p(path);
    if (p.has_parent_path())
        fs::create_directories(p.parent_path());
    file_ = std::make_unique<std::ofstream>(p, std::ios::trunc);
    if (!*file_)
        throw std::runtime_error("state_data: cannot open " + path);
    out_ = file_.get();
    LOGI("[report] state data -> %s (every %lld steps)\n", path.c_str(),
         static_cast<long long>(every_));
}

NextReport StateDataReporter::describe_next_report(const Simulation& sim) const
{
    return NextReport::every(every_, sim.current_step())
        .with_energy(obs_.needs_energy())
        .with_positions(obs_.needs_positions())
        .with_velocities(obs_.needs_velocities());
}

void StateDataReporter::write_header_()
{
    auto& os = *out_;
    os << "\"Step\"" << sep_ << "\"Time [ps]\"";
    for (const auto& l : obs_.labels())
        os << sep_ << '"' << l << '"';
    os << '\n';
    header_written_ = true;
}

void StateDataReporter::report(const Simulation& sim, const engine::State& state)
{
    const auto values = obs_.evaluate(state, sim.system());

    if (!header_written_)
        write_header_();

    auto& os = *out_;
    const auto old_prec = os.precision(std::numeric_limits<double>::digits10);
    os << sim.current_step() << sep_ << state.time;
    for (double v : values)
        os << sep_ << v;
    os << '\n';
    os.precision(old_prec);
    os.flush();
    if (!os)
        throw std::runtime_error("state_data: write failed");
    ++rows_;
}

} // namespace asim::sim::report
