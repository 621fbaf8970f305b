#pragma once
#include "sim/Reporter.hpp"
#include "sim/report/Observables.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>

/**
 * @file StateDataReporter.hpp
 * @brief Delimited text table of observables, one row per report.
 *
 * @details
 * Output (CSV by default):
 *
 * @rst
 * .. code-block:: text
 *
 *   "Step","Time [ps]","Kinetic Energy [kJ/mol]","Temperature [K]"
 *   100,0.2,143.57,118.2
 * @endrst
 */

namespace asim::sim::report
{

class StateDataReporter final : public IReporter
{
  public:
    StateDataReporter(std::ostream& out, std::int64_t every, ObservableSet obs,
                      char separator = ',');
    /// Opens (truncates) `path`; parent directories are created.
    StateDataReporter(const std::string& path, std::int64_t every, ObservableSet obs,
                      char separator = ',');

    NextReport describe_next_report(const Simulation& sim) const override;
    void report(const Simulation& sim, const engine::State& state) override;

    std::int64_t rows() const noexcept { return rows_; }

  private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_;
    std::int64_t every_;
    ObservableSet obs_;
    char sep_;
    bool header_written_{false};
    std::int64_t rows_{0};

    void write_header_();
};

} // namespace asim::sim::report
