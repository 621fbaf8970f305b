#pragma once
#include "sim/Reporter.hpp"
#include "sim/report/Observables.hpp"
#include <cstdint>
#include <memory>
#include <string>

/**
 * @file Hdf5Reporter.hpp
 * @brief Trajectory + observables in one HDF5 file, one frame per report.
 *
 * @details
 * Datasets are extendible along the first (frame) axis and created on the first report, when
 * the particle count is known:
 *
 * - ``/step`` (int64), ``/time`` (f64, ps)
 * - ``/positions`` (frames x N x 3, f64, nm; wrapped into the box when periodic)
 * - ``/velocities`` (frames x N x 3, f64, nm/ps) when enabled
 * - ``/observables/<key>`` (f64) with a string attribute ``label``
 *
 * The file is opened (truncated) at construction and closed by :cpp:func:`close` or the
 * destructor.
 */

namespace asim::sim::report
{

class Hdf5Reporter final : public IReporter
{
  public:
    struct Options
    {
        std::int64_t every{1000};
        bool positions{true};
        bool velocities{false};
    };

    Hdf5Reporter(const std::string& path, Options opt, ObservableSet obs = {});
    ~Hdf5Reporter() override;
    Hdf5Reporter(const Hdf5Reporter&) = delete;
    Hdf5Reporter& operator=(const Hdf5Reporter&) = delete;

    NextReport describe_next_report(const Simulation& sim) const override;
    void report(const Simulation& sim, const engine::State& state) override;

    void close();
    std::int64_t frames() const noexcept;

  private:
    Options opt_;
    ObservableSet obs_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace asim::sim::report
