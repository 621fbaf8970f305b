// Loaded by test_plugin_host through dlopen.
#include "sim/plugin/Registry.hpp"
#include "sim/Simulation.hpp"

#include <memory>

using namespace asim;
using namespace asim::sim;

namespace
{

struct TickReporter final : IReporter
{
    explicit TickReporter(std::int64_t every) : every(every) {}
    NextReport describe_next_report(const Simulation& s) const override
    {
        return NextReport::every(every, s.current_step());
    }
    void report(const Simulation&, const engine::State&) override {}
    std::int64_t every;
};

} // namespace

extern "C" bool asim_register_v1(plugin::Registry* R)
{
    R->observables().add("particle_count",
                         {"Particles", [](const engine::State&, const engine::SystemInfo& sys)
                          { return static_cast<double>(sys.size()); }});
    R->add_reporter("tick", [](const plugin::ReporterConfig& c, const report::ObservableRegistry&)
                    { return std::make_shared<TickReporter>(c.every); });
    return true;
}
