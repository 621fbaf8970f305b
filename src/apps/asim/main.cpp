#include "engine/Lattice.hpp"
#include "sim/Errors.hpp"
#include "sim/Log.hpp"
#include "sim/PluginHost.hpp"
#include "sim/Simulation.hpp"
#include "sim/io/ConfigYAML.hpp" // AppConfig + load_config_from_yaml()

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <string>
#include <utility>

using asim::sim::AppConfig;
using asim::sim::ConfigurationError;
using asim::sim::PluginHost;
using asim::sim::SchedulerFault;
using asim::sim::Simulation;
using asim::sim::StepInterrupted;

namespace
{

std::atomic<bool> g_stop{false};

extern "C" void on_sigint(int)
{
    g_stop.store(true);
}

constexpr int kExitFault = 1;
constexpr int kExitInterrupted = 130;

// progress reporters default to the configured run length
void fill_progress_defaults(AppConfig& cfg)
{
    for (auto& rc : cfg.reporters)
    {
        if (rc.type != "progress")
            continue;
        rc.params.emplace("total", std::to_string(cfg.run.steps));
        rc.params.emplace("start", "0");
    }
}

void run_async(Simulation& sim, std::int64_t steps)
{
    using namespace std::chrono_literals;
    auto t0 = std::chrono::steady_clock::now();
    auto fut = sim.async_step(steps,
                              [t0]
                              {
                                  const double dt = std::chrono::duration<double>(
                                                        std::chrono::steady_clock::now() - t0)
                                                        .count();
                                  LOGI("[run] async step finished in %.2fs\n", dt);
                              });
    while (!fut.wait(500ms))
        LOGD("[run] step=%lld (in flight)\n", static_cast<long long>(sim.current_step()));
    fut.get(); // rethrows a scheduler fault
}

} // namespace

int main(int argc, char** argv)
{
    // ASIM_LOG=quiet|error|warn|info|debug overrides the default
    asim::sim::logx::init({asim::sim::logx::Level::Info});

    const std::string cfg_path = (argc > 1) ? argv[1] : "case.yaml";

    try
    {
        // 1) Parse YAML config
        AppConfig cfg = asim::sim::load_config_from_yaml(cfg_path);
        fill_progress_defaults(cfg);

        // 2) Plugins first: reporters built from a DSO must not outlive its handle
        PluginHost host;
        for (const auto& lib : cfg.plugin_libs)
            host.load_library(lib);

        // 3) System + engine
        auto eng = asim::engine::make_lattice(cfg.system);
        LOGI("[%s] particles=%zu periodic=%d dt=%g ps dof=%d\n", cfg.case_name.c_str(),
             eng->system().size(), int(eng->has_periodic_box()), eng->dt(),
             eng->system().degrees_of_freedom());

        Simulation sim(std::move(eng));
        sim.set_chunk_size(cfg.run.chunk);
        sim.set_stop_flag(&g_stop);
        std::signal(SIGINT, on_sigint);

        // 4) Reporters (registration order = dispatch order)
        for (const auto& rc : cfg.reporters)
            sim.add_reporter(host.make_reporter(rc));
        if (cfg.reporters.empty())
            LOGW("No reporters configured; the run produces no output\n");

        // 5) Optional minimization
        if (cfg.run.minimize.enabled)
            sim.minimize_energy(cfg.run.minimize.tolerance, cfg.run.minimize.max_iterations);

        // 6) Run
        LOGI("[run] steps=%lld chunk=%lld mode=%s\n", static_cast<long long>(cfg.run.steps),
             static_cast<long long>(cfg.run.chunk), cfg.run.async ? "async" : "sync");
        if (cfg.run.async)
            run_async(sim, cfg.run.steps);
        else
            sim.step(cfg.run.steps);

        LOGI("[run] done at step %lld\n", static_cast<long long>(sim.current_step()));
    }
    catch (const StepInterrupted& e)
    {
        LOGW("[run] interrupted at step %lld\n", static_cast<long long>(e.step()));
        return kExitInterrupted;
    }
    catch (const SchedulerFault& e)
    {
        LOGE("[run] %s (step %lld)\n", e.what(), static_cast<long long>(e.step()));
        return kExitFault;
    }
    catch (const ConfigurationError& e)
    {
        LOGE("[config] %s\n", e.what());
        return kExitFault;
    }
    catch (const std::exception& e)
    {
        LOGE("ERROR: %s\n", e.what());
        return kExitFault;
    }
    return 0;
}
