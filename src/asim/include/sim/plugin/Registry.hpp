#pragma once
#include "sim/Reporter.hpp"
#include "sim/report/Observables.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file Registry.hpp
 * @brief Runtime factory registry for reporters and observables.
 *
 * @details
 * Shared libraries register factories under string keys using the exported function
 * :cpp:func:`asim_register_v1`. The application resolves reporter ``type`` keys (from YAML)
 * and constructs the selected reporters; observables registered here become valid keys for
 * every reporter built afterwards.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   extern "C" bool asim_register_v1(Registry* R) {
 *     R->observables().add("kT", {"kT [kJ/mol]", [](const State& s, const SystemInfo& sys){ ... }});
 *     R->add_reporter("energy_log", [](const ReporterConfig& c, const ObservableRegistry& o){ ... });
 *     return true;
 *   }
 * @endrst
 */

namespace asim::sim::plugin
{

using KV = std::unordered_map<std::string, std::string>;

/// One ``reporters:`` entry of the run configuration.
struct ReporterConfig
{
    std::string type;
    std::int64_t every{1};
    std::vector<std::string> observables;
    std::string path; // "-" or empty = stdout where applicable
    KV params;
};

class Registry
{
  public:
    using CreateReporter = std::function<std::shared_ptr<IReporter>(
        const ReporterConfig&, const report::ObservableRegistry&)>;

    Registry() : observables_(report::ObservableRegistry::with_builtins()) {}

    void add_reporter(std::string key, CreateReporter f)
    {
        reporters_[std::move(key)] = std::move(f);
    }
    bool has_reporter(const std::string& key) const { return reporters_.count(key) != 0; }

    std::shared_ptr<IReporter> make_reporter(const ReporterConfig& cfg) const;

    report::ObservableRegistry& observables() noexcept { return observables_; }
    const report::ObservableRegistry& observables() const noexcept { return observables_; }

  private:
    std::unordered_map<std::string, CreateReporter> reporters_;
    report::ObservableRegistry observables_;
};

// Plugin entry point
using RegisterFn = bool (*)(Registry*);
inline constexpr const char* kRegisterSymbol = "asim_register_v1";

} // namespace asim::sim::plugin
