#include "sim/plugin/Registry.hpp"
#include "sim/Errors.hpp"

using namespace asim::sim::plugin;

std::shared_ptr<asim::sim::IReporter> Registry::make_reporter(const ReporterConfig& cfg) const {
  auto it = reporters_.find(cfg.type);
  if (it == reporters_.end()) throw ConfigurationError("No reporter factory for type: " + cfg.type);
  auto r = it->second(cfg, observables_);
  if (!r) throw ConfigurationError("Reporter factory returned null for type: " + cfg.type);
  return r;
}
