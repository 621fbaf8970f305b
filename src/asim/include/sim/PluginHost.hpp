#pragma once
#include "sim/plugin/Registry.hpp"
#include <filesystem>
#include <memory>
#include <vector>

/**
 * @file PluginHost.hpp
 * @brief Loader for shared libraries and registry owner.
 *
 * @details
 * The host owns OS handles (``dlopen``) and exposes a helper to build reporters from the
 * registered factories. The builtin reporters **state_data**, **hdf5** and **progress** are
 * installed so the application runs without external plugins.
 *
 * Recognised ``params`` of the builtins:
 *
 * - ``state_data``: ``separator`` (single character, default ``,``)
 * - ``hdf5``: ``positions`` / ``velocities`` (``true``/``false``)
 * - ``progress``: ``total`` (target step count; required), ``start``
 *
 * @warning On Linux the application must link with ``dl`` to resolve ELF loader calls.
 */

namespace asim::sim
{

class PluginHost
{
  public:
    PluginHost();
    ~PluginHost();
    PluginHost(const PluginHost&) = delete;
    PluginHost& operator=(const PluginHost&) = delete;
    PluginHost(PluginHost&&) noexcept;
    PluginHost& operator=(PluginHost&&) noexcept;

    void load_library(const std::filesystem::path& lib);
    std::shared_ptr<IReporter> make_reporter(const plugin::ReporterConfig& cfg) const;

    plugin::Registry& registry() noexcept { return reg_; }
    const plugin::Registry& registry() const noexcept { return reg_; }

  private:
    plugin::Registry reg_;
    std::vector<void*> handles_;
};

/// Parses ``true/false/1/0/yes/no/on/off``; anything else is a ConfigurationError.
bool parse_bool(const std::string& key, const std::string& v);

} // namespace asim::sim
