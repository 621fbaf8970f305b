#pragma once
#include "engine/State.hpp"
#include "engine/System.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

/**
 * @file Observables.hpp
 * @brief Scalar observables computed from a snapshot, registered under string keys.
 *
 * @details
 * Reporters resolve the keys they were configured with once, at construction, via
 * :cpp:class:`ObservableSet`; an unknown key is a :cpp:class:`asim::sim::ConfigurationError`
 * naming the valid choices. New observables are added with :cpp:func:`ObservableRegistry::add`
 * (from application code or from a plugin) without touching the scheduler.
 *
 * Built-in keys (with aliases): ``KE``, ``potential``, ``total``, ``temperature``,
 * ``volume``, ``density``.
 */

namespace asim::sim::report
{

using ObservableFn = std::function<double(const engine::State&, const engine::SystemInfo&)>;

struct Observable
{
    std::string label; // axis/column label, with units
    ObservableFn fn;
    bool needs_energy{false};
    bool needs_positions{false};
    bool needs_velocities{false};
};

class ObservableRegistry
{
  public:
    /// Registry pre-populated with the built-in observables.
    static ObservableRegistry with_builtins();

    void add(std::string key, Observable obs);
    bool contains(const std::string& key) const { return table_.count(key) != 0; }
    const Observable& resolve(const std::string& key) const;
    std::vector<std::string> keys() const;

  private:
    std::map<std::string, Observable> table_;
};

/// Ordered, pre-resolved list of observables evaluated against one snapshot.
class ObservableSet
{
  public:
    ObservableSet() = default;
    ObservableSet(const ObservableRegistry& reg, const std::vector<std::string>& keys);

    bool empty() const noexcept { return items_.empty(); }
    std::size_t size() const noexcept { return items_.size(); }
    const std::vector<std::string>& keys() const noexcept { return keys_; }
    std::vector<std::string> labels() const;

    bool needs_energy() const noexcept;
    bool needs_positions() const noexcept;
    bool needs_velocities() const noexcept;

    std::vector<double> evaluate(const engine::State& s, const engine::SystemInfo& sys) const;

  private:
    std::vector<std::string> keys_;
    std::vector<Observable> items_;
};

} // namespace asim::sim::report
