#include "sim/report/Observables.hpp"
#include "sim/Errors.hpp"

#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace asim::sim::report
{

namespace
{

constexpr double kGasConstant = 0.00831451; // kJ/mol/K
constexpr double kDaltonPerNm3ToGPerMl = 1.0 / 602.214076;

double ke(const engine::State& s)
{
    if (!s.kinetic_energy)
        throw std::runtime_error("observable needs energy but the snapshot has none");
    return *s.kinetic_energy;
}

double pe(const engine::State& s)
{
    if (!s.potential_energy)
        throw std::runtime_error("observable needs energy but the snapshot has none");
    return *s.potential_energy;
}

double volume(const engine::State& s)
{
    if (!s.box)
        throw std::runtime_error("volume/density are undefined without a periodic box");
    const auto& b = *s.box;
    return b[0] * b[1] * b[2];
}

void add_aliases(ObservableRegistry& r, std::initializer_list<const char*> keys,
                 const Observable& obs)
{
    for (const char* k : keys)
        r.add(k, obs);
}

} // namespace

ObservableRegistry ObservableRegistry::with_builtins()
{
    ObservableRegistry r;

    add_aliases(r, {"KE", "kinetic", "kinetic_energy", "kinetic energy", "kineticEnergy"},
                {"Kinetic Energy [kJ/mol]",
                 [](const engine::State& s, const engine::SystemInfo&) { return ke(s); }, true});

    add_aliases(r, {"V", "potential", "potential_energy", "potential energy", "potentialEnergy"},
                {"Potential Energy [kJ/mol]",
                 [](const engine::State& s, const engine::SystemInfo&) { return pe(s); }, true});

    add_aliases(r, {"total", "total_energy", "totalEnergy", "total energy"},
                {"Total Energy [kJ/mol]",
                 [](const engine::State& s, const engine::SystemInfo&) { return ke(s) + pe(s); },
                 true});

    add_aliases(r, {"T", "temp", "temperature"},
                {"Temperature [K]",
                 [](const engine::State& s, const engine::SystemInfo& sys)
                 {
                     const int dof = sys.degrees_of_freedom();
                     if (dof <= 0)
                         throw std::runtime_error("temperature needs a positive number of "
                                                  "degrees of freedom");
                     return 2.0 * ke(s) / (dof * kGasConstant);
                 },
                 true});

    add_aliases(r, {"vol", "volume"},
                {"Volume [nm^3]",
                 [](const engine::State& s, const engine::SystemInfo&) { return volume(s); }});

    add_aliases(r, {"rho", "density"},
                {"Density [g/mL]",
                 [](const engine::State& s, const engine::SystemInfo& sys)
                 { return sys.total_mass() / volume(s) * kDaltonPerNm3ToGPerMl; }});

    return r;
}

void ObservableRegistry::add(std::string key, Observable obs)
{
    if (key.empty())
        throw ConfigurationError("observable key must not be empty");
    if (!obs.fn)
        throw ConfigurationError("observable '" + key + "' has no function");
    if (obs.label.empty())
        obs.label = key;
    table_[std::move(key)] = std::move(obs);
}

const Observable& ObservableRegistry::resolve(const std::string& key) const
{
    auto it = table_.find(key);
    if (it == table_.end())
    {
        std::string valid;
        for (const auto& [k, _] : table_)
            valid += (valid.empty() ? "\"" : ", \"") + k + "\"";
        throw ConfigurationError("\"" + key + "\" is not a valid observable. You may choose from " +
                                 valid);
    }
    return it->second;
}

std::vector<std::string> ObservableRegistry::keys() const
{
    std::vector<std::string> out;
    out.reserve(table_.size());
    for (const auto& kv : table_)
        out.push_back(kv.first);
    return out;
}

ObservableSet::ObservableSet(const ObservableRegistry& reg, const std::vector<std::string>& keys)
    : keys_(keys)
{
    items_.reserve(keys.size());
    for (const auto& k : keys)
        items_.push_back(reg.resolve(k));
}

std::vector<std::string> ObservableSet::labels() const
{
    std::vector<std::string> out;
    for (const auto& o : items_)
        out.push_back(o.label);
    return out;
}

bool ObservableSet::needs_energy() const noexcept
{
    for (const auto& o : items_)
        if (o.needs_energy)
            return true;
    return false;
}

bool ObservableSet::needs_positions() const noexcept
{
    for (const auto& o : items_)
        if (o.needs_positions)
            return true;
    return false;
}

bool ObservableSet::needs_velocities() const noexcept
{
    for (const auto& o : items_)
        if (o.needs_velocities)
            return true;
    return false;
}

std::vector<double> ObservableSet::evaluate(const engine::State& s,
                                            const engine::SystemInfo& sys) const
{
    std::vector<double> out;
    out.reserve(items_.size());
    for (const auto& o : items_)
        out.push_back(o.fn(s, sys));
    return out;
}

} // namespace asim::sim::report
