#pragma once
#include "engine/Lattice.hpp"
#include "sim/Errors.hpp"
#include "sim/plugin/Registry.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML → AppConfig loader and schema for the asim app.
 *
 * @details
 * @rst
 * **Schema (v1)**
 *
 * .. code-block:: yaml
 *
 *    case: <string>                 # run name (log prefix)
 *
 *    system:
 *      particles: 64                # lattice points, rounded up to a cube
 *      spacing: 0.38                # nm
 *      mass: 39.948                 # dalton
 *      periodic: true
 *      box: [bx, by, bz]            # optional; default n_side * spacing
 *      temperature: 120             # K, initial velocities
 *      seed: 7
 *      remove_cm_motion: true
 *      lj: { epsilon: 0.996, sigma: 0.3405, cutoff: 0.7 }
 *
 *    integrator:
 *      dt: 0.002                    # ps
 *
 *    run:
 *      steps: 1000
 *      async: false                 # step on a worker thread, poll from main
 *      chunk: 10                    # max steps per engine call
 *      minimize: { enabled: true, tolerance: 1.0, max_iterations: 0 }
 *
 *    plugins:
 *      - lib: libmy_reporters.so    # DSOs to load (in order)
 *
 *    reporters:
 *      - type: state_data           # state_data | hdf5 | progress | <plugin key>
 *        every: 100
 *        observables: [KE, temperature]
 *        path: out/run.csv          # '-' = stdout
 *        params: { separator: "," } # free-form KV (string → string)
 *
 * **Semantics**
 *
 * - Missing keys keep their defaults.
 * - ``particles < 1``, ``spacing <= 0``, ``mass <= 0``, ``dt <= 0``, ``steps < 0``,
 *   ``chunk < 1``, ``every < 1``, a ``box`` that is not three positive numbers, or a reporter
 *   without ``type`` raise :cpp:class:`asim::sim::ConfigurationError`.
 * - Type mismatches (e.g. ``particles: many``) are reported the same way, naming the key.
 * @endrst
 */

namespace asim::sim
{

struct AppConfig
{
    std::string case_name = "case";
    engine::LatticeSpec system{};

    struct Run
    {
        std::int64_t steps = 1000;
        bool async = false;
        std::int64_t chunk = 10;

        struct Minimize
        {
            bool enabled = false;
            double tolerance = 1.0;
            int max_iterations = 0;
        } minimize;
    } run;

    std::vector<std::string> plugin_libs{};
    std::vector<plugin::ReporterConfig> reporters{};
};

namespace detail
{

template <class T> T yaml_as(const YAML::Node& n, const char* key)
{
    try
    {
        return n.as<T>();
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigurationError(std::string("config key '") + key + "': " + e.what());
    }
}

inline void require(bool ok, const std::string& msg)
{
    if (!ok)
        throw ConfigurationError(msg);
}

} // namespace detail

inline AppConfig load_config_from_yaml(const std::string& path)
{
    using detail::require;
    using detail::yaml_as;

    AppConfig cfg;
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigurationError("cannot read config '" + path + "': " + e.what());
    }

    if (auto n = root["case"])
        cfg.case_name = yaml_as<std::string>(n, "case");

    auto& S = cfg.system;
    if (auto s = root["system"])
    {
        if (auto n = s["particles"])
            S.particles = yaml_as<int>(n, "system.particles");
        if (auto n = s["spacing"])
            S.spacing = yaml_as<double>(n, "system.spacing");
        if (auto n = s["mass"])
            S.mass = yaml_as<double>(n, "system.mass");
        if (auto n = s["periodic"])
            S.periodic = yaml_as<bool>(n, "system.periodic");
        if (auto n = s["box"])
        {
            auto v = yaml_as<std::vector<double>>(n, "system.box");
            require(v.size() == 3 && v[0] > 0 && v[1] > 0 && v[2] > 0,
                    "system.box must be three positive lengths");
            S.box = engine::Vec3{v[0], v[1], v[2]};
        }
        if (auto n = s["temperature"])
            S.temperature = yaml_as<double>(n, "system.temperature");
        if (auto n = s["seed"])
            S.seed = yaml_as<std::uint32_t>(n, "system.seed");
        if (auto n = s["remove_cm_motion"])
            S.remove_cm_motion = yaml_as<bool>(n, "system.remove_cm_motion");
        if (auto lj = s["lj"])
        {
            if (auto n = lj["epsilon"])
                S.ff.epsilon = yaml_as<double>(n, "system.lj.epsilon");
            if (auto n = lj["sigma"])
                S.ff.sigma = yaml_as<double>(n, "system.lj.sigma");
            if (auto n = lj["cutoff"])
                S.ff.cutoff = yaml_as<double>(n, "system.lj.cutoff");
        }
    }
    require(S.particles >= 1, "system.particles must be >= 1");
    require(S.spacing > 0.0, "system.spacing must be > 0");
    require(S.mass > 0.0, "system.mass must be > 0");
    require(S.temperature >= 0.0, "system.temperature must be >= 0");
    require(S.ff.cutoff >= 0.0, "system.lj.cutoff must be >= 0");

    if (auto i = root["integrator"])
    {
        if (auto n = i["dt"])
            S.dt = yaml_as<double>(n, "integrator.dt");
    }
    require(S.dt > 0.0, "integrator.dt must be > 0");

    if (auto r = root["run"])
    {
        if (auto n = r["steps"])
            cfg.run.steps = yaml_as<std::int64_t>(n, "run.steps");
        if (auto n = r["async"])
            cfg.run.async = yaml_as<bool>(n, "run.async");
        if (auto n = r["chunk"])
            cfg.run.chunk = yaml_as<std::int64_t>(n, "run.chunk");
        if (auto m = r["minimize"])
        {
            if (auto n = m["enabled"])
                cfg.run.minimize.enabled = yaml_as<bool>(n, "run.minimize.enabled");
            if (auto n = m["tolerance"])
                cfg.run.minimize.tolerance = yaml_as<double>(n, "run.minimize.tolerance");
            if (auto n = m["max_iterations"])
                cfg.run.minimize.max_iterations = yaml_as<int>(n, "run.minimize.max_iterations");
        }
    }
    require(cfg.run.steps >= 0, "run.steps must be >= 0");
    require(cfg.run.chunk >= 1, "run.chunk must be >= 1");
    require(cfg.run.minimize.tolerance > 0.0, "run.minimize.tolerance must be > 0");
    require(cfg.run.minimize.max_iterations >= 0, "run.minimize.max_iterations must be >= 0");

    if (auto P = root["plugins"])
    {
        for (const auto& item : P)
        {
            if (auto n = item["lib"])
                cfg.plugin_libs.push_back(yaml_as<std::string>(n, "plugins.lib"));
        }
    }

    if (auto R = root["reporters"])
    {
        for (const auto& item : R)
        {
            plugin::ReporterConfig rc;
            auto t = item["type"];
            require(bool(t), "reporters: every entry needs a 'type'");
            rc.type = yaml_as<std::string>(t, "reporters.type");
            if (auto n = item["every"])
                rc.every = yaml_as<std::int64_t>(n, "reporters.every");
            require(rc.every >= 1, "reporters." + rc.type + ".every must be >= 1");
            if (auto n = item["observables"])
                rc.observables = yaml_as<std::vector<std::string>>(n, "reporters.observables");
            if (auto n = item["path"])
                rc.path = yaml_as<std::string>(n, "reporters.path");
            if (auto K = item["params"])
            {
                for (auto it = K.begin(); it != K.end(); ++it)
                    rc.params.emplace(yaml_as<std::string>(it->first, "reporters.params"),
                                      yaml_as<std::string>(it->second, "reporters.params"));
            }
            cfg.reporters.push_back(std::move(rc));
        }
    }

    return cfg;
}

} // namespace asim::sim
