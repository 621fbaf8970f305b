#include "sim/PluginHost.hpp"
#include "sim/Errors.hpp"
#include "sim/Log.hpp"
#include "sim/report/Hdf5Reporter.hpp"
#include "sim/report/ProgressReporter.hpp"
#include "sim/report/StateDataReporter.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

/// \cond DOXYGEN_EXCLUDE

#include <dlfcn.h>

static void* load_so(const std::string& p)
{
    return ::dlopen(p.c_str(), RTLD_NOW);
}
static void close_so(void* h)
{
    if (h)
        ::dlclose(h);
}
static void* load_sym(void* h, const char* s)
{
    return ::dlsym(h, s);
}

/// \endcond

using namespace asim::sim;

bool asim::sim::parse_bool(const std::string& key, const std::string& v)
{
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    throw ConfigurationError("param '" + key + "': expected a boolean, got '" + v + "'");
}

// ----- builtin reporters -----------------------------------------------------
namespace
{

using namespace asim::sim::plugin;

std::int64_t parse_int(const std::string& key, const std::string& v)
{
    try
    {
        std::size_t pos = 0;
        const long long x = std::stoll(v, &pos);
        if (pos != v.size())
            throw std::invalid_argument(v);
        return x;
    }
    catch (const std::exception&)
    {
        throw ConfigurationError("param '" + key + "': expected an integer, got '" + v + "'");
    }
}

void register_builtin_reporters(Registry& r)
{
    r.add_reporter("state_data",
                   [](const ReporterConfig& c, const report::ObservableRegistry& o)
                       -> std::shared_ptr<IReporter>
                   {
                       char sep = ',';
                       if (auto it = c.params.find("separator"); it != c.params.end())
                       {
                           if (it->second.size() != 1)
                               throw ConfigurationError("state_data: separator must be one "
                                                        "character");
                           sep = it->second[0];
                       }
                       report::ObservableSet obs(o, c.observables);
                       if (c.path.empty() || c.path == "-")
                           return std::make_shared<report::StateDataReporter>(
                               std::cout, c.every, std::move(obs), sep);
                       return std::make_shared<report::StateDataReporter>(c.path, c.every,
                                                                          std::move(obs), sep);
                   });

    r.add_reporter("hdf5",
                   [](const ReporterConfig& c, const report::ObservableRegistry& o)
                   {
                       if (c.path.empty() || c.path == "-")
                           throw ConfigurationError("hdf5: a file path is required");
                       report::Hdf5Reporter::Options opt;
                       opt.every = c.every;
                       if (auto it = c.params.find("positions"); it != c.params.end())
                           opt.positions = parse_bool(it->first, it->second);
                       if (auto it = c.params.find("velocities"); it != c.params.end())
                           opt.velocities = parse_bool(it->first, it->second);
                       return std::make_shared<report::Hdf5Reporter>(
                           c.path, opt, report::ObservableSet(o, c.observables));
                   });

    r.add_reporter("progress",
                   [](const ReporterConfig& c, const report::ObservableRegistry&)
                   {
                       auto it = c.params.find("total");
                       if (it == c.params.end())
                           throw ConfigurationError("progress: param 'total' is required");
                       std::int64_t start = 0;
                       if (auto s = c.params.find("start"); s != c.params.end())
                           start = parse_int(s->first, s->second);
                       return std::make_shared<report::ProgressReporter>(
                           c.every, parse_int(it->first, it->second), start);
                   });
}

} // namespace
// -----------------------------------------------------------------------------

PluginHost::PluginHost()
{
    register_builtin_reporters(reg_);
}

PluginHost::~PluginHost()
{
    // factories may live in the libraries; drop them before unloading
    reg_ = plugin::Registry();
    for (void* h : handles_)
        close_so(h);
}

PluginHost::PluginHost(PluginHost&& o) noexcept
    : reg_(std::move(o.reg_)), handles_(std::move(o.handles_))
{
    o.handles_.clear();
}

PluginHost& PluginHost::operator=(PluginHost&& o) noexcept
{
    if (this != &o)
    {
        auto old = std::move(handles_);
        reg_ = std::move(o.reg_);
        handles_ = std::move(o.handles_);
        o.handles_.clear();
        for (void* h : old)
            close_so(h);
    }
    return *this;
}

void PluginHost::load_library(const std::filesystem::path& lib)
{
    auto* h = load_so(lib.string());
    if (!h)
        throw std::runtime_error("Failed to load plugin library: " + lib.string());
    handles_.push_back(h);

    auto* sym = load_sym(h, plugin::kRegisterSymbol);
    if (!sym)
        throw std::runtime_error("Missing symbol in plugin: " +
                                 std::string(plugin::kRegisterSymbol));
    auto reg_fn = reinterpret_cast<plugin::RegisterFn>(sym);
    if (!reg_fn(&reg_))
        throw std::runtime_error("Plugin registration returned failure");
    LOGI("[plugin] loaded %s\n", lib.string().c_str());
}

std::shared_ptr<IReporter> PluginHost::make_reporter(const plugin::ReporterConfig& cfg) const
{
    return reg_.make_reporter(cfg);
}
