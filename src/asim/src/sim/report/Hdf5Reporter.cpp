#include "sim/report/Hdf5Reporter.hpp"
#include "sim/Errors.hpp"
#include "sim/Log.hpp"
#include "sim/Simulation.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <hdf5.h>

namespace asim::sim::report
{
namespace fs = std::filesystem;

/// \cond DOXYGEN_EXCLUDE

struct Hdf5Reporter::Impl
{
    hid_t file = -1;
    hid_t obs_group = -1;
    hid_t step = -1;
    hid_t time = -1;
    hid_t pos = -1;
    hid_t vel = -1;
    std::vector<hid_t> obs;

    std::string path;
    bool created = false;
    hsize_t natoms = 0;
    hsize_t frames = 0;
};

static void check(herr_t rc, const char* what)
{
    if (rc < 0)
        throw std::runtime_error(std::string("[hdf5] ") + what + " failed");
}

// Dataset of shape (0, tail...) growing along axis 0.
static hid_t make_extendible(hid_t loc, const char* name, hid_t type, int rank,
                             const hsize_t* tail)
{
    hsize_t dims[3] = {0, 0, 0};
    hsize_t maxdims[3] = {H5S_UNLIMITED, 0, 0};
    hsize_t chunk[3] = {64, 0, 0};
    for (int r = 1; r < rank; ++r)
    {
        dims[r] = maxdims[r] = chunk[r] = tail[r - 1];
    }
    if (rank > 1)
        chunk[0] = 1; // one frame per chunk for per-particle arrays

    hid_t space = H5Screate_simple(rank, dims, maxdims);
    hid_t dcpl = H5Pcreate(H5P_DATASET_CREATE);
    H5Pset_chunk(dcpl, rank, chunk);
    hid_t d = H5Dcreate2(loc, name, type, space, H5P_DEFAULT, dcpl, H5P_DEFAULT);
    H5Pclose(dcpl);
    H5Sclose(space);
    if (d < 0)
        throw std::runtime_error(std::string("[hdf5] cannot create dataset ") + name);
    return d;
}

// Write one frame at index `frame`, growing the dataset first.
static void append(hid_t d, hid_t memtype, hsize_t frame, int rank, const hsize_t* tail,
                   const void* data)
{
    hsize_t dims[3] = {frame + 1, 0, 0};
    hsize_t start[3] = {frame, 0, 0};
    hsize_t count[3] = {1, 0, 0};
    for (int r = 1; r < rank; ++r)
        dims[r] = count[r] = tail[r - 1];

    check(H5Dset_extent(d, dims), "H5Dset_extent");
    hid_t fspace = H5Dget_space(d);
    H5Sselect_hyperslab(fspace, H5S_SELECT_SET, start, nullptr, count, nullptr);
    hid_t mspace = H5Screate_simple(rank, count, nullptr);
    const herr_t rc = H5Dwrite(d, memtype, mspace, fspace, H5P_DEFAULT, data);
    H5Sclose(mspace);
    H5Sclose(fspace);
    check(rc, "H5Dwrite");
}

static void write_label(hid_t d, const std::string& label)
{
    hid_t t = H5Tcopy(H5T_C_S1);
    H5Tset_size(t, std::max<std::size_t>(1, label.size()));
    H5Tset_strpad(t, H5T_STR_NULLPAD);
    hid_t space = H5Screate(H5S_SCALAR);
    hid_t a = H5Acreate2(d, "label", t, space, H5P_DEFAULT, H5P_DEFAULT);
    herr_t rc = a < 0 ? -1 : H5Awrite(a, t, label.c_str());
    if (a >= 0)
        H5Aclose(a);
    H5Sclose(space);
    H5Tclose(t);
    check(rc, "label attribute");
}

/// \endcond

Hdf5Reporter::Hdf5Reporter(const std::string& path, Options opt, ObservableSet obs)
    : opt_(opt), obs_(std::move(obs)), impl_(new Impl)
{
    if (opt_.every < 1)
        throw ConfigurationError("hdf5: report interval must be >= 1");

    const fs::path p(path);
    if (p.has_parent_path())
        fs::create_directories(p.parent_path());
    impl_->path = path;
    impl_->file = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (impl_->file < 0)
        throw std::runtime_error("[hdf5] cannot create " + path);
    LOGI("[report] hdf5 -> %s (every %lld steps)\n", path.c_str(),
         static_cast<long long>(opt_.every));
}

Hdf5Reporter::~Hdf5Reporter()
{
    close();
}

std::int64_t Hdf5Reporter::frames() const noexcept
{
    return static_cast<std::int64_t>(impl_->frames);
}

NextReport Hdf5Reporter::describe_next_report(const Simulation& sim) const
{
    return NextReport::every(opt_.every, sim.current_step())
        .with_positions(opt_.positions || obs_.needs_positions())
        .with_velocities(opt_.velocities || obs_.needs_velocities())
        .with_energy(obs_.needs_energy());
}

void Hdf5Reporter::report(const Simulation& sim, const engine::State& state)
{
    auto& I = *impl_;
    if (I.file < 0)
        throw std::runtime_error("[hdf5] report after close: " + I.path);

    if (!I.created)
    {
        I.natoms = sim.system().size();
        const hsize_t tail3[2] = {I.natoms, 3};
        I.step = make_extendible(I.file, "step", H5T_STD_I64LE, 1, nullptr);
        I.time = make_extendible(I.file, "time", H5T_IEEE_F64LE, 1, nullptr);
        if (opt_.positions)
            I.pos = make_extendible(I.file, "positions", H5T_IEEE_F64LE, 3, tail3);
        if (opt_.velocities)
            I.vel = make_extendible(I.file, "velocities", H5T_IEEE_F64LE, 3, tail3);
        if (!obs_.empty())
        {
            I.obs_group =
                H5Gcreate2(I.file, "observables", H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
            if (I.obs_group < 0)
                throw std::runtime_error("[hdf5] cannot create /observables");
            const auto labels = obs_.labels();
            for (std::size_t k = 0; k < obs_.size(); ++k)
            {
                hid_t d = make_extendible(I.obs_group, obs_.keys()[k].c_str(), H5T_IEEE_F64LE,
                                          1, nullptr);
                I.obs.push_back(d);
                write_label(d, labels[k]);
            }
        }
        I.created = true;
    }

    const hsize_t tail3[2] = {I.natoms, 3};
    const std::int64_t step = sim.current_step();
    append(I.step, H5T_NATIVE_INT64, I.frames, 1, nullptr, &step);
    append(I.time, H5T_NATIVE_DOUBLE, I.frames, 1, nullptr, &state.time);

    if (I.pos >= 0)
    {
        if (!state.positions || state.positions->size() != I.natoms)
            throw std::runtime_error("[hdf5] snapshot is missing positions");
        append(I.pos, H5T_NATIVE_DOUBLE, I.frames, 3, tail3, state.positions->data()->data());
    }
    if (I.vel >= 0)
    {
        if (!state.velocities || state.velocities->size() != I.natoms)
            throw std::runtime_error("[hdf5] snapshot is missing velocities");
        append(I.vel, H5T_NATIVE_DOUBLE, I.frames, 3, tail3, state.velocities->data()->data());
    }
    if (!I.obs.empty())
    {
        const auto values = obs_.evaluate(state, sim.system());
        for (std::size_t k = 0; k < values.size(); ++k)
            append(I.obs[k], H5T_NATIVE_DOUBLE, I.frames, 1, nullptr, &values[k]);
    }

    ++I.frames;
    H5Fflush(I.file, H5F_SCOPE_LOCAL);
}

void Hdf5Reporter::close()
{
    auto& I = *impl_;
    for (hid_t d : I.obs)
        H5Dclose(d);
    I.obs.clear();
    for (hid_t* d : {&I.step, &I.time, &I.pos, &I.vel, &I.obs_group})
    {
        if (*d < 0)
            continue;
        if (d == &I.obs_group)
            H5Gclose(*d);
        else
            H5Dclose(*d);
        *d = -1;
    }
    if (I.file >= 0)
    {
        H5Fclose(I.file);
        I.file = -1;
    }
}

} // namespace asim::sim::report
