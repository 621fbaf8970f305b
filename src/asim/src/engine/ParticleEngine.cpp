#include "engine/ParticleEngine.hpp"
#include "sim/Log.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace asim::engine
{

static inline double dot(const Vec3& a, const Vec3& b)
{
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

static inline double lj(double eps, double sigma, double r2)
{
    const double s2 = sigma * sigma / r2;
    const double s6 = s2 * s2 * s2;
    return 4.0 * eps * (s6 * s6 - s6);
}

ParticleEngine::ParticleEngine(SystemInfo system, ForceField ff, std::vector<Vec3> positions,
                               std::vector<Vec3> velocities, double dt)
    : system_(std::move(system)), ff_(std::move(ff)), x_(std::move(positions)),
      v_(std::move(velocities)), dt_(dt)
{
    const std::size_t n = system_.size();
    if (x_.size() != n)
        throw std::invalid_argument("[engine] positions size " + std::to_string(x_.size()) +
                                    " != particle count " + std::to_string(n));
    if (v_.empty())
        v_.assign(n, Vec3{0.0, 0.0, 0.0});
    if (v_.size() != n)
        throw std::invalid_argument("[engine] velocities size does not match particle count");
    if (!(dt_ > 0.0))
        throw std::invalid_argument("[engine] dt must be positive");
    for (const auto& b : ff_.bonds)
        if (b.i >= n || b.j >= n || b.i == b.j)
            throw std::invalid_argument("[engine] bond references invalid particle index");
    if (system_.box)
    {
        const auto& L = *system_.box;
        const double half = 0.5 * std::min({L[0], L[1], L[2]});
        if (ff_.cutoff > half)
            throw std::invalid_argument("[engine] LJ cutoff exceeds half the periodic box");
    }

    if (ff_.cutoff > 0.0)
        shift_ = lj(ff_.epsilon, ff_.sigma, ff_.cutoff * ff_.cutoff);

    f_.assign(n, Vec3{0.0, 0.0, 0.0});
    forces_(x_, f_);
}

Vec3 ParticleEngine::delta_(const Vec3& a, const Vec3& b) const
{
    Vec3 d{b[0] - a[0], b[1] - a[1], b[2] - a[2]};
    if (system_.box)
    {
        const auto& L = *system_.box;
        for (int k = 0; k < 3; ++k)
            d[k] -= L[k] * std::round(d[k] / L[k]);
    }
    return d;
}

double ParticleEngine::potential_(const std::vector<Vec3>& x) const
{
    double e = 0.0;
    const std::size_t n = x.size();
    if (ff_.cutoff > 0.0)
    {
        const double rc2 = ff_.cutoff * ff_.cutoff;
        for (std::size_t i = 0; i < n; ++i)
            for (std::size_t j = i + 1; j < n; ++j)
            {
                const Vec3 d = delta_(x[i], x[j]);
                const double r2 = dot(d, d);
                if (r2 < rc2)
                    e += lj(ff_.epsilon, ff_.sigma, r2) - shift_;
            }
    }
    for (const auto& b : ff_.bonds)
    {
        const Vec3 d = delta_(x[b.i], x[b.j]);
        const double dr = std::sqrt(dot(d, d)) - b.r0;
        e += 0.5 * b.k * dr * dr;
    }
    return e;
}

void ParticleEngine::forces_(const std::vector<Vec3>& x, std::vector<Vec3>& f) const
{
    const std::size_t n = x.size();
    std::fill(f.begin(), f.end(), Vec3{0.0, 0.0, 0.0});

    if (ff_.cutoff > 0.0)
    {
        const double rc2 = ff_.cutoff * ff_.cutoff;
        const double s2 = ff_.sigma * ff_.sigma;
        for (std::size_t i = 0; i < n; ++i)
            for (std::size_t j = i + 1; j < n; ++j)
            {
                const Vec3 d = delta_(x[i], x[j]); // i -> j
                const double r2 = dot(d, d);
                if (r2 >= rc2)
                    continue;
                const double sr2 = s2 / r2;
                const double sr6 = sr2 * sr2 * sr2;
                // -dV/dr / r
                const double fr = 24.0 * ff_.epsilon * (2.0 * sr6 * sr6 - sr6) / r2;
                for (int k = 0; k < 3; ++k)
                {
                    f[i][k] -= fr * d[k];
                    f[j][k] += fr * d[k];
                }
            }
    }

    for (const auto& b : ff_.bonds)
    {
        const Vec3 d = delta_(x[b.i], x[b.j]);
        const double r = std::sqrt(dot(d, d));
        if (r == 0.0)
            continue;
        const double fr = -b.k * (r - b.r0) / r;
        for (int k = 0; k < 3; ++k)
        {
            f[b.i][k] -= fr * d[k];
            f[b.j][k] += fr * d[k];
        }
    }
}

double ParticleEngine::kinetic_energy() const
{
    double ke = 0.0;
    for (std::size_t i = 0; i < v_.size(); ++i)
        ke += 0.5 * system_.masses[i] * dot(v_[i], v_[i]);
    return ke;
}

void ParticleEngine::advance(std::int64_t steps)
{
    const std::size_t n = x_.size();
    for (std::int64_t s = 0; s < steps; ++s)
    {
        for (std::size_t i = 0; i < n; ++i)
        {
            const double m = system_.masses[i];
            if (m <= 0.0)
                continue; // massless particles are fixed
            const double h = 0.5 * dt_ / m;
            for (int k = 0; k < 3; ++k)
            {
                v_[i][k] += h * f_[i][k];
                x_[i][k] += dt_ * v_[i][k];
            }
        }
        forces_(x_, f_);
        for (std::size_t i = 0; i < n; ++i)
        {
            const double m = system_.masses[i];
            if (m <= 0.0)
                continue;
            const double h = 0.5 * dt_ / m;
            for (int k = 0; k < 3; ++k)
                v_[i][k] += h * f_[i][k];
        }
        ++step_;
    }
}

void ParticleEngine::minimize(double tolerance, int max_iterations)
{
    const std::size_t n = x_.size();
    double e = potential_(x_);
    const double e0 = e;
    std::vector<Vec3> trial(n);
    double max_disp = 0.01; // nm
    int it = 0;

    for (; max_iterations == 0 || it < max_iterations; ++it)
    {
        double fmax = 0.0;
        for (const auto& fi : f_)
            fmax = std::max(fmax, std::sqrt(dot(fi, fi)));
        if (fmax < 1e-10)
            break;

        const double scale = max_disp / fmax;
        for (std::size_t i = 0; i < n; ++i)
            for (int k = 0; k < 3; ++k)
                trial[i][k] = x_[i][k] + (system_.masses[i] > 0.0 ? scale * f_[i][k] : 0.0);

        const double e_trial = potential_(trial);
        if (e_trial < e)
        {
            const double gain = e - e_trial;
            x_.swap(trial);
            e = e_trial;
            forces_(x_, f_);
            max_disp *= 1.2;
            if (gain < tolerance)
                break;
        }
        else
        {
            max_disp *= 0.5;
            if (max_disp < 1e-12)
                break;
        }
    }

    LOGD("[engine] minimize: %d iterations, E %.6g -> %.6g kJ/mol\n", it, e0, e);
}

State ParticleEngine::get_state(const StateRequest& req) const
{
    State s;
    s.step = step_;
    s.time = static_cast<double>(step_) * dt_;
    s.box = system_.box;

    if (req.positions)
    {
        auto x = x_;
        if (req.wrap_positions && system_.box)
        {
            const auto& L = *system_.box;
            for (auto& p : x)
                for (int k = 0; k < 3; ++k)
                    p[k] -= L[k] * std::floor(p[k] / L[k]);
        }
        s.positions = std::move(x);
    }
    if (req.velocities)
        s.velocities = v_;
    if (req.forces)
        s.forces = f_;
    if (req.energy)
    {
        s.kinetic_energy = kinetic_energy();
        s.potential_energy = potential_(x_);
    }
    return s;
}

} // namespace asim::engine
