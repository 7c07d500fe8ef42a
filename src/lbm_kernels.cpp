#include "lbm_kernels.hpp"
#include "timing.hpp"
#include "profiling.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace lbflow {
namespace kernels {

namespace {

bool cell_is_finite(const double* fc) {
    for (int q = 0; q < d2q9::Q; ++q) {
        if (!std::isfinite(fc[q])) return false;
    }
    return true;
}

void require_same_grid(const Grid& a, const Grid& b, const char* what) {
    if (a != b) {
        throw std::invalid_argument(std::string(what) + ": grid mismatch");
    }
}

} // namespace

// ============================================================================
// Macroscopic extraction
// ============================================================================

StabilityReport compute_macroscopic(const DistributionField& f,
                                    const ObstacleMask& solid,
                                    ScalarField& rho,
                                    VectorField& u) {
    TIMED_SCOPE("lbm_macroscopic");
    NVTX_SCOPE_MACRO("lbm:macroscopic");

    const Grid& g = f.grid();
    require_same_grid(g, solid.grid(), "compute_macroscopic");
    require_same_grid(g, rho.grid(), "compute_macroscopic");
    require_same_grid(g, u.grid(), "compute_macroscopic");

    const int Nx = g.Nx;
    const int Ny = g.Ny;
    const double* fp = f.data().data();
    const std::uint8_t* sp = solid.flags().data();
    double* rp = rho.data().data();
    double* up = u.u_data().data();
    double* vp = u.v_data().data();

    int first_bad = INT_MAX;

    #pragma omp parallel for reduction(min:first_bad) schedule(static)
    for (int j = 0; j < Ny; ++j) {
        for (int i = 0; i < Nx; ++i) {
            const int idx = j * Nx + i;
            const double* fc = fp + static_cast<std::size_t>(idx) * d2q9::Q;

            double r, jx, jy;
            cell_moments(fc, r, jx, jy);
            rp[idx] = r;

            if (sp[idx]) {
                up[idx] = 0.0;
                vp[idx] = 0.0;
                continue;
            }

            if (!(r > 0.0) || !std::isfinite(r) || !cell_is_finite(fc)) {
                first_bad = std::min(first_bad, idx);
                up[idx] = 0.0;
                vp[idx] = 0.0;
                continue;
            }

            up[idx] = jx / r;
            vp[idx] = jy / r;
        }
    }

    StabilityReport report;
    if (first_bad == INT_MAX) {
        return report;
    }

    // Classify the first offending node serially
    int bi, bj;
    g.inv_index(first_bad, bi, bj);
    const double* fc = f.cell(first_bad);
    const double r = rp[first_bad];
    report.i = bi;
    report.j = bj;
    report.value = r;
    report.count = 1;

    std::ostringstream msg;
    if (!std::isfinite(r) || !cell_is_finite(fc)) {
        report.kind = StabilityKind::NonFinite;
        msg << "non-finite population at (" << bi << ", " << bj << "), rho = " << r;
    } else {
        report.kind = StabilityKind::NonPositiveDensity;
        msg << "density " << r << " <= 0 at (" << bi << ", " << bj << ")";
    }
    report.message = msg.str();
    return report;
}

StabilityReport check_velocity_bound(const VectorField& u,
                                     const ObstacleMask& solid,
                                     double mach_limit) {
    const Grid& g = u.grid();
    require_same_grid(g, solid.grid(), "check_velocity_bound");

    const int n = g.cell_count();
    const double* up = u.u_data().data();
    const double* vp = u.v_data().data();
    const std::uint8_t* sp = solid.flags().data();
    const double limit_sq = mach_limit * mach_limit * d2q9::cs2;

    int count = 0;
    int first_bad = INT_MAX;

    #pragma omp parallel for reduction(+:count) reduction(min:first_bad) schedule(static)
    for (int idx = 0; idx < n; ++idx) {
        if (sp[idx]) continue;
        const double speed_sq = up[idx] * up[idx] + vp[idx] * vp[idx];
        if (speed_sq > limit_sq || !std::isfinite(speed_sq)) {
            ++count;
            first_bad = std::min(first_bad, idx);
        }
    }

    StabilityReport report;
    if (count == 0) {
        return report;
    }

    int bi, bj;
    g.inv_index(first_bad, bi, bj);
    report.kind = StabilityKind::VelocityBound;
    report.i = bi;
    report.j = bj;
    report.count = count;
    report.value = std::sqrt(up[first_bad] * up[first_bad] + vp[first_bad] * vp[first_bad]) / d2q9::cs;

    std::ostringstream msg;
    msg << count << " node(s) above Mach " << mach_limit << ", first at ("
        << bi << ", " << bj << ") with Mach " << report.value;
    report.message = msg.str();
    return report;
}

// ============================================================================
// Equilibrium and collision
// ============================================================================

void compute_equilibrium(const ScalarField& rho, const VectorField& u,
                         DistributionField& feq) {
    const Grid& g = feq.grid();
    require_same_grid(g, rho.grid(), "compute_equilibrium");
    require_same_grid(g, u.grid(), "compute_equilibrium");

    const int Nx = g.Nx;
    const int Ny = g.Ny;
    const double* rp = rho.data().data();
    const double* up = u.u_data().data();
    const double* vp = u.v_data().data();
    double* fe = feq.data().data();

    #pragma omp parallel for schedule(static)
    for (int j = 0; j < Ny; ++j) {
        for (int i = 0; i < Nx; ++i) {
            const int idx = j * Nx + i;
            cell_equilibrium(rp[idx], up[idx], vp[idx],
                             fe + static_cast<std::size_t>(idx) * d2q9::Q);
        }
    }
}

void collide(DistributionField& f, const DistributionField& feq,
             double tau, const ObstacleMask& solid) {
    TIMED_SCOPE("lbm_collision");
    NVTX_SCOPE_COLLIDE("lbm:collision");

    const Grid& g = f.grid();
    require_same_grid(g, feq.grid(), "collide");
    require_same_grid(g, solid.grid(), "collide");

    const int Nx = g.Nx;
    const int Ny = g.Ny;
    double* fp = f.data().data();
    const double* fe = feq.data().data();
    const std::uint8_t* sp = solid.flags().data();

    #pragma omp parallel for schedule(static)
    for (int j = 0; j < Ny; ++j) {
        for (int i = 0; i < Nx; ++i) {
            const int idx = j * Nx + i;
            if (sp[idx]) continue;
            const std::size_t off = static_cast<std::size_t>(idx) * d2q9::Q;
            bgk_relax(fp + off, fe + off, tau);
        }
    }
}

// ============================================================================
// Streaming
// ============================================================================

namespace {

/// dst(i, j, q) = src(i + sign*cx[q], j + sign*cy[q], q) with wrap-around
void shift(const DistributionField& src, DistributionField& dst, int sign) {
    const Grid& g = src.grid();
    require_same_grid(g, dst.grid(), "stream");
    if (&src == &dst) {
        throw std::invalid_argument("stream: source and destination must be distinct buffers");
    }

    const int Nx = g.Nx;
    const int Ny = g.Ny;
    const double* sp = src.data().data();
    double* dp = dst.data().data();

    #pragma omp parallel for schedule(static)
    for (int j = 0; j < Ny; ++j) {
        for (int i = 0; i < Nx; ++i) {
            double* out = dp + static_cast<std::size_t>(j * Nx + i) * d2q9::Q;
            for (int q = 0; q < d2q9::Q; ++q) {
                const int is = (i + sign * d2q9::cx[q] + Nx) % Nx;
                const int js = (j + sign * d2q9::cy[q] + Ny) % Ny;
                out[q] = sp[static_cast<std::size_t>(js * Nx + is) * d2q9::Q + q];
            }
        }
    }
}

} // namespace

void stream(const DistributionField& src, DistributionField& dst) {
    TIMED_SCOPE("lbm_streaming");
    NVTX_SCOPE_STREAM("lbm:streaming");
    shift(src, dst, -1);
}

void stream_reverse(const DistributionField& src, DistributionField& dst) {
    shift(src, dst, +1);
}

} // namespace kernels
} // namespace lbflow
