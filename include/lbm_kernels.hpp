#pragma once

/// @file lbm_kernels.hpp
/// @brief Per-node and grid-wide kernels of the D2Q9 BGK update
///
/// Grid-wide kernels are OpenMP data-parallel loops over rows; each call ends
/// with the implicit barrier of its parallel region, so consecutive calls are
/// separated by a full stage barrier.

#include "fields.hpp"
#include "lattice.hpp"
#include "stability.hpp"

namespace lbflow {
namespace kernels {

// ============================================================================
// Per-node kernels
// ============================================================================

/// Zeroth and first moments of one node's populations.
/// Velocity is left unnormalised (momentum); divide by rho for u.
inline void cell_moments(const double* f, double& rho, double& jx, double& jy) {
    rho = 0.0;
    jx = 0.0;
    jy = 0.0;
    for (int q = 0; q < d2q9::Q; ++q) {
        rho += f[q];
        jx += f[q] * d2q9::cx[q];
        jy += f[q] * d2q9::cy[q];
    }
}

/// Second-order equilibrium population for direction q
///   feq_q = w_q rho (1 + c.u/cs2 + (c.u)^2/(2 cs2^2) - u.u/(2 cs2))
inline double equilibrium(int q, double rho, double ux, double uy) {
    const double cu = d2q9::cx[q] * ux + d2q9::cy[q] * uy;
    const double uu = ux * ux + uy * uy;
    return d2q9::w[q] * rho
         * (1.0 + cu / d2q9::cs2
            + 0.5 * cu * cu / (d2q9::cs2 * d2q9::cs2)
            - 0.5 * uu / d2q9::cs2);
}

/// All Q equilibrium populations of one node
inline void cell_equilibrium(double rho, double ux, double uy, double* feq) {
    for (int q = 0; q < d2q9::Q; ++q) {
        feq[q] = equilibrium(q, rho, ux, uy);
    }
}

/// BGK relaxation of one node: f <- f - (f - feq) / tau
inline void bgk_relax(double* f, const double* feq, double tau) {
    const double inv_tau = 1.0 / tau;
    for (int q = 0; q < d2q9::Q; ++q) {
        f[q] -= (f[q] - feq[q]) * inv_tau;
    }
}

// ============================================================================
// Grid-wide kernels
// ============================================================================

/// Density and velocity of every node.
/// Solid nodes get their density and zero velocity and are not checked.
/// Returns NonFinite / NonPositiveDensity for the first offending fluid node
/// in row-major order, Stable otherwise. Fields are written either way.
StabilityReport compute_macroscopic(const DistributionField& f,
                                    const ObstacleMask& solid,
                                    ScalarField& rho,
                                    VectorField& u);

/// Count fluid nodes with |u| / c_s > mach_limit.
/// Returns VelocityBound with count, first offending node and its Mach number
/// when count > 0, Stable otherwise.
StabilityReport check_velocity_bound(const VectorField& u,
                                     const ObstacleMask& solid,
                                     double mach_limit);

/// Equilibrium distribution of every node from (rho, u)
void compute_equilibrium(const ScalarField& rho, const VectorField& u,
                         DistributionField& feq);

/// BGK collision in place; solid nodes are left untouched
void collide(DistributionField& f, const DistributionField& feq,
             double tau, const ObstacleMask& solid);

/// Pull streaming with periodic addressing:
///   dst(i, j, q) = src(i - cx[q], j - cy[q], q)
/// src and dst must be distinct fields on the same grid.
void stream(const DistributionField& src, DistributionField& dst);

/// Inverse of stream():
///   dst(i, j, q) = src(i + cx[q], j + cy[q], q)
void stream_reverse(const DistributionField& src, DistributionField& dst);

} // namespace kernels
} // namespace lbflow
