#include "boundary.hpp"
#include "lbm_kernels.hpp"
#include "timing.hpp"
#include "profiling.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace lbflow {

InflowProfile make_inflow_profile(double u_in, double eps, int Ny) {
    const double ly = static_cast<double>(Ny - 1);
    if (eps == 0.0 || ly <= 0.0) {
        return [u_in](double) { return u_in; };
    }
    const double two_pi = 2.0 * 3.14159265358979323846;
    return [u_in, eps, ly, two_pi](double y) {
        return u_in * (1.0 + eps * std::sin(two_pi * y / ly));
    };
}

BoundarySpec make_boundary_spec(const Config& config) {
    BoundarySpec bc;
    bc.x_lo = config.x_lo;
    bc.x_hi = config.x_hi;
    bc.y_lo = config.y_lo;
    bc.y_hi = config.y_hi;
    bc.scheme = config.inflow_scheme;
    bc.inflow_density = config.inflow_density;
    if (bc.has_inflow()) {
        bc.u_inflow = make_inflow_profile(config.u_inflow, config.inflow_perturbation, config.Ny);
    }
    return bc;
}

ObstacleMask make_wall_mask(const Grid& grid, const BoundarySpec& bc) {
    ObstacleMask walls(grid);
    if (bc.x_lo == BoundaryType::Wall) {
        for (int j = 0; j < grid.Ny; ++j) walls.set(0, j, true);
    }
    if (bc.x_hi == BoundaryType::Wall) {
        for (int j = 0; j < grid.Ny; ++j) walls.set(grid.Nx - 1, j, true);
    }
    if (bc.y_lo == BoundaryType::Wall) {
        for (int i = 0; i < grid.Nx; ++i) walls.set(i, 0, true);
    }
    if (bc.y_hi == BoundaryType::Wall) {
        for (int i = 0; i < grid.Nx; ++i) walls.set(i, grid.Ny - 1, true);
    }
    return walls;
}

ObstacleMask build_solid_mask(const ObstacleMask& obstacle, const BoundarySpec& bc) {
    ObstacleMask solid = obstacle;
    solid.merge(make_wall_mask(obstacle.grid(), bc));
    return solid;
}

void apply_bounce_back(DistributionField& f, const ObstacleMask& cells) {
    if (f.grid() != cells.grid()) {
        throw std::invalid_argument("apply_bounce_back: grid mismatch");
    }
    const int n = f.grid().cell_count();
    const std::uint8_t* sp = cells.flags().data();
    double* fp = f.data().data();

    #pragma omp parallel for schedule(static)
    for (int idx = 0; idx < n; ++idx) {
        if (!sp[idx]) continue;
        double* fc = fp + static_cast<std::size_t>(idx) * d2q9::Q;
        // Pairs (1,3), (2,4), (5,7), (6,8)
        std::swap(fc[1], fc[3]);
        std::swap(fc[2], fc[4]);
        std::swap(fc[5], fc[7]);
        std::swap(fc[6], fc[8]);
    }
}

void apply_inflow(DistributionField& f, const ObstacleMask& solid, const BoundarySpec& bc) {
    if (!bc.has_inflow()) return;
    if (!bc.u_inflow) {
        throw std::logic_error("apply_inflow: inflow side without a velocity profile");
    }

    const Grid& g = f.grid();
    const int i = 0;

    // Profiles are std::function and may not be thread-safe; keep this serial
    for (int j = 0; j < g.Ny; ++j) {
        if (solid.is_solid(i, j)) continue;

        const double y = g.y(j);
        const double ux = bc.u_inflow(y);
        double* fc = f.cell(i, j);

        if (bc.scheme == InflowScheme::Equilibrium) {
            kernels::cell_equilibrium(bc.inflow_density, ux, 0.0, fc);
            continue;
        }

        // Zou-He: density from the known populations, then the unknown
        // east-pointing ones by bouncing back the non-equilibrium part of
        // their west-pointing opposites
        const double rho = (fc[0] + fc[2] + fc[4] + 2.0 * (fc[3] + fc[6] + fc[7])) / (1.0 - ux);
        double feq[d2q9::Q];
        kernels::cell_equilibrium(rho, ux, 0.0, feq);
        for (int k = 0; k < 3; ++k) {
            const int q = d2q9::east_pointing[k];
            const int opp = d2q9::opposite[q];
            fc[q] = feq[q] + fc[opp] - feq[opp];
        }
    }
}

void apply_outflow(DistributionField& f, const ObstacleMask& solid, const BoundarySpec& bc) {
    if (!bc.has_outflow()) return;

    const Grid& g = f.grid();
    const int i_out = g.Nx - 1;
    const int i_in = g.Nx - 2;

    #pragma omp parallel for schedule(static)
    for (int j = 0; j < g.Ny; ++j) {
        if (solid.is_solid(i_out, j)) continue;
        double* dst = f.cell(i_out, j);
        const double* src = f.cell(i_in, j);
        for (int k = 0; k < 3; ++k) {
            const int q = d2q9::west_pointing[k];
            dst[q] = src[q];
        }
    }
}

void apply_boundaries(DistributionField& f,
                      const ObstacleMask& obstacle,
                      const ObstacleMask& walls,
                      const ObstacleMask& solid,
                      const BoundarySpec& bc) {
    TIMED_SCOPE("lbm_boundary");
    NVTX_SCOPE_BC("lbm:boundary");

    apply_bounce_back(f, obstacle);
    apply_inflow(f, solid, bc);
    apply_outflow(f, solid, bc);
    if (bc.has_walls()) {
        apply_bounce_back(f, walls);
    }
}

} // namespace lbflow
