#pragma once

/// @file boundary.hpp
/// @brief Post-streaming boundary handling
///
/// Applied to the freshly streamed buffer in this order, on disjoint node sets:
///   1. Obstacle bounce-back (full-way: swap each population with its opposite)
///   2. Inflow on column 0 (equilibrium overwrite or Zou-He velocity condition)
///   3. Outflow on column Nx-1 (zero-gradient copy of west-pointing populations)
///   4. Wall bounce-back on the solid border layers of Wall sides
/// Inflow and outflow never touch solid nodes.

#include "config.hpp"
#include "fields.hpp"
#include <functional>

namespace lbflow {

/// Velocity profile along the inflow column, evaluated at y = j
using InflowProfile = std::function<double(double y)>;

/// Resolved boundary configuration of the four domain sides
struct BoundarySpec {
    BoundaryType x_lo = BoundaryType::Periodic;
    BoundaryType x_hi = BoundaryType::Periodic;
    BoundaryType y_lo = BoundaryType::Periodic;
    BoundaryType y_hi = BoundaryType::Periodic;

    InflowScheme scheme = InflowScheme::Equilibrium;
    double inflow_density = 1.0;    ///< Equilibrium scheme only
    InflowProfile u_inflow;         ///< Normal velocity u(y), v = 0

    bool has_inflow() const { return x_lo == BoundaryType::Inflow; }
    bool has_outflow() const { return x_hi == BoundaryType::Outflow; }
    bool periodic_x() const { return x_lo == BoundaryType::Periodic; }
    bool periodic_y() const { return y_lo == BoundaryType::Periodic; }
    bool has_walls() const {
        return x_lo == BoundaryType::Wall || x_hi == BoundaryType::Wall
            || y_lo == BoundaryType::Wall || y_hi == BoundaryType::Wall;
    }
};

/// u(y) = u_in * (1 + eps * sin(2 pi y / (Ny - 1)))
InflowProfile make_inflow_profile(double u_in, double eps, int Ny);

/// BoundarySpec from a finalized configuration
BoundarySpec make_boundary_spec(const Config& config);

/// Solid border layers of the Wall sides
ObstacleMask make_wall_mask(const Grid& grid, const BoundarySpec& bc);

/// Obstacle nodes united with the wall layers
ObstacleMask build_solid_mask(const ObstacleMask& obstacle, const BoundarySpec& bc);

/// Full-way bounce-back: f(q) <-> f(opposite(q)) at every node of cells
void apply_bounce_back(DistributionField& f, const ObstacleMask& cells);

/// Inflow condition on column 0 (skipped without an inflow side)
void apply_inflow(DistributionField& f, const ObstacleMask& solid, const BoundarySpec& bc);

/// Zero-gradient outflow on column Nx-1 (skipped without an outflow side)
void apply_outflow(DistributionField& f, const ObstacleMask& solid, const BoundarySpec& bc);

/// Whole boundary pass in the order documented above.
/// walls must not overlap obstacle; solid is their union.
void apply_boundaries(DistributionField& f,
                      const ObstacleMask& obstacle,
                      const ObstacleMask& walls,
                      const ObstacleMask& solid,
                      const BoundarySpec& bc);

} // namespace lbflow
