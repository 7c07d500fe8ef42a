#pragma once

/// @file geometry.hpp
/// @brief Obstacle predicates, mask construction and flow-path checks

#include "config.hpp"
#include "fields.hpp"
#include <functional>

namespace lbflow {

/// Implicit obstacle shape: true where (x, y) lies inside the solid
using ObstaclePredicate = std::function<bool(double x, double y)>;

/// (x-cx)^2 + (y-cy)^2 < r^2
ObstaclePredicate cylinder_predicate(double cx, double cy, double r);

/// (x-cx)^2/a^2 + (y-cy)^2/b^2 < 1
ObstaclePredicate ellipse_predicate(double cx, double cy, double a, double b);

/// Evaluate a predicate at every node (x = i, y = j)
ObstacleMask make_obstacle_mask(const Grid& grid, const ObstaclePredicate& inside);

/// Obstacle mask for the shape selected in a finalized configuration
ObstacleMask make_obstacle_mask(const Grid& grid, const Config& config);

/// Number of solid nodes
int count_solid(const ObstacleMask& mask);

/// True if fluid nodes connect column 0 to column Nx-1.
/// Breadth-first search over the eight D2Q9 neighbours; axes flagged
/// periodic wrap around.
bool check_flow_path(const ObstacleMask& solid, bool periodic_x, bool periodic_y);

/// Throw ConfigError if the solid set (obstacle plus walls) leaves no fluid,
/// or, with an inflow, no fluid path from inflow to outflow
void validate_geometry(const ObstacleMask& solid, const Config& config);

} // namespace lbflow
