#include "geometry.hpp"
#include "lattice.hpp"
#include <deque>
#include <sstream>
#include <vector>

namespace lbflow {

ObstaclePredicate cylinder_predicate(double cx, double cy, double r) {
    const double r2 = r * r;
    return [cx, cy, r2](double x, double y) {
        const double dx = x - cx;
        const double dy = y - cy;
        return dx * dx + dy * dy < r2;
    };
}

ObstaclePredicate ellipse_predicate(double cx, double cy, double a, double b) {
    const double a2 = a * a;
    const double b2 = b * b;
    return [cx, cy, a2, b2](double x, double y) {
        const double dx = x - cx;
        const double dy = y - cy;
        return dx * dx / a2 + dy * dy / b2 < 1.0;
    };
}

ObstacleMask make_obstacle_mask(const Grid& grid, const ObstaclePredicate& inside) {
    ObstacleMask mask(grid);
    if (!inside) {
        return mask;
    }
    for (int j = 0; j < grid.Ny; ++j) {
        for (int i = 0; i < grid.Nx; ++i) {
            if (inside(grid.x(i), grid.y(j))) {
                mask.set(i, j, true);
            }
        }
    }
    return mask;
}

ObstacleMask make_obstacle_mask(const Grid& grid, const Config& config) {
    switch (config.obstacle) {
        case ObstacleShape::Cylinder:
            return make_obstacle_mask(grid, cylinder_predicate(config.obstacle_cx, config.obstacle_cy,
                                                               config.obstacle_r));
        case ObstacleShape::Ellipse:
            return make_obstacle_mask(grid, ellipse_predicate(config.obstacle_cx, config.obstacle_cy,
                                                              config.ellipse_a, config.ellipse_b));
        case ObstacleShape::None:
            break;
    }
    return ObstacleMask(grid);
}

int count_solid(const ObstacleMask& mask) {
    return mask.count();
}

bool check_flow_path(const ObstacleMask& solid, bool periodic_x, bool periodic_y) {
    const Grid& g = solid.grid();
    std::vector<std::uint8_t> visited(g.cell_count(), 0);
    std::deque<int> queue;

    for (int j = 0; j < g.Ny; ++j) {
        const int idx = g.index(0, j);
        if (!solid.is_solid(idx)) {
            visited[idx] = 1;
            queue.push_back(idx);
        }
    }

    while (!queue.empty()) {
        const int idx = queue.front();
        queue.pop_front();

        int i, j;
        g.inv_index(idx, i, j);
        if (i == g.Nx - 1) {
            return true;
        }

        for (int q = 1; q < d2q9::Q; ++q) {
            int ni = i + d2q9::cx[q];
            int nj = j + d2q9::cy[q];
            if (periodic_x) ni = g.wrap_x(ni);
            if (periodic_y) nj = g.wrap_y(nj);
            if (!g.contains(ni, nj)) continue;

            const int nidx = g.index(ni, nj);
            if (visited[nidx] || solid.is_solid(nidx)) continue;
            visited[nidx] = 1;
            queue.push_back(nidx);
        }
    }
    return false;
}

void validate_geometry(const ObstacleMask& solid, const Config& config) {
    const int n_solid = count_solid(solid);
    const int n_total = solid.grid().cell_count();

    if (n_solid >= n_total) {
        throw ConfigError("Obstacle mask leaves no fluid nodes (entire domain is solid)");
    }

    if (config.x_lo == BoundaryType::Inflow) {
        const bool periodic_y = config.y_lo == BoundaryType::Periodic;
        if (!check_flow_path(solid, false, periodic_y)) {
            std::ostringstream oss;
            oss << "Obstacle blocks the channel: no fluid path from inflow (x = 0) to outflow (x = "
                << solid.grid().Nx - 1 << "), " << n_solid << " of " << n_total << " nodes solid";
            throw ConfigError(oss.str());
        }
    }
}

} // namespace lbflow
