#include "fields.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace lbflow {

// ============================================================================
// ScalarField
// ============================================================================

ScalarField::ScalarField(const Grid& grid, double init_val)
    : grid_(grid), data_(grid.cell_count(), init_val) {}

void ScalarField::fill(double val) {
    std::fill(data_.begin(), data_.end(), val);
}

double ScalarField::sum() const {
    return std::accumulate(data_.begin(), data_.end(), 0.0);
}

double ScalarField::min() const {
    return data_.empty() ? 0.0 : *std::min_element(data_.begin(), data_.end());
}

double ScalarField::max() const {
    return data_.empty() ? 0.0 : *std::max_element(data_.begin(), data_.end());
}

// ============================================================================
// VectorField
// ============================================================================

VectorField::VectorField(const Grid& grid, double init_u, double init_v)
    : grid_(grid)
    , u_data_(grid.cell_count(), init_u)
    , v_data_(grid.cell_count(), init_v) {}

void VectorField::fill(double u_val, double v_val) {
    std::fill(u_data_.begin(), u_data_.end(), u_val);
    std::fill(v_data_.begin(), v_data_.end(), v_val);
}

double VectorField::magnitude(int i, int j) const {
    const double uu = u(i, j);
    const double vv = v(i, j);
    return std::sqrt(uu * uu + vv * vv);
}

double VectorField::max_magnitude() const {
    double max_sq = 0.0;
    for (std::size_t idx = 0; idx < u_data_.size(); ++idx) {
        max_sq = std::max(max_sq, u_data_[idx] * u_data_[idx] + v_data_[idx] * v_data_[idx]);
    }
    return std::sqrt(max_sq);
}

// ============================================================================
// DistributionField
// ============================================================================

DistributionField::DistributionField(const Grid& grid, double init_val)
    : grid_(grid)
    , data_(static_cast<std::size_t>(grid.cell_count()) * d2q9::Q, init_val) {}

void DistributionField::fill(double val) {
    std::fill(data_.begin(), data_.end(), val);
}

double DistributionField::total_mass() const {
    return std::accumulate(data_.begin(), data_.end(), 0.0);
}

void DistributionField::swap(DistributionField& other) noexcept {
    std::swap(grid_, other.grid_);
    data_.swap(other.data_);
}

// ============================================================================
// ObstacleMask
// ============================================================================

ObstacleMask::ObstacleMask(const Grid& grid, bool solid)
    : grid_(grid), flags_(grid.cell_count(), solid ? 1 : 0) {}

int ObstacleMask::count() const {
    return static_cast<int>(std::count(flags_.begin(), flags_.end(), std::uint8_t{1}));
}

void ObstacleMask::merge(const ObstacleMask& other) {
    if (other.grid_ != grid_) {
        throw std::invalid_argument("ObstacleMask::merge: grid mismatch");
    }
    for (std::size_t idx = 0; idx < flags_.size(); ++idx) {
        flags_[idx] = (flags_[idx] || other.flags_[idx]) ? 1 : 0;
    }
}

} // namespace lbflow
