#pragma once

#include "grid.hpp"
#include "lattice.hpp"
#include <vector>
#include <cstdint>

namespace lbflow {

/// Scalar field (one value per lattice node)
class ScalarField {
public:
    ScalarField() = default;
    explicit ScalarField(const Grid& grid, double init_val = 0.0);

    double& operator()(int i, int j) { return data_[grid_.index(i, j)]; }
    double operator()(int i, int j) const { return data_[grid_.index(i, j)]; }

    /// Access by flat index
    double& operator[](int idx) { return data_[idx]; }
    double operator[](int idx) const { return data_[idx]; }

    void fill(double val);

    double sum() const;
    double min() const;
    double max() const;

    std::vector<double>& data() { return data_; }
    const std::vector<double>& data() const { return data_; }

    const Grid& grid() const { return grid_; }

private:
    Grid grid_;
    std::vector<double> data_;
};

/// Node-collocated 2D vector field (u, v)
class VectorField {
public:
    VectorField() = default;
    explicit VectorField(const Grid& grid, double init_u = 0.0, double init_v = 0.0);

    double& u(int i, int j) { return u_data_[grid_.index(i, j)]; }
    double u(int i, int j) const { return u_data_[grid_.index(i, j)]; }

    double& v(int i, int j) { return v_data_[grid_.index(i, j)]; }
    double v(int i, int j) const { return v_data_[grid_.index(i, j)]; }

    std::vector<double>& u_data() { return u_data_; }
    std::vector<double>& v_data() { return v_data_; }
    const std::vector<double>& u_data() const { return u_data_; }
    const std::vector<double>& v_data() const { return v_data_; }

    void fill(double u_val, double v_val);

    /// Velocity magnitude at node (i, j)
    double magnitude(int i, int j) const;

    /// Max velocity magnitude over the grid
    double max_magnitude() const;

    const Grid& grid() const { return grid_; }

private:
    Grid grid_;
    std::vector<double> u_data_;
    std::vector<double> v_data_;
};

/// Particle distribution populations, d2q9::Q values per node
/// Layout is (row, column, direction): flat = (j * Nx + i) * Q + q
class DistributionField {
public:
    DistributionField() = default;
    explicit DistributionField(const Grid& grid, double init_val = 0.0);

    double& operator()(int i, int j, int q) { return data_[offset(i, j) + q]; }
    double operator()(int i, int j, int q) const { return data_[offset(i, j) + q]; }

    /// Pointer to the Q populations of node (i, j)
    double* cell(int i, int j) { return data_.data() + offset(i, j); }
    const double* cell(int i, int j) const { return data_.data() + offset(i, j); }

    /// Pointer to the Q populations of the node with flat index idx
    double* cell(int idx) { return data_.data() + static_cast<std::size_t>(idx) * d2q9::Q; }
    const double* cell(int idx) const { return data_.data() + static_cast<std::size_t>(idx) * d2q9::Q; }

    void fill(double val);

    /// Sum of all populations over the grid
    double total_mass() const;

    /// Exchange storage with another field of the same grid (O(1))
    void swap(DistributionField& other) noexcept;

    std::vector<double>& data() { return data_; }
    const std::vector<double>& data() const { return data_; }

    const Grid& grid() const { return grid_; }

private:
    std::size_t offset(int i, int j) const {
        return static_cast<std::size_t>(grid_.index(i, j)) * d2q9::Q;
    }

    Grid grid_;
    std::vector<double> data_;
};

/// Boolean solid/fluid flag per node
class ObstacleMask {
public:
    ObstacleMask() = default;
    explicit ObstacleMask(const Grid& grid, bool solid = false);

    bool is_solid(int i, int j) const { return flags_[grid_.index(i, j)] != 0; }
    bool is_solid(int idx) const { return flags_[idx] != 0; }

    void set(int i, int j, bool solid) { flags_[grid_.index(i, j)] = solid ? 1 : 0; }

    /// Number of solid nodes
    int count() const;

    /// Node-wise union with another mask of the same grid
    void merge(const ObstacleMask& other);

    const std::vector<std::uint8_t>& flags() const { return flags_; }

    const Grid& grid() const { return grid_; }

private:
    Grid grid_;
    std::vector<std::uint8_t> flags_;
};

} // namespace lbflow
