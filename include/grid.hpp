#pragma once

namespace lbflow {

/// Uniform 2D lattice of Nx x Ny nodes (no ghost layers)
/// Node (i, j) sits at lattice coordinates x = i, y = j.
/// Storage is row-major: flat index = j * Nx + i.
struct Grid {
    int Nx = 0;     ///< Number of nodes in x (width)
    int Ny = 0;     ///< Number of nodes in y (height)

    Grid() = default;
    Grid(int nx, int ny) { init(nx, ny); }

    /// Set dimensions (throws std::invalid_argument on non-positive sizes)
    void init(int nx, int ny);

    int cell_count() const { return Nx * Ny; }

    /// Convert (i, j) to flat index
    int index(int i, int j) const { return j * Nx + i; }

    /// Convert flat index back to (i, j)
    void inv_index(int idx, int& i, int& j) const {
        j = idx / Nx;
        i = idx % Nx;
    }

    bool contains(int i, int j) const {
        return i >= 0 && i < Nx && j >= 0 && j < Ny;
    }

    /// True for nodes on the outermost row or column
    bool is_border(int i, int j) const {
        return i == 0 || j == 0 || i == Nx - 1 || j == Ny - 1;
    }

    /// Periodic wrap of an index that is at most one period out of range
    int wrap_x(int i) const { return (i + Nx) % Nx; }
    int wrap_y(int j) const { return (j + Ny) % Ny; }

    /// Lattice coordinates of node (i, j)
    double x(int i) const { return static_cast<double>(i); }
    double y(int j) const { return static_cast<double>(j); }

    bool operator==(const Grid& other) const { return Nx == other.Nx && Ny == other.Ny; }
    bool operator!=(const Grid& other) const { return !(*this == other); }
};

} // namespace lbflow
