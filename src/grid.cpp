#include "grid.hpp"
#include <stdexcept>
#include <string>

namespace lbflow {

void Grid::init(int nx, int ny) {
    if (nx <= 0 || ny <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive (got "
                                    + std::to_string(nx) + " x " + std::to_string(ny) + ")");
    }
    Nx = nx;
    Ny = ny;
}

} // namespace lbflow
