#include "io.hpp"
#include "lattice.hpp"
#include "simulation.hpp"
#include "timing.hpp"
#include "profiling.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

namespace lbflow {
namespace io {

namespace {

constexpr char kCheckpointMagic[8] = {'L', 'B', 'F', 'L', 'O', 'W', 'C', 'K'};
constexpr std::uint32_t kCheckpointVersion = 1;

// Populations per checkpoint; keeps every flat index within int range
constexpr long long kMaxCheckpointEntries = std::numeric_limits<int>::max();

template <typename T>
void write_pod(std::ostream& os, const T& val) {
    os.write(reinterpret_cast<const char*>(&val), sizeof(T));
}

template <typename T>
void read_pod(std::istream& is, T& val, const std::string& filename) {
    is.read(reinterpret_cast<char*>(&val), sizeof(T));
    if (!is) {
        throw std::runtime_error("Truncated checkpoint header: " + filename);
    }
}

} // namespace

// ============================================================================
// Statistics
// ============================================================================

FlowStatistics compute_statistics(const DistributionField& f,
                                  const ScalarField& rho,
                                  const VectorField& u,
                                  const ObstacleMask& solid) {
    FlowStatistics s;
    s.total_mass = f.total_mass();
    s.rho_min = std::numeric_limits<double>::max();
    s.rho_max = std::numeric_limits<double>::lowest();

    const int n = rho.grid().cell_count();
    const auto& ud = u.u_data();
    const auto& vd = u.v_data();
    double rho_sum = 0.0;
    double umax_sq = 0.0;

    for (int idx = 0; idx < n; ++idx) {
        if (solid.is_solid(idx)) continue;
        const double r = rho[idx];
        const double uu = ud[idx] * ud[idx] + vd[idx] * vd[idx];
        s.rho_min = std::min(s.rho_min, r);
        s.rho_max = std::max(s.rho_max, r);
        rho_sum += r;
        umax_sq = std::max(umax_sq, uu);
        s.kinetic_energy += 0.5 * r * uu;
        ++s.fluid_cells;
    }

    if (s.fluid_cells == 0) {
        s.rho_min = 0.0;
        s.rho_max = 0.0;
        return s;
    }
    s.rho_mean = rho_sum / s.fluid_cells;
    s.u_max = std::sqrt(umax_sq);
    s.mach_max = s.u_max / d2q9::cs;
    return s;
}

FlowStatistics compute_statistics(const Simulation& sim) {
    return compute_statistics(sim.distribution(), sim.density(), sim.velocity(), sim.solid());
}

// ============================================================================
// VTK output
// ============================================================================

void write_vtk(const std::string& filename,
               const ScalarField& rho,
               const VectorField& u,
               const ObstacleMask& solid,
               int step) {
    TIMED_SCOPE("io_vtk");
    NVTX_SCOPE_IO("io:vtk");

    const Grid& g = rho.grid();
    const int Nx = g.Nx;
    const int Ny = g.Ny;

    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open " + filename + " for writing");
    }

    file << "# vtk DataFile Version 3.0\n";
    file << "LBM flow step " << step << "\n";
    file << "ASCII\n";
    file << "DATASET STRUCTURED_POINTS\n";
    file << "DIMENSIONS " << Nx << " " << Ny << " 1\n";
    file << "ORIGIN 0 0 0\n";
    file << "SPACING 1 1 1\n";
    file << "POINT_DATA " << Nx * Ny << "\n";

    file << std::setprecision(10);

    file << "VECTORS velocity double\n";
    for (int j = 0; j < Ny; ++j) {
        for (int i = 0; i < Nx; ++i) {
            file << u.u(i, j) << " " << u.v(i, j) << " 0\n";
        }
    }

    file << "\nSCALARS density double 1\n";
    file << "LOOKUP_TABLE default\n";
    for (int j = 0; j < Ny; ++j) {
        for (int i = 0; i < Nx; ++i) {
            file << rho(i, j) << "\n";
        }
    }

    file << "\nSCALARS velocity_magnitude double 1\n";
    file << "LOOKUP_TABLE default\n";
    for (int j = 0; j < Ny; ++j) {
        for (int i = 0; i < Nx; ++i) {
            file << u.magnitude(i, j) << "\n";
        }
    }

    file << "\nSCALARS obstacle int 1\n";
    file << "LOOKUP_TABLE default\n";
    for (int j = 0; j < Ny; ++j) {
        for (int i = 0; i < Nx; ++i) {
            file << (solid.is_solid(i, j) ? 1 : 0) << "\n";
        }
    }

    if (!file) {
        throw std::runtime_error("Error writing " + filename);
    }
}

void write_vtk(const std::string& filename, const Simulation& sim) {
    write_vtk(filename, sim.density(), sim.velocity(), sim.solid(), sim.step_index());
}

// ============================================================================
// Checkpoints
// ============================================================================

void write_checkpoint(const std::string& filename, const DistributionField& f, int step) {
    TIMED_SCOPE("io_checkpoint");
    NVTX_SCOPE_IO("io:checkpoint");

    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open " + filename + " for writing");
    }

    const Grid& g = f.grid();
    file.write(kCheckpointMagic, sizeof(kCheckpointMagic));
    write_pod(file, kCheckpointVersion);
    write_pod(file, static_cast<std::int32_t>(g.Nx));
    write_pod(file, static_cast<std::int32_t>(g.Ny));
    write_pod(file, static_cast<std::int32_t>(d2q9::Q));
    write_pod(file, static_cast<std::int32_t>(step));
    file.write(reinterpret_cast<const char*>(f.data().data()),
               static_cast<std::streamsize>(f.data().size() * sizeof(double)));

    if (!file) {
        throw std::runtime_error("Error writing checkpoint " + filename);
    }
}

Checkpoint read_checkpoint(const std::string& filename) {
    TIMED_SCOPE("io_checkpoint");

    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open checkpoint " + filename);
    }

    char magic[8];
    file.read(magic, sizeof(magic));
    if (!file || std::memcmp(magic, kCheckpointMagic, sizeof(magic)) != 0) {
        throw std::runtime_error("Not an lbflow checkpoint: " + filename);
    }

    std::uint32_t version = 0;
    std::int32_t nx = 0, ny = 0, q = 0, step = 0;
    read_pod(file, version, filename);
    read_pod(file, nx, filename);
    read_pod(file, ny, filename);
    read_pod(file, q, filename);
    read_pod(file, step, filename);

    if (version != kCheckpointVersion) {
        throw std::runtime_error("Unsupported checkpoint version " + std::to_string(version)
                                 + " in " + filename);
    }
    if (nx <= 0 || ny <= 0 || q != d2q9::Q || step < 0) {
        throw std::runtime_error("Malformed checkpoint header in " + filename);
    }
    const long long entries = static_cast<long long>(nx) * ny * q;
    if (entries > kMaxCheckpointEntries) {
        throw std::runtime_error("Checkpoint lattice " + std::to_string(nx) + " x "
                                 + std::to_string(ny) + " too large in " + filename);
    }

    // Check the payload size before allocating
    const std::streampos data_start = file.tellg();
    file.seekg(0, std::ios::end);
    const std::streamoff available = file.tellg() - data_start;
    file.seekg(data_start);
    if (!file || available < static_cast<std::streamoff>(entries * sizeof(double))) {
        throw std::runtime_error("Truncated checkpoint data in " + filename);
    }

    Checkpoint cp;
    cp.step = step;
    cp.f = DistributionField(Grid(nx, ny));
    file.read(reinterpret_cast<char*>(cp.f.data().data()),
              static_cast<std::streamsize>(cp.f.data().size() * sizeof(double)));
    if (!file) {
        throw std::runtime_error("Truncated checkpoint data in " + filename);
    }
    return cp;
}

} // namespace io
} // namespace lbflow
