#pragma once

/// @file io.hpp
/// @brief Snapshot output, checkpoints and flow diagnostics

#include "fields.hpp"
#include <string>

namespace lbflow {

class Simulation;

namespace io {

/// Diagnostics over the fluid nodes
struct FlowStatistics {
    double total_mass = 0.0;        ///< Sum of all populations (fluid and solid)
    double rho_min = 0.0;
    double rho_max = 0.0;
    double rho_mean = 0.0;
    double u_max = 0.0;             ///< Max |u|
    double mach_max = 0.0;          ///< u_max / c_s
    double kinetic_energy = 0.0;    ///< sum 0.5 rho |u|^2
    int fluid_cells = 0;
};

FlowStatistics compute_statistics(const DistributionField& f,
                                  const ScalarField& rho,
                                  const VectorField& u,
                                  const ObstacleMask& solid);

FlowStatistics compute_statistics(const Simulation& sim);

/// Legacy ASCII VTK (STRUCTURED_POINTS): velocity, density, velocity
/// magnitude and obstacle flag. Throws std::runtime_error if the file
/// cannot be written.
void write_vtk(const std::string& filename,
               const ScalarField& rho,
               const VectorField& u,
               const ObstacleMask& solid,
               int step = 0);

void write_vtk(const std::string& filename, const Simulation& sim);

/// Distribution snapshot with its step index
struct Checkpoint {
    int step = 0;
    DistributionField f;
};

/// Binary checkpoint, native byte order:
///   char[8] "LBFLOWCK", uint32 version, int32 Nx, Ny, Q, step,
///   then Nx * Ny * Q doubles in (j, i, q) order
void write_checkpoint(const std::string& filename, const DistributionField& f, int step);

/// Read a checkpoint written by write_checkpoint().
/// Throws std::runtime_error on I/O errors or malformed headers.
Checkpoint read_checkpoint(const std::string& filename);

} // namespace io
} // namespace lbflow
