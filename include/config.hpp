#pragma once

#include <string>
#include <map>
#include <stdexcept>

namespace lbflow {

/// Invalid configuration or geometry, detected before the simulation starts
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/// Treatment of one side of the domain
enum class BoundaryType {
    Periodic,   ///< Wrap-around (both sides of the axis must be periodic)
    Wall,       ///< Solid layer with bounce-back (no-slip)
    Inflow,     ///< Prescribed velocity (x_lo only)
    Outflow     ///< Zero-gradient extrapolation (x_hi only)
};

/// Inflow condition scheme
enum class InflowScheme {
    Equilibrium,    ///< Overwrite with feq(inflow_density, u_inflow)
    ZouHe           ///< Zou-He velocity condition, density from known populations
};

/// Built-in obstacle shapes
enum class ObstacleShape {
    None,
    Cylinder,   ///< (x-cx)^2 + (y-cy)^2 < r^2
    Ellipse     ///< (x-cx)^2/a^2 + (y-cy)^2/b^2 < 1
};

/// Simulation configuration
struct Config {
    // Lattice
    int Nx = 420;
    int Ny = 180;

    // Physical parameters (lattice units)
    double Re = 220.0;              ///< Reynolds number based on char_length
    double u_inflow = 0.04;         ///< Inflow velocity
    double char_length = -1.0;      ///< Characteristic length (<0: obstacle radius)
    double nu = 0.0;                ///< Kinematic viscosity (derived)
    double tau = 0.0;               ///< BGK relaxation time (derived unless given)
    double inflow_density = 1.0;    ///< Density imposed by the equilibrium inflow
    double inflow_perturbation = 1e-4;  ///< Relative sine perturbation of the inflow profile

    // Obstacle (negative values are resolved by finalize())
    ObstacleShape obstacle = ObstacleShape::Cylinder;
    double obstacle_cx = -1.0;      ///< Default Nx/4
    double obstacle_cy = -1.0;      ///< Default Ny/2
    double obstacle_r = -1.0;       ///< Default Ny/9
    double ellipse_a = -1.0;        ///< Semi-axis in x, default sqrt(44 r)
    double ellipse_b = -1.0;        ///< Semi-axis in y, default sqrt(16.5 r)

    // Boundaries
    BoundaryType x_lo = BoundaryType::Inflow;
    BoundaryType x_hi = BoundaryType::Outflow;
    BoundaryType y_lo = BoundaryType::Periodic;
    BoundaryType y_hi = BoundaryType::Periodic;
    InflowScheme inflow_scheme = InflowScheme::Equilibrium;

    // Run control
    int max_steps = 30000;

    // Stability limits
    double mach_limit = 0.35;           ///< Max |u|/c_s before a cell counts as unstable
    int unstable_cell_tolerance = 0;    ///< Cells allowed above mach_limit per step
    int unstable_step_tolerance = 10;   ///< Consecutive unstable steps before failing
    double tau_max = 2.0;               ///< Largest accepted relaxation time
    double tau_warn = 0.505;            ///< Warn below this relaxation time

    // Parallelism
    int num_threads = 0;            ///< OpenMP threads set by the CLI (0 = runtime default)

    // Output
    std::string output_dir = "output/";
    int output_freq = 100;          ///< Snapshot / progress frequency (steps)
    bool write_vtk = true;
    std::string checkpoint_file;    ///< Written at the end of the run if non-empty
    std::string restart_file;       ///< Loaded before the run if non-empty
    bool verbose = true;

    // Track which parameters were explicitly set
    bool Re_specified = false;
    bool tau_specified = false;

    /// Load configuration from file
    void load(const std::string& filename);

    /// Parse command line arguments
    void parse_args(int argc, char** argv);

    /// Print configuration
    void print() const;

    /// Resolve geometry defaults and the Re / nu / tau coupling
    void finalize();

    /// Check ranges and boundary combinations, throws ConfigError
    void validate() const;
};

/// Parse a key-value config file
std::map<std::string, std::string> parse_config_file(const std::string& filename);

BoundaryType parse_boundary_type(const std::string& name);
InflowScheme parse_inflow_scheme(const std::string& name);
ObstacleShape parse_obstacle_shape(const std::string& name);

const char* to_string(BoundaryType type);
const char* to_string(InflowScheme scheme);
const char* to_string(ObstacleShape shape);

} // namespace lbflow
