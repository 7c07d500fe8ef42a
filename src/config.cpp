#include "config.hpp"
#include "lattice.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace lbflow {

static std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::map<std::string, std::string> parse_config_file(const std::string& filename) {
    std::map<std::string, std::string> result;
    std::ifstream file(filename);

    if (!file) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        result[key] = value;
    }

    return result;
}

BoundaryType parse_boundary_type(const std::string& name) {
    const std::string s = to_lower(name);
    if (s == "periodic") return BoundaryType::Periodic;
    if (s == "wall" || s == "bounce_back" || s == "noslip") return BoundaryType::Wall;
    if (s == "inflow" || s == "inlet") return BoundaryType::Inflow;
    if (s == "outflow" || s == "outlet") return BoundaryType::Outflow;
    throw ConfigError("Unknown boundary type: " + name);
}

InflowScheme parse_inflow_scheme(const std::string& name) {
    const std::string s = to_lower(name);
    if (s == "equilibrium") return InflowScheme::Equilibrium;
    if (s == "zou_he" || s == "zouhe") return InflowScheme::ZouHe;
    throw ConfigError("Unknown inflow scheme: " + name);
}

ObstacleShape parse_obstacle_shape(const std::string& name) {
    const std::string s = to_lower(name);
    if (s == "none") return ObstacleShape::None;
    if (s == "cylinder" || s == "circle") return ObstacleShape::Cylinder;
    if (s == "ellipse") return ObstacleShape::Ellipse;
    throw ConfigError("Unknown obstacle shape: " + name);
}

const char* to_string(BoundaryType type) {
    switch (type) {
        case BoundaryType::Periodic: return "periodic";
        case BoundaryType::Wall:     return "wall";
        case BoundaryType::Inflow:   return "inflow";
        case BoundaryType::Outflow:  return "outflow";
    }
    return "unknown";
}

const char* to_string(InflowScheme scheme) {
    switch (scheme) {
        case InflowScheme::Equilibrium: return "equilibrium";
        case InflowScheme::ZouHe:       return "zou_he";
    }
    return "unknown";
}

const char* to_string(ObstacleShape shape) {
    switch (shape) {
        case ObstacleShape::None:     return "none";
        case ObstacleShape::Cylinder: return "cylinder";
        case ObstacleShape::Ellipse:  return "ellipse";
    }
    return "unknown";
}

void Config::load(const std::string& filename) {
    auto params = parse_config_file(filename);

    auto get_int = [&](const std::string& key, int def) {
        auto it = params.find(key);
        return it != params.end() ? std::stoi(it->second) : def;
    };

    auto get_double = [&](const std::string& key, double def) {
        auto it = params.find(key);
        return it != params.end() ? std::stod(it->second) : def;
    };

    auto get_bool = [&](const std::string& key, bool def) {
        auto it = params.find(key);
        if (it != params.end()) {
            return it->second == "true" || it->second == "1";
        }
        return def;
    };

    auto get_string = [&](const std::string& key, const std::string& def) {
        auto it = params.find(key);
        return it != params.end() ? it->second : def;
    };

    auto has = [&](const std::string& key) { return params.find(key) != params.end(); };

    // Lattice
    Nx = get_int("Nx", Nx);
    Ny = get_int("Ny", Ny);

    // Physical
    Re = get_double("Re", Re);
    tau = get_double("tau", tau);
    if (has("Re")) Re_specified = true;
    if (has("tau")) tau_specified = true;
    u_inflow = get_double("u_inflow", u_inflow);
    char_length = get_double("char_length", char_length);
    inflow_density = get_double("inflow_density", inflow_density);
    inflow_perturbation = get_double("inflow_perturbation", inflow_perturbation);

    // Obstacle
    if (has("obstacle")) obstacle = parse_obstacle_shape(params["obstacle"]);
    obstacle_cx = get_double("obstacle_cx", obstacle_cx);
    obstacle_cy = get_double("obstacle_cy", obstacle_cy);
    obstacle_r = get_double("obstacle_r", obstacle_r);
    ellipse_a = get_double("ellipse_a", ellipse_a);
    ellipse_b = get_double("ellipse_b", ellipse_b);

    // Boundaries
    if (has("x_lo")) x_lo = parse_boundary_type(params["x_lo"]);
    if (has("x_hi")) x_hi = parse_boundary_type(params["x_hi"]);
    if (has("y_lo")) y_lo = parse_boundary_type(params["y_lo"]);
    if (has("y_hi")) y_hi = parse_boundary_type(params["y_hi"]);
    if (has("inflow_scheme")) inflow_scheme = parse_inflow_scheme(params["inflow_scheme"]);

    // Run control and stability
    max_steps = get_int("max_steps", max_steps);
    mach_limit = get_double("mach_limit", mach_limit);
    unstable_cell_tolerance = get_int("unstable_cell_tolerance", unstable_cell_tolerance);
    unstable_step_tolerance = get_int("unstable_step_tolerance", unstable_step_tolerance);
    tau_max = get_double("tau_max", tau_max);
    tau_warn = get_double("tau_warn", tau_warn);
    num_threads = get_int("num_threads", num_threads);

    // Output
    output_dir = get_string("output_dir", output_dir);
    output_freq = get_int("output_freq", output_freq);
    write_vtk = get_bool("write_vtk", write_vtk);
    checkpoint_file = get_string("checkpoint_file", checkpoint_file);
    restart_file = get_string("restart_file", restart_file);
    verbose = get_bool("verbose", verbose);

    finalize();
}

void Config::parse_args(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            load(argv[++i]);
        } else if (arg == "--Nx" && i + 1 < argc) {
            Nx = std::stoi(argv[++i]);
        } else if (arg == "--Ny" && i + 1 < argc) {
            Ny = std::stoi(argv[++i]);
        } else if (arg == "--Re" && i + 1 < argc) {
            Re = std::stod(argv[++i]);
            Re_specified = true;
        } else if (arg == "--tau" && i + 1 < argc) {
            tau = std::stod(argv[++i]);
            tau_specified = true;
        } else if (arg == "--u_inflow" && i + 1 < argc) {
            u_inflow = std::stod(argv[++i]);
        } else if (arg == "--char_length" && i + 1 < argc) {
            char_length = std::stod(argv[++i]);
        } else if (arg == "--perturbation" && i + 1 < argc) {
            inflow_perturbation = std::stod(argv[++i]);
        } else if (arg == "--obstacle" && i + 1 < argc) {
            obstacle = parse_obstacle_shape(argv[++i]);
        } else if (arg == "--cx" && i + 1 < argc) {
            obstacle_cx = std::stod(argv[++i]);
        } else if (arg == "--cy" && i + 1 < argc) {
            obstacle_cy = std::stod(argv[++i]);
        } else if (arg == "--radius" && i + 1 < argc) {
            obstacle_r = std::stod(argv[++i]);
        } else if (arg == "--walls") {
            y_lo = BoundaryType::Wall;
            y_hi = BoundaryType::Wall;
        } else if (arg == "--inflow_scheme" && i + 1 < argc) {
            inflow_scheme = parse_inflow_scheme(argv[++i]);
        } else if (arg == "--max_steps" && i + 1 < argc) {
            max_steps = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            num_threads = std::stoi(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--output_freq" && i + 1 < argc) {
            output_freq = std::stoi(argv[++i]);
        } else if (arg == "--no_vtk") {
            write_vtk = false;
        } else if (arg == "--checkpoint" && i + 1 < argc) {
            checkpoint_file = argv[++i];
        } else if (arg == "--restart" && i + 1 < argc) {
            restart_file = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--quiet") {
            verbose = false;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --config FILE         Load config file\n"
                      << "  --Nx N                Lattice nodes in x\n"
                      << "  --Ny N                Lattice nodes in y\n"
                      << "  --Re R                Reynolds number (derives tau)\n"
                      << "  --tau T               Relaxation time (derives Re)\n"
                      << "  --u_inflow U          Inflow velocity (lattice units)\n"
                      << "  --char_length L       Characteristic length (default: radius)\n"
                      << "  --perturbation EPS    Relative inflow perturbation (default 1e-4)\n"
                      << "  --obstacle SHAPE      none, cylinder, ellipse\n"
                      << "  --cx X --cy Y         Obstacle centre\n"
                      << "  --radius R            Obstacle radius\n"
                      << "  --walls               No-slip walls at y_lo / y_hi (default periodic)\n"
                      << "  --inflow_scheme S     equilibrium (default), zou_he\n"
                      << "  --max_steps N         Number of time steps\n"
                      << "  --threads N           OpenMP threads\n"
                      << "  --output DIR          Output directory\n"
                      << "  --output_freq N       Snapshot / progress frequency\n"
                      << "  --no_vtk              Skip VTK snapshots\n"
                      << "  --checkpoint FILE     Write checkpoint at the end of the run\n"
                      << "  --restart FILE        Restart from checkpoint\n"
                      << "  --verbose/--quiet     Print progress\n"
                      << "  --help                Show this message\n"
                      << "\nRelaxation coupling:\n"
                      << "  nu = u_inflow * L / Re, tau = 3 nu + 1/2.\n"
                      << "  Specify either Re or tau; the other is derived.\n";
            std::exit(0);
        } else {
            throw ConfigError("Unknown or incomplete argument: " + arg);
        }
    }

    finalize();
}

namespace {

double resolved_radius(const Config& c) {
    return c.obstacle_r > 0.0 ? c.obstacle_r : static_cast<double>(c.Ny / 9);
}

} // namespace

void Config::finalize() {
    if (obstacle_cx < 0.0) obstacle_cx = static_cast<double>(Nx / 4);
    if (obstacle_cy < 0.0) obstacle_cy = static_cast<double>(Ny / 2);
    const double r = resolved_radius(*this);
    if (obstacle_r < 0.0) obstacle_r = r;
    if (obstacle == ObstacleShape::Ellipse) {
        if (ellipse_a < 0.0) ellipse_a = std::sqrt(44.0 * r);
        if (ellipse_b < 0.0) ellipse_b = std::sqrt(16.5 * r);
    }

    double L = char_length;
    if (L <= 0.0) {
        L = (obstacle == ObstacleShape::None) ? static_cast<double>(Ny) : r;
    }

    if (Re_specified && tau_specified) {
        // Over-constrained: accept only if consistent
        const double nu_tau = (tau - 0.5) / 3.0;
        const double Re_check = nu_tau > 0.0 ? u_inflow * L / nu_tau : 0.0;
        if (Re <= 0.0 || std::abs(Re_check - Re) / Re > 0.01) {
            std::ostringstream oss;
            oss << "Over-constrained input: Re = " << Re << " and tau = " << tau
                << " are inconsistent (tau implies Re = " << Re_check
                << "). Specify only one of them.";
            throw ConfigError(oss.str());
        }
        nu = nu_tau;
    } else if (tau_specified) {
        nu = (tau - 0.5) / 3.0;
        if (nu > 0.0) {
            Re = u_inflow * L / nu;
        }
    } else {
        nu = Re > 0.0 ? u_inflow * L / Re : 0.0;
        tau = 3.0 * nu + 0.5;
    }
}

void Config::validate() const {
    std::ostringstream err;

    if (Nx < 3 || Ny < 3) {
        err << "Lattice must be at least 3 x 3 (got " << Nx << " x " << Ny << ")";
        throw ConfigError(err.str());
    }
    if (!tau_specified && Re <= 0.0) {
        throw ConfigError("Reynolds number must be positive");
    }
    if (!(tau > 0.5)) {
        err << "Relaxation time tau = " << tau << " must exceed 0.5 (non-positive viscosity)";
        throw ConfigError(err.str());
    }
    if (tau > tau_max) {
        err << "Relaxation time tau = " << tau << " exceeds tau_max = " << tau_max;
        throw ConfigError(err.str());
    }
    if (mach_limit <= 0.0) {
        throw ConfigError("mach_limit must be positive");
    }
    if (unstable_cell_tolerance < 0 || unstable_step_tolerance < 0) {
        throw ConfigError("Stability tolerances must be non-negative");
    }
    if (max_steps < 0) {
        throw ConfigError("max_steps must be non-negative");
    }
    if (output_freq <= 0) {
        throw ConfigError("output_freq must be positive");
    }

    // Boundary combinations
    if ((x_lo == BoundaryType::Periodic) != (x_hi == BoundaryType::Periodic)) {
        throw ConfigError("x boundaries: periodic must be set on both sides");
    }
    if ((y_lo == BoundaryType::Periodic) != (y_hi == BoundaryType::Periodic)) {
        throw ConfigError("y boundaries: periodic must be set on both sides");
    }
    if (x_hi == BoundaryType::Inflow || y_lo == BoundaryType::Inflow || y_hi == BoundaryType::Inflow) {
        throw ConfigError("Inflow is only supported on x_lo");
    }
    if (x_lo == BoundaryType::Outflow || y_lo == BoundaryType::Outflow || y_hi == BoundaryType::Outflow) {
        throw ConfigError("Outflow is only supported on x_hi");
    }
    if ((x_lo == BoundaryType::Inflow) != (x_hi == BoundaryType::Outflow)) {
        throw ConfigError("Inflow on x_lo requires outflow on x_hi and vice versa");
    }

    if (x_lo == BoundaryType::Inflow) {
        if (inflow_density <= 0.0) {
            throw ConfigError("inflow_density must be positive");
        }
        const double u_peak = std::abs(u_inflow) * (1.0 + std::abs(inflow_perturbation));
        const double mach = u_peak / d2q9::cs;
        if (mach > mach_limit) {
            err << "Inflow velocity " << u_peak << " gives Mach " << mach
                << " above the stability bound " << mach_limit;
            throw ConfigError(err.str());
        }
    }

    if (obstacle == ObstacleShape::Cylinder && obstacle_r <= 0.0) {
        throw ConfigError("Cylinder radius must be positive");
    }
    if (obstacle == ObstacleShape::Ellipse && (ellipse_a <= 0.0 || ellipse_b <= 0.0)) {
        throw ConfigError("Ellipse semi-axes must be positive");
    }

    if (tau < tau_warn) {
        std::cerr << "WARNING: tau = " << tau << " is below the recommended minimum "
                  << tau_warn << "; BGK may become unstable\n";
    }
}

void Config::print() const {
    std::cout << "=== Configuration ===\n"
              << "Lattice: " << Nx << " x " << Ny << " (D2Q9)\n"
              << "Physical: Re = " << Re << ", u_inflow = " << u_inflow
              << ", nu = " << nu << ", tau = " << tau << "\n"
              << "Obstacle: " << to_string(obstacle);
    if (obstacle == ObstacleShape::Cylinder) {
        std::cout << " at (" << obstacle_cx << ", " << obstacle_cy << "), r = " << obstacle_r;
    } else if (obstacle == ObstacleShape::Ellipse) {
        std::cout << " at (" << obstacle_cx << ", " << obstacle_cy << "), a = " << ellipse_a
                  << ", b = " << ellipse_b;
    }
    std::cout << "\n"
              << "Boundaries: x_lo = " << to_string(x_lo) << ", x_hi = " << to_string(x_hi)
              << ", y_lo = " << to_string(y_lo) << ", y_hi = " << to_string(y_hi) << "\n"
              << "Inflow scheme: " << to_string(inflow_scheme)
              << " (perturbation " << inflow_perturbation << ")\n"
              << "Steps: " << max_steps << ", output every " << output_freq << "\n"
              << "Stability: mach_limit = " << mach_limit
              << ", tolerance = " << unstable_cell_tolerance << " cells / "
              << unstable_step_tolerance << " steps\n"
              << "=====================\n";
}

} // namespace lbflow
