/// Flow past a cylinder (or ellipse) with the D2Q9 lattice Boltzmann method
/// - Prescribed inflow at x = 0 with a small sinusoidal perturbation
/// - Zero-gradient outflow at x = Nx-1
/// - Periodic (default) or no-slip walls in y
/// Writes VTK snapshots every output_freq steps; Ctrl-C stops after the
/// current step and still writes the final checkpoint.

#include "config.hpp"
#include "fields.hpp"
#include "geometry.hpp"
#include "io.hpp"
#include "simulation.hpp"
#include "timing.hpp"

#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace lbflow;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int) {
    g_interrupted = 1;
}

std::string snapshot_name(const std::string& dir, int step) {
    std::ostringstream oss;
    oss << dir << "cylinder_" << std::setw(7) << std::setfill('0') << step << ".vtk";
    return oss.str();
}

void print_progress(const Simulation& sim) {
    const auto stats = io::compute_statistics(sim);
    std::cout << "step " << std::setw(7) << sim.step_index()
              << std::scientific << std::setprecision(4)
              << "  mass " << stats.total_mass
              << "  rho [" << stats.rho_min << ", " << stats.rho_max << "]"
              << "  |u|max " << stats.u_max
              << std::fixed << std::setprecision(3)
              << "  Ma " << stats.mach_max << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "=== Lattice Boltzmann Flow Past an Obstacle ===\n\n";

    Config config;
    try {
        config.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    if (config.verbose) {
        config.print();
    }

#ifdef _OPENMP
    if (config.num_threads > 0) {
        omp_set_num_threads(config.num_threads);
    }
    if (config.verbose) {
        std::cout << "OpenMP threads: " << omp_get_max_threads() << "\n\n";
    }
#endif

    const Grid grid(config.Nx, config.Ny);
    std::unique_ptr<Simulation> sim;
    try {
        const ObstacleMask obstacle = make_obstacle_mask(grid, config);
        if (config.verbose) {
            std::cout << "Obstacle nodes: " << count_solid(obstacle) << " of "
                      << grid.cell_count() << "\n\n";
        }
        sim = std::make_unique<Simulation>(config, obstacle);

        if (!config.restart_file.empty()) {
            io::Checkpoint cp = io::read_checkpoint(config.restart_file);
            sim->restore(cp.f, cp.step);
            std::cout << "Restarted from " << config.restart_file << " at step " << cp.step << "\n";
        }
    } catch (const ConfigError& e) {
        std::cerr << "ERROR: invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    if (config.write_vtk || !config.checkpoint_file.empty()) {
        std::filesystem::create_directories(config.output_dir);
    }

    std::signal(SIGINT, handle_sigint);
    Simulation& s = *sim;
    s.add_observer([&s](const Simulation&) {
        if (g_interrupted) {
            s.request_stop();
        }
    });

    s.add_observer([&config](const Simulation& current) {
        if (config.verbose) {
            print_progress(current);
        }
        if (config.write_vtk) {
            try {
                io::write_vtk(snapshot_name(config.output_dir, current.step_index()), current);
            } catch (const std::exception& e) {
                std::cerr << "WARNING: could not write snapshot: " << e.what() << "\n";
            }
        }
    }, config.output_freq);

    ScopedTimer total_timer("Total simulation");
    const SimState final_state = s.run();
    const double wall_time = total_timer.stop();

    std::cout << "\n=== Results ===\n";
    std::cout << "State: " << to_string(final_state) << " at step " << s.step_index() << "\n";
    std::cout << total_timer.name() << ": " << std::fixed << std::setprecision(2)
              << wall_time << " s\n";
    if (final_state == SimState::Running) {
        std::cout << "Interrupted, stopped after step " << s.step_index() << "\n";
    }

    int exit_code = 0;
    if (final_state == SimState::Failed) {
        const auto& report = s.stability();
        std::cerr << "ERROR: " << to_string(report.kind) << " at (" << report.i << ", "
                  << report.j << "), step " << report.step << ": " << report.message << "\n";
        exit_code = 2;
    } else {
        print_progress(s);
        if (!config.checkpoint_file.empty()) {
            const std::string path = config.output_dir + config.checkpoint_file;
            try {
                io::write_checkpoint(path, s.distribution(), s.step_index());
                std::cout << "Checkpoint written to " << path << "\n";
            } catch (const std::exception& e) {
                std::cerr << "ERROR: " << e.what() << "\n";
                exit_code = 1;
            }
        }
    }

    TimingStats::instance().print_summary();
    TimingStats::instance().print_throughput(grid.cell_count());

    return exit_code;
}
