/// Tests for the timestep driver
///
/// - State machine: Initialized -> Running -> Completed, no resume after the end
/// - Cooperative stop between steps, from an observer or another thread
/// - Observers called on the requested cadence with consistent fields
/// - Restore from a snapshot reproduces an uninterrupted run
/// - Invalid configuration or geometry never produces a simulation

#include "geometry.hpp"
#include "lbm_kernels.hpp"
#include "simulation.hpp"
#include "test_harness.hpp"
#include "test_utilities.hpp"
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace lbflow;
using lbflow::test::harness::record;

namespace {

Config small_channel(int max_steps) {
    Config config = lbflow::test::channel_config(40, 16, 0.04, 0.7);
    config.max_steps = max_steps;
    return config;
}

ObstacleMask small_cylinder(const Config& config) {
    return make_obstacle_mask(Grid(config.Nx, config.Ny), cylinder_predicate(10.0, 8.0, 3.0));
}

} // namespace

void test_state_machine() {
    Config config = small_channel(20);
    Simulation sim(config, small_cylinder(config));

    record("Constructed in Initialized state",
           sim.state() == SimState::Initialized && sim.step_index() == 0 && sim.time() == 0.0);

    record("start() enters Running", sim.start() && sim.state() == SimState::Running);
    record("start() while Running is harmless", sim.start() && sim.step_index() == 0);

    record("step() advances by one", sim.step() && sim.step_index() == 1 && sim.time() == 1.0);
    record("step(n) advances by n", sim.step(5) == 5 && sim.step_index() == 6);

    const SimState final_state = sim.run();
    record("run() completes at max_steps",
           final_state == SimState::Completed && sim.step_index() == 20);
    record("Stability ok after a healthy run", sim.stability().ok());

    record("step() after completion is refused", !sim.step() && sim.step_index() == 20);
    record("step(n) after completion takes no steps", sim.step(3) == 0);
    record("run() after completion stays Completed", sim.run() == SimState::Completed);
}

void test_implicit_start() {
    Config config = small_channel(3);
    Simulation sim(config, small_cylinder(config));
    record("step() on a fresh simulation starts it", sim.step() && sim.state() == SimState::Running);
    record("Last step reports completion", sim.step() && !sim.step() && sim.state() == SimState::Completed);
}

void test_zero_steps() {
    Config config = small_channel(0);
    Simulation sim(config, small_cylinder(config));
    record("max_steps = 0 completes at start", !sim.start() && sim.state() == SimState::Completed);
    record("No step taken", sim.step_index() == 0);
}

void test_default_initial_condition() {
    Config config = small_channel(10);
    ObstacleMask obstacle = small_cylinder(config);
    Simulation sim(config, obstacle);

    bool fluid_ok = true;
    bool solid_ok = true;
    for (int j = 0; j < config.Ny; ++j) {
        for (int i = 0; i < config.Nx; ++i) {
            const double u = sim.velocity().u(i, j);
            const double v = sim.velocity().v(i, j);
            if (obstacle.is_solid(i, j)) {
                solid_ok = solid_ok && u == 0.0 && v == 0.0;
            } else {
                fluid_ok = fluid_ok && std::abs(u - 0.04) < 1e-14 && std::abs(v) < 1e-14;
            }
            fluid_ok = fluid_ok && std::abs(sim.density()(i, j) - 1.0) < 1e-14;
        }
    }
    record("Fluid starts at the inflow velocity", fluid_ok);
    record("Solid starts at rest", solid_ok);
}

void test_stop_request() {
    Config config = small_channel(50);
    Simulation sim(config, small_cylinder(config));

    sim.add_observer([&sim](const Simulation& s) {
        if (s.step_index() == 7) {
            sim.request_stop();
        }
    });

    SimState state = sim.run();
    record("Stop request pauses after the current step",
           state == SimState::Running && sim.step_index() == 7);
    record("Stop request consumed", !sim.stop_requested());

    state = sim.run();
    record("run() resumes to completion", state == SimState::Completed && sim.step_index() == 50);

    Simulation paused(config, small_cylinder(config));
    paused.start();
    paused.request_stop();
    record("step(n) honours a pending stop", paused.step(10) == 0 && paused.step_index() == 0);
}

void test_stop_from_thread() {
    Config config = lbflow::test::periodic_config(8, 8, 0.8);
    config.max_steps = 100000000;
    Simulation sim(config, ObstacleMask(Grid(8, 8)));

    std::thread stopper([&sim] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        sim.request_stop();
    });
    const SimState state = sim.run();
    stopper.join();

    record("Stop request from another thread",
           state == SimState::Running && sim.step_index() < config.max_steps);
}

void test_observers() {
    Config config = small_channel(20);
    Simulation sim(config, small_cylinder(config));

    int calls = 0;
    int last_step = -1;
    bool consistent = true;
    sim.add_observer([&](const Simulation& s) {
        ++calls;
        last_step = s.step_index();
        double r, jx, jy;
        kernels::cell_moments(s.distribution().cell(30, 5), r, jx, jy);
        consistent = consistent && std::abs(r - s.density()(30, 5)) < 1e-14
                                && std::abs(jx / r - s.velocity().u(30, 5)) < 1e-14;
    }, 5);

    int every_step = 0;
    sim.add_observer([&every_step](const Simulation&) { ++every_step; });

    sim.run();
    record("Observer called every 5 steps", calls == 4 && last_step == 20);
    record("Default observer called every step", every_step == 20);
    record("Observer sees fields consistent with the distribution", consistent);

    bool threw = false;
    try {
        sim.add_observer([](const Simulation&) {}, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    record("Non-positive cadence rejected", threw);
}

void test_restore() {
    Config config = small_channel(30);

    Simulation reference(config, small_cylinder(config));
    reference.step(10);
    const DistributionField snapshot = reference.distribution();
    reference.run();

    Simulation resumed(config, small_cylinder(config));
    resumed.restore(snapshot, 10);
    record("Restore sets the step index", resumed.step_index() == 10);
    resumed.run();

    auto cmp = lbflow::test::compare_distributions(reference.distribution(), resumed.distribution());
    record("Restored run matches the uninterrupted run",
           resumed.state() == SimState::Completed && cmp.max_abs_diff == 0.0);

    bool threw = false;
    try {
        resumed.restore(snapshot, 10);
    } catch (const std::logic_error&) {
        threw = true;
    }
    record("Restore after start rejected", threw);

    Simulation fresh(config, small_cylinder(config));
    threw = false;
    try {
        fresh.restore(DistributionField(Grid(10, 10)), 0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    record("Restore with a different lattice rejected", threw);

    threw = false;
    try {
        resumed.initialize_equilibrium([](double, double) { return 1.0; },
                                       [](double, double, double& u, double& v) { u = v = 0.0; });
    } catch (const std::logic_error&) {
        threw = true;
    }
    record("Re-initialization after start rejected", threw);

    Simulation late(config, small_cylinder(config));
    late.restore(snapshot, 30);
    record("Restore at max_steps completes on start",
           !late.start() && late.state() == SimState::Completed);
}

void test_construction_errors() {
    auto rejected = [](const Config& config, const ObstacleMask& obstacle) {
        try {
            Simulation sim(config, obstacle);
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    };

    Config config = small_channel(10);
    record("Mismatched obstacle mask rejected", rejected(config, ObstacleMask(Grid(10, 10))));
    record("All-solid obstacle rejected",
           rejected(config, ObstacleMask(Grid(config.Nx, config.Ny), true)));

    ObstacleMask wall(Grid(config.Nx, config.Ny));
    for (int j = 0; j < config.Ny; ++j) wall.set(20, j, true);
    record("Obstacle blocking the channel rejected", rejected(config, wall));

    Config bad_tau = config;
    bad_tau.tau = 0.45;
    bad_tau.finalize();
    record("Unstable relaxation time rejected",
           rejected(bad_tau, ObstacleMask(Grid(config.Nx, config.Ny))));

    Config fast = config;
    fast.u_inflow = 0.25;
    fast.finalize();
    record("Supersonic-range inflow rejected", rejected(fast, ObstacleMask(Grid(config.Nx, config.Ny))));
}

void test_thread_setting_untouched() {
#ifdef _OPENMP
    const int before = omp_get_max_threads();
    Config config = small_channel(5);
    config.num_threads = before + 3;
    Simulation sim(config, small_cylinder(config));
    sim.run();
    record("Constructing and running leaves the OpenMP team size alone",
           omp_get_max_threads() == before);
#else
    record("Constructing and running leaves the OpenMP team size alone", true, true);
#endif
}

int main() {
    return lbflow::test::harness::run_sections("Simulation Driver Tests", {
        {"State machine", test_state_machine},
        {"Implicit start", test_implicit_start},
        {"Zero steps", test_zero_steps},
        {"Initial condition", test_default_initial_condition},
        {"Stop request", test_stop_request},
        {"Stop from thread", test_stop_from_thread},
        {"Observers", test_observers},
        {"Restore", test_restore},
        {"Construction errors", test_construction_errors},
        {"Thread setting", test_thread_setting_untouched}
    });
}
