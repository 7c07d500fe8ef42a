/// Tests for snapshot output, checkpoints and flow statistics

#include "geometry.hpp"
#include "io.hpp"
#include "simulation.hpp"
#include "test_harness.hpp"
#include "test_utilities.hpp"
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lbflow;
using lbflow::test::harness::record;

namespace fs = std::filesystem;

namespace {

std::string temp_path(const std::string& name) {
    return (fs::temp_directory_path() / ("lbflow_test_io_" + name)).string();
}

bool read_throws(const std::string& filename) {
    try {
        io::read_checkpoint(filename);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

std::vector<char> slurp(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    return std::vector<char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void spit(const std::string& filename, const std::vector<char>& bytes) {
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::vector<std::string> read_lines(const std::string& filename) {
    std::ifstream in(filename);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

int find_line(const std::vector<std::string>& lines, const std::string& text) {
    for (size_t k = 0; k < lines.size(); ++k) {
        if (lines[k] == text) return static_cast<int>(k);
    }
    return -1;
}

Config channel(int max_steps) {
    Config config = lbflow::test::channel_config(40, 16, 0.04, 0.7);
    config.max_steps = max_steps;
    return config;
}

ObstacleMask cylinder(const Config& config) {
    return make_obstacle_mask(Grid(config.Nx, config.Ny), cylinder_predicate(10.0, 8.0, 3.0));
}

} // namespace

void test_checkpoint_round_trip() {
    const Grid grid(7, 5);
    DistributionField f(grid);
    lbflow::test::fill_random(f, 7);

    const std::string path = temp_path("roundtrip.chk");
    io::write_checkpoint(path, f, 123);
    const io::Checkpoint cp = io::read_checkpoint(path);

    record("Step index preserved", cp.step == 123);
    record("Lattice size preserved", cp.f.grid() == grid);
    auto cmp = lbflow::test::compare_distributions(f, cp.f);
    record("Populations preserved bit for bit", cmp.max_abs_diff == 0.0);

    const auto expected_size = 8 + 4 + 4 * 4 + grid.cell_count() * d2q9::Q * sizeof(double);
    record("File size matches the layout", fs::file_size(path) == expected_size);
    fs::remove(path);
}

void test_restart_from_file() {
    Config config = channel(40);
    const std::string path = temp_path("restart.chk");

    Simulation reference(config, cylinder(config));
    reference.step(15);
    io::write_checkpoint(path, reference.distribution(), reference.step_index());
    reference.run();

    io::Checkpoint cp = io::read_checkpoint(path);
    Simulation resumed(config, cylinder(config));
    resumed.restore(cp.f, cp.step);
    resumed.run();

    auto cmp = lbflow::test::compare_distributions(reference.distribution(), resumed.distribution());
    record("Restart resumes at the saved step", cp.step == 15);
    record("Restarted run matches the uninterrupted run",
           resumed.state() == SimState::Completed && cmp.max_abs_diff == 0.0);
    fs::remove(path);
}

void test_malformed_checkpoints() {
    record("Missing file rejected", read_throws(temp_path("does_not_exist.chk")));

    const std::string path = temp_path("malformed.chk");
    {
        std::ofstream out(path);
        out << "Nx = 10\nNy = 10\n";
    }
    record("Foreign file rejected", read_throws(path));

    DistributionField f(Grid(6, 4));
    lbflow::test::fill_random(f, 3);
    io::write_checkpoint(path, f, 5);
    const std::vector<char> good = slurp(path);

    std::vector<char> bytes = good;
    bytes.resize(good.size() - sizeof(double));
    spit(path, bytes);
    record("Truncated data rejected", read_throws(path));

    bytes = good;
    bytes.resize(14);
    spit(path, bytes);
    record("Truncated header rejected", read_throws(path));

    bytes = good;
    const std::uint32_t bad_version = 99;
    std::memcpy(bytes.data() + 8, &bad_version, sizeof(bad_version));
    spit(path, bytes);
    record("Unknown version rejected", read_throws(path));

    bytes = good;
    const std::int32_t bad_q = 19;
    std::memcpy(bytes.data() + 20, &bad_q, sizeof(bad_q));
    spit(path, bytes);
    record("Wrong velocity set rejected", read_throws(path));

    bytes = good;
    const std::int32_t bad_step = -3;
    std::memcpy(bytes.data() + 24, &bad_step, sizeof(bad_step));
    spit(path, bytes);
    record("Negative step rejected", read_throws(path));

    bytes = good;
    const std::int32_t huge = 100000;
    std::memcpy(bytes.data() + 12, &huge, sizeof(huge));
    std::memcpy(bytes.data() + 16, &huge, sizeof(huge));
    spit(path, bytes);
    record("Lattice beyond the index range rejected", read_throws(path));

    bytes = good;
    const std::int32_t wide = 4000;
    std::memcpy(bytes.data() + 12, &wide, sizeof(wide));
    spit(path, bytes);
    record("Header larger than the payload rejected", read_throws(path));

    fs::remove(path);

    bool threw = false;
    try {
        io::write_checkpoint(temp_path("no_such_dir/out.chk"), f, 0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    record("Unwritable checkpoint path rejected", threw);
}

void test_vtk_output() {
    const Grid grid(4, 3);
    ScalarField rho(grid, 1.0);
    VectorField u(grid);
    ObstacleMask solid(grid);
    rho(2, 1) = 1.25;
    u.u(1, 0) = 0.3;
    u.v(1, 0) = 0.4;
    solid.set(3, 2, true);

    const std::string path = temp_path("snapshot.vtk");
    io::write_vtk(path, rho, u, solid, 42);
    const std::vector<std::string> lines = read_lines(path);

    record("VTK header", !lines.empty() && lines[0] == "# vtk DataFile Version 3.0");
    record("Step in title", lines.size() > 1 && lines[1] == "LBM flow step 42");
    record("Structured points dataset", find_line(lines, "DATASET STRUCTURED_POINTS") > 0);
    record("Dimensions", find_line(lines, "DIMENSIONS 4 3 1") > 0);
    record("Point count", find_line(lines, "POINT_DATA 12") > 0);

    const int vel = find_line(lines, "VECTORS velocity double");
    bool vel_ok = vel > 0 && static_cast<int>(lines.size()) > vel + 12;
    if (vel_ok) {
        std::istringstream row(lines[vel + 2]);  // node (1, 0)
        double ux = 0.0, uy = 0.0, uz = 1.0;
        row >> ux >> uy >> uz;
        vel_ok = std::abs(ux - 0.3) < 1e-12 && std::abs(uy - 0.4) < 1e-12 && uz == 0.0;
    }
    record("Velocity vectors in row-major order", vel_ok);

    const int den = find_line(lines, "SCALARS density double 1");
    record("Density scalar",
           den > 0 && std::abs(std::stod(lines[den + 2 + grid.index(2, 1)]) - 1.25) < 1e-12);

    const int mag = find_line(lines, "SCALARS velocity_magnitude double 1");
    record("Velocity magnitude scalar",
           mag > 0 && std::abs(std::stod(lines[mag + 2 + grid.index(1, 0)]) - 0.5) < 1e-12);

    const int obs = find_line(lines, "SCALARS obstacle int 1");
    bool obs_ok = obs > 0 && static_cast<int>(lines.size()) >= obs + 2 + grid.cell_count();
    if (obs_ok) {
        for (int idx = 0; idx < grid.cell_count(); ++idx) {
            const std::string expected = (idx == grid.index(3, 2)) ? "1" : "0";
            obs_ok = obs_ok && lines[obs + 2 + idx] == expected;
        }
    }
    record("Obstacle flags", obs_ok);
    fs::remove(path);

    bool threw = false;
    try {
        io::write_vtk(temp_path("no_such_dir/out.vtk"), rho, u, solid);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    record("Unwritable snapshot path rejected", threw);
}

void test_statistics() {
    const Grid grid(3, 2);
    DistributionField f(grid, 0.5);
    ScalarField rho(grid, 1.0);
    VectorField u(grid);
    ObstacleMask solid(grid);

    rho(0, 0) = 0.9;
    rho(2, 1) = 1.2;
    u.u(1, 1) = 0.06;
    u.v(1, 1) = 0.08;
    solid.set(0, 1, true);
    rho(0, 1) = 50.0;   // solid nodes are ignored
    u.u(0, 1) = 3.0;

    const io::FlowStatistics st = io::compute_statistics(f, rho, u, solid);
    record("Fluid node count", st.fluid_cells == 5);
    record("Total mass over all nodes", std::abs(st.total_mass - 0.5 * 6 * d2q9::Q) < 1e-12);
    record("Density range", st.rho_min == 0.9 && st.rho_max == 1.2);
    record("Mean density", std::abs(st.rho_mean - (0.9 + 1.0 + 1.0 + 1.0 + 1.2) / 5.0) < 1e-14);
    record("Max speed", std::abs(st.u_max - 0.1) < 1e-14);
    record("Max Mach number", std::abs(st.mach_max - 0.1 / d2q9::cs) < 1e-12);
    record("Kinetic energy", std::abs(st.kinetic_energy - 0.5 * 0.01) < 1e-14);

    Config config = channel(10);
    Simulation sim(config, cylinder(config));
    const io::FlowStatistics s0 = io::compute_statistics(sim);
    const int solid_nodes = sim.solid().count();
    record("Initial mass equals node count",
           std::abs(s0.total_mass - config.Nx * config.Ny) < 1e-10);
    record("Initial fluid at rest density", std::abs(s0.rho_mean - 1.0) < 1e-14);
    record("Initial speed is the inflow speed", std::abs(s0.u_max - 0.04) < 1e-14);
    record("Solid nodes excluded", s0.fluid_cells == config.Nx * config.Ny - solid_nodes);
}

void test_snapshot_of_simulation() {
    Config config = channel(20);
    Simulation sim(config, cylinder(config));

    const std::string path = temp_path("observer.vtk");
    int written = 0;
    sim.add_observer([&](const Simulation& s) {
        io::write_vtk(path, s);
        ++written;
    }, 10);
    sim.run();

    const std::vector<std::string> lines = read_lines(path);
    record("Observer wrote snapshots", written == 2);
    record("Last snapshot is the final step", lines.size() > 1 && lines[1] == "LBM flow step 20");
    fs::remove(path);
}

int main() {
    return lbflow::test::harness::run_sections("I/O Tests", {
        {"Checkpoint round trip", test_checkpoint_round_trip},
        {"Restart from file", test_restart_from_file},
        {"Malformed checkpoints", test_malformed_checkpoints},
        {"VTK output", test_vtk_output},
        {"Statistics", test_statistics},
        {"Simulation snapshot", test_snapshot_of_simulation}
    });
}
