#include "simulation.hpp"
#include "geometry.hpp"
#include "lbm_kernels.hpp"
#include "timing.hpp"
#include "profiling.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lbflow {

const char* to_string(SimState state) {
    switch (state) {
        case SimState::Initialized: return "initialized";
        case SimState::Running:     return "running";
        case SimState::Completed:   return "completed";
        case SimState::Failed:      return "failed";
    }
    return "unknown";
}

Simulation::Simulation(const Config& config, const ObstacleMask& obstacle)
    : config_(config)
{
    config_.validate();
    grid_ = Grid(config_.Nx, config_.Ny);

    if (obstacle.grid() != grid_) {
        std::ostringstream oss;
        oss << "Obstacle mask is " << obstacle.grid().Nx << " x " << obstacle.grid().Ny
            << " but the lattice is " << grid_.Nx << " x " << grid_.Ny;
        throw ConfigError(oss.str());
    }

    bc_ = make_boundary_spec(config_);
    obstacle_ = obstacle;

    // Wall layers exclude obstacle nodes so both bounce-back passes act on
    // disjoint sets
    walls_ = make_wall_mask(grid_, bc_);
    for (int idx = 0; idx < grid_.cell_count(); ++idx) {
        if (obstacle_.is_solid(idx)) {
            int i, j;
            grid_.inv_index(idx, i, j);
            walls_.set(i, j, false);
        }
    }
    solid_ = obstacle_;
    solid_.merge(walls_);

    validate_geometry(solid_, config_);

    f_ = DistributionField(grid_);
    f_next_ = DistributionField(grid_);
    feq_ = DistributionField(grid_);
    rho_ = ScalarField(grid_, 1.0);
    u_ = VectorField(grid_);

    initialize_default();
}

void Simulation::initialize_default() {
    const double rho0 = config_.inflow_density;
    const InflowProfile profile = bc_.u_inflow;
    initialize_equilibrium(
        [rho0](double, double) { return rho0; },
        [&profile](double, double y, double& u, double& v) {
            u = profile ? profile(y) : 0.0;
            v = 0.0;
        });
}

void Simulation::initialize_equilibrium(const DensityInit& rho_fn, const VelocityInit& vel_fn) {
    if (state_ != SimState::Initialized) {
        throw std::logic_error("Simulation::initialize_equilibrium: simulation already started");
    }
    if (!rho_fn || !vel_fn) {
        throw std::invalid_argument("Simulation::initialize_equilibrium: empty initializer");
    }

    for (int j = 0; j < grid_.Ny; ++j) {
        for (int i = 0; i < grid_.Nx; ++i) {
            const double x = grid_.x(i);
            const double y = grid_.y(j);
            const double r = rho_fn(x, y);
            double u = 0.0;
            double v = 0.0;
            if (!solid_.is_solid(i, j)) {
                vel_fn(x, y, u, v);
            }
            kernels::cell_equilibrium(r, u, v, f_.cell(i, j));
        }
    }
    update_macroscopic();
}

void Simulation::restore(const DistributionField& f, int step) {
    if (state_ != SimState::Initialized) {
        throw std::logic_error("Simulation::restore: simulation already started");
    }
    if (f.grid() != grid_) {
        std::ostringstream oss;
        oss << "Simulation::restore: distribution is " << f.grid().Nx << " x " << f.grid().Ny
            << ", lattice is " << grid_.Nx << " x " << grid_.Ny;
        throw std::runtime_error(oss.str());
    }
    if (step < 0) {
        throw std::invalid_argument("Simulation::restore: negative step index");
    }
    f_ = f;
    step_ = step;
    update_macroscopic();
}

bool Simulation::start() {
    if (state_ != SimState::Initialized) {
        return state_ == SimState::Running;
    }

    state_ = SimState::Running;
    unstable_streak_ = 0;
    check_stability();

    if (state_ == SimState::Running && step_ >= config_.max_steps) {
        state_ = SimState::Completed;
    }
    if (config_.verbose) {
        std::cout << "Simulation " << to_string(state_) << " at step " << step_
                  << " (" << grid_.Nx << " x " << grid_.Ny << ", tau = " << config_.tau << ")\n";
    }
    return state_ == SimState::Running;
}

bool Simulation::step() {
    if (state_ == SimState::Initialized && !start()) {
        return false;
    }
    if (state_ != SimState::Running) {
        return false;
    }

    {
        TIMED_SCOPE("lbm_step");
        NVTX_SCOPE_STEP("lbm:step");

        kernels::compute_equilibrium(rho_, u_, feq_);
        kernels::collide(f_, feq_, config_.tau, solid_);
        kernels::stream(f_, f_next_);
        apply_boundaries(f_next_, obstacle_, walls_, solid_, bc_);
        f_.swap(f_next_);
        ++step_;

        update_macroscopic();
        check_stability();
    }

    if (state_ == SimState::Failed) {
        return false;
    }

    notify_observers();

    if (step_ >= config_.max_steps) {
        state_ = SimState::Completed;
        return false;
    }
    return true;
}

int Simulation::step(int n) {
    int taken = 0;
    for (int k = 0; k < n; ++k) {
        if (stop_requested_.exchange(false)) {
            break;
        }
        const int before = step_;
        const bool more = step();
        if (step_ != before) {
            ++taken;
        }
        if (!more) {
            break;
        }
    }
    return taken;
}

SimState Simulation::run() {
    if (!start()) {
        return state_;
    }
    while (state_ == SimState::Running) {
        if (stop_requested_.exchange(false)) {
            if (config_.verbose) {
                std::cout << "Stop requested, pausing at step " << step_ << "\n";
            }
            break;
        }
        step();
    }
    return state_;
}

void Simulation::add_observer(Observer fn, int every_n) {
    if (!fn) {
        throw std::invalid_argument("Simulation::add_observer: empty observer");
    }
    if (every_n <= 0) {
        throw std::invalid_argument("Simulation::add_observer: every_n must be positive");
    }
    observers_.push_back({std::move(fn), every_n});
}

void Simulation::update_macroscopic() {
    extraction_ = kernels::compute_macroscopic(f_, solid_, rho_, u_);
}

void Simulation::check_stability() {
    if (!extraction_.ok()) {
        StabilityReport report = extraction_;
        report.step = step_;
        fail(report);
        return;
    }

    StabilityReport vb = kernels::check_velocity_bound(u_, solid_, config_.mach_limit);
    vb.step = step_;

    if (vb.count > config_.unstable_cell_tolerance) {
        ++unstable_streak_;
        if (unstable_streak_ > config_.unstable_step_tolerance) {
            fail(vb);
            return;
        }
        if (unstable_streak_ == 1) {
            std::cerr << "WARNING: step " << step_ << ": " << vb.message << "\n";
        }
        stability_ = vb;
    } else {
        unstable_streak_ = 0;
        stability_ = StabilityReport{};
        stability_.step = step_;
    }
}

void Simulation::fail(const StabilityReport& report) {
    stability_ = report;
    state_ = SimState::Failed;
    std::cerr << "ERROR: simulation failed at step " << report.step << ": "
              << to_string(report.kind) << " at node (" << report.i << ", " << report.j
              << "), value " << report.value;
    if (!report.message.empty()) {
        std::cerr << " [" << report.message << "]";
    }
    std::cerr << "\n";
}

void Simulation::notify_observers() {
    for (const auto& obs : observers_) {
        if (step_ % obs.every == 0) {
            obs.fn(*this);
        }
    }
}

} // namespace lbflow
