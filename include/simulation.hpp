#pragma once

/// @file simulation.hpp
/// @brief Timestep driver owning the distribution buffers
///
/// Per step (Running only):
///   equilibrium(rho, u) -> BGK collision in place -> stream into the spare
///   buffer -> boundary pass on the spare buffer -> swap -> extract rho, u
///   from the new buffer -> stability check.
/// The macroscopic fields therefore always describe the current distribution.

#include "boundary.hpp"
#include "config.hpp"
#include "fields.hpp"
#include "stability.hpp"
#include <atomic>
#include <functional>
#include <vector>

namespace lbflow {

enum class SimState {
    Initialized,    ///< Constructed, populations may still be replaced
    Running,        ///< Stepping (also while paused by a stop request)
    Completed,      ///< max_steps reached
    Failed          ///< Numerical instability detected, terminal
};

const char* to_string(SimState state);

/// D2Q9 BGK simulation of flow around an obstacle
class Simulation {
public:
    /// Called with the simulation after a completed step
    using Observer = std::function<void(const Simulation&)>;

    /// Initial density at (x, y)
    using DensityInit = std::function<double(double x, double y)>;
    /// Initial velocity at (x, y)
    using VelocityInit = std::function<void(double x, double y, double& u, double& v)>;

    /// config must be finalized. obstacle must cover an Nx x Ny grid.
    /// Throws ConfigError for invalid parameters or geometry.
    Simulation(const Config& config, const ObstacleMask& obstacle);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /// Replace the populations by feq(rho(x, y), u(x, y)) on fluid nodes and
    /// feq(rho, 0) on solid nodes. Initialized state only (std::logic_error).
    void initialize_equilibrium(const DensityInit& rho_fn, const VelocityInit& vel_fn);

    /// Load populations and step index (checkpoint restart).
    /// Initialized state only (std::logic_error); grid mismatch throws
    /// std::runtime_error.
    void restore(const DistributionField& f, int step);

    /// Initialized -> Running (or straight to Completed / Failed).
    /// Returns true if the simulation is Running afterwards.
    bool start();

    /// Advance one step. Starts the simulation if needed.
    /// Returns false without doing anything in Completed / Failed,
    /// and false after the step that fails or completes the run.
    bool step();

    /// Advance up to n steps, returns the number of steps taken.
    /// Stops early on completion, failure or a stop request.
    int step(int n);

    /// Step until Completed, Failed, or a stop request
    SimState run();

    /// Ask a running step loop to return after the current step.
    /// Safe to call from another thread.
    void request_stop() { stop_requested_.store(true); }
    bool stop_requested() const { return stop_requested_.load(); }

    /// Register an observer called after every step whose index is a
    /// multiple of every_n
    void add_observer(Observer fn, int every_n = 1);

    SimState state() const { return state_; }
    int step_index() const { return step_; }

    /// Simulation time in lattice units (dt = 1)
    double time() const { return static_cast<double>(step_); }

    /// Last-known stability status
    const StabilityReport& stability() const { return stability_; }

    /// Consecutive steps over the velocity bound
    int unstable_streak() const { return unstable_streak_; }

    const ScalarField& density() const { return rho_; }
    const VectorField& velocity() const { return u_; }
    const DistributionField& distribution() const { return f_; }

    const Grid& grid() const { return grid_; }
    const Config& config() const { return config_; }
    const BoundarySpec& boundary() const { return bc_; }
    const ObstacleMask& obstacle() const { return obstacle_; }
    const ObstacleMask& solid() const { return solid_; }

    /// Sum of all populations
    double total_mass() const { return f_.total_mass(); }

private:
    void initialize_default();
    void update_macroscopic();
    void check_stability();
    void fail(const StabilityReport& report);
    void notify_observers();

    struct ObserverEntry {
        Observer fn;
        int every = 1;
    };

    Grid grid_;
    Config config_;
    BoundarySpec bc_;

    ObstacleMask obstacle_;
    ObstacleMask walls_;        ///< Wall layers minus obstacle nodes
    ObstacleMask solid_;        ///< obstacle_ united with walls_

    // Double-buffered populations; only step() swaps them
    DistributionField f_;
    DistributionField f_next_;
    DistributionField feq_;

    ScalarField rho_;
    VectorField u_;

    SimState state_ = SimState::Initialized;
    int step_ = 0;
    int unstable_streak_ = 0;
    StabilityReport stability_;
    StabilityReport extraction_;    ///< Result of the last macroscopic extraction

    std::atomic<bool> stop_requested_{false};
    std::vector<ObserverEntry> observers_;
};

} // namespace lbflow
