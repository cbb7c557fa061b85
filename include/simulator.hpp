#pragma once

#include "adaptive_solver.hpp"
#include "eom.hpp"
#include "integrator.hpp"
#include "rigid_body.hpp"
#include "state.hpp"

#include <vector>

// Time history of a run: one entry per time grid point
struct Trajectory {
    std::vector<double> time;
    std::vector<SixDofState> states;
    std::vector<Accelerations> accelerations;

    size_t size() const { return time.size(); }

    // Sample i in the packed 21-slot layout
    PackedState packed(size_t i) const;
};

struct SimulatorOptions {
    IntegrationMethod method = IntegrationMethod::RK4;
    double fixed_step_size = 0.01;  // Step size, or initial step hint for Adaptive
    AdaptiveOptions adaptive;
};

// numPoints = ceil((t1 - t0) / step) (at least 2) evenly spaced over [t0, t1].
// Fixed-step runs split each interval into equal sub-steps no longer than step.
// Throws ConfigError for a non-positive step or t1 <= t0.
std::vector<double> buildTimeGrid(double t0, double t1, double step);

class Simulator {
public:
    // Throws ConfigError for a non-positive step size or bad adaptive options
    Simulator(const RigidBody& body, IntegrationMethod method, double fixed_step_size,
              const AdaptiveOptions& adaptive = AdaptiveOptions());
    Simulator(const RigidBody& body, const SimulatorOptions& options);

    // Constant body loads over the whole horizon
    Trajectory run(const SixDofState& initial, const Vec3& force, const Vec3& moment,
                   double t0, double t1) const;

    // Loads from a model evaluated at every derivative evaluation
    Trajectory run(const SixDofState& initial, const ForceMomentSource& loads,
                   double t0, double t1) const;

    // Single step of size h with the configured method
    StepResult advance(const SixDofState& state, const Vec3& force, const Vec3& moment,
                       double h) const;

    const RigidBody& body() const { return body_; }
    IntegrationMethod method() const { return method_; }
    double fixedStepSize() const { return step_size_; }
    const AdaptiveOptions& adaptiveOptions() const { return adaptive_; }

private:
    Trajectory integrate(const SixDofState& initial, const DerivativeFunc& f,
                         double t0, double t1) const;

    RigidBody body_;
    IntegrationMethod method_;
    double step_size_;
    AdaptiveOptions adaptive_;
    StepFunc step_;  // Bound once; nullptr for Adaptive
};
