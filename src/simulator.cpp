#include "simulator.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

bool isFinite(const SixDofState& s) {
    return toVector(s).allFinite();
}

// Equal sub-steps needed so that none exceeds h. An interval within 1e-9 h
// of a multiple of h gets no extra sub-step.
int subStepCount(double interval, double h) {
    const double ratio = interval / h;
    return std::max(1, static_cast<int>(std::ceil(ratio - 1e-9)));
}

}  // namespace

PackedState Trajectory::packed(size_t i) const {
    return toPackedVector(states.at(i), accelerations.at(i));
}

std::vector<double> buildTimeGrid(double t0, double t1, double step) {
    if (!std::isfinite(step) || step <= 0.0) {
        throw ConfigError("step size must be finite and > 0 (got " + std::to_string(step) + ")");
    }
    if (!std::isfinite(t0) || !std::isfinite(t1) || t1 <= t0) {
        throw ConfigError("time span must satisfy t0 < t1 (got t0=" + std::to_string(t0) +
                          ", t1=" + std::to_string(t1) + ")");
    }

    double n_real = std::ceil((t1 - t0) / step);
    size_t n = (n_real < 2.0) ? 2 : static_cast<size_t>(n_real);

    std::vector<double> grid(n);
    const double spacing = (t1 - t0) / static_cast<double>(n - 1);
    for (size_t i = 0; i < n; ++i) {
        grid[i] = t0 + spacing * static_cast<double>(i);
    }
    grid.back() = t1;
    return grid;
}

Simulator::Simulator(const RigidBody& body, IntegrationMethod method, double fixed_step_size,
                     const AdaptiveOptions& adaptive)
    : body_(body),
      method_(method),
      step_size_(fixed_step_size),
      adaptive_(adaptive),
      step_(fixedStepFunction(method)) {
    if (!std::isfinite(fixed_step_size) || fixed_step_size <= 0.0) {
        throw ConfigError("fixed step size must be finite and > 0 (got " +
                          std::to_string(fixed_step_size) + ")");
    }
    if (method_ == IntegrationMethod::Adaptive) {
        validateAdaptiveOptions(adaptive_);
    }
}

Simulator::Simulator(const RigidBody& body, const SimulatorOptions& options)
    : Simulator(body, options.method, options.fixed_step_size, options.adaptive) {}

Trajectory Simulator::run(const SixDofState& initial, const Vec3& force, const Vec3& moment,
                          double t0, double t1) const {
    if (!force.allFinite() || !moment.allFinite()) {
        throw ConfigError("force and moment must be finite");
    }
    return integrate(initial, makeDerivativeFunc(body_, force, moment), t0, t1);
}

Trajectory Simulator::run(const SixDofState& initial, const ForceMomentSource& loads,
                          double t0, double t1) const {
    return integrate(initial, makeDerivativeFunc(body_, loads), t0, t1);
}

StepResult Simulator::advance(const SixDofState& state, const Vec3& force, const Vec3& moment,
                              double h) const {
    if (!std::isfinite(h) || h <= 0.0) {
        throw ConfigError("step size must be finite and > 0");
    }
    DerivativeFunc f = makeDerivativeFunc(body_, force, moment);
    if (step_ != nullptr) {
        return step_(0.0, h, state, f);
    }
    std::vector<StepResult> out = solveAdaptive(f, state, 0.0, h, h, {h}, adaptive_);
    return out.back();
}

Trajectory Simulator::integrate(const SixDofState& initial, const DerivativeFunc& f,
                                double t0, double t1) const {
    if (!isFinite(initial)) {
        throw ConfigError("initial state must be finite");
    }

    Trajectory traj;
    traj.time = buildTimeGrid(t0, t1, step_size_);
    const size_t n = traj.time.size();

    if (step_ == nullptr) {
        std::vector<StepResult> samples =
            solveAdaptive(f, initial, t0, t1, step_size_, traj.time, adaptive_);
        traj.states.reserve(n);
        traj.accelerations.reserve(n);
        for (const auto& s : samples) {
            traj.states.push_back(s.state);
            traj.accelerations.push_back(s.accel);
        }
        return traj;
    }

    traj.states.reserve(n);
    traj.accelerations.reserve(n);

    // Sample 0 is the initial state with the accelerations it produces
    SixDofState state = initial;
    traj.states.push_back(state);
    traj.accelerations.push_back(f(t0, state).accelerations());

    // Each grid interval is covered by equal sub-steps no longer than the
    // configured step; the sample keeps the last sub-step's accelerations
    for (size_t i = 0; i + 1 < n; ++i) {
        const double t = traj.time[i];
        const double interval = traj.time[i + 1] - t;
        const int substeps = subStepCount(interval, step_size_);
        const double h = interval / static_cast<double>(substeps);

        StepResult r;
        for (int k = 0; k < substeps; ++k) {
            r = step_(t + h * static_cast<double>(k), h, state, f);
            state = r.state;
        }
        traj.states.push_back(state);
        traj.accelerations.push_back(r.accel);
    }

    return traj;
}
