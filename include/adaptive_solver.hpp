#pragma once

#include "integrator.hpp"

#include <vector>

// Step-size controller settings for the embedded Dormand-Prince 5(4) solver
struct AdaptiveOptions {
    double rtol = 1e-6;      // Relative tolerance (>= 0)
    double atol = 1e-9;      // Absolute tolerance (> 0)
    double dt_min = 1e-10;   // Smallest step before giving up
    double dt_max = 0.0;     // Largest step (0 = no limit)
    double safety = 0.9;     // Step size safety factor
    int max_steps = 100000;  // Accepted + rejected step budget
};

// Counters from one solve
struct AdaptiveStats {
    int accepted = 0;
    int rejected = 0;
    int evaluations = 0;
};

// Validates options, throws ConfigError
void validateAdaptiveOptions(const AdaptiveOptions& opts);

// Integrate from t0 to t1 with local error control and return one sample per
// entry of output_times (sorted, inside [t0, t1]). Samples between internal
// steps are interpolated with a cubic Hermite polynomial built from the step
// end points and their derivatives. A sample at t0 is the initial state.
// Each sample's accelerations are evaluated at the sampled state.
//
// dt0 is the initial step hint. Throws SolverError if the step size drops
// below dt_min, the step budget is exhausted, or the error becomes non-finite.
std::vector<StepResult> solveAdaptive(
    const DerivativeFunc& f,
    const SixDofState& y0,
    double t0,
    double t1,
    double dt0,
    const std::vector<double>& output_times,
    const AdaptiveOptions& opts = AdaptiveOptions(),
    AdaptiveStats* stats = nullptr
);
