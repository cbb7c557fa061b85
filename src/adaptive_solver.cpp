#include "adaptive_solver.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

// Dormand-Prince 5(4) Butcher tableau
constexpr double c2 = 1.0 / 5.0;
constexpr double c3 = 3.0 / 10.0;
constexpr double c4 = 4.0 / 5.0;
constexpr double c5 = 8.0 / 9.0;

constexpr double a21 = 1.0 / 5.0;
constexpr double a31 = 3.0 / 40.0;
constexpr double a32 = 9.0 / 40.0;
constexpr double a41 = 44.0 / 45.0;
constexpr double a42 = -56.0 / 15.0;
constexpr double a43 = 32.0 / 9.0;
constexpr double a51 = 19372.0 / 6561.0;
constexpr double a52 = -25360.0 / 2187.0;
constexpr double a53 = 64448.0 / 6561.0;
constexpr double a54 = -212.0 / 729.0;
constexpr double a61 = 9017.0 / 3168.0;
constexpr double a62 = -355.0 / 33.0;
constexpr double a63 = 46732.0 / 5247.0;
constexpr double a64 = 49.0 / 176.0;
constexpr double a65 = -5103.0 / 18656.0;

// 5th order weights (b2 = b7 = 0), also row 7 of the tableau (FSAL)
constexpr double b1 = 35.0 / 384.0;
constexpr double b3 = 500.0 / 1113.0;
constexpr double b4 = 125.0 / 192.0;
constexpr double b5 = -2187.0 / 6784.0;
constexpr double b6 = 11.0 / 84.0;

// Error weights: 5th order minus embedded 4th order
constexpr double e1 = 71.0 / 57600.0;
constexpr double e3 = -71.0 / 16695.0;
constexpr double e4 = 71.0 / 1920.0;
constexpr double e5 = -17253.0 / 339200.0;
constexpr double e6 = 22.0 / 525.0;
constexpr double e7 = -1.0 / 40.0;

constexpr double MAX_GROWTH = 5.0;
constexpr double MAX_SHRINK = 0.1;
constexpr double MIN_SHRINK_ON_ACCEPT = 0.2;

IntegratedVector evalVec(const DerivativeFunc& f, double t, const IntegratedVector& y) {
    return toVector(f(t, fromVector(y)));
}

// Cubic Hermite interpolation on [t, t + h] at fraction s
IntegratedVector hermite(const IntegratedVector& y0, const IntegratedVector& y1,
                         const IntegratedVector& f0, const IntegratedVector& f1,
                         double h, double s) {
    const double s2 = s * s;
    const double s3 = s2 * s;
    const double h00 = 2.0 * s3 - 3.0 * s2 + 1.0;
    const double h10 = s3 - 2.0 * s2 + s;
    const double h01 = -2.0 * s3 + 3.0 * s2;
    const double h11 = s3 - s2;
    return h00 * y0 + h10 * h * f0 + h01 * y1 + h11 * h * f1;
}

StepResult sampleAt(const DerivativeFunc& f, double t, const IntegratedVector& y) {
    SixDofState state = fromVector(y);
    return {state, f(t, state).accelerations()};
}

// Single Dormand-Prince attempt of size h from (t, y) with known k1 = f(t, y):
// 5th-order solution, its derivative (FSAL stage) and the scaled RMS error
struct DormandPrinceStep {
    IntegratedVector y;
    IntegratedVector dydt;
    double error = 0.0;
};

DormandPrinceStep dormandPrinceStep(
    const DerivativeFunc& f,
    double t,
    double h,
    const IntegratedVector& y,
    const IntegratedVector& k1,
    const AdaptiveOptions& opts
) {
    IntegratedVector k2 = evalVec(f, t + c2 * h, y + h * (a21 * k1));
    IntegratedVector k3 = evalVec(f, t + c3 * h, y + h * (a31 * k1 + a32 * k2));
    IntegratedVector k4 = evalVec(f, t + c4 * h, y + h * (a41 * k1 + a42 * k2 + a43 * k3));
    IntegratedVector k5 = evalVec(f, t + c5 * h,
                                  y + h * (a51 * k1 + a52 * k2 + a53 * k3 + a54 * k4));
    IntegratedVector k6 = evalVec(f, t + h,
                                  y + h * (a61 * k1 + a62 * k2 + a63 * k3 + a64 * k4 + a65 * k5));

    DormandPrinceStep out;
    out.y = y + h * (b1 * k1 + b3 * k3 + b4 * k4 + b5 * k5 + b6 * k6);
    out.dydt = evalVec(f, t + h, out.y);

    IntegratedVector err = h * (e1 * k1 + e3 * k3 + e4 * k4 + e5 * k5 + e6 * k6 + e7 * out.dydt);
    IntegratedVector scale = (opts.atol +
        opts.rtol * y.cwiseAbs().cwiseMax(out.y.cwiseAbs()).array()).matrix();
    out.error = std::sqrt((err.cwiseQuotient(scale)).squaredNorm() /
                          static_cast<double>(layout::INTEGRATED_SIZE));
    return out;
}

}  // namespace

void validateAdaptiveOptions(const AdaptiveOptions& opts) {
    // atol > 0 keeps every error scale positive, including components at zero
    if (!(opts.atol > 0.0)) {
        throw ConfigError("atol must be > 0");
    }
    if (!(opts.rtol >= 0.0)) {
        throw ConfigError("rtol must be >= 0");
    }
    if (!(opts.dt_min > 0.0)) {
        throw ConfigError("dt_min must be > 0");
    }
    if (!(opts.dt_max >= 0.0)) {
        throw ConfigError("dt_max must be >= 0 (0 disables the limit)");
    }
    if (opts.dt_max > 0.0 && opts.dt_max < opts.dt_min) {
        throw ConfigError("dt_max must not be smaller than dt_min");
    }
    if (!(opts.safety > 0.0 && opts.safety <= 1.0)) {
        throw ConfigError("safety factor must be in (0, 1]");
    }
    if (opts.max_steps <= 0) {
        throw ConfigError("max_steps must be > 0");
    }
}

std::vector<StepResult> solveAdaptive(
    const DerivativeFunc& f,
    const SixDofState& y0,
    double t0,
    double t1,
    double dt0,
    const std::vector<double>& output_times,
    const AdaptiveOptions& opts,
    AdaptiveStats* stats
) {
    validateAdaptiveOptions(opts);
    if (!std::isfinite(t0) || !std::isfinite(t1) || t1 <= t0) {
        throw ConfigError("adaptive solve requires finite t0 < t1");
    }
    if (!(dt0 > 0.0)) {
        throw ConfigError("initial step hint must be > 0");
    }
    for (size_t i = 0; i < output_times.size(); ++i) {
        const double ts = output_times[i];
        if (ts < t0 || ts > t1 || (i > 0 && ts < output_times[i - 1])) {
            throw ConfigError("output times must be sorted and inside [t0, t1]");
        }
    }

    AdaptiveStats local;
    AdaptiveStats& st = (stats != nullptr) ? *stats : local;
    st = AdaptiveStats();

    DerivativeFunc counted = [&f, &st](double t, const SixDofState& y) {
        ++st.evaluations;
        return f(t, y);
    };

    std::vector<StepResult> samples;
    samples.reserve(output_times.size());

    const double span = t1 - t0;
    const double dt_max = (opts.dt_max > 0.0) ? opts.dt_max : span;
    const double t_eps = 1e-12 * std::max(1.0, std::abs(t1));

    double t = t0;
    IntegratedVector y = toVector(y0);
    IntegratedVector k1 = evalVec(counted, t, y);
    double h = std::min(std::max(dt0, opts.dt_min), dt_max);
    size_t next = 0;

    // Samples sitting on t0 are the initial state
    while (next < output_times.size() && output_times[next] <= t0) {
        samples.push_back(sampleAt(counted, t0, y));
        ++next;
    }

    while (next < output_times.size()) {
        if (st.accepted + st.rejected >= opts.max_steps) {
            throw SolverError("adaptive solver exceeded max_steps=" +
                              std::to_string(opts.max_steps) + " at t=" + std::to_string(t));
        }

        bool last = (t + h >= t1 - t_eps);
        if (last) {
            h = t1 - t;
        }

        DormandPrinceStep step = dormandPrinceStep(counted, t, h, y, k1, opts);
        if (!std::isfinite(step.error)) {
            throw SolverError("adaptive solver produced a non-finite error estimate at t=" +
                              std::to_string(t));
        }

        if (step.error > 1.0) {
            ++st.rejected;
            double factor = opts.safety * std::pow(step.error, -0.25);
            h *= std::max(factor, MAX_SHRINK);
            if (h < opts.dt_min) {
                throw SolverError("adaptive step size fell below dt_min at t=" +
                                  std::to_string(t) + " (error " +
                                  std::to_string(step.error) + ")");
            }
            continue;
        }

        ++st.accepted;
        const double t_new = last ? t1 : t + h;

        // Emit every requested sample covered by this step
        while (next < output_times.size() && output_times[next] <= t_new) {
            const double ts = output_times[next];
            const double s = (ts - t) / (t_new - t);
            IntegratedVector ys = (ts >= t_new) ? step.y : hermite(y, step.y, k1, step.dydt, t_new - t, s);
            samples.push_back(sampleAt(counted, ts, ys));
            ++next;
        }

        t = t_new;
        y = step.y;
        k1 = step.dydt;

        double growth = (step.error < 1e-30)
            ? MAX_GROWTH
            : opts.safety * std::pow(step.error, -0.2);
        growth = std::min(MAX_GROWTH, std::max(MIN_SHRINK_ON_ACCEPT, growth));
        h = std::min(h * growth, dt_max);
        h = std::max(h, opts.dt_min);

        if (last) {
            break;
        }
    }

    return samples;
}
