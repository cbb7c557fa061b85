#include "sim_setup.hpp"
#include "errors.hpp"

#include <cmath>
#include <vector>

namespace {

constexpr double DEG_TO_RAD = M_PI / 180.0;

}  // namespace

Vec3 readVec3(const Config& cfg, const std::string& key, const Vec3& default_val) {
    if (!cfg.has(key)) {
        return default_val;
    }
    std::vector<double> values = cfg.getDoubleList(key);
    if (values.size() != 3) {
        throw ConfigError("'" + key + "' expects 3 values, got " + std::to_string(values.size()));
    }
    return Vec3(values[0], values[1], values[2]);
}

RigidBody readRigidBody(const Config& cfg) {
    double mass = cfg.getDouble("mass");
    std::vector<double> inertia = cfg.getDoubleList("inertia");

    Mat3 I = Mat3::Zero();
    if (inertia.size() == 3) {
        I.diagonal() << inertia[0], inertia[1], inertia[2];
    } else if (inertia.size() == 9) {
        for (int row = 0; row < 3; ++row) {
            for (int col = 0; col < 3; ++col) {
                I(row, col) = inertia[static_cast<size_t>(3 * row + col)];
            }
        }
    } else {
        throw ConfigError("'inertia' expects 3 (diagonal) or 9 (row-major) values, got " +
                          std::to_string(inertia.size()));
    }

    return RigidBody(mass, I);
}

SixDofState readInitialState(const Config& cfg) {
    SixDofState s;
    s.Ve = readVec3(cfg, "Ve0", Vec3::Zero());
    s.Xe = readVec3(cfg, "Xe0", Vec3::Zero());
    s.Vb = readVec3(cfg, "Vb0", Vec3::Zero());
    s.euler = readVec3(cfg, "euler0", Vec3::Zero());
    s.pqr = readVec3(cfg, "pqr0", Vec3::Zero());

    if (cfg.getBool("euler0_deg", false)) {
        s.euler *= DEG_TO_RAD;
    }
    return s;
}

SimulatorOptions readSimulatorOptions(const Config& cfg) {
    SimulatorOptions opts;
    opts.method = parseIntegrationMethod(cfg.getString("method", "rk4"));
    opts.fixed_step_size = cfg.getDouble("dt", opts.fixed_step_size);

    AdaptiveOptions& a = opts.adaptive;
    a.rtol = cfg.getDouble("rtol", a.rtol);
    a.atol = cfg.getDouble("atol", a.atol);
    a.dt_min = cfg.getDouble("dt_min", a.dt_min);
    a.dt_max = cfg.getDouble("dt_max", a.dt_max);
    a.max_steps = cfg.getInt("max_steps", a.max_steps);

    if (!std::isfinite(opts.fixed_step_size) || opts.fixed_step_size <= 0.0) {
        throw ConfigError("'dt' must be finite and > 0");
    }
    if (opts.method == IntegrationMethod::Adaptive) {
        validateAdaptiveOptions(a);
    }
    return opts;
}

ForceMoment readLoads(const Config& cfg) {
    return ForceMoment(readVec3(cfg, "force", Vec3::Zero()),
                       readVec3(cfg, "moment", Vec3::Zero()));
}

TimeSpan readTimeSpan(const Config& cfg) {
    TimeSpan span;
    span.t0 = cfg.getDouble("t0", 0.0);
    span.t1 = cfg.getDouble("t1");
    if (!std::isfinite(span.t0) || !std::isfinite(span.t1) || span.t1 <= span.t0) {
        throw ConfigError("'t1' must be greater than 't0'");
    }
    return span;
}

RunSettings readRunSettings(const Config& cfg) {
    RunSettings settings;
    settings.print_every = cfg.getInt("print_every", settings.print_every);
    if (settings.print_every <= 0) {
        throw ConfigError("'print_every' must be > 0");
    }
    return settings;
}
