#include "integrator.hpp"
#include "errors.hpp"
#include "parse_utils.hpp"

namespace {

// y + h * k
SixDofState offset(const SixDofState& y, double h, const StateDerivative& k) {
    return SixDofState(
        y.Ve + h * k.dVe,
        y.Xe + h * k.dXe,
        y.Vb + h * k.dVb,
        y.euler + h * k.deuler,
        y.pqr + h * k.dpqr
    );
}

}  // namespace

IntegrationMethod parseIntegrationMethod(const std::string& name) {
    const std::string key = parseutil::toLowerCopy(parseutil::trimCopy(name));
    if (key == "rk4") return IntegrationMethod::RK4;
    if (key == "euler") return IntegrationMethod::Euler;
    if (key == "adaptive" || key == "diffrax") return IntegrationMethod::Adaptive;
    throw ConfigError("Unknown integration method '" + name +
                      "' (expected 'rk4', 'euler' or 'adaptive')");
}

std::string methodName(IntegrationMethod method) {
    switch (method) {
        case IntegrationMethod::RK4: return "rk4";
        case IntegrationMethod::Euler: return "euler";
        case IntegrationMethod::Adaptive: return "adaptive";
    }
    return "unknown";
}

DerivativeFunc makeDerivativeFunc(const RigidBody& body, const ForceMomentSource& loads) {
    if (!loads) {
        throw ConfigError("Force/moment source is empty");
    }
    return [body, loads](double t, const SixDofState& y) {
        ForceMoment fm = loads(t, y);
        return equationOfMotion(y, body, fm.force, fm.moment);
    };
}

DerivativeFunc makeDerivativeFunc(const RigidBody& body, const Vec3& force, const Vec3& moment) {
    return [body, force, moment](double, const SixDofState& y) {
        return equationOfMotion(y, body, force, moment);
    };
}

StepResult stepEuler(double t, double h, const SixDofState& y, const DerivativeFunc& f) {
    StateDerivative k1 = f(t, y);
    return {offset(y, h, k1), k1.accelerations()};
}

StepResult stepRK4(double t, double h, const SixDofState& y, const DerivativeFunc& f) {
    StateDerivative k1 = f(t, y);
    StateDerivative k2 = f(t + 0.5 * h, offset(y, 0.5 * h, k1));
    StateDerivative k3 = f(t + 0.5 * h, offset(y, 0.5 * h, k2));
    StateDerivative k4 = f(t + h, offset(y, h, k3));

    // Combine: y_new = y + (h/6) * (k1 + 2*k2 + 2*k3 + k4)
    const double h6 = h / 6.0;
    SixDofState next(
        y.Ve + h6 * (k1.dVe + 2.0 * k2.dVe + 2.0 * k3.dVe + k4.dVe),
        y.Xe + h6 * (k1.dXe + 2.0 * k2.dXe + 2.0 * k3.dXe + k4.dXe),
        y.Vb + h6 * (k1.dVb + 2.0 * k2.dVb + 2.0 * k3.dVb + k4.dVb),
        y.euler + h6 * (k1.deuler + 2.0 * k2.deuler + 2.0 * k3.deuler + k4.deuler),
        y.pqr + h6 * (k1.dpqr + 2.0 * k2.dpqr + 2.0 * k3.dpqr + k4.dpqr)
    );
    return {next, k4.accelerations()};
}

StepResult stepEuler(double h, const SixDofState& y, const RigidBody& body,
                     const Vec3& force, const Vec3& moment) {
    return stepEuler(0.0, h, y, makeDerivativeFunc(body, force, moment));
}

StepResult stepRK4(double h, const SixDofState& y, const RigidBody& body,
                   const Vec3& force, const Vec3& moment) {
    return stepRK4(0.0, h, y, makeDerivativeFunc(body, force, moment));
}

StepFunc fixedStepFunction(IntegrationMethod method) {
    switch (method) {
        case IntegrationMethod::RK4: return &stepRK4;
        case IntegrationMethod::Euler: return &stepEuler;
        case IntegrationMethod::Adaptive: return nullptr;
    }
    return nullptr;
}
