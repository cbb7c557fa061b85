#pragma once

#include "eom.hpp"

#include <functional>
#include <string>

// Integration schemes selectable by the simulator
enum class IntegrationMethod {
    RK4,
    Euler,
    Adaptive
};

// Accepts "rk4", "euler", "adaptive" (or "diffrax"), case-insensitive.
// Throws ConfigError for anything else.
IntegrationMethod parseIntegrationMethod(const std::string& name);
std::string methodName(IntegrationMethod method);

// Derivative of the integrated state at time t
using DerivativeFunc = std::function<StateDerivative(double t, const SixDofState& y)>;

// Binds a body and a load source into a derivative function
DerivativeFunc makeDerivativeFunc(const RigidBody& body, const ForceMomentSource& loads);

// Binds a body and constant loads into a derivative function
DerivativeFunc makeDerivativeFunc(const RigidBody& body, const Vec3& force, const Vec3& moment);

struct StepResult {
    SixDofState state;
    Accelerations accel;  // Accelerations from the final evaluation of the step
};

// Fixed-step scheme signature, shared by Euler and RK4
using StepFunc = StepResult (*)(double t, double h, const SixDofState& y, const DerivativeFunc& f);

StepResult stepEuler(double t, double h, const SixDofState& y, const DerivativeFunc& f);

StepResult stepRK4(double t, double h, const SixDofState& y, const DerivativeFunc& f);

// Convenience wrappers for constant loads
StepResult stepEuler(double h, const SixDofState& y, const RigidBody& body,
                     const Vec3& force, const Vec3& moment);

StepResult stepRK4(double h, const SixDofState& y, const RigidBody& body,
                   const Vec3& force, const Vec3& moment);

// Step function for a fixed-step method; nullptr for Adaptive
StepFunc fixedStepFunction(IntegrationMethod method);
