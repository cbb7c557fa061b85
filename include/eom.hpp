#pragma once

#include "linalg.hpp"
#include "rigid_body.hpp"
#include "state.hpp"

#include <functional>

// Body-frame loads acting on the rigid body
struct ForceMoment {
    Vec3 force;   // [Fx, Fy, Fz]
    Vec3 moment;  // [Mx, My, Mz]

    ForceMoment() : force(Vec3::Zero()), moment(Vec3::Zero()) {}
    ForceMoment(const Vec3& f, const Vec3& m) : force(f), moment(m) {}
};

// Load model hook: returns body loads for the current time and state.
// An aerodynamic model binds its control inputs into the callable.
using ForceMomentSource = std::function<ForceMoment(double t, const SixDofState& state)>;

// Gimbal-lock guard added to cos(theta) in the yaw-rate equation.
// Bounds the yaw-rate error near theta = +-90 deg, does not remove it.
constexpr double GIMBAL_EPSILON = 1e-6;

// Time derivative of SixDofState
struct StateDerivative {
    Vec3 dVe;     // NED acceleration
    Vec3 dXe;     // NED velocity
    Vec3 dVb;     // Body acceleration [du, dv, dw]
    Vec3 deuler;  // Euler angle rates
    Vec3 dpqr;    // Body angular acceleration [dp, dq, dr]

    StateDerivative()
        : dVe(Vec3::Zero()), dXe(Vec3::Zero()), dVb(Vec3::Zero()),
          deuler(Vec3::Zero()), dpqr(Vec3::Zero()) {}

    Accelerations accelerations() const { return Accelerations(dVb, dpqr); }
};

IntegratedVector toVector(const StateDerivative& d);

// Compute state derivatives (Newton-Euler equations with 3-2-1 Euler kinematics)
StateDerivative equationOfMotion(
    const SixDofState& state,
    const RigidBody& body,
    const Vec3& force_body,
    const Vec3& moment_body
);

// Derivative in the packed 21-slot layout. The acceleration slots hold the
// accelerations themselves (slots 15-17 == 6-8, 18-20 == 12-14).
PackedState packedDerivative(
    const SixDofState& state,
    const RigidBody& body,
    const Vec3& force_body,
    const Vec3& moment_body
);
