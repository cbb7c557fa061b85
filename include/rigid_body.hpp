#pragma once

#include "linalg.hpp"

// Mass properties of the simulated body. Validated once at construction;
// the inertia inverse is cached so the equations of motion never invert.
class RigidBody {
public:
    // Throws ConfigError if mass is not finite and > 0,
    // SingularMatrixError if inertia is not finite or not invertible.
    RigidBody(double mass, const Mat3& inertia);

    // Diagonal inertia [Ixx, Iyy, Izz]
    RigidBody(double mass, const Vec3& principal_inertia);

    double mass() const { return mass_; }
    const Mat3& inertia() const { return inertia_; }
    const Mat3& inertiaInverse() const { return inertia_inv_; }

private:
    double mass_;
    Mat3 inertia_;
    Mat3 inertia_inv_;
};
