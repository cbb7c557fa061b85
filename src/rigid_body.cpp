#include "rigid_body.hpp"
#include "errors.hpp"

#include <cmath>
#include <string>

RigidBody::RigidBody(double mass, const Mat3& inertia)
    : mass_(mass), inertia_(inertia), inertia_inv_(Mat3::Zero()) {
    if (!std::isfinite(mass) || mass <= 0.0) {
        throw ConfigError("mass must be finite and > 0 (got " + std::to_string(mass) + ")");
    }
    if (!inertia.allFinite()) {
        throw SingularMatrixError("inertia tensor contains non-finite entries");
    }

    Eigen::FullPivLU<Mat3> lu(inertia);
    if (!lu.isInvertible()) {
        throw SingularMatrixError("inertia tensor is singular (rank " +
                                  std::to_string(lu.rank()) + ")");
    }
    inertia_inv_ = lu.inverse();
}

RigidBody::RigidBody(double mass, const Vec3& principal_inertia)
    : RigidBody(mass, Mat3(principal_inertia.asDiagonal())) {}
