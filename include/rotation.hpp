#pragma once

#include "linalg.hpp"

// Rotation matrices about principal axes
Mat3 rotX(double angle);
Mat3 rotY(double angle);
Mat3 rotZ(double angle);

// Body-to-NED direction cosine matrix for a 3-2-1 (yaw, pitch, roll) sequence.
// Multiplying a body-frame vector by the result gives its NED components.
// phi: roll, theta: pitch, psi: yaw (radians)
Mat3 eulerToDcm(double phi, double theta, double psi);

// Same, with euler = [phi, theta, psi]
Mat3 eulerToDcm(const Vec3& euler);

// Euler angle rates [dphi, dtheta, dpsi] from body rates [p, q, r].
// cos_eps is added to cos(theta) in the yaw-rate denominator; dphi keeps the
// plain tan(theta) and is unbounded at theta = +-90 deg.
Vec3 eulerRates(const Vec3& euler, const Vec3& pqr, double cos_eps);
