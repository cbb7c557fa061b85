#pragma once

#include "linalg.hpp"

// Slot offsets of the packed 21-component state vector.
// Consumers read the packed vector positionally, so the order is fixed.
namespace layout {
constexpr int VE = 0;       // NED velocity
constexpr int XE = 3;       // NED position
constexpr int VB = 6;       // Body velocity [u, v, w]
constexpr int EULER = 9;    // [roll, pitch, yaw]
constexpr int PQR = 12;     // Body angular rate [p, q, r]
constexpr int AB = 15;      // Last body linear acceleration
constexpr int DOTPQR = 18;  // Last body angular acceleration

constexpr int INTEGRATED_SIZE = 15;
constexpr int PACKED_SIZE = 21;
}  // namespace layout

using IntegratedVector = Eigen::Matrix<double, layout::INTEGRATED_SIZE, 1>;
using PackedState = Eigen::Matrix<double, layout::PACKED_SIZE, 1>;

// Integrated rigid-body state (15 components)
struct SixDofState {
    Vec3 Ve;     // NED velocity
    Vec3 Xe;     // NED position
    Vec3 Vb;     // Body velocity [u, v, w]
    Vec3 euler;  // [phi, theta, psi] (radians)
    Vec3 pqr;    // Body angular rate [p, q, r]

    SixDofState()
        : Ve(Vec3::Zero()), Xe(Vec3::Zero()), Vb(Vec3::Zero()),
          euler(Vec3::Zero()), pqr(Vec3::Zero()) {}

    SixDofState(const Vec3& ve, const Vec3& xe, const Vec3& vb,
                const Vec3& eul, const Vec3& rates)
        : Ve(ve), Xe(xe), Vb(vb), euler(eul), pqr(rates) {}
};

// Accelerations reported alongside each step. Never integrated.
struct Accelerations {
    Vec3 ab;      // [du, dv, dw]
    Vec3 dotpqr;  // [dp, dq, dr]

    Accelerations() : ab(Vec3::Zero()), dotpqr(Vec3::Zero()) {}
    Accelerations(const Vec3& a, const Vec3& dw) : ab(a), dotpqr(dw) {}
};

IntegratedVector toVector(const SixDofState& s);
SixDofState fromVector(const IntegratedVector& v);

// Packed 21-slot layout: integrated state followed by the accelerations
PackedState toPackedVector(const SixDofState& s, const Accelerations& a = Accelerations());
// Slots 15-20 are ignored; they carry no integration history
SixDofState fromPackedVector(const PackedState& v);
Accelerations accelerationsFromPacked(const PackedState& v);
