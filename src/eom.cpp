#include "eom.hpp"
#include "rotation.hpp"

IntegratedVector toVector(const StateDerivative& d) {
    IntegratedVector v;
    v << d.dVe, d.dXe, d.dVb, d.deuler, d.dpqr;
    return v;
}

StateDerivative equationOfMotion(
    const SixDofState& state,
    const RigidBody& body,
    const Vec3& force_body,
    const Vec3& moment_body
) {
    const double u = state.Vb.x();
    const double v = state.Vb.y();
    const double w = state.Vb.z();
    const double p = state.pqr.x();
    const double q = state.pqr.y();
    const double r = state.pqr.z();

    StateDerivative d;

    // Body to NED
    Mat3 dcm = eulerToDcm(state.euler);
    d.dXe = dcm * state.Vb;

    // Translational dynamics in the rotating body frame
    const double inv_m = 1.0 / body.mass();
    d.dVb << force_body.x() * inv_m + r * v - q * w,
             force_body.y() * inv_m + p * w - r * u,
             force_body.z() * inv_m + q * u - p * v;
    d.dVe = dcm * d.dVb;

    // Euler's rigid-body equations
    const Mat3& I = body.inertia();
    d.dpqr = body.inertiaInverse() * (moment_body - state.pqr.cross(I * state.pqr));

    d.deuler = eulerRates(state.euler, state.pqr, GIMBAL_EPSILON);

    return d;
}

PackedState packedDerivative(
    const SixDofState& state,
    const RigidBody& body,
    const Vec3& force_body,
    const Vec3& moment_body
) {
    StateDerivative d = equationOfMotion(state, body, force_body, moment_body);
    PackedState out;
    out << toVector(d), d.dVb, d.dpqr;
    return out;
}
