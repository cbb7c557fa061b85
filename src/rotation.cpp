#include "rotation.hpp"

#include <cmath>

Mat3 rotX(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    Mat3 R;
    R << 1,  0,  0,
         0,  c, -s,
         0,  s,  c;
    return R;
}

Mat3 rotY(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    Mat3 R;
    R <<  c, 0, s,
          0, 1, 0,
         -s, 0, c;
    return R;
}

Mat3 rotZ(double angle) {
    double c = std::cos(angle);
    double s = std::sin(angle);
    Mat3 R;
    R << c, -s, 0,
         s,  c, 0,
         0,  0, 1;
    return R;
}

Mat3 eulerToDcm(double phi, double theta, double psi) {
    // Yaw first, then pitch, then roll
    return rotZ(psi) * rotY(theta) * rotX(phi);
}

Mat3 eulerToDcm(const Vec3& euler) {
    return eulerToDcm(euler.x(), euler.y(), euler.z());
}

Vec3 eulerRates(const Vec3& euler, const Vec3& pqr, double cos_eps) {
    const double sphi = std::sin(euler.x());
    const double cphi = std::cos(euler.x());
    const double ttheta = std::tan(euler.y());
    const double p = pqr.x();
    const double q = pqr.y();
    const double r = pqr.z();

    Vec3 rates;
    rates << p + q * sphi * ttheta + r * cphi * ttheta,
             q * cphi - r * sphi,
             (q * sphi + r * cphi) / (std::cos(euler.y()) + cos_eps);
    return rates;
}
