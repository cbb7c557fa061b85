#include "state.hpp"

IntegratedVector toVector(const SixDofState& s) {
    IntegratedVector v;
    v << s.Ve, s.Xe, s.Vb, s.euler, s.pqr;
    return v;
}

SixDofState fromVector(const IntegratedVector& v) {
    return SixDofState(
        v.segment<3>(layout::VE),
        v.segment<3>(layout::XE),
        v.segment<3>(layout::VB),
        v.segment<3>(layout::EULER),
        v.segment<3>(layout::PQR)
    );
}

PackedState toPackedVector(const SixDofState& s, const Accelerations& a) {
    PackedState v;
    v << toVector(s), a.ab, a.dotpqr;
    return v;
}

SixDofState fromPackedVector(const PackedState& v) {
    return fromVector(v.head<layout::INTEGRATED_SIZE>());
}

Accelerations accelerationsFromPacked(const PackedState& v) {
    return Accelerations(v.segment<3>(layout::AB), v.segment<3>(layout::DOTPQR));
}
