#include "coordinate/frame_shift.hpp"
#include <iomanip>
#include <sstream>

namespace solcat {

// JPL Horizons, Sun (10) wrt SSB (500@0), ecliptic J2000, 2000-Jan-01 12:00 TDB
const Vec3 FrameShift::SUN_SSB_POSITION_J2000{
    -1.067598502264559E+03, -4.182343932742174E+02, 3.083761810502339E+01};
const Vec3 FrameShift::SUN_SSB_VELOCITY_J2000{
    9.312570119052345E-06, -1.282474958274199E-05, -1.633335103087856E-07};

Vec3 FrameShift::velocity_offset(VelocityUnit unit) {
    if (unit == VelocityUnit::PER_DAY) {
        return SUN_SSB_VELOCITY_J2000 * SECONDS_PER_DAY;
    }
    return SUN_SSB_VELOCITY_J2000;
}

void FrameShift::check_epoch(const StateVector& state) {
    if (state.epoch != J2000_JD) {
        std::ostringstream oss;
        oss << std::setprecision(15)
            << "Sun-barycenter offset is only known at JD " << J2000_JD
            << ", state is tagged JD " << state.epoch;
        throw FrameShiftError(oss.str());
    }
}

StateVector FrameShift::to_barycentric(const StateVector& state) {
    check_epoch(state);
    if (state.frame != CoordinateFrame::HELIOCENTRIC_ECLIPTIC) {
        throw FrameShiftError("Expected a heliocentric state, got " +
                              frame_to_string(state.frame));
    }

    StateVector out = state;
    out.position = state.position + SUN_SSB_POSITION_J2000;
    out.velocity = state.velocity + velocity_offset(state.velocity_unit);
    out.frame = CoordinateFrame::BARYCENTRIC_ECLIPTIC;
    return out;
}

} // namespace solcat
