#include "core/state_vector.hpp"
#include <stdexcept>

namespace solcat {

std::string frame_to_string(CoordinateFrame frame) {
    switch (frame) {
        case CoordinateFrame::HELIOCENTRIC_ECLIPTIC: return "HELIOCENTRIC_ECLIPTIC";
        case CoordinateFrame::BARYCENTRIC_ECLIPTIC:  return "BARYCENTRIC_ECLIPTIC";
        default:                                     return "BARYCENTRIC_ECLIPTIC";
    }
}

std::string velocity_unit_to_string(VelocityUnit unit) {
    switch (unit) {
        case VelocityUnit::PER_SECOND: return "per_second";
        case VelocityUnit::PER_DAY:    return "per_day";
        default:                       return "per_second";
    }
}

VelocityUnit string_to_velocity_unit(const std::string& s) {
    if (s == "per_second") return VelocityUnit::PER_SECOND;
    if (s == "per_day")    return VelocityUnit::PER_DAY;
    throw std::runtime_error("Unknown velocity unit: '" + s + "'");
}

} // namespace solcat
