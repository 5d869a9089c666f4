#ifndef SOLCAT_STATE_VECTOR_HPP
#define SOLCAT_STATE_VECTOR_HPP

#include <cmath>
#include <string>

namespace solcat {

/**
 * @brief Reference frame a state vector is expressed in
 */
enum class CoordinateFrame {
    HELIOCENTRIC_ECLIPTIC,   // Sun-centered, J2000 ecliptic (solver output)
    BARYCENTRIC_ECLIPTIC     // Solar-system barycenter, J2000 ecliptic (catalog)
};

/**
 * @brief Unit of the velocity components
 *
 * Positions are always megameters; velocities are Mm/s in the catalog,
 * but the solver can emit Mm/day when asked to.
 */
enum class VelocityUnit {
    PER_SECOND,
    PER_DAY
};

/**
 * @brief Simple 3D vector
 */
struct Vec3 {
    double x, y, z;

    Vec3() : x(0), y(0), z(0) {}
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double norm() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    static Vec3 Zero() { return Vec3(0, 0, 0); }
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) {
    return Vec3{a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3 operator*(const Vec3& v, double s) {
    return Vec3{v.x * s, v.y * s, v.z * s};
}

inline Vec3 operator/(const Vec3& v, double s) {
    double inv = 1.0 / s;
    return Vec3{v.x * inv, v.y * inv, v.z * inv};
}

/**
 * @brief Dated Cartesian state of one body
 *
 * The epoch is a Julian Date. For solver snapshots it may be the fixed
 * canonical epoch label rather than the instant the state was computed
 * for (see SolverOptions::epoch_tag).
 */
struct StateVector {
    // Julian Date
    double epoch;

    // Position [Mm]
    Vec3 position;

    // Velocity [Mm/s] or [Mm/day], see velocity_unit
    Vec3 velocity;

    CoordinateFrame frame;
    VelocityUnit velocity_unit;

    StateVector()
        : epoch(0.0),
          position(Vec3::Zero()),
          velocity(Vec3::Zero()),
          frame(CoordinateFrame::BARYCENTRIC_ECLIPTIC),
          velocity_unit(VelocityUnit::PER_SECOND) {}

    StateVector(double epoch_, const Vec3& pos, const Vec3& vel)
        : epoch(epoch_),
          position(pos),
          velocity(vel),
          frame(CoordinateFrame::BARYCENTRIC_ECLIPTIC),
          velocity_unit(VelocityUnit::PER_SECOND) {}
};

std::string frame_to_string(CoordinateFrame frame);
std::string velocity_unit_to_string(VelocityUnit unit);

/**
 * @brief Parse a velocity unit name ("per_second" / "per_day")
 * @throws std::runtime_error on an unknown name
 */
VelocityUnit string_to_velocity_unit(const std::string& s);

} // namespace solcat

#endif // SOLCAT_STATE_VECTOR_HPP
