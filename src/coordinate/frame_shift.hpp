#ifndef SOLCAT_FRAME_SHIFT_HPP
#define SOLCAT_FRAME_SHIFT_HPP

#include "core/state_vector.hpp"
#include "physics/orbital_elements.hpp"
#include <stdexcept>
#include <string>

namespace solcat {

class FrameShiftError : public std::runtime_error {
public:
    explicit FrameShiftError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Heliocentric to solar-system-barycentric shift at J2000
 *
 * Not a general frame transform: the Sun's barycentric state is a single
 * fixed 6-vector valid only at the canonical epoch, so only states tagged
 * with that epoch are accepted.
 */
class FrameShift {
public:
    // Sun position wrt the SSB at J2000, ecliptic [Mm]
    static const Vec3 SUN_SSB_POSITION_J2000;

    // Sun velocity wrt the SSB at J2000, ecliptic [Mm/s]
    static const Vec3 SUN_SSB_VELOCITY_J2000;

    /**
     * @brief Shift a heliocentric state to the barycentric frame
     * @param state Heliocentric state tagged with the canonical epoch
     * @return Same state relative to the SSB
     * @throws FrameShiftError on a different epoch or an already barycentric state
     */
    static StateVector to_barycentric(const StateVector& state);

private:
    static Vec3 velocity_offset(VelocityUnit unit);
    static void check_epoch(const StateVector& state);
};

} // namespace solcat

#endif // SOLCAT_FRAME_SHIFT_HPP
