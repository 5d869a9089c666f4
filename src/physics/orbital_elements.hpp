#ifndef SOLCAT_ORBITAL_ELEMENTS_HPP
#define SOLCAT_ORBITAL_ELEMENTS_HPP

#include <string>

namespace solcat {

// Constants
constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;

constexpr double AU_TO_MM = 149597.8707;          // Astronomical unit [Mm]
constexpr double SECONDS_PER_DAY = 86400.0;
constexpr double J2000_JD = 2451545.0;            // Canonical catalog epoch

// Well-known body ids
constexpr const char* SSB_ID = "0";               // Solar-system barycenter
constexpr const char* SUN_ID = "10";

/**
 * @brief Osculating (Keplerian) orbital elements at an epoch
 *
 * Same field names as the persisted catalog. Angles in radians,
 * semi-major axis in megameters, period in days.
 */
struct OsculatingElements {
    double epoch;          // Julian Date
    std::string ref_id;    // Body the orbit is measured around

    double a;              // Semi-major axis [Mm]
    double e;              // Eccentricity; 1.0 marks a degenerate set
    double i;              // Inclination [rad]
    double O;              // Longitude of ascending node [rad]
    double w;              // Argument of periapsis [rad]
    double M;              // Mean anomaly at epoch [rad]
    double p;              // Sidereal orbital period [days]

    OsculatingElements()
        : epoch(0), a(0), e(0), i(0), O(0), w(0), M(0), p(0) {}

    OsculatingElements(double epoch_, const std::string& ref,
                       double a_, double e_, double i_, double O_,
                       double w_, double M_, double p_)
        : epoch(epoch_), ref_id(ref), a(a_), e(e_), i(i_),
          O(O_), w(w_), M(M_), p(p_) {}

    bool is_heliocentric() const { return ref_id == SUN_ID; }

    // The e == 1 sentinel: present for uniformity, never solved
    bool is_degenerate() const { return e == 1.0; }

    // Mean motion n = 2*pi / p [rad/day]
    double mean_motion() const;

    // Gravitational parameter implied by Kepler's third law, n^2 a^3 [Mm^3/day^2]
    double proxy_mu() const;
};

/**
 * @brief Degenerate element set used where a body has no solvable orbit
 *
 * e = 1 (sentinel), all other elements zero.
 */
OsculatingElements make_degenerate_elements(double epoch, const std::string& ref_id);

} // namespace solcat

#endif // SOLCAT_ORBITAL_ELEMENTS_HPP
