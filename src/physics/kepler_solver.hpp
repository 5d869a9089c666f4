/**
 * Kepler Solver
 *
 * Converts heliocentric osculating elements at their epoch into a
 * Cartesian state at another instant:
 *   1. Advance the query time by whole periods until it is not before the epoch
 *   2. Advance the mean anomaly with n = 2*pi/p
 *   3. Solve Kepler's equation E - e*sin(E) = M by Newton-Raphson
 *   4. Compute true anomaly, radius and orbital-plane position/velocity
 *   5. Rotate by w, i, O into the J2000 ecliptic frame of the reference body
 *
 * The gravitational parameter is not an input: it is implied by the period
 * and semi-major axis (u = n^2 a^3), so the two must be consistent.
 */

#ifndef SOLCAT_KEPLER_SOLVER_HPP
#define SOLCAT_KEPLER_SOLVER_HPP

#include "core/state_vector.hpp"
#include "physics/orbital_elements.hpp"
#include <stdexcept>
#include <string>

namespace solcat {

// ─────────────────────────────────────────────────────────────
// Errors (fatal for the record being solved)
// ─────────────────────────────────────────────────────────────

class SolverError : public std::runtime_error {
public:
    explicit SolverError(const std::string& msg) : std::runtime_error(msg) {}
};

// Orbit is not measured around the Sun
class UnsupportedCenterError : public SolverError {
public:
    explicit UnsupportedCenterError(const std::string& msg) : SolverError(msg) {}
};

// Period is zero, negative or not finite
class InvalidPeriodError : public SolverError {
public:
    explicit InvalidPeriodError(const std::string& msg) : SolverError(msg) {}
};

// Eccentricity outside [0, 1)
class UnsupportedOrbitError : public SolverError {
public:
    explicit UnsupportedOrbitError(const std::string& msg) : SolverError(msg) {}
};

// ─────────────────────────────────────────────────────────────
// Options and diagnostics
// ─────────────────────────────────────────────────────────────

/**
 * @brief What the epoch field of a solved StateVector holds
 */
enum class EpochTag {
    CANONICAL_LABEL,   // Fixed canonical epoch, whatever the query time
    QUERY_TIME         // The instant the state was solved for
};

struct SolverOptions {
    EpochTag epoch_tag = EpochTag::CANONICAL_LABEL;
    double canonical_epoch = J2000_JD;
    VelocityUnit velocity_unit = VelocityUnit::PER_SECOND;
    double tolerance = 1e-10;      // |E - e*sin(E) - M| [rad]
    int max_iterations = 30;
};

/**
 * @brief Result of the eccentric anomaly iteration
 */
struct AnomalySolution {
    double eccentric_anomaly = 0.0;   // E [rad]
    double residual = 0.0;            // E - e*sin(E) - M at the last iterate
    int iterations = 0;
    bool converged = false;
};

/**
 * @brief Intermediate quantities of one solve, for diagnostics
 */
struct KeplerSolution {
    double query_time = 0.0;       // After forward normalization [JD]
    double mean_anomaly = 0.0;     // M(t) [rad]
    double true_anomaly = 0.0;     // v [rad]
    double radius = 0.0;           // r [Mm]
    double mu = 0.0;               // n^2 a^3 [Mm^3/day^2]
    AnomalySolution anomaly;
};

class KeplerSolver {
public:
    /**
     * @brief Solve heliocentric elements for the state at time t
     * @param elements Osculating elements (ref_id must be the Sun)
     * @param t Query time [JD]
     * @param options Epoch tag, velocity unit and iteration controls
     * @param diagnostics Optional output of intermediate quantities
     * @return State in the heliocentric ecliptic frame
     * @throws UnsupportedCenterError, InvalidPeriodError, UnsupportedOrbitError
     */
    static StateVector solve(const OsculatingElements& elements, double t,
                             const SolverOptions& options = SolverOptions(),
                             KeplerSolution* diagnostics = nullptr);

    /**
     * @brief Newton-Raphson for Kepler's equation, starting from E0 = M
     *
     * Never throws on non-convergence; check AnomalySolution::converged.
     */
    static AnomalySolution solve_anomaly(double mean_anomaly, double eccentricity,
                                         double tolerance = 1e-10,
                                         int max_iterations = 30);

    /**
     * @brief True anomaly from eccentric anomaly
     */
    static double eccentric_to_true_anomaly(double E, double e);

    /**
     * @brief Move t forward by whole periods until t >= epoch
     * @throws InvalidPeriodError if period is not positive
     */
    static double normalize_query_time(double t, double epoch, double period);
};

} // namespace solcat

#endif // SOLCAT_KEPLER_SOLVER_HPP
