/**
 * Kepler Solver Implementation
 *
 * References:
 *   Schwarz, "Keplerian Orbit Elements to Cartesian State Vectors" (2017)
 *   Vallado, "Fundamentals of Astrodynamics and Applications", Alg. 2
 */

#include "physics/kepler_solver.hpp"
#include <cmath>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace solcat {

AnomalySolution KeplerSolver::solve_anomaly(double M, double e,
                                            double tolerance, int max_iterations) {
    AnomalySolution sol;

    // Newton-Raphson iteration for Kepler's equation: M = E - e*sin(E)
    double E = M;  // Initial guess
    double residual = E - e * std::sin(E) - M;

    int iter = 0;
    for (; iter < max_iterations; iter++) {
        if (std::abs(residual) <= tolerance) {
            break;
        }
        E -= residual / (1.0 - e * std::cos(E));
        residual = E - e * std::sin(E) - M;
    }

    sol.eccentric_anomaly = E;
    sol.residual = residual;
    sol.iterations = iter;
    sol.converged = std::abs(residual) <= tolerance;
    return sol;
}

double KeplerSolver::eccentric_to_true_anomaly(double E, double e) {
    return 2.0 * std::atan2(std::sqrt(1.0 + e) * std::sin(E / 2.0),
                            std::sqrt(1.0 - e) * std::cos(E / 2.0));
}

double KeplerSolver::normalize_query_time(double t, double epoch, double period) {
    if (!(period > 0.0) || !std::isfinite(period)) {
        std::ostringstream oss;
        oss << "Orbital period must be positive, got " << period;
        throw InvalidPeriodError(oss.str());
    }

    if (t < epoch) {
        // Whole periods only; the loop absorbs rounding of the product
        t += std::floor((epoch - t) / period) * period;
        while (t < epoch) {
            t += period;
        }
    }
    return t;
}

StateVector KeplerSolver::solve(const OsculatingElements& elements, double t,
                                const SolverOptions& options,
                                KeplerSolution* diagnostics) {
    // Orbits around other centers would need compounding with the
    // center's own heliocentric orbit, which is not done here
    if (!elements.is_heliocentric()) {
        throw UnsupportedCenterError("Only heliocentric elements can be solved, got ref_id '" +
                                     elements.ref_id + "'");
    }

    double e = elements.e;
    if (!(e >= 0.0 && e < 1.0)) {
        std::ostringstream oss;
        oss << "Only elliptic orbits can be solved, got e = " << e;
        throw UnsupportedOrbitError(oss.str());
    }

    double a = elements.a;
    double inc = elements.i;
    double O = elements.O;
    double w = elements.w;
    double p = elements.p;
    double epoch = elements.epoch;

    double query = normalize_query_time(t, epoch, p);

    double n = elements.mean_motion();
    double u = elements.proxy_mu();
    double M = elements.M + n * (query - epoch);

    AnomalySolution anomaly = solve_anomaly(M, e, options.tolerance, options.max_iterations);
    if (!anomaly.converged) {
        std::cerr << "[KeplerSolver] WARNING: Kepler's equation did not converge in "
                  << options.max_iterations << " iterations (e = " << e
                  << ", M = " << M << ", residual = " << anomaly.residual
                  << "); using last iterate\n";
    }
    double E = anomaly.eccentric_anomaly;

    double v = eccentric_to_true_anomaly(E, e);

    // Distance
    double r = a * (1.0 - e * std::cos(E));

    // Position in orbital plane
    double x_pf = r * std::cos(v);
    double y_pf = r * std::sin(v);

    // Velocity in orbital plane [Mm/day]
    double scalar = std::sqrt(u * a) / r;
    double vx_pf = -scalar * std::sin(E);
    double vy_pf = scalar * std::sqrt(1.0 - e * e) * std::cos(E);

    // Rotation matrix components
    double cos_w = std::cos(w);
    double sin_w = std::sin(w);
    double cos_O = std::cos(O);
    double sin_O = std::sin(O);
    double cos_i = std::cos(inc);
    double sin_i = std::sin(inc);

    // R = R3(-O) * R1(-i) * R3(-w)
    double r11 = cos_w * cos_O - sin_w * cos_i * sin_O;
    double r12 = -(sin_w * cos_O + cos_w * cos_i * sin_O);
    double r21 = cos_w * sin_O + sin_w * cos_i * cos_O;
    double r22 = cos_w * cos_i * cos_O - sin_w * sin_O;
    double r31 = sin_w * sin_i;
    double r32 = cos_w * sin_i;

    StateVector state;
    state.frame = CoordinateFrame::HELIOCENTRIC_ECLIPTIC;
    state.velocity_unit = options.velocity_unit;

    state.position.x = r11 * x_pf + r12 * y_pf;
    state.position.y = r21 * x_pf + r22 * y_pf;
    state.position.z = r31 * x_pf + r32 * y_pf;

    state.velocity.x = r11 * vx_pf + r12 * vy_pf;
    state.velocity.y = r21 * vx_pf + r22 * vy_pf;
    state.velocity.z = r31 * vx_pf + r32 * vy_pf;

    if (options.velocity_unit == VelocityUnit::PER_SECOND) {
        state.velocity = state.velocity / SECONDS_PER_DAY;
    }

    if (options.epoch_tag == EpochTag::CANONICAL_LABEL) {
        if (t != options.canonical_epoch) {
            std::cerr << "[KeplerSolver] WARNING: state solved for JD "
                      << std::setprecision(15) << t
                      << " is labelled with canonical epoch JD "
                      << options.canonical_epoch << "\n";
        }
        state.epoch = options.canonical_epoch;
    } else {
        state.epoch = t;
    }

    if (diagnostics) {
        diagnostics->query_time = query;
        diagnostics->mean_anomaly = M;
        diagnostics->true_anomaly = v;
        diagnostics->radius = r;
        diagnostics->mu = u;
        diagnostics->anomaly = anomaly;
    }

    return state;
}

} // namespace solcat
