/*
FILE: tests/test_kepler_solver.cpp
PURPOSE: Kepler solver against a Horizons reference state, plus the
         circular, vis-viva, convergence and precondition properties.
*/
#include <cassert>
#include <cmath>
#include <cstdio>

#include "physics/kepler_solver.hpp"

using namespace solcat;

static bool close_rel(double got, double want, double tol) {
    double scale = std::fabs(want) > 1.0 ? std::fabs(want) : 1.0;
    return std::fabs(got - want) <= tol * scale;
}

static bool close_abs(double got, double want, double tol) {
    return std::fabs(got - want) <= tol;
}

// Venus, heliocentric ecliptic J2000 elements at JD 2451545.0
static OsculatingElements venus_elements() {
    return OsculatingElements(J2000_JD, SUN_ID,
                              0.7233269274790103 * AU_TO_MM,
                              6.755786250503024E-03,
                              3.394589648659516 * DEG_TO_RAD,
                              76.67837463924961 * DEG_TO_RAD,
                              55.18596653686583 * DEG_TO_RAD,
                              50.11477187351476 * DEG_TO_RAD,
                              224.6983300739057);
}

static void test_reference_state() {
    StateVector s = KeplerSolver::solve(venus_elements(), J2000_JD);

    assert(close_rel(s.position.x, -1.074564940489116E+05, 1e-8));
    assert(close_rel(s.position.y, -4.885015029930510E+03, 1e-6));
    assert(close_rel(s.position.z, 6.135634314000621E+03, 1e-6));

    assert(close_abs(s.velocity.x, 1.381906047920155E-03, 1e-9));
    assert(close_abs(s.velocity.y, -3.514029517606325E-02, 1e-9));
    assert(close_abs(s.velocity.z, -5.600423209496981E-04, 1e-9));

    assert(s.epoch == J2000_JD);
    assert(s.frame == CoordinateFrame::HELIOCENTRIC_ECLIPTIC);
    assert(s.velocity_unit == VelocityUnit::PER_SECOND);
}

static void test_circular_orbit() {
    OsculatingElements elem(J2000_JD, SUN_ID, 150000.0, 0.0, 0.0, 0.0, 0.0, 1.0, 365.0);

    KeplerSolution diag;
    StateVector s = KeplerSolver::solve(elem, J2000_JD + 30.0, SolverOptions(), &diag);

    double expected_M = 1.0 + TWO_PI / 365.0 * 30.0;
    assert(close_abs(diag.mean_anomaly, expected_M, 1e-12));
    assert(diag.anomaly.eccentric_anomaly == diag.mean_anomaly);
    assert(diag.anomaly.iterations == 0);
    assert(close_abs(diag.true_anomaly, expected_M, 1e-12));
    assert(close_rel(s.position.norm(), 150000.0, 1e-12));
}

static void test_vis_viva() {
    SolverOptions opts;
    opts.velocity_unit = VelocityUnit::PER_DAY;
    opts.epoch_tag = EpochTag::QUERY_TIME;

    const double es[] = {0.0, 0.1, 0.5, 0.9};
    const double ts[] = {J2000_JD, J2000_JD + 17.25, J2000_JD + 1000.0};

    for (double e : es) {
        OsculatingElements elem(J2000_JD, SUN_ID, 400000.0, e,
                                0.3, 1.2, 2.1, 0.7, 800.0);
        double u = elem.proxy_mu();

        for (double t : ts) {
            StateVector s = KeplerSolver::solve(elem, t, opts);
            double r = s.position.norm();
            double v = s.velocity.norm();
            double v2 = v * v;
            double expected = u * (2.0 / r - 1.0 / elem.a);
            assert(close_rel(v2, expected, 1e-9));
            assert(s.epoch == t);
        }
    }
}

static void test_convergence() {
    for (int k = 0; k < 99; k++) {
        double e = k / 100.0;
        for (int j = 0; j < 24; j++) {
            double M = -PI + j * (TWO_PI / 24.0);
            AnomalySolution sol = KeplerSolver::solve_anomaly(M, e);
            assert(sol.converged);
            assert(sol.iterations <= 30);
            assert(std::fabs(sol.residual) <= 1e-10);
        }
    }
}

static void test_iteration_cap_keeps_last_iterate() {
    OsculatingElements elem(J2000_JD, SUN_ID, 200000.0, 0.95, 0.2, 0.4, 0.6, 0.3, 500.0);
    SolverOptions opts;
    opts.max_iterations = 1;

    KeplerSolution diag;
    StateVector s = KeplerSolver::solve(elem, J2000_JD, opts, &diag);

    assert(!diag.anomaly.converged);
    assert(diag.anomaly.iterations == 1);
    assert(std::fabs(diag.anomaly.residual) > opts.tolerance);
    assert(std::isfinite(s.position.x));
    assert(std::isfinite(s.position.y));
    assert(std::isfinite(s.position.z));
    assert(std::isfinite(s.velocity.x));
    assert(s.epoch == J2000_JD);
}

static void test_non_heliocentric_rejected() {
    OsculatingElements elem = venus_elements();
    elem.ref_id = "399";

    bool threw = false;
    try {
        KeplerSolver::solve(elem, J2000_JD);
    } catch (const UnsupportedCenterError&) {
        threw = true;
    }
    assert(threw);
}

static void test_bad_period_rejected() {
    const double periods[] = {0.0, -10.0, NAN};
    for (double p : periods) {
        OsculatingElements elem = venus_elements();
        elem.p = p;

        bool threw = false;
        try {
            KeplerSolver::solve(elem, J2000_JD - 1000.0);
        } catch (const InvalidPeriodError&) {
            threw = true;
        }
        assert(threw);
    }
}

static void test_hyperbolic_rejected() {
    OsculatingElements elem = venus_elements();
    elem.e = 1.2;

    bool threw = false;
    try {
        KeplerSolver::solve(elem, J2000_JD);
    } catch (const SolverError&) {
        threw = true;
    }
    assert(threw);
}

static void test_normalize_query_time() {
    assert(KeplerSolver::normalize_query_time(110.0, 100.0, 7.0) == 110.0);
    assert(KeplerSolver::normalize_query_time(100.0, 100.0, 7.0) == 100.0);

    double t = KeplerSolver::normalize_query_time(50.0, 100.0, 7.0);
    assert(t >= 100.0);
    assert(t < 107.0);
    assert(close_abs(std::fmod(t - 50.0, 7.0), 0.0, 1e-9));

    // Whole periods earlier lands on the same state
    OsculatingElements elem = venus_elements();
    SolverOptions opts;
    opts.epoch_tag = EpochTag::QUERY_TIME;
    StateVector now = KeplerSolver::solve(elem, J2000_JD + 10.0, opts);
    StateVector earlier = KeplerSolver::solve(elem, J2000_JD + 10.0 - 3.0 * elem.p, opts);
    assert(close_abs(now.position.x, earlier.position.x, 1e-3));
    assert(close_abs(now.position.y, earlier.position.y, 1e-3));
    assert(close_abs(now.position.z, earlier.position.z, 1e-3));
}

static void test_epoch_tag_and_units() {
    OsculatingElements elem = venus_elements();
    double t = J2000_JD + 42.0;

    StateVector labelled = KeplerSolver::solve(elem, t);
    assert(labelled.epoch == J2000_JD);

    SolverOptions query;
    query.epoch_tag = EpochTag::QUERY_TIME;
    StateVector tagged = KeplerSolver::solve(elem, t, query);
    assert(tagged.epoch == t);
    assert(tagged.position.x == labelled.position.x);

    SolverOptions per_day;
    per_day.velocity_unit = VelocityUnit::PER_DAY;
    StateVector daily = KeplerSolver::solve(elem, t, per_day);
    assert(daily.velocity_unit == VelocityUnit::PER_DAY);
    assert(close_rel(daily.velocity.y, labelled.velocity.y * SECONDS_PER_DAY, 1e-12));
    assert(close_rel(daily.velocity.norm() / SECONDS_PER_DAY, labelled.velocity.norm(), 1e-12));
}

int main(void) {
    test_reference_state();
    test_circular_orbit();
    test_vis_viva();
    test_convergence();
    test_iteration_cap_keeps_last_iterate();
    test_non_heliocentric_rejected();
    test_bad_period_rejected();
    test_hyperbolic_rejected();
    test_normalize_query_time();
    test_epoch_tag_and_units();

    std::printf("test_kepler_solver: OK\n");
    return 0;
}
