/*
FILE: tests/test_reconciliation.cpp
PURPOSE: Barycenter/body identity split and the Sun's degenerate element set.
*/
#include <cassert>
#include <cstdio>

#include "catalog/reconciliation.hpp"

using namespace solcat;

static const double MERCURY_MASS = 3.302e23;
static const double MERCURY_RADIUS = 2.4397;

static void add_combined_mercury(Catalog& catalog) {
    Body& mercury = catalog.get_or_create("199");
    mercury.name = "Mercury Barycenter";
    mercury.physical.mass = MERCURY_MASS;
    mercury.physical.radius = MERCURY_RADIUS;
    mercury.physical.rotation_axis = Vec3(0.0, 0.0, 1.0);
    mercury.osc_elements.merge({
        OsculatingElements(J2000_JD - 30.0, SUN_ID, 57909.0, 0.2056, 0.12, 0.84, 0.51, 3.05, 87.97),
        OsculatingElements(J2000_JD, SUN_ID, 57909.1, 0.2056, 0.12, 0.84, 0.51, 3.10, 87.97)
    });
    mercury.state_vectors.merge({StateVector(J2000_JD, Vec3(-20000.0, -66000.0, -3500.0),
                                             Vec3(0.037, -0.012, -0.004))});
}

static void test_split_scenario() {
    Catalog catalog;
    add_combined_mercury(catalog);

    const BarycenterSplit& split = default_barycenter_splits()[0];
    assert(split.body_id == "199" && split.barycenter_id == "1");
    assert(split_barycenter(catalog, split, J2000_JD));

    const Body* bary = catalog.find("1");
    assert(bary != nullptr);
    assert(bary->name == "Mercury Barycenter");
    assert(bary->type == BodyType::BARYCENTER);
    assert(bary->physical.mass && *bary->physical.mass == 0.0);
    assert(bary->physical.radius && *bary->physical.radius == 0.0);
    assert(bary->physical.rotation_axis && bary->physical.rotation_axis->z == 0.0);
    assert(bary->state_vectors.empty());
    assert(bary->osc_elements.size() == 2);
    assert(bary->osc_elements.back().a == 57909.1);

    const Body* body = catalog.find("199");
    assert(body->name == "Mercury");
    assert(body->type == BodyType::PLANET);
    assert(*body->physical.mass == MERCURY_MASS);
    assert(*body->physical.radius == MERCURY_RADIUS);
    assert(body->state_vectors.size() == 1);
    assert(body->osc_elements.size() == 1);

    const OsculatingElements& at_bary = body->osc_elements.front();
    assert(at_bary.ref_id == "1");
    assert(at_bary.epoch == J2000_JD);
    assert(at_bary.a == 0.0 && at_bary.e == 0.0 && at_bary.p == 0.0);
}

static void test_split_skipped_without_source() {
    Catalog catalog;
    catalog.get_or_create("399");

    assert(!split_barycenter(catalog, default_barycenter_splits()[0], J2000_JD));
    assert(!catalog.contains("1"));
    assert(catalog.size() == 1);
}

static void test_rerun_is_noop() {
    Catalog catalog;
    add_combined_mercury(catalog);
    catalog.get_or_create(SUN_ID).name = "Sun";

    ReconcileReport first = reconcile_identities(catalog, J2000_JD);
    assert(first.split_body_ids.size() == 1);
    assert(first.split_body_ids[0] == "199");
    assert(first.sun_elements_added);

    ReconcileReport second = reconcile_identities(catalog, J2000_JD);
    assert(second.split_body_ids.empty());

    // Barycenter still holds the heliocentric orbit, not the synthetic one
    assert(catalog.find("1")->osc_elements.size() == 2);
    assert(catalog.find("199")->osc_elements.size() == 1);
    assert(catalog.find(SUN_ID)->osc_elements.size() == 1);
}

static void test_sun_elements() {
    Catalog catalog;
    assert(!add_sun_elements(catalog, J2000_JD));

    catalog.get_or_create(SUN_ID);
    assert(add_sun_elements(catalog, J2000_JD));

    const Body* sun = catalog.find(SUN_ID);
    assert(sun->type == BodyType::STAR);
    assert(sun->osc_elements.size() == 1);

    const OsculatingElements& elem = sun->osc_elements.front();
    assert(elem.ref_id == SUN_ID);
    assert(elem.epoch == J2000_JD);
    assert(elem.is_degenerate());
    assert(elem.a == 0.0 && elem.M == 0.0);
}

int main(void) {
    test_split_scenario();
    test_split_skipped_without_source();
    test_rerun_is_noop();
    test_sun_elements();

    std::printf("test_reconciliation: OK\n");
    return 0;
}
