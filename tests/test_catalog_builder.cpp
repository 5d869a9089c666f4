/*
FILE: tests/test_catalog_builder.cpp
PURPOSE: Batch folding order, physical parameter updates and the full build pass.
*/
#include <cassert>
#include <cstdio>
#include <vector>

#include "catalog/catalog_builder.hpp"

using namespace solcat;

static SourceBatch vectors_batch(const char* source, const char* body, double epoch, double x) {
    SourceBatch batch;
    batch.source_id = source;
    batch.body_id = body;
    batch.state_vectors.push_back(StateVector(epoch, Vec3(x, 0.0, 0.0), Vec3::Zero()));
    return batch;
}

static void test_fold_order_independent() {
    std::vector<SourceBatch> batches = {
        vectors_batch("c_horizons", "399", J2000_JD, 3.0),
        vectors_batch("a_horizons", "399", J2000_JD, 1.0),
        vectors_batch("b_horizons", "399", J2000_JD, 2.0),
        vectors_batch("b_horizons", "399", J2000_JD + 1.0, 5.0)
    };

    Catalog forward;
    CatalogBuilder fb;
    fb.add_batches(batches);
    fb.fold(forward);

    Catalog reverse;
    CatalogBuilder rb;
    for (auto it = batches.rbegin(); it != batches.rend(); ++it) {
        rb.add_batch(*it);
    }
    rb.fold(reverse);

    const Body* f = forward.find("399");
    const Body* r = reverse.find("399");
    assert(f->state_vectors.size() == 2);
    assert(r->state_vectors.size() == 2);

    // "c_horizons" sorts last and wins the shared epoch
    assert(f->state_vectors.front().position.x == 3.0);
    assert(r->state_vectors.front().position.x == 3.0);
    assert(f->state_vectors.back().position.x == 5.0);
}

static void test_fold_identity_and_physical() {
    Catalog catalog;

    SourceBatch first;
    first.source_id = "a";
    first.body_id = "a2000001";
    first.body_name = "Ceres";
    first.physical.radius = 0.4699;
    first.physical.albedo = 0.09;

    SourceBatch second;
    second.source_id = "b";
    second.body_id = "a2000001";
    second.physical.albedo = 0.1;
    second.body_type = BodyType::OTHER;

    assert(CatalogBuilder::fold_batch(catalog, first));
    assert(!CatalogBuilder::fold_batch(catalog, second));

    const Body* ceres = catalog.find("a2000001");
    assert(ceres->name == "Ceres");
    assert(ceres->type == BodyType::OTHER);
    assert(*ceres->physical.radius == 0.4699);
    assert(*ceres->physical.albedo == 0.1);
    assert(!ceres->physical.mass);
}

static void test_new_body_defaults() {
    Catalog catalog;
    SourceBatch batch = vectors_batch("x", "c1P", J2000_JD, 1.0);
    CatalogBuilder::fold_batch(catalog, batch);

    const Body* comet = catalog.find("c1P");
    assert(comet->name == "c1P");
    assert(comet->type == BodyType::COMET);
}

static SourceBatch venus_batch() {
    SourceBatch venus;
    venus.source_id = "major/299";
    venus.body_id = "299";
    venus.body_name = "Venus Barycenter";
    venus.physical.mass = 4.8685e24;
    venus.osc_elements.push_back(OsculatingElements(
        J2000_JD, SUN_ID, 0.7233269274790103 * AU_TO_MM, 6.755786250503024E-03,
        3.394589648659516 * DEG_TO_RAD, 76.67837463924961 * DEG_TO_RAD,
        55.18596653686583 * DEG_TO_RAD, 50.11477187351476 * DEG_TO_RAD,
        224.6983300739057));
    return venus;
}

static void test_build_pipeline() {
    CatalogBuilder builder;

    SourceBatch sun;
    sun.source_id = "major/10";
    sun.body_id = SUN_ID;
    sun.body_name = "Sun";
    builder.add_batch(sun);
    builder.add_batch(venus_batch());

    Catalog catalog;
    BuildReport report = builder.build(catalog);

    assert(builder.pending_batches() == 0);
    assert(report.batches_folded == 2);
    assert(report.bodies_created == 2);
    assert(report.bootstrap.computed == 1);
    assert(report.bootstrap.failed_ids.empty());
    assert(report.reconcile.sun_elements_added);
    assert(report.reconcile.split_body_ids.size() == 1);

    // Venus keeps the bootstrapped vector, the barycenter keeps the orbit
    const Body* body = catalog.find("299");
    const Body* bary = catalog.find("2");
    assert(body->name == "Venus");
    assert(body->state_vectors.size() == 1);
    assert(body->osc_elements.front().ref_id == "2");
    assert(bary->state_vectors.empty());
    assert(bary->osc_elements.front().is_heliocentric());
    assert(*bary->physical.mass == 0.0);

    std::vector<std::string> ids = catalog.ids();
    assert(ids.size() == 3);
    assert(ids[0] == "2" && ids[1] == "10" && ids[2] == "299");
}

static void test_rebuild_keeps_barycenter_bare() {
    Catalog catalog;
    CatalogBuilder first;
    first.add_batch(venus_batch());
    first.build(catalog);
    assert(catalog.find("2")->state_vectors.empty());

    // Second pass over the built catalog, as a --catalog run does
    BuildReport again = CatalogBuilder().build(catalog);
    assert(again.bootstrap.computed == 0);
    assert(again.bootstrap.skipped_barycenters == 1);
    assert(again.reconcile.split_body_ids.empty());

    const Body* bary = catalog.find("2");
    const Body* venus = catalog.find("299");
    assert(bary->state_vectors.empty());
    assert(bary->osc_elements.front().is_heliocentric());
    assert(venus->state_vectors.size() == 1);
    assert(venus->osc_elements.size() == 1);
    assert(venus->osc_elements.front().ref_id == "2");
}

int main(void) {
    test_fold_order_independent();
    test_fold_identity_and_physical();
    test_new_body_defaults();
    test_build_pipeline();
    test_rebuild_keeps_barycenter_bare();

    std::printf("test_catalog_builder: OK\n");
    return 0;
}
