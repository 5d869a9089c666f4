#include "catalog/reconciliation.hpp"
#include <algorithm>
#include <iostream>

namespace solcat {

const std::vector<BarycenterSplit>& default_barycenter_splits() {
    static const std::vector<BarycenterSplit> splits = {
        {"199", "1", "Mercury", "Mercury Barycenter"},
        {"299", "2", "Venus",   "Venus Barycenter"}
    };
    return splits;
}

bool is_split_barycenter(const Body& body) {
    if (body.type != BodyType::BARYCENTER) {
        return false;
    }
    const auto& splits = default_barycenter_splits();
    return std::any_of(splits.begin(), splits.end(), [&](const BarycenterSplit& split) {
        return split.barycenter_id == body.id;
    });
}

bool add_sun_elements(Catalog& catalog, double canonical_epoch) {
    Body* sun = catalog.find(SUN_ID);
    if (!sun) {
        return false;
    }
    sun->osc_elements.merge_one(make_degenerate_elements(canonical_epoch, SUN_ID));
    return true;
}

static bool is_already_split(const Catalog& catalog, const Body& source,
                             const BarycenterSplit& split) {
    if (!catalog.contains(split.barycenter_id) || source.osc_elements.empty()) {
        return false;
    }
    return std::all_of(source.osc_elements.begin(), source.osc_elements.end(),
                       [&](const OsculatingElements& elem) {
                           return elem.ref_id == split.barycenter_id;
                       });
}

bool split_barycenter(Catalog& catalog, const BarycenterSplit& split, double canonical_epoch) {
    Body* source = catalog.find(split.body_id);
    if (!source || is_already_split(catalog, *source, split)) {
        return false;
    }

    // Both halves come from the untouched source
    Body barycenter = *source;
    barycenter.id = split.barycenter_id;
    barycenter.name = split.barycenter_name;
    barycenter.type = BodyType::BARYCENTER;
    barycenter.physical.zero();
    barycenter.state_vectors.clear();

    std::vector<OsculatingElements> orbit;
    for (const auto& elem : source->osc_elements) {
        if (elem.ref_id != split.barycenter_id) {
            orbit.push_back(elem);
        }
    }
    barycenter.osc_elements.assign(std::move(orbit));

    catalog.put(std::move(barycenter));

    Body& body = *source;
    body.name = split.body_name;
    body.type = BodyType::PLANET;

    // The body sits at its system barycenter
    OsculatingElements at_barycenter;
    at_barycenter.epoch = canonical_epoch;
    at_barycenter.ref_id = split.barycenter_id;
    body.osc_elements.assign({at_barycenter});

    return true;
}

ReconcileReport reconcile_identities(Catalog& catalog, double canonical_epoch, bool verbose) {
    ReconcileReport report;

    for (const auto& split : default_barycenter_splits()) {
        if (split_barycenter(catalog, split, canonical_epoch)) {
            report.split_body_ids.push_back(split.body_id);
            if (verbose) {
                std::cout << "[Reconcile] Split body " << split.body_id
                          << " into \"" << split.body_name << "\" and barycenter "
                          << split.barycenter_id << "\n";
            }
        } else if (verbose) {
            std::cout << "[Reconcile] Skipped split of body " << split.body_id << "\n";
        }
    }

    report.sun_elements_added = add_sun_elements(catalog, canonical_epoch);
    if (verbose && report.sun_elements_added) {
        std::cout << "[Reconcile] Added degenerate element set to the Sun\n";
    }

    return report;
}

} // namespace solcat
