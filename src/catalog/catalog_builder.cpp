#include "catalog/catalog_builder.hpp"
#include <algorithm>
#include <iostream>

namespace solcat {

void CatalogBuilder::add_batch(SourceBatch batch) {
    batches_.push_back(std::move(batch));
}

void CatalogBuilder::add_batches(std::vector<SourceBatch> batches) {
    for (auto& batch : batches) {
        batches_.push_back(std::move(batch));
    }
}

bool CatalogBuilder::fold_batch(Catalog& catalog, const SourceBatch& batch) {
    bool created = !catalog.contains(batch.body_id);
    Body& body = catalog.get_or_create(batch.body_id);

    if (!batch.body_name.empty()) {
        body.name = batch.body_name;
    }
    if (batch.body_type) {
        body.type = *batch.body_type;
    }
    body.physical.update_from(batch.physical);

    if (!batch.osc_elements.empty()) {
        body.osc_elements.merge(batch.osc_elements);
    }
    if (!batch.state_vectors.empty()) {
        body.state_vectors.merge(batch.state_vectors);
    }
    return created;
}

size_t CatalogBuilder::fold(Catalog& catalog) {
    std::stable_sort(batches_.begin(), batches_.end(),
                     [](const SourceBatch& lhs, const SourceBatch& rhs) {
                         return lhs.source_id < rhs.source_id;
                     });

    size_t created = 0;
    for (const auto& batch : batches_) {
        if (fold_batch(catalog, batch)) {
            created++;
        }
        if (verbose_) {
            std::cout << "[CatalogBuilder] Folded " << batch.source_id
                      << " into body " << batch.body_id << " ("
                      << batch.osc_elements.size() << " element sets, "
                      << batch.state_vectors.size() << " state vectors)\n";
        }
    }
    batches_.clear();
    return created;
}

BuildReport CatalogBuilder::build(Catalog& catalog) {
    BuildReport report;
    report.batches_folded = batches_.size();
    report.bodies_created = fold(catalog);

    report.bootstrap = bootstrap_catalog(catalog, options_, verbose_);
    report.reconcile = reconcile_identities(catalog, options_.canonical_epoch, verbose_);

    if (verbose_) {
        std::cout << "[CatalogBuilder] " << report.batches_folded << " batches, "
                  << report.bodies_created << " new bodies, "
                  << catalog.size() << " bodies in catalog\n";
    }
    return report;
}

} // namespace solcat
