/**
 * CatalogBuilder: one-shot rebuild of the catalog from source batches.
 *
 *   add_batch() x N  →  build():
 *     1. sort batches by source id (stable)
 *     2. fold each batch into its body (merge engine, last writer wins)
 *     3. bootstrap missing canonical-epoch state vectors
 *     4. reconcile identities
 *
 * Sorting by source id makes the result independent of the order the
 * batches were discovered in.
 */

#ifndef SOLCAT_CATALOG_BUILDER_HPP
#define SOLCAT_CATALOG_BUILDER_HPP

#include "catalog/bootstrap.hpp"
#include "catalog/catalog.hpp"
#include "catalog/reconciliation.hpp"
#include "physics/kepler_solver.hpp"
#include <optional>
#include <string>
#include <vector>

namespace solcat {

/**
 * Records one upstream extract reported for one body
 */
struct SourceBatch {
    std::string source_id;        // e.g. extract file name; orders the fold
    std::string body_id;
    std::string body_name;        // Empty keeps the current name
    std::optional<BodyType> body_type;

    PhysicalParameters physical;
    std::vector<OsculatingElements> osc_elements;
    std::vector<StateVector> state_vectors;
};

struct BuildReport {
    size_t batches_folded = 0;
    size_t bodies_created = 0;
    BootstrapReport bootstrap;
    ReconcileReport reconcile;
};

class CatalogBuilder {
public:
    explicit CatalogBuilder(const SolverOptions& options = SolverOptions(),
                            bool verbose = false)
        : options_(options), verbose_(verbose) {}

    void add_batch(SourceBatch batch);
    void add_batches(std::vector<SourceBatch> batches);

    size_t pending_batches() const { return batches_.size(); }

    /**
     * @brief Fold every pending batch into catalog, then bootstrap and reconcile
     *
     * Pending batches are consumed.
     */
    BuildReport build(Catalog& catalog);

    /**
     * @brief Fold pending batches only (no bootstrap, no reconciliation)
     * @return Number of bodies created
     */
    size_t fold(Catalog& catalog);

    /**
     * @brief Merge one batch into its body
     * @return true if the body was created by this batch
     */
    static bool fold_batch(Catalog& catalog, const SourceBatch& batch);

private:
    SolverOptions options_;
    bool verbose_;
    std::vector<SourceBatch> batches_;
};

} // namespace solcat

#endif // SOLCAT_CATALOG_BUILDER_HPP
