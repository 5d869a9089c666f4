/**
 * Identity Reconciliation
 *
 * One-shot structural fixes applied to a fully merged catalog:
 *  - the Sun gets a degenerate element set so every body exposes at
 *    least one (e = 1 marks it as not solvable)
 *  - bodies Horizons reports together with their system barycenter
 *    (Mercury, Venus) are split into a massless barycenter that keeps
 *    the heliocentric orbit and a body that keeps the measurements
 */

#ifndef SOLCAT_RECONCILIATION_HPP
#define SOLCAT_RECONCILIATION_HPP

#include "catalog/catalog.hpp"
#include <string>
#include <vector>

namespace solcat {

struct BarycenterSplit {
    std::string body_id;          // Combined entry, e.g. "199"
    std::string barycenter_id;    // New identity, e.g. "1"
    std::string body_name;        // "Mercury"
    std::string barycenter_name;  // "Mercury Barycenter"
};

// Mercury (199 -> 1) and Venus (299 -> 2)
const std::vector<BarycenterSplit>& default_barycenter_splits();

// True for a barycenter produced by one of the default splits; these
// carry orbits but never state vectors
bool is_split_barycenter(const Body& body);

struct ReconcileReport {
    bool sun_elements_added = false;
    std::vector<std::string> split_body_ids;
};

/**
 * @brief Merge the degenerate element set into the Sun's series
 * @return false if the catalog has no Sun
 */
bool add_sun_elements(Catalog& catalog, double canonical_epoch);

/**
 * @brief Split a combined body/barycenter entry into two identities
 *
 * Copies the combined entry to the barycenter id (physical parameters
 * zeroed, state vectors dropped, type barycenter), then turns the
 * original into the body proper with one element set pointing at the
 * barycenter.
 * @return false if the source is missing or was already split
 */
bool split_barycenter(Catalog& catalog, const BarycenterSplit& split, double canonical_epoch);

/**
 * @brief Apply the Sun elements and the default splits
 */
ReconcileReport reconcile_identities(Catalog& catalog, double canonical_epoch,
                                     bool verbose = false);

} // namespace solcat

#endif // SOLCAT_RECONCILIATION_HPP
