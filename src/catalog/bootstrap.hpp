/**
 * Closest-Epoch Bootstrap
 *
 * Fills in a barycentric state vector at the canonical epoch for bodies
 * that only have orbital elements: pick the heliocentric element set
 * closest in time, solve it, shift it to the SSB, merge it in.
 */

#ifndef SOLCAT_BOOTSTRAP_HPP
#define SOLCAT_BOOTSTRAP_HPP

#include "catalog/catalog.hpp"
#include "physics/kepler_solver.hpp"
#include <string>
#include <vector>

namespace solcat {

enum class BootstrapOutcome {
    COMPUTED,                 // New state vector merged in
    ALREADY_PRESENT,          // Body already had a vector at the target epoch
    NO_HELIOCENTRIC_ELEMENTS  // Nothing to solve (e.g. natural satellites)
};

struct BootstrapReport {
    size_t computed = 0;
    size_t already_present = 0;
    size_t no_anchor = 0;
    size_t skipped_barycenters = 0;        // Mercury/Venus barycenters on a rebuild
    std::vector<std::string> failed_ids;   // Solver or frame shift rejected the body
};

/**
 * @brief Heliocentric element set closest to target_epoch
 *
 * Ties keep the first one in series order. The body's own
 * self-referencing element set (the Sun's sentinel) is never picked.
 * @return nullptr if the body has no usable element set
 */
const OsculatingElements* select_closest_elements(const Body& body, double target_epoch);

/**
 * @brief Ensure body has a barycentric state vector at target_epoch
 *
 * Idempotent. The solver runs with options.epoch_tag; target_epoch must be
 * the canonical epoch for the frame shift to accept the result.
 * @throws SolverError, FrameShiftError
 */
BootstrapOutcome bootstrap_state_vector(Body& body, double target_epoch,
                                        const SolverOptions& options = SolverOptions());

/**
 * @brief Bootstrap every body at options.canonical_epoch, in catalog order
 *
 * A body whose elements cannot be solved is logged and listed in the
 * report; the remaining bodies are still processed. Barycenters split
 * off by reconciliation are left without a state vector.
 */
BootstrapReport bootstrap_catalog(Catalog& catalog,
                                  const SolverOptions& options = SolverOptions(),
                                  bool verbose = false);

} // namespace solcat

#endif // SOLCAT_BOOTSTRAP_HPP
