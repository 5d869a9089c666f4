#include "catalog/bootstrap.hpp"
#include "catalog/reconciliation.hpp"
#include "coordinate/frame_shift.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

namespace solcat {

const OsculatingElements* select_closest_elements(const Body& body, double target_epoch) {
    const OsculatingElements* best = nullptr;

    for (const auto& elem : body.osc_elements) {
        if (!elem.is_heliocentric() || elem.ref_id == body.id) {
            continue;
        }
        if (!best || std::abs(elem.epoch - target_epoch) < std::abs(best->epoch - target_epoch)) {
            best = &elem;
        }
    }
    return best;
}

BootstrapOutcome bootstrap_state_vector(Body& body, double target_epoch,
                                        const SolverOptions& options) {
    if (body.state_vectors.contains_epoch(target_epoch)) {
        return BootstrapOutcome::ALREADY_PRESENT;
    }

    const OsculatingElements* elements = select_closest_elements(body, target_epoch);
    if (!elements) {
        return BootstrapOutcome::NO_HELIOCENTRIC_ELEMENTS;
    }

    StateVector helio = KeplerSolver::solve(*elements, target_epoch, options);
    StateVector bary = FrameShift::to_barycentric(helio);

    body.state_vectors.merge_one(bary);
    return BootstrapOutcome::COMPUTED;
}

BootstrapReport bootstrap_catalog(Catalog& catalog, const SolverOptions& options, bool verbose) {
    BootstrapReport report;
    const double target = options.canonical_epoch;

    for (auto& entry : catalog.bodies()) {
        Body& body = entry.second;
        if (is_split_barycenter(body)) {
            report.skipped_barycenters++;
            continue;
        }

        try {
            switch (bootstrap_state_vector(body, target, options)) {
                case BootstrapOutcome::COMPUTED: {
                    report.computed++;
                    if (verbose) {
                        const StateVector& sv = *body.state_vectors.find(target);
                        std::cout << "[Bootstrap] Computed state vector for body " << body.id
                                  << " (\"" << body.name << "\"): "
                                  << std::setprecision(15)
                                  << sv.position.x << ", " << sv.position.y << ", "
                                  << sv.position.z << " Mm\n";
                    }
                    break;
                }
                case BootstrapOutcome::ALREADY_PRESENT:
                    report.already_present++;
                    break;
                case BootstrapOutcome::NO_HELIOCENTRIC_ELEMENTS:
                    report.no_anchor++;
                    break;
            }
        } catch (const SolverError& e) {
            std::cerr << "[Bootstrap] ERROR: body " << body.id << ": " << e.what() << "\n";
            report.failed_ids.push_back(body.id);
        } catch (const FrameShiftError& e) {
            std::cerr << "[Bootstrap] ERROR: body " << body.id << ": " << e.what() << "\n";
            report.failed_ids.push_back(body.id);
        }
    }

    if (verbose) {
        std::cout << "[Bootstrap] " << report.computed << " computed, "
                  << report.already_present << " already present, "
                  << report.no_anchor << " without heliocentric elements, "
                  << report.skipped_barycenters << " split barycenters skipped, "
                  << report.failed_ids.size() << " failed\n";
    }
    return report;
}

} // namespace solcat
