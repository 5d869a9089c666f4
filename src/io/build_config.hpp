/**
 * BuildConfig: settings for one catalog build run.
 *
 * Filled from an optional JSON file, then overridden by command-line flags:
 * {
 *   "inputs": ["extracts/planets.json", "extracts/asteroids.json"],
 *   "catalog_dir": "catalog",          // existing catalog to merge into
 *   "output_dir": "catalog",           // where partition files are written
 *   "velocity_unit": "per_second",     // or "per_day"
 *   "kepler_tolerance": 1e-10,
 *   "kepler_max_iterations": 30,
 *   "verbose": false
 * }
 */

#ifndef SOLCAT_BUILD_CONFIG_HPP
#define SOLCAT_BUILD_CONFIG_HPP

#include "io/json_reader.hpp"
#include "physics/kepler_solver.hpp"
#include <string>
#include <vector>

namespace solcat {

struct BuildConfig {
    std::vector<std::string> inputs;    // Source batch files
    std::string catalog_dir;            // empty = start from an empty catalog
    std::string output_dir = ".";
    std::string config_path;
    bool verbose = false;

    // Canonical epoch is fixed at J2000: the Sun-SSB offset is only known there
    SolverOptions solver;
};

class BuildConfigParser {
public:
    /**
     * Apply the members of a config JSON object on top of config.
     * Unknown keys are ignored; "inputs" are appended.
     * @throws std::runtime_error on a value of the wrong type
     */
    static void apply(const JsonValue& json, BuildConfig& config);

    /**
     * Parse a config file and apply it.
     * @throws std::runtime_error on file, parse or value errors
     */
    static void apply_file(const std::string& path, BuildConfig& config);
};

} // namespace solcat

#endif // SOLCAT_BUILD_CONFIG_HPP
