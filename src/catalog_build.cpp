/**
 * solcat_build: Rebuild the body catalog from source extracts.
 *
 * Loads an existing catalog directory (if any), folds every source batch
 * file into it, bootstraps missing J2000 state vectors, applies the
 * identity fixes and writes the partition files.
 *
 * Usage:
 *   solcat_build --input <file> [--input <file> ...] [--catalog <dir>]
 *                [--output <dir>] [--verbose]
 *   solcat_build --config <file> [overrides...]
 */

#include "catalog/catalog_builder.hpp"
#include "io/build_config.hpp"
#include "io/catalog_io.hpp"
#include <iostream>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>    Build config JSON (flags below override it)\n"
              << "  --input <path>     Source batch JSON file (repeatable)\n"
              << "  --catalog <dir>    Existing catalog to merge into (default: none)\n"
              << "  --output <dir>     Directory for partition files (default: .)\n"
              << "  --verbose          Progress to stdout\n"
              << "  --help             Show this message\n";
}

int main(int argc, char* argv[]) {
    solcat::BuildConfig config;

    std::string config_path;
    std::vector<std::string> cli_inputs;
    std::string cli_catalog;
    std::string cli_output;
    bool cli_verbose = false;

    // Parse CLI arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--input" && i + 1 < argc) {
            cli_inputs.push_back(argv[++i]);
        } else if (arg == "--catalog" && i + 1 < argc) {
            cli_catalog = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            cli_output = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            cli_verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!config_path.empty()) {
        try {
            solcat::BuildConfigParser::apply_file(config_path, config);
        } catch (const std::exception& e) {
            std::cerr << "Error loading config: " << e.what() << "\n";
            return 1;
        }
    }

    // Command line wins over the config file
    config.inputs.insert(config.inputs.end(), cli_inputs.begin(), cli_inputs.end());
    if (!cli_catalog.empty()) config.catalog_dir = cli_catalog;
    if (!cli_output.empty()) config.output_dir = cli_output;
    if (cli_verbose) config.verbose = true;

    if (config.inputs.empty() && config.catalog_dir.empty()) {
        std::cerr << "Error: nothing to build, give --input or --catalog\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (config.verbose) {
        std::cout << "=== Catalog Build ===\n"
                  << "Inputs: " << config.inputs.size() << " file(s)\n"
                  << "Catalog: " << (config.catalog_dir.empty() ? "(new)" : config.catalog_dir) << "\n"
                  << "Output: " << config.output_dir << "\n"
                  << "Velocity unit: "
                  << solcat::velocity_unit_to_string(config.solver.velocity_unit) << "\n\n";
    }

    // Load existing catalog and source batches
    solcat::Catalog catalog;
    solcat::CatalogBuilder builder(config.solver, config.verbose);
    try {
        if (!config.catalog_dir.empty()) {
            catalog = solcat::CatalogIO::load_catalog(config.catalog_dir, config.verbose);
        }
        for (const auto& path : config.inputs) {
            builder.add_batches(solcat::CatalogIO::load_batches(path));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading input: " << e.what() << "\n";
        return 1;
    }

    solcat::BuildReport report = builder.build(catalog);

    if (!solcat::CatalogIO::save_catalog(catalog, config.output_dir, config.verbose)) {
        std::cerr << "Error: failed to write catalog to " << config.output_dir << "\n";
        return 1;
    }

    std::cout << "Catalog: " << catalog.size() << " bodies ("
              << report.bodies_created << " new), "
              << report.bootstrap.computed << " state vectors bootstrapped";
    if (!report.bootstrap.failed_ids.empty()) {
        std::cout << ", " << report.bootstrap.failed_ids.size() << " bodies failed";
    }
    std::cout << "\n";

    return 0;
}
