#include "io/build_config.hpp"
#include <cmath>
#include <stdexcept>

namespace solcat {

// Largest kepler_max_iterations accepted from a config file
static const int MAX_KEPLER_ITERATIONS = 10000;

void BuildConfigParser::apply(const JsonValue& json, BuildConfig& config) {
    if (!json.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    if (json.has("inputs")) {
        const auto& inputs = json["inputs"];
        if (!inputs.is_array()) {
            throw std::runtime_error("Config 'inputs' must be an array of paths");
        }
        for (const auto& path : inputs.as_array()) {
            config.inputs.push_back(path.as_string());
        }
    }

    if (json.has("catalog_dir")) config.catalog_dir = json["catalog_dir"].as_string();
    if (json.has("output_dir"))  config.output_dir = json["output_dir"].as_string();

    if (json.has("velocity_unit")) {
        config.solver.velocity_unit = string_to_velocity_unit(json["velocity_unit"].as_string());
    }
    if (json.has("kepler_tolerance")) {
        double tol = json["kepler_tolerance"].as_number();
        if (!(tol > 0.0)) {
            throw std::runtime_error("Config 'kepler_tolerance' must be positive");
        }
        config.solver.tolerance = tol;
    }
    if (json.has("kepler_max_iterations")) {
        double iters = json["kepler_max_iterations"].as_number();
        if (!(iters >= 1.0) || iters > MAX_KEPLER_ITERATIONS || iters != std::floor(iters)) {
            throw std::runtime_error("Config 'kepler_max_iterations' must be a whole number in [1, " +
                                     std::to_string(MAX_KEPLER_ITERATIONS) + "]");
        }
        config.solver.max_iterations = static_cast<int>(iters);
    }

    if (json.has("verbose")) config.verbose = json["verbose"].as_bool();
}

void BuildConfigParser::apply_file(const std::string& path, BuildConfig& config) {
    JsonValue json = JsonReader::parse_file(path);
    try {
        apply(json, config);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
    config.config_path = path;
}

} // namespace solcat
