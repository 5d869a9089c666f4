/**
 * Catalog persistence implementation
 */

#include "io/catalog_io.hpp"
#include "io/json_reader.hpp"
#include "io/json_writer.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace solcat {

namespace {

// Load a persisted series, repairing it if it is out of order or has duplicates
template <typename Series>
void load_series(Series& series, std::vector<typename Series::value_type> records,
                 const std::string& body_id, const char* what) {
    bool ordered = true;
    for (size_t i = 1; i < records.size(); i++) {
        if (!(Series::key_of(records[i - 1]) < Series::key_of(records[i]))) {
            ordered = false;
            break;
        }
    }
    if (!ordered) {
        std::cerr << "[CatalogIO] WARNING: body " << body_id << " has unordered or duplicate "
                  << what << ", re-merging\n";
    }
    series.merge(std::move(records));
}

}  // anonymous namespace

std::string CatalogIO::partition_path(const std::string& directory,
                                      const std::string& partition) {
    if (directory.empty()) return partition + ".json";
    char last = directory.back();
    if (last == '/' || last == '\\') return directory + partition + ".json";
    return directory + "/" + partition + ".json";
}

// ─────────────────────────────────────────────────────────────
// Physical parameters
// ─────────────────────────────────────────────────────────────

void CatalogIO::write_physical(JsonWriter& w, const PhysicalParameters& p) {
    if (p.mass)            w.kv("mass", *p.mass);
    if (p.radius)          w.kv("radius", *p.radius);
    if (p.albedo)          w.kv("albedo", *p.albedo);
    if (p.magnitude)       w.kv("magnitude", *p.magnitude);
    if (p.rotation_period) w.kv("rotation_period", *p.rotation_period);
    if (p.rotation_axis) {
        const Vec3& axis = *p.rotation_axis;
        w.key("rotation_axis").row({axis.x, axis.y, axis.z});
    }
}

PhysicalParameters CatalogIO::read_physical(const JsonValue& json) {
    PhysicalParameters p;

    // Nulls (NaN written out) count as absent
    if (json["mass"].is_number())            p.mass = json["mass"].as_number();
    if (json["radius"].is_number())          p.radius = json["radius"].as_number();
    if (json["albedo"].is_number())          p.albedo = json["albedo"].as_number();
    if (json["magnitude"].is_number())       p.magnitude = json["magnitude"].as_number();
    if (json["rotation_period"].is_number()) p.rotation_period = json["rotation_period"].as_number();

    const auto& axis = json["rotation_axis"];
    if (axis.is_array() && axis.size() == 3) {
        p.rotation_axis = Vec3(axis[0].get_number(), axis[1].get_number(), axis[2].get_number());
    }
    return p;
}

// ─────────────────────────────────────────────────────────────
// Element sets and state vectors
// ─────────────────────────────────────────────────────────────

void CatalogIO::write_elements(JsonWriter& w, const OsculatingElements& elem) {
    w.begin_object();
    w.kv("ref_id", elem.ref_id);
    w.kv("epoch", elem.epoch);
    w.kv("a", elem.a);
    w.kv("e", elem.e);
    w.kv("i", elem.i);
    w.kv("O", elem.O);
    w.kv("w", elem.w);
    w.kv("M", elem.M);
    w.kv("p", elem.p);
    w.end_object();
}

OsculatingElements CatalogIO::read_elements(const JsonValue& json) {
    if (!json.is_object() || !json["epoch"].is_number() || !json["ref_id"].is_string()) {
        throw std::runtime_error("Element set needs a numeric 'epoch' and a string 'ref_id'");
    }

    OsculatingElements elem;
    elem.epoch = json["epoch"].as_number();
    elem.ref_id = json["ref_id"].as_string();
    elem.a = json["a"].get_number();
    elem.e = json["e"].get_number();
    elem.i = json["i"].get_number();
    elem.O = json["O"].get_number();
    elem.w = json["w"].get_number();
    elem.M = json["M"].get_number();
    elem.p = json["p"].get_number();
    return elem;
}

void CatalogIO::write_state_vector(JsonWriter& w, const StateVector& s) {
    // Persisted velocities are always Mm/s
    Vec3 vel = s.velocity;
    if (s.velocity_unit == VelocityUnit::PER_DAY) {
        vel = vel / SECONDS_PER_DAY;
    }

    w.row({s.epoch, s.position.x, s.position.y, s.position.z, vel.x, vel.y, vel.z});
}

StateVector CatalogIO::read_state_vector(const JsonValue& json) {
    if (!json.is_array() || json.size() != 7) {
        throw std::runtime_error("State vector must be [epoch, x, y, z, vx, vy, vz]");
    }
    for (const auto& v : json.as_array()) {
        if (!v.is_number()) {
            throw std::runtime_error("State vector entries must be numbers");
        }
    }

    // Persisted vectors are barycentric, Mm and Mm/s
    return StateVector(json[0].as_number(),
                       Vec3(json[1].as_number(), json[2].as_number(), json[3].as_number()),
                       Vec3(json[4].as_number(), json[5].as_number(), json[6].as_number()));
}

// ─────────────────────────────────────────────────────────────
// Bodies
// ─────────────────────────────────────────────────────────────

void CatalogIO::write_body(JsonWriter& w, const Body& body) {
    w.begin_object();
    w.kv("name", body.name);
    w.kv("type", body_type_to_string(body.type));
    write_physical(w, body.physical);

    if (!body.osc_elements.empty()) {
        w.key("osc_elements").begin_array();
        for (const auto& elem : body.osc_elements) {
            write_elements(w, elem);
        }
        w.end_array();
    }

    if (!body.state_vectors.empty()) {
        w.key("state_vectors").begin_array();
        for (const auto& sv : body.state_vectors) {
            write_state_vector(w, sv);
        }
        w.end_array();
    }

    w.end_object();
}

Body CatalogIO::read_body(const std::string& id, const JsonValue& json) {
    if (!json.is_object()) {
        throw std::runtime_error("Body '" + id + "' is not a JSON object");
    }

    Body body(id, json["name"].get_string(id), body_type_for_id(id));
    if (json["type"].is_string()) {
        body.type = string_to_body_type(json["type"].as_string());
    }
    body.physical = read_physical(json);

    std::vector<OsculatingElements> elements;
    for (const auto& e : json["osc_elements"].as_array()) {
        elements.push_back(read_elements(e));
    }
    std::vector<StateVector> vectors;
    for (const auto& v : json["state_vectors"].as_array()) {
        vectors.push_back(read_state_vector(v));
    }

    load_series(body.osc_elements, std::move(elements), id, "element sets");
    load_series(body.state_vectors, std::move(vectors), id, "state vectors");
    return body;
}

// ─────────────────────────────────────────────────────────────
// Catalog directory
// ─────────────────────────────────────────────────────────────

Catalog CatalogIO::load_catalog(const std::string& directory, bool verbose) {
    Catalog catalog;

    for (const auto& partition : Catalog::partitions()) {
        std::string path = partition_path(directory, partition);

        std::ifstream existing(path);
        if (!existing.is_open()) {
            if (verbose) {
                std::cout << "[CatalogIO] No " << path << ", skipping\n";
            }
            continue;
        }
        existing.close();

        JsonValue root = JsonReader::parse_file(path);
        if (!root.is_object()) {
            throw std::runtime_error(path + ": expected an object of bodies");
        }

        for (const auto& entry : root.as_object()) {
            catalog.put(read_body(entry.first, entry.second));
        }

        if (verbose) {
            std::cout << "[CatalogIO] Loaded " << root.size() << " bodies from " << path << "\n";
        }
    }
    return catalog;
}

bool CatalogIO::save_catalog(const Catalog& catalog, const std::string& directory, bool verbose) {
    for (const auto& partition : Catalog::partitions()) {
        std::string path = partition_path(directory, partition);

        std::ofstream file(path);
        if (!file.is_open()) {
            std::cerr << "[CatalogIO] Cannot open file for writing: " << path << "\n";
            return false;
        }

        auto ids = catalog.ids_in_partition(partition);

        JsonWriter w(file);
        w.begin_object();
        for (const auto& id : ids) {
            w.key(id);
            write_body(w, *catalog.find(id));
        }
        w.end_object();
        file << "\n";

        if (!file.good()) {
            std::cerr << "[CatalogIO] Write failed: " << path << "\n";
            return false;
        }
        if (verbose) {
            std::cout << "[CatalogIO] Wrote " << ids.size() << " bodies to " << path << "\n";
        }
    }
    return true;
}

// ─────────────────────────────────────────────────────────────
// Source batches
// ─────────────────────────────────────────────────────────────

SourceBatch CatalogIO::read_batch(const JsonValue& json, const std::string& default_source) {
    if (!json.is_object() || !json["body_id"].is_string()) {
        throw std::runtime_error(default_source + ": batch needs a string 'body_id'");
    }

    SourceBatch batch;
    batch.source_id = json["source"].get_string(default_source);
    batch.body_id = json["body_id"].as_string();
    batch.body_name = json["name"].get_string("");
    if (json["type"].is_string()) {
        batch.body_type = string_to_body_type(json["type"].as_string());
    }
    batch.physical = read_physical(json);

    for (const auto& e : json["osc_elements"].as_array()) {
        batch.osc_elements.push_back(read_elements(e));
    }
    for (const auto& v : json["state_vectors"].as_array()) {
        batch.state_vectors.push_back(read_state_vector(v));
    }
    return batch;
}

std::vector<SourceBatch> CatalogIO::parse_batches(const JsonValue& root,
                                                  const std::string& default_source) {
    std::vector<SourceBatch> batches;

    if (root["batches"].is_array()) {
        const auto& list = root["batches"].as_array();
        for (size_t i = 0; i < list.size(); i++) {
            batches.push_back(read_batch(list[i], default_source + "#" + std::to_string(i)));
        }
    } else {
        batches.push_back(read_batch(root, default_source + "#0"));
    }
    return batches;
}

std::vector<SourceBatch> CatalogIO::load_batches(const std::string& filename) {
    JsonValue root = JsonReader::parse_file(filename);
    try {
        return parse_batches(root, filename);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(filename + ": " + e.what());
    }
}

}  // namespace solcat
