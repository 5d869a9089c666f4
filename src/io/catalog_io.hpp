/**
 * Catalog persistence and source batch loading
 *
 * Catalog directory: one JSON file per partition (major_bodies.json,
 * asteroids.json, ...), each mapping body id to body:
 * {
 *   "199": {
 *     "name": "Mercury",
 *     "type": "planet",
 *     "mass": 3.302e23,                  // optional physical parameters
 *     "radius": 2.44,
 *     "osc_elements": [
 *       {"ref_id": "1", "epoch": 2451545.0, "a": 0, "e": 0, "i": 0,
 *        "O": 0, "w": 0, "M": 0, "p": 0}
 *     ],
 *     "state_vectors": [
 *       [2451545.0, x, y, z, vx, vy, vz]   // JD, Mm, Mm/s, SSB ecliptic
 *     ]
 *   }
 * }
 *
 * Source batch file:
 * {
 *   "batches": [
 *     {
 *       "source": "horizons/299_elements.txt",
 *       "body_id": "299",
 *       "name": "Venus",
 *       "type": "planet",                  // optional, else from the id
 *       "radius": 6.0518,                  // optional physical parameters
 *       "osc_elements": [ {...}, ... ],
 *       "state_vectors": [ [...], ... ]
 *     }
 *   ]
 * }
 * A file holding a single batch object is accepted too.
 */

#ifndef SOLCAT_CATALOG_IO_HPP
#define SOLCAT_CATALOG_IO_HPP

#include "catalog/catalog.hpp"
#include "catalog/catalog_builder.hpp"
#include <string>
#include <vector>

namespace solcat {

class JsonWriter;
class JsonValue;

class CatalogIO {
public:
    /**
     * Load every partition file present in a catalog directory.
     * Missing partition files are skipped.
     *
     * @throws std::runtime_error on malformed files
     */
    static Catalog load_catalog(const std::string& directory, bool verbose = false);

    /**
     * Write one file per partition into a directory (which must exist).
     *
     * @return true on success
     */
    static bool save_catalog(const Catalog& catalog, const std::string& directory,
                             bool verbose = false);

    /**
     * Load the source batches of one file. Batches without a "source"
     * get "<filename>#<index>".
     *
     * @throws std::runtime_error on missing or malformed files
     */
    static std::vector<SourceBatch> load_batches(const std::string& filename);

    // Parse a batch file already in memory
    static std::vector<SourceBatch> parse_batches(const JsonValue& root,
                                                  const std::string& default_source);

    // Body (de)serialization, exposed for tests
    static void write_body(JsonWriter& w, const Body& body);
    static Body read_body(const std::string& id, const JsonValue& json);

private:
    static void write_physical(JsonWriter& w, const PhysicalParameters& p);
    static PhysicalParameters read_physical(const JsonValue& json);

    static void write_elements(JsonWriter& w, const OsculatingElements& elem);
    static OsculatingElements read_elements(const JsonValue& json);

    static void write_state_vector(JsonWriter& w, const StateVector& s);
    static StateVector read_state_vector(const JsonValue& json);

    static SourceBatch read_batch(const JsonValue& json, const std::string& default_source);

    static std::string partition_path(const std::string& directory,
                                      const std::string& partition);
};

}  // namespace solcat

#endif  // SOLCAT_CATALOG_IO_HPP
