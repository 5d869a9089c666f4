/**
 * Body Definitions
 *
 * One catalog entry: identity, optional physical parameters and the two
 * dated series (osculating elements and barycentric state vectors).
 */

#ifndef SOLCAT_BODY_HPP
#define SOLCAT_BODY_HPP

#include "core/state_vector.hpp"
#include "core/time_series.hpp"
#include <optional>
#include <string>

namespace solcat {

enum class BodyType {
    STAR,
    PLANET,
    BARYCENTER,
    SATELLITE,
    ASTEROID,
    COMET,
    ARTIFICIAL,
    OTHER
};

std::string body_type_to_string(BodyType type);

/**
 * @brief Parse a lowercase body type name ("planet", "comet", ...)
 * @return BodyType::OTHER for unknown names
 */
BodyType string_to_body_type(const std::string& s);

/**
 * Physical parameters, each present only if some source reported it
 */
struct PhysicalParameters {
    std::optional<double> mass;             // kg
    std::optional<double> radius;           // Mm
    std::optional<double> albedo;
    std::optional<double> magnitude;        // Absolute magnitude H
    std::optional<double> rotation_period;  // days
    std::optional<Vec3> rotation_axis;      // J2000 ecliptic, normalized

    // Overwrite fields that are present in other
    void update_from(const PhysicalParameters& other);

    // Set every field to zero (present, not absent)
    void zero();
};

struct Body {
    std::string id;
    std::string name;
    BodyType type = BodyType::OTHER;

    PhysicalParameters physical;

    ElementSeries osc_elements;
    StateVectorSeries state_vectors;

    Body() = default;
    Body(const std::string& id_, const std::string& name_, BodyType type_)
        : id(id_), name(name_), type(type_) {}
};

// ─────────────────────────────────────────────────────────────
// Body id conventions
//
// Numeric ids follow the JPL NAIF scheme (0 SSB, 1-9 system
// barycenters, 10 Sun, x99 planets, other 3-digit satellites);
// "a..." ids are asteroids and "c..." ids comets.
// ─────────────────────────────────────────────────────────────

// Numeric value of an all-digit id
std::optional<long> numeric_body_id(const std::string& id);

BodyType body_type_for_id(const std::string& id);

/**
 * @brief Catalog file an id is persisted in ("major_bodies", "asteroids", ...)
 */
std::string partition_for_id(const std::string& id);

/**
 * @brief Catalog ordering: numeric ids ascending, then the rest lexicographically
 */
struct BodyIdLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

} // namespace solcat

#endif // SOLCAT_BODY_HPP
