#include "core/body.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace solcat {

std::string body_type_to_string(BodyType type) {
    switch (type) {
        case BodyType::STAR:       return "star";
        case BodyType::PLANET:     return "planet";
        case BodyType::BARYCENTER: return "barycenter";
        case BodyType::SATELLITE:  return "satellite";
        case BodyType::ASTEROID:   return "asteroid";
        case BodyType::COMET:      return "comet";
        case BodyType::ARTIFICIAL: return "artificial";
        default:                   return "other";
    }
}

BodyType string_to_body_type(const std::string& s) {
    if (s == "star")       return BodyType::STAR;
    if (s == "planet")     return BodyType::PLANET;
    if (s == "barycenter") return BodyType::BARYCENTER;
    if (s == "satellite")  return BodyType::SATELLITE;
    if (s == "asteroid")   return BodyType::ASTEROID;
    if (s == "comet")      return BodyType::COMET;
    if (s == "artificial") return BodyType::ARTIFICIAL;
    return BodyType::OTHER;
}

void PhysicalParameters::update_from(const PhysicalParameters& other) {
    if (other.mass)            mass = other.mass;
    if (other.radius)          radius = other.radius;
    if (other.albedo)          albedo = other.albedo;
    if (other.magnitude)       magnitude = other.magnitude;
    if (other.rotation_period) rotation_period = other.rotation_period;
    if (other.rotation_axis)   rotation_axis = other.rotation_axis;
}

void PhysicalParameters::zero() {
    mass = 0.0;
    radius = 0.0;
    albedo = 0.0;
    magnitude = 0.0;
    rotation_period = 0.0;
    rotation_axis = Vec3::Zero();
}

// ─────────────────────────────────────────────────────────────
// Id conventions
// ─────────────────────────────────────────────────────────────

std::optional<long> numeric_body_id(const std::string& id) {
    if (id.empty() || id.size() > 9) return std::nullopt;
    for (char c : id) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::stol(id);
}

static bool is_planet_id(long n) {
    return n > 100 && (n + 1) % 100 == 0;
}

BodyType body_type_for_id(const std::string& id) {
    auto n = numeric_body_id(id);
    if (n) {
        if (*n < 10)       return BodyType::BARYCENTER;
        if (*n == 10)      return BodyType::STAR;
        if (is_planet_id(*n)) return BodyType::PLANET;
        if (*n > 100)      return BodyType::SATELLITE;
        return BodyType::OTHER;
    }

    if (!id.empty() && id[0] == 'a') return BodyType::ASTEROID;
    if (!id.empty() && id[0] == 'c') return BodyType::COMET;
    return BodyType::OTHER;
}

// Irregular moons Horizons files under 55xxx / 65xxx provisional ids
static const long JOVIAN_EXTRA[] = {
    55060, 55061, 55062, 55064, 55065, 55066, 55068, 55070, 55071, 55074
};
static const long SATURNIAN_EXTRA[] = {
    65035, 65040, 65041, 65045, 65048, 65050, 65055, 65056, 65065, 65066,
    65067, 65068, 65069, 65070, 65071, 65073, 65074, 65075, 65076, 65077,
    65078
};
static const long OTHER_SATELLITE_EXTRA[] = { 301, 401, 402 };

template <size_t N>
static bool contains(const long (&table)[N], long n) {
    return std::find(std::begin(table), std::end(table), n) != std::end(table);
}

std::string partition_for_id(const std::string& id) {
    auto n = numeric_body_id(id);
    if (n) {
        long v = *n;
        if (v <= 10 || is_planet_id(v)) {
            return "major_bodies";
        }
        if ((v > 500 && v < 599) || (v > 55500 && v < 55510) || contains(JOVIAN_EXTRA, v)) {
            return "jovian_satellites";
        }
        if ((v > 600 && v < 700) || contains(SATURNIAN_EXTRA, v)) {
            return "saturnian_satellites";
        }
        if ((v > 700 && v < 999) || contains(OTHER_SATELLITE_EXTRA, v)) {
            return "other_satellites";
        }
        return "artificial";
    }

    if (!id.empty() && id[0] == 'a') return "asteroids";
    if (!id.empty() && id[0] == 'c') return "comets";
    return "artificial";
}

bool BodyIdLess::operator()(const std::string& lhs, const std::string& rhs) const {
    auto l = numeric_body_id(lhs);
    auto r = numeric_body_id(rhs);

    if (l && r) {
        if (*l != *r) return *l < *r;
        return lhs < rhs;  // "01" vs "1"
    }
    if (l) return true;
    if (r) return false;
    return lhs < rhs;
}

} // namespace solcat
