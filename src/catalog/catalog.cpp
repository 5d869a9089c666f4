#include "catalog/catalog.hpp"

namespace solcat {

Body& Catalog::get_or_create(const std::string& id) {
    auto it = bodies_.find(id);
    if (it != bodies_.end()) {
        return it->second;
    }
    Body body(id, id, body_type_for_id(id));
    return bodies_.emplace(id, std::move(body)).first->second;
}

Body* Catalog::find(const std::string& id) {
    auto it = bodies_.find(id);
    return it == bodies_.end() ? nullptr : &it->second;
}

const Body* Catalog::find(const std::string& id) const {
    auto it = bodies_.find(id);
    return it == bodies_.end() ? nullptr : &it->second;
}

bool Catalog::contains(const std::string& id) const {
    return bodies_.count(id) > 0;
}

Body& Catalog::put(Body body) {
    std::string id = body.id;
    auto it = bodies_.find(id);
    if (it != bodies_.end()) {
        it->second = std::move(body);
        return it->second;
    }
    return bodies_.emplace(id, std::move(body)).first->second;
}

std::vector<std::string> Catalog::ids() const {
    std::vector<std::string> out;
    out.reserve(bodies_.size());
    for (const auto& entry : bodies_) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<std::string> Catalog::ids_in_partition(const std::string& partition) const {
    std::vector<std::string> out;
    for (const auto& entry : bodies_) {
        if (partition_for_id(entry.first) == partition) {
            out.push_back(entry.first);
        }
    }
    return out;
}

const std::vector<std::string>& Catalog::partitions() {
    static const std::vector<std::string> names = {
        "asteroids",
        "comets",
        "jovian_satellites",
        "saturnian_satellites",
        "other_satellites",
        "major_bodies",
        "artificial"
    };
    return names;
}

} // namespace solcat
