#ifndef SOLCAT_CATALOG_HPP
#define SOLCAT_CATALOG_HPP

#include "core/body.hpp"
#include <map>
#include <string>
#include <vector>

namespace solcat {

/**
 * @brief Every known body, keyed by id in catalog order
 *
 * Owned by one build pass and handed by reference to each stage.
 */
class Catalog {
public:
    using BodyMap = std::map<std::string, Body, BodyIdLess>;

    Catalog() = default;

    /**
     * @brief Body with this id, created on first mention
     *
     * A new body gets its type from the id convention and the id as a
     * placeholder name until a source names it.
     */
    Body& get_or_create(const std::string& id);

    Body* find(const std::string& id);
    const Body* find(const std::string& id) const;
    bool contains(const std::string& id) const;

    /**
     * @brief Insert or overwrite the body stored under body.id
     */
    Body& put(Body body);

    size_t size() const { return bodies_.size(); }
    bool empty() const { return bodies_.empty(); }

    std::vector<std::string> ids() const;

    // Ids of bodies persisted in one partition file, catalog order
    std::vector<std::string> ids_in_partition(const std::string& partition) const;

    BodyMap& bodies() { return bodies_; }
    const BodyMap& bodies() const { return bodies_; }

    // Partition file names, in the order they are written
    static const std::vector<std::string>& partitions();

private:
    BodyMap bodies_;
};

} // namespace solcat

#endif // SOLCAT_CATALOG_HPP
