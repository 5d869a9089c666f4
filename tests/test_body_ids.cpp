/*
FILE: tests/test_body_ids.cpp
PURPOSE: Id conventions: body type, partition file and catalog ordering.
*/
#include <algorithm>
#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

#include "catalog/catalog.hpp"

using namespace solcat;

static void test_body_types() {
    assert(body_type_for_id("0") == BodyType::BARYCENTER);
    assert(body_type_for_id("5") == BodyType::BARYCENTER);
    assert(body_type_for_id("10") == BodyType::STAR);
    assert(body_type_for_id("199") == BodyType::PLANET);
    assert(body_type_for_id("399") == BodyType::PLANET);
    assert(body_type_for_id("301") == BodyType::SATELLITE);
    assert(body_type_for_id("65035") == BodyType::SATELLITE);
    assert(body_type_for_id("a2000001") == BodyType::ASTEROID);
    assert(body_type_for_id("c1P") == BodyType::COMET);
    assert(body_type_for_id("-82") == BodyType::OTHER);
    assert(body_type_for_id("50") == BodyType::OTHER);
}

static void test_type_names() {
    assert(body_type_to_string(BodyType::BARYCENTER) == "barycenter");
    assert(string_to_body_type("comet") == BodyType::COMET);
    assert(string_to_body_type("spacecraft") == BodyType::OTHER);
    assert(string_to_body_type(body_type_to_string(BodyType::ARTIFICIAL)) == BodyType::ARTIFICIAL);
}

static void test_partitions() {
    assert(partition_for_id("0") == "major_bodies");
    assert(partition_for_id("10") == "major_bodies");
    assert(partition_for_id("899") == "major_bodies");
    assert(partition_for_id("502") == "jovian_satellites");
    assert(partition_for_id("55501") == "jovian_satellites");
    assert(partition_for_id("55060") == "jovian_satellites");
    assert(partition_for_id("610") == "saturnian_satellites");
    assert(partition_for_id("65067") == "saturnian_satellites");
    assert(partition_for_id("301") == "other_satellites");
    assert(partition_for_id("402") == "other_satellites");
    assert(partition_for_id("801") == "other_satellites");
    assert(partition_for_id("a0000433") == "asteroids");
    assert(partition_for_id("c2P") == "comets");
    assert(partition_for_id("-31") == "artificial");
    assert(partition_for_id("12345") == "artificial");

    const auto& names = Catalog::partitions();
    assert(names.size() == 7);
    for (const char* id : {"10", "502", "610", "301", "a1", "c1", "-1"}) {
        assert(std::find(names.begin(), names.end(), partition_for_id(id)) != names.end());
    }
}

static void test_catalog_order() {
    std::vector<std::string> ids = {"c1P", "299", "a2000001", "10", "-82", "2", "1000", "a0000433"};
    std::sort(ids.begin(), ids.end(), BodyIdLess());

    const std::vector<std::string> expected = {"2", "10", "299", "1000", "-82",
                                               "a0000433", "a2000001", "c1P"};
    assert(ids == expected);

    assert(numeric_body_id("0042") && *numeric_body_id("0042") == 42);
    assert(!numeric_body_id(""));
    assert(!numeric_body_id("4a"));
}

int main(void) {
    test_body_types();
    test_type_names();
    test_partitions();
    test_catalog_order();

    std::printf("test_body_ids: OK\n");
    return 0;
}
