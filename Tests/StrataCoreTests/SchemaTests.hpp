#pragma once

#include "TestFixtures.hpp"
#include <cassert>
#include <iostream>

namespace schema_tests {

using namespace strata;
using namespace test_fixtures;

// ============================================================================
// test_property_def_hash: stable, sensitive to every field
// ============================================================================

void test_property_def_hash() {
    std::cout << "  test_property_def_hash..." << std::flush;

    auto a = property_def("age", property_type::integer);
    auto b = property_def("age", property_type::integer);
    assert(a.hash() == b.hash());
    assert(a.fully_equals(b));

    b.not_null();
    assert(a.hash() != b.hash());
    assert(!a.fully_equals(b));
    // Structural identity is still the name.
    assert(a == b);

    auto c = property_def("age", property_type::big_integer);
    assert(a.hash() != c.hash());

    auto d = property_def("age", property_type::integer).with_default(0);
    auto e = property_def("age", property_type::integer).with_default(1);
    assert(d.hash() != e.hash());
    assert(d.hash() != a.hash());

    // FNV-1a of the empty input is the offset basis.
    assert(hasher().value() == hasher::offset_basis);
    assert(hasher().update("a").value() == 0xaf63dc4c8601ec8cULL);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_aspect_def_hash: declaration order never matters
// ============================================================================

void test_aspect_def_hash() {
    std::cout << "  test_aspect_def_hash..." << std::flush;

    object_factory factory;
    auto forward = factory.create_immutable_aspect_def("pair", def_id(10), {
        property_def("left", property_type::string),
        property_def("right", property_type::integer),
    });
    auto backward = factory.create_immutable_aspect_def("pair", def_id(10), {
        property_def("right", property_type::integer),
        property_def("left", property_type::string),
    });
    assert(forward->hash() == backward->hash());
    assert(forward->fully_equals(*backward));
    assert(backward->fully_equals(*forward));
    assert(forward->fully_equals(*forward));

    auto renamed = factory.create_immutable_aspect_def("pair2", def_id(10), {
        property_def("left", property_type::string),
        property_def("right", property_type::integer),
    });
    assert(forward->hash() != renamed->hash());

    auto smaller = factory.create_immutable_aspect_def("pair", def_id(10), {
        property_def("left", property_type::string),
    });
    assert(!forward->fully_equals(*smaller));
    assert(!smaller->fully_equals(*forward));

    auto mutable_pair = factory.create_mutable_aspect_def("pair", def_id(10), {
        property_def("left", property_type::string),
        property_def("right", property_type::integer),
    });
    assert(forward->hash() != mutable_pair->hash());

    // Repeated hashing of one definition is stable.
    assert(forward->hash() == forward->hash());

    bool threw = false;
    try {
        aspect_def("dupes", def_id(11), {property_def("x", property_type::integer),
                                         property_def("x", property_type::string)});
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_catalog_def_hash
// ============================================================================

void test_catalog_def_hash() {
    std::cout << "  test_catalog_def_hash..." << std::flush;

    object_factory factory;
    auto one = factory.create_catalog(catalog_id(20), catalog_species::sink);
    one.create_entity_list("a");
    one.create_entity_set("b");

    auto two = factory.create_catalog(catalog_id(21), catalog_species::sink);
    two.create_entity_set("b");
    two.create_entity_list("a");
    assert(one.schema_hash() == two.schema_hash());

    two.remove_hierarchy("a");
    two.create_entity_directory("a");
    assert(one.schema_hash() != two.schema_hash());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_aspect_permissions: checked access honours every flag
// ============================================================================

void test_aspect_permissions() {
    std::cout << "  test_aspect_permissions..." << std::flush;

    object_factory factory;
    auto def = factory.create_immutable_aspect_def("guarded", def_id(30), {
        property_def("secret", property_type::string).write_only(),
        property_def("fixed", property_type::string).read_only().with_default("v1"),
        property_def("required", property_type::integer).not_null(),
        property_def("tags", property_type::string).multivalued(),
        property_def("when", property_type::date_time),
    });
    auto owner = factory.create_entity();
    aspect a(owner, def, 90);

    a.write("secret", "s3cret");
    bool threw = false;
    try {
        a.read("secret");
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);
    assert(a.unsafe_read("secret") == property_value("s3cret"));

    assert(a.read("fixed") == property_value("v1"));
    threw = false;
    try {
        a.write("fixed", "v2");
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        a.write("required", nullptr);
    } catch (const null_violation&) {
        threw = true;
    }
    assert(threw);
    assert(!a.contains("required"));

    threw = false;
    try {
        a.read("missing");
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    // A scalar written to a multivalued property becomes a list.
    a.write("tags", "solo");
    assert(a.read("tags").is_list());
    assert(a.read("tags").items().size() == 1);

    threw = false;
    try {
        a.write("required", property_value::make_list({1, 2}));
    } catch (const type_coercion_error&) {
        threw = true;
    }
    assert(threw);

    // Offsetless date-times take the aspect's default offset.
    a.write("when", "2024-01-02T03:04");
    assert(a.read("when").as<date_time>().offset_minutes == 90);

    auto hidden = factory.create_aspect_def("hidden", def_id(31), {property_def("x", property_type::integer)},
                                            false, false);
    aspect h(owner, hidden);
    threw = false;
    try {
        h.read("x");
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        h.write("x", 1);
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_mutability_shapes: (can_add, can_remove) picks the shape
// ============================================================================

void test_mutability_shapes() {
    std::cout << "  test_mutability_shapes..." << std::flush;

    object_factory factory;
    auto owner = factory.create_entity();

    auto fixed = factory.create_immutable_aspect_def("fixed", def_id(40), {
        property_def("x", property_type::integer).removable(),
    });
    assert(fixed->mutability() == aspect_mutability::immutable);

    aspect a(owner, fixed);
    bool threw = false;
    try {
        a.add(property_def("y", property_type::integer), 1);
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        a.remove("x");
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    auto open = factory.create_mutable_aspect_def("open", def_id(41), {
        property_def("keep", property_type::integer),
        property_def("drop", property_type::integer).removable(),
    });
    assert(open->mutability() == aspect_mutability::fully_mutable);

    aspect b(owner, open);
    b.add(property_def("extra", property_type::string).removable(), "added");
    assert(b.read("extra") == property_value("added"));
    assert(b.added_properties().size() == 1);

    threw = false;
    try {
        b.add(property_def("keep", property_type::integer), 2);
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    b.write("drop", 5);
    b.remove("drop");
    assert(!b.contains("drop"));
    b.remove("extra");
    assert(b.added_properties().empty());

    threw = false;
    try {
        b.remove("keep");
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    auto add_only = factory.create_aspect_def("add_only", def_id(42), {}, true, true, true, false);
    assert(add_only->mutability() == aspect_mutability::mixed);
    auto remove_only = factory.create_aspect_def("remove_only", def_id(43), {}, true, true, false, true);
    assert(remove_only->mutability() == aspect_mutability::mixed);

    // Definition-level changes follow the same capabilities.
    open->add_property(property_def("later", property_type::boolean));
    assert(open->find_property("later"));
    open->remove_property("drop");
    assert(!open->find_property("drop"));
    threw = false;
    try {
        fixed->add_property(property_def("later", property_type::boolean));
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    // The unsafe variants skip every check.
    aspect c(owner, fixed);
    c.unsafe_write("anything", 1);
    assert(c.unsafe_read("anything") == property_value(1));
    c.unsafe_remove("anything");
    assert(!c.contains("anything"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_aspect_cache: bounded LRU, authoritative catalogs behind it
// ============================================================================

void test_aspect_cache() {
    std::cout << "  test_aspect_cache..." << std::flush;

    object_factory factory(2);
    auto& registry = factory.entities();
    auto def = person_def(factory);

    auto e1 = factory.get_or_register_entity(entity_id(1));
    auto e2 = factory.get_or_register_entity(entity_id(2));
    auto e3 = factory.get_or_register_entity(entity_id(3));
    assert(factory.get_or_register_entity(entity_id(1)) == e1);
    assert(factory.create_entity() != factory.create_entity());

    auto a1 = factory.create_aspect(e1, def);
    auto a2 = factory.create_aspect(e2, def);
    auto a3 = factory.create_aspect(e3, def);

    registry.cache_aspect(a1);
    registry.cache_aspect(a2);
    // Touch a1 so a2 becomes least recently used.
    assert(registry.cached_aspect(e1, "person") == a1);
    registry.cache_aspect(a3);
    assert(registry.cache_size() == 2);
    assert(registry.cached_aspect(e2, "person") == nullptr);
    assert(registry.cached_aspect(e1, "person") == a1);
    assert(registry.cached_aspect(e3, "person") == a3);

    // A miss falls through to the catalogs and caches the hit.
    auto cat = factory.create_catalog(catalog_id(50), catalog_species::sink);
    cat.create_aspect_map(def).put(a2);
    assert(registry.find_aspect(e2, *def, {&cat}) == a2);
    assert(registry.cached_aspect(e2, "person") == a2);

    registry.evict(e2);
    assert(registry.cached_aspect(e2, "person") == nullptr);
    assert(registry.find_aspect(e2, *def, {}) == nullptr);

    registry.clear_cache();
    assert(registry.cache_size() == 0);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "--- Schema Tests ---" << std::endl;
    test_property_def_hash();
    test_aspect_def_hash();
    test_catalog_def_hash();
    test_aspect_permissions();
    test_mutability_shapes();
    test_aspect_cache();
}

} // namespace schema_tests
