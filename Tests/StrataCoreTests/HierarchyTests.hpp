#pragma once

#include "TestFixtures.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

namespace hierarchy_tests {

using namespace strata;
using namespace test_fixtures;

// ============================================================================
// test_entity_list: ordered, duplicates allowed
// ============================================================================

void test_entity_list() {
    std::cout << "  test_entity_list..." << std::flush;

    entity_list_hierarchy list("queue", catalog_id(1));
    entity a(entity_id(1)), b(entity_id(2)), c(entity_id(3));
    list.add(a);
    list.add(b);
    list.add(a);
    assert(list.size() == 3);
    assert(list.at(2) == a);

    list.insert(1, c);
    assert(list.at(1) == c);
    assert(list.remove(a));
    assert(list.at(0) == c);
    assert(list.size() == 3);
    list.remove_at(0);
    assert(list.at(0) == b);
    assert(!list.remove(c));

    bool threw = false;
    try {
        list.insert(10, a);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_entity_set: unique members, insertion order
// ============================================================================

void test_entity_set() {
    std::cout << "  test_entity_set..." << std::flush;

    entity_set_hierarchy set("members", catalog_id(1));
    entity a(entity_id(1)), b(entity_id(2));
    assert(set.add(b));
    assert(set.add(a));
    assert(!set.add(b));
    assert(set.size() == 2);
    assert(set.entities().front() == b);
    assert(set.contains(a));
    assert(set.remove(a));
    assert(!set.contains(a));
    assert(!set.remove(a));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_entity_directory: unique keys, replacing keeps position
// ============================================================================

void test_entity_directory() {
    std::cout << "  test_entity_directory..." << std::flush;

    entity_directory_hierarchy dir("by_name", catalog_id(1));
    entity a(entity_id(1)), b(entity_id(2)), c(entity_id(3));
    dir.put("zeta", a);
    dir.put("alpha", b);
    dir.put("zeta", c);
    assert(dir.size() == 2);
    assert(dir.entries().front().first == "zeta");
    assert(dir.get("zeta") == c);
    assert(!dir.get("missing"));
    assert(dir.contains_key("alpha"));
    assert(dir.remove("alpha"));
    assert(!dir.contains_key("alpha"));
    assert(!dir.remove("alpha"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_entity_tree: keyed children, paths, replacement
// ============================================================================

void test_entity_tree() {
    std::cout << "  test_entity_tree..." << std::flush;

    entity_tree_hierarchy tree("outline", catalog_id(1));
    entity a(entity_id(1)), b(entity_id(2));
    assert(tree.size() == 1);
    assert(tree.at(tree.root()).is_leaf());

    auto docs = tree.add_child(tree.root(), "docs", a);
    auto guide = tree.add_child(docs, "guide", b);
    tree.add_child(tree.root(), "api");
    assert(tree.size() == 4);
    assert(tree.path_of(guide) == "/docs/guide");
    assert(tree.path_of(tree.root()) == "");
    assert(tree.find("/docs/guide") == guide);
    assert(tree.find("docs") == docs);
    assert(tree.find("/") == tree.root());
    assert(!tree.find("/docs/missing"));
    assert(tree.at(guide).value == b);

    // Children iterate in key order.
    assert(tree.at(tree.root()).children.begin()->first == "api");

    // Replacing a child detaches its subtree.
    tree.add_child(tree.root(), "docs");
    assert(tree.size() == 3);
    assert(!tree.find("/docs/guide"));
    assert(!tree.at(*tree.find("/docs")).value);

    assert(tree.remove_child(tree.root(), "api"));
    assert(tree.size() == 2);
    assert(!tree.remove_child(tree.root(), "api"));

    // Repeated edits reuse freed slots instead of growing the arena.
    const size_t slots = tree.arena_size();
    for (int i = 0; i < 100; ++i) {
        auto scratch = tree.add_child(tree.root(), "scratch", a);
        tree.add_child(scratch, "leaf", b);
        tree.add_child(tree.root(), "scratch");
        assert(tree.remove_child(tree.root(), "scratch"));
    }
    assert(tree.arena_size() <= slots + 2);
    assert(tree.size() == 2);
    assert(tree.path_of(*tree.find("/docs")) == "/docs");

    bool threw = false;
    try {
        tree.add_child(tree.root(), "a/b");
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    entity_tree_hierarchy other("outline", catalog_id(1));
    other.add_child(other.root(), "docs");
    assert(tree.contents_equal(other));
    other.set_value(other.root(), a);
    assert(!tree.contents_equal(other));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_aspect_map: one aspect definition, keyed by entity
// ============================================================================

void test_aspect_map() {
    std::cout << "  test_aspect_map..." << std::flush;

    object_factory factory;
    auto def = person_def(factory);
    aspect_map_hierarchy map(def, catalog_id(1));
    assert(map.name() == "person");

    auto a = factory.create_entity();
    auto first = factory.create_aspect(a, def);
    first->write("name", "Ada");
    map.put(first);
    auto second = factory.create_aspect(a, def);
    second->write("name", "Grace");
    map.put(second);
    assert(map.size() == 1);
    assert(map.get(a)->read("name") == property_value("Grace"));

    auto other_def = factory.create_immutable_aspect_def("other", def_id(60), {});
    bool threw = false;
    try {
        map.put(factory.create_aspect(a, other_def));
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    // Same name, different properties: still a different definition.
    auto impostor = factory.create_immutable_aspect_def("person", def_id(61), {
        property_def("label", property_type::string),
    });
    threw = false;
    try {
        map.put(factory.create_aspect(a, impostor));
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);
    assert(map.get(a) == second);

    // A structurally identical copy of the definition is accepted.
    auto twin = factory.create_aspect_def(def->name(), def->global_id(), def->properties(),
                                          def->is_readable(), def->is_writable(),
                                          def->can_add_properties(), def->can_remove_properties());
    map.put(factory.create_aspect(a, twin));
    assert(map.size() == 1);

    assert(map.remove(a));
    assert(map.empty());
    assert(!map.get(a));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_catalog_rules: species, names and aspect map protection
// ============================================================================

void test_catalog_rules() {
    std::cout << "  test_catalog_rules..." << std::flush;

    object_factory factory;

    bool threw = false;
    try {
        factory.create_catalog(catalog_id(70), catalog_species::mirror);
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        factory.create_catalog(catalog_id(70), catalog_species::source, std::nullopt, catalog_id(71));
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    auto fork = factory.create_catalog(catalog_id(72), catalog_species::fork, std::nullopt, catalog_id(71));
    assert(fork.upstream() == catalog_id(71));
    assert(species_name(catalog_species::fork) == std::string("FORK"));
    assert(catalog_species_from_string("mirror") == catalog_species::mirror);
    assert(!catalog_species_from_string("river"));

    auto cat = factory.create_catalog(catalog_id(73), catalog_species::sink);
    cat.create_entity_list("things").add(entity(entity_id(1)));
    // Same-named hierarchies replace each other.
    cat.create_entity_set("things");
    assert(cat.hierarchies().size() == 1);
    assert(cat.find<entity_set_hierarchy>("things"));
    assert(!cat.find<entity_list_hierarchy>("things"));

    auto def = person_def(factory);
    cat.create_aspect_map(def);
    assert(cat.find_aspect_def("person") == def);
    threw = false;
    try {
        cat.create_entity_list("person");
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    // A different definition under a registered name is rejected.
    auto clash = factory.create_immutable_aspect_def("person", def_id(2), {
        property_def("name", property_type::text),
    });
    threw = false;
    try {
        cat.extend(clash);
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);
    // An equal one is accepted.
    cat.extend(person_def(factory));
    assert(cat.aspect_defs().size() == 1);

    threw = false;
    try {
        cat.add_hierarchy(entity_list_hierarchy("foreign", catalog_id(99)));
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        entity_list_hierarchy("", catalog_id(73));
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    assert(cat.remove_hierarchy("things"));
    assert(!cat.find_hierarchy("things"));
    assert(!cat.remove_hierarchy("things"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_catalog_equality
// ============================================================================

void test_catalog_equality() {
    std::cout << "  test_catalog_equality..." << std::flush;

    object_factory factory;
    auto one = build_sample_catalog(factory, catalog_id(80));
    auto two = build_sample_catalog(factory, catalog_id(80));
    assert(one.contents_equal(two));
    assert(two.contents_equal(one));

    two.find<entity_list_hierarchy>("queue")->add(entity(entity_id(9)));
    assert(!one.contents_equal(two));

    auto three = build_sample_catalog(factory, catalog_id(80));
    three.find<aspect_map_hierarchy>("all_types")->get(entity(entity_id(2)))->write("int_val", 8);
    assert(!one.contents_equal(three));

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "--- Hierarchy Tests ---" << std::endl;
    test_entity_list();
    test_entity_set();
    test_entity_directory();
    test_entity_tree();
    test_aspect_map();
    test_catalog_rules();
    test_catalog_equality();
}

} // namespace hierarchy_tests
