#pragma once

#include <strata/strata.hpp>
#include <string>
#include <vector>

namespace test_fixtures {

using namespace strata;

// Fixed ids keep failures reproducible.
inline uuid_t catalog_id(uint64_t n) { return uuid_t(0xCA7A100000000000ULL, n); }
inline uuid_t def_id(uint64_t n) { return uuid_t(0xDEF0000000000000ULL, n); }
inline uuid_t entity_id(uint64_t n) { return uuid_t(0xE000000000000000ULL, n); }

/// One property of every type, with no defaults or flags.
inline aspect_def_ptr all_types_def(object_factory& factory) {
    std::vector<property_def> props = {
        property_def("int_val", property_type::integer),
        property_def("float_val", property_type::floating),
        property_def("bool_val", property_type::boolean),
        property_def("string_val", property_type::string),
        property_def("text_val", property_type::text),
        property_def("big_int_val", property_type::big_integer),
        property_def("big_dec_val", property_type::big_decimal),
        property_def("date_val", property_type::date_time),
        property_def("uri_val", property_type::uri),
        property_def("uuid_val", property_type::uuid),
        property_def("clob_val", property_type::clob),
        property_def("blob_val", property_type::blob),
    };
    return factory.create_immutable_aspect_def("all_types", def_id(1), std::move(props));
}

inline void fill_all_types(aspect& a) {
    a.write("int_val", 42);
    a.write("float_val", 2.5);
    a.write("bool_val", true);
    a.write("string_val", "hello");
    a.write("text_val", "a longer piece of text");
    a.write("big_int_val", *big_integer::parse("123456789012345678901234567890"));
    a.write("big_dec_val", *big_decimal::parse("3.14159265358979323846"));
    a.write("date_val", *date_time::parse("2024-03-01T12:30:00.250+02:00"));
    a.write("uri_val", *uri_t::parse("https://example.com/a?b=c"));
    a.write("uuid_val", uuid_t(0x1234, 0x5678));
    a.write("clob_val", "character large object");
    a.write("blob_val", blob_t{0x00, 0xff, 0x10, 0x7f});
}

/// person {name: STR not-null default "", tags: STR multivalued}.
inline aspect_def_ptr person_def(object_factory& factory) {
    std::vector<property_def> props = {
        property_def("name", property_type::string).not_null().with_default(""),
        property_def("tags", property_type::string).multivalued(),
    };
    return factory.create_immutable_aspect_def("person", def_id(2), std::move(props));
}

/// A catalog holding one hierarchy of every shape.
inline catalog build_sample_catalog(object_factory& factory, const uuid_t& id) {
    auto cat = factory.create_catalog(id, catalog_species::sink, uri_t::parse("strata://samples/one"), std::nullopt, 3);

    auto e1 = factory.get_or_register_entity(entity_id(1));
    auto e2 = factory.get_or_register_entity(entity_id(2));
    auto e3 = factory.get_or_register_entity(entity_id(3));

    auto& list = cat.create_entity_list("queue", 1);
    list.add(e1);
    list.add(e2);
    list.add(e1);

    auto& set = cat.create_entity_set("members");
    set.add(e3);
    set.add(e1);

    auto& dir = cat.create_entity_directory("by_name");
    dir.put("zeta", e2);
    dir.put("alpha", e1);

    auto& tree = cat.create_entity_tree("outline");
    tree.set_value(tree.root(), e3);
    auto a = tree.add_child(tree.root(), "a", e1);
    tree.add_child(a, "x", e2);
    tree.add_child(tree.root(), "b");

    auto& map = cat.create_aspect_map(all_types_def(factory), 2);
    auto full = factory.create_aspect(e1, map.def_ptr());
    fill_all_types(*full);
    map.put(full);
    auto sparse = factory.create_aspect(e2, map.def_ptr());
    sparse->write("int_val", -7);
    sparse->write("string_val", nullptr);
    map.put(sparse);

    return cat;
}

} // namespace test_fixtures
