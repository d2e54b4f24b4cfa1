#pragma once

#include "TestFixtures.hpp"
#include <cassert>
#include <iostream>

namespace json_tests {

using namespace strata;
using namespace test_fixtures;

// ============================================================================
// test_catalog_document: export and import give back the same catalog
// ============================================================================

void test_catalog_document() {
    std::cout << "  test_catalog_document..." << std::flush;

    object_factory factory;
    auto cat = build_sample_catalog(factory, catalog_id(300));
    auto doc = to_json(cat);

    assert(doc["globalId"] == catalog_id(300).to_string());
    assert(doc["species"] == "sink");
    assert(doc["version"] == 3);
    assert(!doc.contains("upstream"));

    const auto& by_name = doc["hierarchies"]["by_name"];
    assert(by_name["type"] == "ED");
    assert(by_name["contents"].begin().key() == "zeta");
    assert(doc["hierarchies"]["queue"]["contents"].size() == 3);

    const auto& outline = doc["hierarchies"]["outline"]["contents"];
    assert(outline["entityId"] == entity_id(3).to_string());
    assert(outline["children"]["a"]["children"]["x"]["entityId"] == entity_id(2).to_string());
    assert(!outline["children"]["b"].contains("entityId"));

    const auto& full = doc["hierarchies"]["all_types"]["contents"][entity_id(1).to_string()];
    assert(full["int_val"] == 42);
    assert(full["blob_val"] == "00ff107f");
    assert(full["date_val"] == "2024-03-01T12:30:00.250+02:00");
    const auto& sparse = doc["hierarchies"]["all_types"]["contents"][entity_id(2).to_string()];
    assert(sparse["string_val"].is_null());
    assert(!sparse.contains("float_val"));

    const auto& props = doc["aspectDefs"]["all_types"]["propertyDefs"];
    assert(props.size() == 12);
    assert(props[0]["type"] == "INT");
    assert(!props[0].contains("isNullable"));

    // Through text and back.
    object_factory fresh;
    auto restored = catalog_from_json(json::parse(doc.dump()), fresh);
    assert(restored.contents_equal(cat));
    assert(to_json(restored) == doc);
    assert(restored.find<entity_set_hierarchy>("members")->contains(entity(entity_id(3))));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_schema_documents: property and aspect definitions keep every flag
// ============================================================================

void test_schema_documents() {
    std::cout << "  test_schema_documents..." << std::flush;

    object_factory factory;
    auto def = factory.create_aspect_def("flags", def_id(310), {
        property_def("hidden", property_type::text).write_only(),
        property_def("count", property_type::integer).not_null().with_default(5),
        property_def("labels", property_type::string).multivalued().removable(),
        property_def("payload", property_type::blob).with_default(blob_t{0x01, 0x02}),
    }, true, false, true, false);

    auto doc = aspect_def_to_json(*def);
    assert(doc["isWritable"] == false);
    assert(doc["canAddProperties"] == true);
    assert(!doc.contains("canRemoveProperties"));
    assert(doc["propertyDefs"][1]["defaultValue"] == 5);
    assert(doc["propertyDefs"][3]["defaultValue"] == "0102");

    auto restored = aspect_def_from_json(doc, factory);
    assert(restored->fully_equals(*def));
    assert(restored->hash() == def->hash());

    auto prop = property_def_from_json(json::parse(R"({"name": "n", "type": "BGI", "defaultValue": "12"})"));
    assert(prop.type == property_type::big_integer);
    assert(prop.default_value.as<big_integer>().to_string() == "12");

    bool threw = false;
    try {
        property_def_from_json(json::parse(R"({"name": "n", "type": "XYZ"})"));
    } catch (const structural_inconsistency&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_value_documents: typed reading of JSON values
// ============================================================================

void test_value_documents() {
    std::cout << "  test_value_documents..." << std::flush;

    assert(value_to_json(property_value(big_decimal(big_integer(7)))) == "7");
    assert(value_to_json(property_value::make_list({1, nullptr})).dump() == "[1,null]");
    assert(value_from_json(json::parse("[1, 2.5, true, \"x\", null]")).items().size() == 5);

    assert(value_from_json(json("42"), property_type::integer) == property_value(42));
    assert(value_from_json(json("beef"), property_type::blob) == property_value(blob_t{0xbe, 0xef}));
    assert(value_from_json(json("2024-01-01T00:00"), property_type::date_time, 60)
               .as<date_time>().offset_minutes == 60);

    bool threw = false;
    try {
        value_from_json(json("xyz"), property_type::blob);
    } catch (const type_coercion_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        value_from_json(json::parse(R"({"a": 1})"));
    } catch (const type_coercion_error&) {
        threw = true;
    }
    assert(threw);

    uuid_t id = json(entity_id(5).to_string()).get<uuid_t>();
    assert(id == entity_id(5));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_malformed_documents
// ============================================================================

void test_malformed_documents() {
    std::cout << "  test_malformed_documents..." << std::flush;

    object_factory factory;
    auto expect_inconsistent = [&](const std::string& text) {
        bool threw = false;
        try {
            catalog_from_json(json::parse(text), factory);
        } catch (const structural_inconsistency&) {
            threw = true;
        }
        assert(threw);
    };

    const std::string id = catalog_id(320).to_string();
    expect_inconsistent("[]");
    expect_inconsistent(R"({"species": "sink"})");
    expect_inconsistent(R"({"globalId": "not-a-uuid", "species": "sink"})");
    expect_inconsistent(R"({"globalId": ")" + id + R"(", "species": "river"})");
    expect_inconsistent(R"({"globalId": ")" + id + R"(", "species": "sink",
        "hierarchies": {"h": {"type": "XX"}}})");
    expect_inconsistent(R"({"globalId": ")" + id + R"(", "species": "sink",
        "hierarchies": {"ghost": {"type": "AM", "contents": {}}}})");
    expect_inconsistent(R"({"globalId": ")" + id + R"(", "species": "sink",
        "hierarchies": {"l": {"type": "EL", "contents": {}}}})");

    // Species rules still apply to imported catalogs.
    bool threw = false;
    try {
        catalog_from_json(json::parse(R"({"globalId": ")" + id + R"(", "species": "mirror"})"), factory);
    } catch (const schema_violation&) {
        threw = true;
    }
    assert(threw);

    // Unknown properties inside an aspect map are skipped.
    auto def = person_def(factory);
    json doc = {
        {"globalId", id},
        {"species", "SINK"},
        {"aspectDefs", {{"person", aspect_def_to_json(*def)}}},
        {"hierarchies", {{"person", {
            {"type", "AM"},
            {"contents", {{entity_id(1).to_string(), {{"name", "Ada"}, {"nickname", "Countess"}}}}},
        }}}},
    };
    auto cat = catalog_from_json(doc, factory);
    auto a = cat.find<aspect_map_hierarchy>("person")->get(entity(entity_id(1)));
    assert(a->read("name") == property_value("Ada"));
    assert(!a->contains("nickname"));

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "--- JSON Tests ---" << std::endl;
    test_catalog_document();
    test_schema_documents();
    test_value_documents();
    test_malformed_documents();
}

} // namespace json_tests
