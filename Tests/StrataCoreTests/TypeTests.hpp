#pragma once

#include <strata/strata.hpp>
#include <cassert>
#include <iostream>

namespace type_tests {

using namespace strata;

// ============================================================================
// test_coercion: values convert to each property type or fail loudly
// ============================================================================

void test_coercion() {
    std::cout << "  test_coercion..." << std::flush;

    assert(coerce("42", property_type::integer) == property_value(42));
    assert(coerce(" 42 ", property_type::integer) == property_value(42));
    assert(coerce(3.0, property_type::integer) == property_value(3));
    assert(coerce(7, property_type::floating) == property_value(7.0));
    assert(coerce("TRUE", property_type::boolean) == property_value(true));
    assert(coerce(0, property_type::boolean) == property_value(false));
    assert(coerce(12, property_type::string) == property_value("12"));
    assert(coerce("-0042", property_type::big_integer).as<big_integer>().to_string() == "-42");
    assert(coerce(nullptr, property_type::integer).is_null());

    bool threw = false;
    try {
        coerce(2.5, property_type::integer);
    } catch (const type_coercion_error& e) {
        threw = true;
        assert(e.from_type() == "float");
        assert(e.to_type() == "INT");
    }
    assert(threw);

    threw = false;
    try {
        coerce("yes", property_type::boolean);
    } catch (const type_coercion_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        coerce(std::string(max_string_length + 1, 'x'), property_type::string);
    } catch (const type_coercion_error&) {
        threw = true;
    }
    assert(threw);

    // TXT has no length limit.
    auto text = coerce(std::string(max_string_length + 1, 'x'), property_type::text);
    assert(text.as<std::string>().size() == max_string_length + 1);

    // Lists coerce element by element and keep nulls.
    auto list = coerce(property_value::make_list({"1", nullptr, 3}), property_type::integer);
    assert(list.items().size() == 3);
    assert(list.items()[0] == property_value(1));
    assert(list.items()[1].is_null());

    threw = false;
    try {
        coerce(property_value::make_list({property_value::make_list({1})}), property_type::integer);
    } catch (const type_coercion_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_date_time: ISO-8601 parsing keeps the offset
// ============================================================================

void test_date_time() {
    std::cout << "  test_date_time..." << std::flush;

    auto dt = date_time::parse("2024-03-01T12:30:00.250+02:00");
    assert(dt);
    assert(dt->offset_minutes == 120);
    assert(dt->to_string() == "2024-03-01T12:30:00.250+02:00");

    auto utc = date_time::parse("2024-03-01T10:30:00.250Z");
    assert(utc);
    assert(utc->epoch_millis == dt->epoch_millis);
    assert(*utc != *dt);

    auto date_only = date_time::parse("2024-03-01", 60);
    assert(date_only);
    assert(date_only->to_string() == "2024-03-01T00:00:00+01:00");

    assert(date_time::parse("1970-01-01T00:00:00Z")->epoch_millis == 0);
    assert(date_time::parse("2024-03-01T12:30:00+01:00[Europe/Paris]"));
    assert(!date_time::parse("2024-13-01"));
    assert(!date_time::parse("2024-02-31"));
    assert(!date_time::parse("2023-02-29"));
    assert(!date_time::parse("2100-02-29"));
    assert(!date_time::parse("2024-04-31T00:00:00Z"));
    assert(date_time::parse("2024-02-29")->to_string() == "2024-02-29T00:00:00Z");
    assert(date_time::parse("2000-02-29"));
    assert(date_time::parse("2024-12-31"));
    assert(!date_time::parse("2024-03-01T25:00"));
    assert(!date_time::parse("yesterday"));

    auto coerced = coerce("2024-03-01T12:30", property_type::date_time, -300);
    assert(coerced.as<date_time>().offset_minutes == -300);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_scalar_types: uuids, big numbers, uris and hex
// ============================================================================

void test_scalar_types() {
    std::cout << "  test_scalar_types..." << std::flush;

    auto id = uuid_t(0x550e8400e29b41d4ULL, 0xa716446655440000ULL);
    assert(id.to_string() == "550e8400-e29b-41d4-a716-446655440000");
    assert(uuid_t::parse("550E8400-E29B-41D4-A716-446655440000") == id);
    assert(uuid_t::parse("550e8400e29b41d4a716446655440000") == id);
    assert(!uuid_t::parse("550e8400-e29b-41d4-a716"));

    auto generated = uuid_t::generate();
    assert(!generated.is_nil());
    assert((generated.bytes[6] & 0xF0) == 0x40);

    assert(big_integer::parse("+0007")->to_string() == "7");
    assert(big_integer::parse("-0")->to_string() == "0");
    assert(!big_integer::parse("12a"));
    assert(!big_integer::parse("123456789012345678901234567890")->to_int64());

    assert(*big_decimal::parse("1.0") != *big_decimal::parse("1.00"));
    assert(big_decimal::parse("+2.5e-3")->to_string() == "2.5e-3");
    assert(!big_decimal::parse("."));
    assert(!big_decimal::parse("1e"));

    assert(uri_t::parse("https://example.com/path"));
    assert(uri_t::parse("relative/path"));
    assert(!uri_t::parse("has space"));
    assert(!uri_t::parse("1http://bad"));

    blob_t bytes{0x00, 0xff, 0x10};
    assert(to_hex(bytes) == "00ff10");
    assert(blob_from_hex("00FF10") == bytes);
    assert(!blob_from_hex("abc"));
    assert(!blob_from_hex("zz"));

    assert(property_value(bytes).to_string() == "00ff10");
    assert(property_value::make_list({1, "a"}).to_string() == "[1, a]");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_type_codes: codes and SQL affinities
// ============================================================================

void test_type_codes() {
    std::cout << "  test_type_codes..." << std::flush;

    assert(all_property_types().size() == 12);
    for (auto type : all_property_types()) {
        assert(property_type_from_code(type_code(type)) == type);
    }
    assert(!property_type_from_code("int"));

    assert(column_type_for(property_type::boolean) == column_type::integer);
    assert(column_type_for(property_type::floating) == column_type::real);
    assert(column_type_for(property_type::date_time) == column_type::text);
    assert(column_type_for(property_type::blob) == column_type::blob);
    assert(column_type_for(property_def("tags", property_type::integer).multivalued()) == column_type::text);

    assert(column_type_from_sql("VARCHAR(20)") == column_type::text);
    assert(column_type_from_sql("BIGINT") == column_type::integer);
    assert(column_type_from_sql("DOUBLE") == column_type::real);
    assert(column_type_from_sql("BLOB") == column_type::blob);
    assert(!column_type_from_sql(""));
    assert(property_type_for(column_type::real) == property_type::floating);

    for (auto type : {hierarchy_type::entity_list, hierarchy_type::entity_set, hierarchy_type::entity_directory,
                      hierarchy_type::entity_tree, hierarchy_type::aspect_map}) {
        assert(hierarchy_type_from_code(hierarchy_type_code(type)) == type);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_log_level_names
// ============================================================================

void test_log_level_names() {
    std::cout << "  test_log_level_names..." << std::flush;

    assert(log_level_from_string("DEBUG") == log_level::debug);
    assert(log_level_from_string("off") == log_level::off);
    assert(log_level_from_string("Info") == log_level::info);
    assert(log_level_from_string("nonsense") == log_level::warn);
    assert(log_level_from_string(nullptr) == log_level::warn);

    auto previous = get_log_level();
    set_log_level(log_level::error);
    assert(get_log_level() == log_level::error);
    set_log_level(previous);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "--- Type Tests ---" << std::endl;
    test_coercion();
    test_date_time();
    test_scalar_types();
    test_type_codes();
    test_log_level_names();
}

} // namespace type_tests
