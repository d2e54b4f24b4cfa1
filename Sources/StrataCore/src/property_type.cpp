#include "strata/property_type.hpp"
#include "strata/errors.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cctype>
#include <cstdlib>

namespace strata {

namespace {

struct type_entry {
    property_type type;
    const char* code;
};

constexpr type_entry type_table[] = {
    {property_type::integer, "INT"},
    {property_type::floating, "FLT"},
    {property_type::boolean, "BLN"},
    {property_type::string, "STR"},
    {property_type::text, "TXT"},
    {property_type::big_integer, "BGI"},
    {property_type::big_decimal, "BGF"},
    {property_type::date_time, "DAT"},
    {property_type::uri, "URI"},
    {property_type::uuid, "UID"},
    {property_type::clob, "CLB"},
    {property_type::blob, "BLB"},
};

[[noreturn]] void fail(const property_value& value, property_type target, const std::string& detail = {}) {
    throw type_coercion_error(value.kind_name(), type_code(target), detail);
}

std::string trimmed(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::optional<int64_t> parse_int64(const std::string& s) {
    int64_t v = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (first != last && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc() || ptr != last || first == last) return std::nullopt;
    return v;
}

std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return std::nullopt;
    return v;
}

bool is_integral_double(double v) {
    return std::isfinite(v) && std::floor(v) == v &&
           v >= -9223372036854775808.0 && v < 9223372036854775808.0;
}

property_value coerce_scalar(const property_value& value, property_type target, int32_t default_offset) {
    switch (target) {
        case property_type::integer: {
            if (value.is<int64_t>()) return value;
            if (value.is<double>()) {
                double d = value.as<double>();
                if (!is_integral_double(d)) fail(value, target, "not integral");
                return static_cast<int64_t>(d);
            }
            if (value.is<big_integer>()) {
                if (auto v = value.as<big_integer>().to_int64()) return *v;
                fail(value, target, "out of range");
            }
            if (value.is<std::string>()) {
                if (auto v = parse_int64(trimmed(value.as<std::string>()))) return *v;
                fail(value, target, "'" + value.as<std::string>() + "'");
            }
            break;
        }
        case property_type::floating: {
            if (value.is<double>()) return value;
            if (value.is<int64_t>()) return static_cast<double>(value.as<int64_t>());
            if (value.is<big_integer>() || value.is<big_decimal>()) {
                if (auto v = parse_double(value.to_string())) return *v;
            }
            if (value.is<std::string>()) {
                if (auto v = parse_double(trimmed(value.as<std::string>()))) return *v;
                fail(value, target, "'" + value.as<std::string>() + "'");
            }
            break;
        }
        case property_type::boolean: {
            if (value.is<bool>()) return value;
            if (value.is<int64_t>()) return value.as<int64_t>() != 0;
            if (value.is<std::string>()) {
                std::string s = trimmed(value.as<std::string>());
                std::transform(s.begin(), s.end(), s.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (s == "true") return true;
                if (s == "false") return false;
                fail(value, target, "'" + value.as<std::string>() + "'");
            }
            break;
        }
        case property_type::string:
        case property_type::text:
        case property_type::clob: {
            if (value.is<blob_t>()) break;
            std::string s = value.is<std::string>() ? value.as<std::string>() : value.to_string();
            if (target == property_type::string && s.size() > max_string_length) {
                fail(value, target, "longer than " + std::to_string(max_string_length) + " characters");
            }
            return s;
        }
        case property_type::big_integer: {
            if (value.is<big_integer>()) return value;
            if (value.is<int64_t>()) return big_integer(value.as<int64_t>());
            if (value.is<double>()) {
                double d = value.as<double>();
                if (!is_integral_double(d)) fail(value, target, "not integral");
                return big_integer(static_cast<int64_t>(d));
            }
            if (value.is<std::string>()) {
                if (auto v = big_integer::parse(trimmed(value.as<std::string>()))) return *v;
                fail(value, target, "'" + value.as<std::string>() + "'");
            }
            break;
        }
        case property_type::big_decimal: {
            if (value.is<big_decimal>()) return value;
            if (value.is<big_integer>()) return big_decimal(value.as<big_integer>());
            if (value.is<int64_t>()) return big_decimal(big_integer(value.as<int64_t>()));
            if (value.is<double>()) {
                if (!std::isfinite(value.as<double>())) fail(value, target, "not finite");
                return big_decimal(value.as<double>());
            }
            if (value.is<std::string>()) {
                if (auto v = big_decimal::parse(trimmed(value.as<std::string>()))) return *v;
                fail(value, target, "'" + value.as<std::string>() + "'");
            }
            break;
        }
        case property_type::date_time: {
            if (value.is<date_time>()) return value;
            if (value.is<int64_t>()) return date_time(value.as<int64_t>(), default_offset);
            if (value.is<std::string>()) {
                if (auto v = date_time::parse(trimmed(value.as<std::string>()), default_offset)) return *v;
                fail(value, target, "'" + value.as<std::string>() + "'");
            }
            break;
        }
        case property_type::uri: {
            if (value.is<uri_t>()) return value;
            if (value.is<std::string>()) {
                if (auto v = uri_t::parse(value.as<std::string>())) return *v;
                fail(value, target, "'" + value.as<std::string>() + "'");
            }
            break;
        }
        case property_type::uuid: {
            if (value.is<uuid_t>()) return value;
            if (value.is<std::string>()) {
                if (auto v = uuid_t::parse(trimmed(value.as<std::string>()))) return *v;
                fail(value, target, "'" + value.as<std::string>() + "'");
            }
            break;
        }
        case property_type::blob: {
            if (value.is<blob_t>()) return value;
            break;
        }
    }
    fail(value, target);
}

} // namespace

const char* type_code(property_type type) {
    for (const auto& entry : type_table) {
        if (entry.type == type) return entry.code;
    }
    return "???";
}

std::optional<property_type> property_type_from_code(std::string_view code) {
    for (const auto& entry : type_table) {
        if (code == entry.code) return entry.type;
    }
    return std::nullopt;
}

const std::vector<property_type>& all_property_types() {
    static const std::vector<property_type> types = [] {
        std::vector<property_type> out;
        for (const auto& entry : type_table) out.push_back(entry.type);
        return out;
    }();
    return types;
}

property_value coerce(const property_value& value, property_type target, int32_t default_offset_minutes) {
    if (value.is_null()) return value;

    if (value.is_list()) {
        property_value::list_t out;
        out.reserve(value.items().size());
        for (const auto& item : value.items()) {
            if (item.is_null()) {
                out.push_back(item);
                continue;
            }
            if (item.is_list()) fail(item, target, "nested list");
            out.push_back(coerce_scalar(item, target, default_offset_minutes));
        }
        return property_value::make_list(std::move(out));
    }
    return coerce_scalar(value, target, default_offset_minutes);
}

} // namespace strata
