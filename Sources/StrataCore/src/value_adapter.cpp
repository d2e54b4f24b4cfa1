#include "strata/value_adapter.hpp"
#include "strata/errors.hpp"
#include "strata/json.hpp"

namespace strata {

column_value_t value_adapter::to_storage(const property_value& scalar, property_type type) const {
    if (scalar.is_null()) return nullptr;
    if (scalar.is_list()) {
        throw type_coercion_error("list", type_code(type), "stored values are scalars");
    }
    auto typed = coerce(scalar, type, default_offset_);
    if (typed.is<blob_t>()) return typed.as<blob_t>();
    return typed.to_string();
}

property_value value_adapter::from_storage(const column_value_t& stored, property_type type) const {
    return std::visit([&](auto&& v) -> property_value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (type != property_type::blob) throw type_coercion_error("blob", type_code(type));
            return blob_t(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (type == property_type::blob) {
                auto bytes = blob_from_hex(v);
                if (!bytes) throw type_coercion_error("string", type_code(type), "not hex");
                return *bytes;
            }
            return coerce(property_value(v), type, default_offset_);
        } else {
            return coerce(property_value(v), type, default_offset_);
        }
    }, stored);
}

column_value_t value_adapter::to_column(const property_value& value, const property_def& def) const {
    if (value.is_null()) return nullptr;
    if (def.is_multivalued) {
        auto typed = coerce(value.is_list() ? value : property_value::make_list({value}), def.type, default_offset_);
        return value_to_json(typed).dump();
    }

    auto typed = coerce(value, def.type, default_offset_);
    switch (def.type) {
        case property_type::integer:
            return typed.as<int64_t>();
        case property_type::floating:
            return typed.as<double>();
        case property_type::boolean:
            return static_cast<int64_t>(typed.as<bool>() ? 1 : 0);
        case property_type::blob:
            return typed.as<blob_t>();
        default:
            return typed.to_string();
    }
}

property_value value_adapter::from_column(const column_value_t& stored, const property_def& def) const {
    if (std::holds_alternative<std::nullptr_t>(stored)) return nullptr;
    if (!def.is_multivalued) return from_storage(stored, def.type);

    const auto* text = std::get_if<std::string>(&stored);
    if (!text) {
        throw type_coercion_error("column", type_code(def.type), "multivalued column " + def.name + " is not text");
    }
    json parsed;
    try {
        parsed = json::parse(*text);
    } catch (const json::parse_error& e) {
        throw type_coercion_error("string", type_code(def.type), "column " + def.name + ": " + e.what());
    }
    auto value = value_from_json(parsed, def.type, default_offset_);
    if (!value.is_null() && !value.is_list()) return property_value::make_list({value});
    return value;
}

} // namespace strata
