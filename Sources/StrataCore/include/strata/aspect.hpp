#pragma once

#ifdef __cplusplus

#include "entity.hpp"
#include "schema.hpp"
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/// One aspect definition's property values bound to one entity.
///
/// Checked operations consult the aspect definition and the property
/// definition and raise schema_violation (null_violation for nulls) instead
/// of ignoring a forbidden call. The unsafe_ variants skip every check.
class aspect {
public:
    aspect(entity owner, std::shared_ptr<const aspect_def> def, int32_t default_offset_minutes = 0);

    const entity& owner() const { return owner_; }
    const aspect_def& def() const { return *def_; }
    const std::shared_ptr<const aspect_def>& def_ptr() const { return def_; }

    /// Definition from the aspect definition, or one added to this instance.
    const property_def* find_property(std::string_view name) const;

    /// Properties added to this instance beyond the aspect definition.
    const std::vector<property_def>& added_properties() const { return added_; }

    /// True when a value (possibly null) is stored for name.
    bool contains(std::string_view name) const;

    property_value read(std::string_view name) const;

    /// Coerces value to the property's type before storing it.
    void write(std::string_view name, const property_value& value);

    /// Adds a property this instance's definition does not declare.
    void add(property_def def, const property_value& value);

    void remove(std::string_view name);

    /// Stored value, else the declared default, else null.
    property_value unsafe_read(std::string_view name) const;
    void unsafe_write(std::string_view name, property_value value);
    void unsafe_remove(std::string_view name);

    /// Same owner, same definition name and equal reads of every property.
    bool values_equal(const aspect& other) const;

private:
    entity owner_;
    std::shared_ptr<const aspect_def> def_;
    int32_t default_offset_;
    std::vector<property_def> added_;
    std::map<std::string, property_value, std::less<>> values_;
};

using aspect_ptr = std::shared_ptr<aspect>;

} // namespace strata

#endif // __cplusplus
