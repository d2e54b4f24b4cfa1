#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace strata {

/// Base of every error the library raises.
class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

/// A read, write, add or remove the schema or property permissions forbid.
class schema_violation : public error {
public:
    explicit schema_violation(const std::string& msg) : error(msg) {}
};

/// Null written to a non-nullable property.
class null_violation : public schema_violation {
public:
    explicit null_violation(const std::string& msg) : schema_violation(msg) {}
};

class type_coercion_error : public error {
public:
    type_coercion_error(const std::string& from, const std::string& to, const std::string& detail = {})
        : error("cannot coerce " + from + " to " + to + (detail.empty() ? "" : ": " + detail))
        , from_(from), to_(to) {}

    const std::string& from_type() const { return from_; }
    const std::string& to_type() const { return to_; }

private:
    std::string from_;
    std::string to_;
};

/// Stored or declared structure that cannot be reconciled, e.g. an orphaned
/// tree row or a table mapping naming an unknown property.
class structural_inconsistency : public error {
public:
    explicit structural_inconsistency(const std::string& msg) : error(msg) {}
};

/// A storage operation failed. Carries the operation, the catalog it ran
/// against and the message of the underlying db_error.
class persistence_error : public error {
public:
    persistence_error(const std::string& operation, const std::string& catalog_id, const std::string& cause)
        : error(operation + " failed for catalog " + catalog_id + ": " + cause)
        , operation_(operation), catalog_id_(catalog_id), cause_(cause) {}

    const std::string& operation() const { return operation_; }
    const std::string& catalog_id() const { return catalog_id_; }
    const std::string& cause() const { return cause_; }

private:
    std::string operation_;
    std::string catalog_id_;
    std::string cause_;
};

} // namespace strata

#endif // __cplusplus
