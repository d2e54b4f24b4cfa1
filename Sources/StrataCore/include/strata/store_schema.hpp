#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include <string>
#include <vector>

namespace strata {

/// Store tables, parents first. Drop and truncate walk it backwards.
const std::vector<std::string>& store_tables();

/// True when every store table exists.
bool store_schema_exists(database& db);

/// Creates the store tables and indexes that do not exist yet, then the audit
/// extension when with_audit is set.
void create_store_schema(database& db, bool with_audit = false);

/// Adds created_at to every store table and updated_at to the mutable ones,
/// stamped by insert and update triggers. Safe to run more than once.
void create_audit_extension(database& db);

/// Drops triggers, then tables child-first.
void drop_store_schema(database& db);

/// Deletes every row, child tables first.
void truncate_store_schema(database& db);

} // namespace strata

#endif // __cplusplus
