#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace strata {

struct configuration {
    /// Database file path. Use ":memory:" for an in-memory database.
    std::string path = ":memory:";

    /// Opens with SQLITE_OPEN_READONLY and skips schema creation.
    bool read_only = false;

    /// How long SQLite waits on a locked database before SQLITE_BUSY.
    int busy_timeout_ms = 5000;

    /// Adds created_at/updated_at columns and triggers when the store schema
    /// is first created.
    bool enable_audit = false;

    /// Offset applied to date-times parsed without one.
    int32_t default_utc_offset_minutes = 0;

    /// Bound of the entity registry's aspect cache.
    size_t aspect_cache_capacity = 1024;

    /// Applied to the global log level when a store is constructed.
    std::optional<log_level> log;
};

} // namespace strata

#endif // __cplusplus
