#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "db.hpp"
#include <memory>
#include <mutex>

namespace strata {

/// Hands out database connections for the duration of one store call.
class connection_provider {
public:
    virtual ~connection_provider() = default;

    virtual database& acquire() = 0;
    virtual void release(database& db) noexcept = 0;
};

/// One serialized SQLite connection: acquire blocks while another thread
/// holds it and nests on the holding thread. An in-memory database lives as
/// long as the provider.
class sqlite_connection_provider : public connection_provider {
public:
    explicit sqlite_connection_provider(const configuration& config);

    database& acquire() override;
    void release(database& db) noexcept override;

    const configuration& config() const { return config_; }

private:
    configuration config_;
    std::unique_ptr<database> db_;
    std::recursive_mutex mutex_;
};

/// RAII acquire/release pair. A transaction the holder opened and left open
/// is rolled back before the connection goes back to the provider.
class connection_lease {
public:
    explicit connection_lease(connection_provider& provider)
        : provider_(provider), db_(provider.acquire()), outer_transaction_(db_.is_in_transaction()) {}

    ~connection_lease();

    connection_lease(const connection_lease&) = delete;
    connection_lease& operator=(const connection_lease&) = delete;

    database& db() { return db_; }
    database* operator->() { return &db_; }

private:
    connection_provider& provider_;
    database& db_;
    bool outer_transaction_;
};

} // namespace strata

#endif // __cplusplus
