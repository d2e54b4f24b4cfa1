#include "strata/connection.hpp"
#include "strata/log.hpp"

namespace strata {

sqlite_connection_provider::sqlite_connection_provider(const configuration& config)
    : config_(config)
    , db_(std::make_unique<database>(config.path,
                                     config.read_only ? database::open_mode::read_only
                                                      : database::open_mode::read_write,
                                     config.busy_timeout_ms)) {}

database& sqlite_connection_provider::acquire() {
    mutex_.lock();
    return *db_;
}

void sqlite_connection_provider::release(database&) noexcept {
    mutex_.unlock();
}

connection_lease::~connection_lease() {
    if (!outer_transaction_ && db_.is_in_transaction()) {
        LOG_WARN("db", "connection released inside a transaction, rolling back");
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "rollback on release failed: %s", e.what());
        }
    }
    provider_.release(db_);
}

} // namespace strata
