#include "strata/log.hpp"
#include <strings.h>

namespace strata {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

log_level log_level_from_string(const char* name) {
    if (!name) return log_level::warn;
    struct entry {
        const char* name;
        log_level level;
    };
    static const entry levels[] = {
        {"off", log_level::off},
        {"error", log_level::error},
        {"warn", log_level::warn},
        {"info", log_level::info},
        {"debug", log_level::debug},
    };
    for (const auto& e : levels) {
        if (strcasecmp(name, e.name) == 0) return e.level;
    }
    return log_level::warn;
}

} // namespace strata
