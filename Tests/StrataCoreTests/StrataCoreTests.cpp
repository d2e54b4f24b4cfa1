#include <strata/strata.hpp>
#include <cassert>
#include <cstdlib>
#include <iostream>

#include "TypeTests.hpp"
#include "SchemaTests.hpp"
#include "HierarchyTests.hpp"
#include "PersistenceTests.hpp"
#include "MappedTableTests.hpp"
#include "JsonTests.hpp"

int main() {
    std::cout << "=== StrataCore Tests ===" << std::endl;

    // STRATA_LOG_LEVEL=debug shows the store's log output while the tests run.
    if (const char* level = std::getenv("STRATA_LOG_LEVEL")) {
        strata::set_log_level(strata::log_level_from_string(level));
    }
    std::cout << std::endl;

    try {
        type_tests::run_all();
        schema_tests::run_all();
        hierarchy_tests::run_all();
        persistence_tests::run_all();
        mapped_table_tests::run_all();
        json_tests::run_all();

        std::cout << std::endl;
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
