#pragma once

// Umbrella header for the strata data model and its SQLite store.

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "configuration.hpp"
#include "property_type.hpp"
#include "hasher.hpp"
#include "schema.hpp"
#include "entity.hpp"
#include "aspect.hpp"
#include "hierarchy.hpp"
#include "catalog.hpp"
#include "factory.hpp"
#include "db.hpp"
#include "connection.hpp"
#include "store_schema.hpp"
#include "type_mapping.hpp"
#include "table_mapping.hpp"
#include "value_adapter.hpp"
#include "json.hpp"
#include "catalog_store.hpp"
