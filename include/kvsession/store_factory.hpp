#pragma once

#include "kvsession/kv_store.hpp"

namespace kvsession
{
namespace config { class ServiceConfig; }

// Build the store named by store.backend ("memory", "filesystem" or
// "postgres"). Throws ConfigError for an unknown backend.
KeyValueStorePtr make_store(const config::ServiceConfig& service_config);

} // namespace kvsession
