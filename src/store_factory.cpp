#include "kvsession/store_factory.hpp"
#include "kvsession/db_config.hpp"
#include "kvsession/db_pool.hpp"
#include "kvsession/errors.hpp"
#include "kvsession/filesystem_store.hpp"
#include "kvsession/logger.hpp"
#include "kvsession/memory_store.hpp"
#include "kvsession/postgres_store.hpp"
#include "kvsession/service_config.hpp"

namespace kvsession
{

KeyValueStorePtr make_store(const config::ServiceConfig& service_config)
    {
    log::Logger logger("StoreFactory");
    std::string backend = service_config.get_string("store.backend", "filesystem");

    if (backend == "memory")
        {
        logger.info("Using in-memory session store");
        return std::make_shared<MemoryStore>();
        }

    if (backend == "filesystem")
        {
        std::string path = service_config.get_string("store.path", "sessions");
        logger.info("Using filesystem session store at " + path);
        return std::make_shared<FilesystemStore>(path);
        }

    if (backend == "postgres")
        {
        auto pool = std::make_shared<db::ConnectionPool>(db::Config::from_config(service_config));
        auto store = std::make_shared<PostgresStore>(
            pool, service_config.get_string("store.table", "kvsession_store"));
        store->ensure_schema();
        logger.info("Using PostgreSQL session store, table " + store->table());
        return store;
        }

    throw ConfigError("unknown store.backend: " + backend);
    }

} // namespace kvsession
