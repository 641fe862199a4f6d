#include "kvsession/postgres_store.hpp"
#include "kvsession/errors.hpp"

namespace kvsession
{

PostgresStore::PostgresStore(std::shared_ptr<db::ConnectionPool> pool, std::string table)
    : pool_(std::move(pool))
    , table_(std::move(table))
    {
    if (!pool_)
        {
        throw ConfigError("PostgresStore requires a connection pool");
        }
    if (table_.empty())
        {
        throw ConfigError("PostgresStore table name is empty");
        }
    }

std::string PostgresStore::quoted_table(pqxx::connection& conn) const
    {
    return conn.quote_name(table_);
    }

void PostgresStore::ensure_schema()
    {
    auto conn = pool_->acquire();
    pqxx::work txn(conn.get());
    txn.exec("CREATE TABLE IF NOT EXISTS " + quoted_table(conn.get()) +
             " (key TEXT PRIMARY KEY, value TEXT NOT NULL)");
    txn.commit();
    }

std::string PostgresStore::put(const std::string& key, const std::string& data)
    {
    auto conn = pool_->acquire();
    pqxx::work txn(conn.get());
    txn.exec_params(
        "INSERT INTO " + quoted_table(conn.get()) + " (key, value) VALUES ($1, $2) "
        "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value",
        key, data
    );
    txn.commit();
    return key;
    }

std::string PostgresStore::get(const std::string& key)
    {
    auto conn = pool_->acquire();
    pqxx::work txn(conn.get());
    auto result = txn.exec_params(
        "SELECT value FROM " + quoted_table(conn.get()) + " WHERE key = $1",
        key
    );
    txn.commit();

    if (result.empty())
        {
        throw KeyNotFound(key);
        }
    return result[0][0].as<std::string>();
    }

void PostgresStore::del(const std::string& key)
    {
    auto conn = pool_->acquire();
    pqxx::work txn(conn.get());
    txn.exec_params(
        "DELETE FROM " + quoted_table(conn.get()) + " WHERE key = $1",
        key
    );
    txn.commit();
    }

std::vector<std::string> PostgresStore::keys()
    {
    auto conn = pool_->acquire();
    pqxx::work txn(conn.get());
    auto result = txn.exec("SELECT key FROM " + quoted_table(conn.get()));
    txn.commit();

    std::vector<std::string> keys;
    keys.reserve(result.size());
    for (const auto& row : result)
        {
        keys.push_back(row[0].as<std::string>());
        }
    return keys;
    }

} // namespace kvsession
