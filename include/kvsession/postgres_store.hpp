#pragma once

#include "kvsession/db_pool.hpp"
#include "kvsession/kv_store.hpp"
#include <memory>

namespace kvsession
{

/*
  Store backed by a two-column PostgreSQL table:

    CREATE TABLE <table> (key TEXT PRIMARY KEY, value TEXT NOT NULL)

  put() upserts so a colliding key overwrites. pqxx exceptions from the
  database are not translated.
*/
class PostgresStore : public KeyValueStore
    {
    public:
        PostgresStore(std::shared_ptr<db::ConnectionPool> pool, std::string table = "kvsession_store");

        // Create the table if it does not exist yet.
        void ensure_schema();

        std::string put(const std::string& key, const std::string& data) override;
        std::string get(const std::string& key) override;
        void del(const std::string& key) override;
        std::vector<std::string> keys() override;

        const std::string& table() const
            {
            return table_;
            }

    private:
        std::string quoted_table(pqxx::connection& conn) const;

        std::shared_ptr<db::ConnectionPool> pool_;
        std::string table_;
    };

} // namespace kvsession
