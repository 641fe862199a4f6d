#include "kvsession/db_config.hpp"
#include "kvsession/service_config.hpp"
#include <cstdlib>
#include <sstream>

namespace kvsession
{
namespace db
{

std::string Config::connection_string() const
    {
    std::ostringstream oss;
    oss << "host=" << host
        << " port=" << port
        << " dbname=" << dbname
        << " user=" << user;

    if (!password.empty())
        {
        oss << " password=" << password;
        }

    oss << " connect_timeout=" << connect_timeout;

    return oss.str();
    }

void Config::apply_env()
    {
    if (const char* env = std::getenv("KVSESSION_DB_HOST"))
        {
        host = env;
        }
    if (const char* env = std::getenv("KVSESSION_DB_PORT"))
        {
        port = env;
        }
    if (const char* env = std::getenv("KVSESSION_DB_NAME"))
        {
        dbname = env;
        }
    if (const char* env = std::getenv("KVSESSION_DB_USER"))
        {
        user = env;
        }
    if (const char* env = std::getenv("KVSESSION_DB_PASSWORD"))
        {
        password = env;
        }
    if (const char* env = std::getenv("KVSESSION_DB_POOL_SIZE"))
        {
        pool_size = std::atoi(env);
        }
    if (pool_size < 1) pool_size = 4;
    }

Config Config::from_env()
    {
    Config cfg;
    cfg.apply_env();
    return cfg;
    }

Config Config::from_config(const config::ServiceConfig& service_config)
    {
    Config cfg;
    cfg.host = service_config.get_string("db.host", cfg.host);
    cfg.port = service_config.get_string("db.port", cfg.port);
    cfg.dbname = service_config.get_string("db.name", cfg.dbname);
    cfg.user = service_config.get_string("db.user", cfg.user);
    cfg.password = service_config.get_string("db.password", cfg.password);
    cfg.pool_size = service_config.get_int("db.pool_size", cfg.pool_size);
    cfg.connect_timeout = service_config.get_int("db.connect_timeout", cfg.connect_timeout);
    cfg.apply_env();
    return cfg;
    }

} // namespace db
} // namespace kvsession
