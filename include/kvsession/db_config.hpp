#pragma once
#include <string>

namespace kvsession {
namespace config { class ServiceConfig; }

namespace db {

struct Config {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "kvsession";
    std::string user = "kvsession";
    std::string password = "";
    int pool_size = 4;
    int connect_timeout = 5;

    // Build PostgreSQL connection string
    std::string connection_string() const;

    // Load from environment variables
    static Config from_env();

    // Load the "db" section of the service config, then apply environment overrides
    static Config from_config(const config::ServiceConfig& service_config);

private:
    void apply_env();
};

} // namespace db
} // namespace kvsession
