#include "kvsession/session_context.hpp"
#include "kvsession/errors.hpp"
#include "kvsession/logger.hpp"
#include "kvsession/service_config.hpp"
#include <cstdlib>
#include <limits>
#include <string>

namespace kvsession
{

namespace
{

std::string require_secret(std::string secret)
    {
    if (secret.empty())
        {
        throw ConfigError("session secret key is empty");
        }
    return secret;
    }

} // namespace

SessionSettings SessionSettings::from_config(const config::ServiceConfig& service_config)
    {
    SessionSettings settings;
    settings.secret_key = service_config.get_string("session.secret_key", settings.secret_key);
    settings.hash_method = service_config.get_string("session.hash_method", settings.hash_method);
    unsigned long long key_bits = service_config.get_ulonglong("session.key_bits", settings.key_bits);
    if (key_bits > std::numeric_limits<unsigned>::max())
        {
        throw ConfigError("session.key_bits is out of range: " + std::to_string(key_bits));
        }
    settings.key_bits = static_cast<unsigned>(key_bits);
    settings.random_source = service_config.get_string("session.random_source", settings.random_source);
    settings.random_seed = service_config.get_ulonglong("session.random_seed", settings.random_seed);

    if (const char* env = std::getenv("KVSESSION_SECRET_KEY"))
        {
        settings.secret_key = env;
        }
    return settings;
    }

void SessionSettings::validate() const
    {
    if (secret_key.empty())
        {
        throw ConfigError("session.secret_key must be set");
        }
    if (key_bits == 0)
        {
        throw ConfigError("session.key_bits must be at least 1");
        }
    if (random_source != "system" && random_source != "seeded")
        {
        throw ConfigError("unknown session.random_source: " + random_source);
        }
    }

SessionContext::SessionContext(std::string secret_key,
                               RandomSourcePtr random_source,
                               std::string hash_method,
                               unsigned key_bits,
                               ClockFn clock)
    : signer_(require_secret(std::move(secret_key)), std::move(hash_method))
    , random_source_(std::move(random_source))
    , key_bits_(key_bits)
    , clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
    {
    if (!random_source_)
        {
        throw ConfigError("session context requires a random source");
        }
    if (key_bits_ == 0)
        {
        throw ConfigError("session key bits must be at least 1");
        }
    }

SessionContext SessionContext::from_settings(const SessionSettings& settings, ClockFn clock)
    {
    settings.validate();

    RandomSourcePtr random_source;
    if (settings.random_source == "seeded")
        {
        log::Logger("SessionContext").warning(
            "Using seeded random source; session ids are predictable");
        random_source = std::make_shared<SeededRandomSource>(settings.random_seed);
        }
    else
        {
        random_source = std::make_shared<SystemRandomSource>();
        }

    return SessionContext(settings.secret_key, std::move(random_source),
                          settings.hash_method, settings.key_bits, std::move(clock));
    }

} // namespace kvsession
