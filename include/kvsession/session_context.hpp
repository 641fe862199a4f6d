#pragma once

#include "kvsession/random_source.hpp"
#include "kvsession/session_key.hpp"
#include "kvsession/signer.hpp"
#include <functional>
#include <memory>
#include <string>

namespace kvsession
{
namespace config { class ServiceConfig; }

// Settings recognised under the "session" section of the config file.
struct SessionSettings
    {
    std::string secret_key;
    std::string hash_method = "sha256";
    unsigned key_bits = kDefaultKeyBits;
    std::string random_source = "system";
    std::uint64_t random_seed = 0;

    // Reads session.* keys; KVSESSION_SECRET_KEY overrides the configured secret.
    static SessionSettings from_config(const config::ServiceConfig& service_config);

    // Throws ConfigError for an empty secret, zero key bits or an unknown random source.
    void validate() const;
    };

/*
  Process-wide state shared by every session operation: the signer (secret and
  hash method), the random source, the key width and the clock. Constant after
  construction.
*/
class SessionContext
    {
    public:
        using ClockFn = std::function<Clock::time_point()>;

        SessionContext(std::string secret_key,
                       RandomSourcePtr random_source,
                       std::string hash_method = "sha256",
                       unsigned key_bits = kDefaultKeyBits,
                       ClockFn clock = nullptr);

        static SessionContext from_settings(const SessionSettings& settings, ClockFn clock = nullptr);

        const Signer& signer() const { return signer_; }
        RandomSource& random_source() const { return *random_source_; }
        unsigned key_bits() const { return key_bits_; }

        Clock::time_point now() const { return clock_(); }
        std::int64_t now_epoch() const { return to_epoch_seconds(clock_()); }

    private:
        Signer signer_;
        RandomSourcePtr random_source_;
        unsigned key_bits_;
        ClockFn clock_;
    };

} // namespace kvsession
