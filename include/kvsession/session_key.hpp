#pragma once

#include "kvsession/random_source.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kvsession
{

using Clock = std::chrono::system_clock;

// Session keys have the form "<random-id>_<expires>", both lower-case hex
// without padding. An expiry of 0 means the session never expires.
struct SessionKeyParts
    {
    std::string random_id;
    std::uint64_t expires = 0;

    bool never_expires() const
        {
        return expires == 0;
        }

    // Expired once `now` reaches the embedded expiry.
    bool expired_at(std::int64_t now) const
        {
        return expires != 0 && now >= 0 && static_cast<std::uint64_t>(now) >= expires;
        }
    };

constexpr unsigned kDefaultKeyBits = 64;

// Mint a new key. `expires_epoch` is UTC seconds; nullopt encodes as 0.
// Throws std::invalid_argument for a negative epoch.
std::string generate_key(RandomSource& random_source,
                         std::optional<std::int64_t> expires_epoch,
                         unsigned bits = kDefaultKeyBits);

std::string generate_key(RandomSource& random_source,
                         Clock::time_point expires,
                         unsigned bits = kDefaultKeyBits);

std::int64_t to_epoch_seconds(Clock::time_point tp);

Clock::time_point from_epoch_seconds(std::int64_t epoch);

// Returns nullopt unless `key` has the "<hex>_<hex>" shape and its expiry fits in 64 bits.
std::optional<SessionKeyParts> parse_key(const std::string& key);

// Split a signed token at its last underscore into (key, mac).
std::optional<std::pair<std::string, std::string>> split_token(const std::string& token);

// Lower-case hex of a big-endian integer, leading zeros stripped ("0" for zero).
std::string to_hex(const std::vector<std::uint8_t>& big_endian);

} // namespace kvsession
