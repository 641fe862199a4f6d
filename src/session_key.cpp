#include "kvsession/session_key.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>

namespace kvsession
{

namespace
{

const std::regex& key_pattern()
    {
    static const std::regex pattern("^[0-9a-f]+_([0-9a-f]+)$");
    return pattern;
    }

} // namespace

std::string to_hex(const std::vector<std::uint8_t>& big_endian)
    {
    static const char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(big_endian.size() * 2);
    for (std::uint8_t byte : big_endian)
        {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
        }

    auto first = out.find_first_not_of('0');
    if (first == std::string::npos)
        {
        return "0";
        }
    return out.substr(first);
    }

std::int64_t to_epoch_seconds(Clock::time_point tp)
    {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

Clock::time_point from_epoch_seconds(std::int64_t epoch)
    {
    return Clock::time_point(std::chrono::seconds(epoch));
    }

std::string generate_key(RandomSource& random_source,
                         std::optional<std::int64_t> expires_epoch,
                         unsigned bits)
    {
    std::int64_t expires = expires_epoch.value_or(0);
    if (expires < 0)
        {
        throw std::invalid_argument("session expiry before the epoch: " + std::to_string(expires));
        }

    std::ostringstream oss;
    oss << to_hex(random_source.random_bits(bits)) << '_' << std::hex << expires;
    return oss.str();
    }

std::string generate_key(RandomSource& random_source,
                         Clock::time_point expires,
                         unsigned bits)
    {
    return generate_key(random_source, std::optional<std::int64_t>(to_epoch_seconds(expires)), bits);
    }

std::optional<SessionKeyParts> parse_key(const std::string& key)
    {
    std::smatch match;
    if (!std::regex_match(key, match, key_pattern()))
        {
        return std::nullopt;
        }

    std::string expiry = match[1].str();
    auto first = expiry.find_first_not_of('0');
    std::string significant = first == std::string::npos ? "0" : expiry.substr(first);
    if (significant.size() > 16)
        {
        return std::nullopt;
        }

    SessionKeyParts parts;
    parts.random_id = key.substr(0, key.find('_'));
    parts.expires = std::stoull(significant, nullptr, 16);
    return parts;
    }

std::optional<std::pair<std::string, std::string>> split_token(const std::string& token)
    {
    auto pos = token.rfind('_');
    if (pos == std::string::npos)
        {
        return std::nullopt;
        }
    return std::make_pair(token.substr(0, pos), token.substr(pos + 1));
    }

} // namespace kvsession
