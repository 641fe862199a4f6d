#include "kvsession/signer.hpp"
#include "kvsession/errors.hpp"
#include "kvsession/session_key.hpp"
#include <openssl/crypto.h>
#include <openssl/hmac.h>
#include <utility>

namespace kvsession
{

Signer::Signer(std::string secret, std::string hash_method)
    : secret_(std::move(secret))
    , hash_method_(std::move(hash_method))
    , md_(EVP_get_digestbyname(hash_method_.c_str()))
    {
    if (md_ == nullptr)
        {
        throw ConfigError("unknown hash method: " + hash_method_);
        }
    }

std::string Signer::sign(const std::string& key) const
    {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (HMAC(md_, secret_.data(), static_cast<int>(secret_.size()),
             reinterpret_cast<const unsigned char*>(key.data()), key.size(),
             digest, &digest_len) == nullptr)
        {
        throw std::runtime_error("HMAC computation failed for " + hash_method_);
        }

    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i)
        {
        hex.push_back(digits[digest[i] >> 4]);
        hex.push_back(digits[digest[i] & 0x0F]);
        }
    return hex;
    }

bool Signer::verify(const std::string& key, const std::string& mac_hex) const
    {
    std::string expected = sign(key);

    // Digest length is public, only the contents need constant-time treatment
    if (expected.size() != mac_hex.size())
        {
        return false;
        }
    return CRYPTO_memcmp(expected.data(), mac_hex.data(), expected.size()) == 0;
    }

std::string Signer::make_token(const std::string& key) const
    {
    return key + "_" + sign(key);
    }

std::optional<std::string> Signer::unsign(const std::string& token) const
    {
    auto parts = split_token(token);
    if (!parts || !verify(parts->first, parts->second))
        {
        return std::nullopt;
        }
    return parts->first;
    }

} // namespace kvsession
