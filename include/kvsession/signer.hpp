#pragma once

#include <optional>
#include <string>
#include <openssl/evp.h>

namespace kvsession
{

// HMAC signer for session keys. Immutable after construction, safe to share
// between threads.
class Signer
    {
    public:
        // Throws ConfigError when `hash_method` is not a digest OpenSSL knows.
        explicit Signer(std::string secret, std::string hash_method = "sha256");

        // Lower-case hex HMAC of `key`.
        std::string sign(const std::string& key) const;

        // Constant-time comparison of `mac_hex` against the expected digest.
        bool verify(const std::string& key, const std::string& mac_hex) const;

        // "<key>_<mac>"
        std::string make_token(const std::string& key) const;

        // Returns the embedded key when `token` is well formed and authentic.
        std::optional<std::string> unsign(const std::string& token) const;

        const std::string& hash_method() const
            {
            return hash_method_;
            }

    private:
        std::string secret_;
        std::string hash_method_;
        const EVP_MD* md_;
    };

} // namespace kvsession
