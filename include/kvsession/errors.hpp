#pragma once

#include <stdexcept>
#include <string>

namespace kvsession
{

// Raised by KeyValueStore::get when the key is absent.
class KeyNotFound : public std::runtime_error
    {
    public:
        explicit KeyNotFound(const std::string& key)
            : std::runtime_error("key not found: " + key)
            , key_(key)
            {}

        const std::string& key() const
            {
            return key_;
            }

    private:
        std::string key_;
    };

// I/O failure inside one of the bundled stores.
class StoreError : public std::runtime_error
    {
    public:
        explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
    };

// Stored payload could not be decoded.
class PayloadError : public std::runtime_error
    {
    public:
        explicit PayloadError(const std::string& msg) : std::runtime_error(msg) {}
    };

class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
    };

// Precondition violated by the caller, e.g. destroying a session that was never stored.
class UsageError : public std::logic_error
    {
    public:
        explicit UsageError(const std::string& msg) : std::logic_error(msg) {}
    };

} // namespace kvsession
