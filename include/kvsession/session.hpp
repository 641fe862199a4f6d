#pragma once

#include "kvsession/session_key.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace kvsession
{

// Values a session can hold. The payload encoding preserves the alternative.
using SessionValue = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;

// Build a SessionValue without relying on the variant's converting constructor,
// which would turn string literals into bool and ints into ambiguities.
template <typename T>
SessionValue make_session_value(T&& value)
    {
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, SessionValue>)
        {
        return std::forward<T>(value);
        }
    else if constexpr (std::is_same_v<D, std::nullptr_t>)
        {
        return SessionValue(std::in_place_type<std::nullptr_t>, nullptr);
        }
    else if constexpr (std::is_same_v<D, bool>)
        {
        return SessionValue(std::in_place_type<bool>, value);
        }
    else if constexpr (std::is_integral_v<D>)
        {
        return SessionValue(std::in_place_type<std::int64_t>, static_cast<std::int64_t>(value));
        }
    else if constexpr (std::is_floating_point_v<D>)
        {
        return SessionValue(std::in_place_type<double>, static_cast<double>(value));
        }
    else
        {
        return SessionValue(std::in_place_type<std::string>, std::string(std::forward<T>(value)));
        }
    }

// In-memory session: a plain value container plus the metadata needed to
// correlate it with its store entry. Owned by a single request; not thread-safe.
class Session
    {
    public:
        using Data = std::map<std::string, SessionValue>;

        Session() = default;

        template <typename T>
        void set(const std::string& key, T&& value)
            {
            data_[key] = make_session_value(std::forward<T>(value));
            }

        const SessionValue* find(const std::string& key) const;

        // Typed lookup; nullopt when absent or holding another type.
        template <typename T>
        std::optional<T> get(const std::string& key) const
            {
            const SessionValue* value = find(key);
            if (value == nullptr)
                {
                return std::nullopt;
                }
            if (const T* typed = std::get_if<T>(value))
                {
                return *typed;
                }
            return std::nullopt;
            }

        bool contains(const std::string& key) const;
        bool erase(const std::string& key);
        void clear();
        std::size_t size() const;
        bool empty() const;

        Data& data() { return data_; }
        const Data& data() const { return data_; }

        // Key of the store entry this session was loaded from or last written to.
        const std::optional<std::string>& store_key() const { return store_key_; }
        void bind_key(std::string key);
        void unbind_key();
        bool is_new() const { return !store_key_.has_value(); }

        // Desired expiration applied on commit; nullopt means never expires.
        const std::optional<Clock::time_point>& expires() const { return expires_; }
        void set_expires(std::optional<Clock::time_point> expires);

        // Ask the next commit to destroy the session instead of writing it.
        void mark_for_deletion() { marked_for_deletion_ = true; }
        bool marked_for_deletion() const { return marked_for_deletion_; }

    private:
        Data data_;
        std::optional<std::string> store_key_;
        std::optional<Clock::time_point> expires_;
        bool marked_for_deletion_ = false;
    };

} // namespace kvsession
