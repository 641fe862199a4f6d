#pragma once

#include "kvsession/kv_store.hpp"
#include "kvsession/logger.hpp"
#include "kvsession/session.hpp"
#include "kvsession/session_context.hpp"
#include <cstddef>
#include <cstdint>

namespace kvsession
{

// Explicit invalidation and the expiry sweep. Both tolerate keys that are
// already gone, so they can run concurrently with request traffic.
class SessionLifecycle
    {
    public:
        SessionLifecycle(const SessionContext& context, KeyValueStore& store);

        // Clear the session data and delete its store entry. Throws UsageError
        // when the session has no backing key.
        void destroy(Session& session);

        // Delete every "<hex>_<hex>" key whose non-zero expiry is at or before
        // the context clock. Other keys are left alone. Returns the number of
        // keys deleted; store failures propagate.
        std::size_t cleanup_sessions();

        std::size_t cleanup_sessions(std::int64_t now_epoch);

    private:
        void delete_key(const std::string& key);

        const SessionContext& context_;
        KeyValueStore& store_;
        log::Logger logger_{ "SessionLifecycle" };
    };

// Sweep `store` at `now_epoch` without a context.
std::size_t cleanup_sessions(KeyValueStore& store, std::int64_t now_epoch);

} // namespace kvsession
