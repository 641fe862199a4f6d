#include "kvsession/session_lifecycle.hpp"
#include "kvsession/errors.hpp"
#include "kvsession/session_key.hpp"

namespace kvsession
{

namespace
{

// A store that reports a missing key on delete is treated like one that
// ignores it; the key is gone either way.
void delete_if_present(KeyValueStore& store, const std::string& key)
    {
    try
        {
        store.del(key);
        }
        catch (const KeyNotFound&)
            {
            }
    }

} // namespace

std::size_t cleanup_sessions(KeyValueStore& store, std::int64_t now_epoch)
    {
    std::size_t removed = 0;
    for (const auto& key : store.keys())
        {
        auto parts = parse_key(key);
        if (!parts || !parts->expired_at(now_epoch))
            {
            continue;
            }
        delete_if_present(store, key);
        ++removed;
        }
    return removed;
    }

SessionLifecycle::SessionLifecycle(const SessionContext& context, KeyValueStore& store)
    : context_(context)
    , store_(store)
    {}

void SessionLifecycle::destroy(Session& session)
    {
    if (!session.store_key())
        {
        throw UsageError("cannot destroy a session that has no store key");
        }

    session.clear();
    delete_key(*session.store_key());
    logger_.debug("Destroyed session " + *session.store_key());
    }

void SessionLifecycle::delete_key(const std::string& key)
    {
    delete_if_present(store_, key);
    }

std::size_t SessionLifecycle::cleanup_sessions()
    {
    return cleanup_sessions(context_.now_epoch());
    }

std::size_t SessionLifecycle::cleanup_sessions(std::int64_t now_epoch)
    {
    std::size_t removed = kvsession::cleanup_sessions(store_, now_epoch);
    if (removed > 0)
        {
        logger_.info("Cleanup removed " + std::to_string(removed) + " expired session(s)");
        }
    else
        {
        logger_.debug("Cleanup found no expired sessions");
        }
    return removed;
    }

} // namespace kvsession
