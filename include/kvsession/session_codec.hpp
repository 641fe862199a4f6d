#pragma once

#include "kvsession/kv_store.hpp"
#include "kvsession/logger.hpp"
#include "kvsession/session.hpp"
#include "kvsession/session_context.hpp"
#include "kvsession/session_lifecycle.hpp"
#include <optional>
#include <string>

namespace kvsession
{

/*
  Binds in-memory sessions to store entries and signed tokens.

  Writing: the session data is encoded, stored under a freshly minted key and
  the key is signed; the caller hands the resulting token to its transport.

  Reading: a token whose signature does not verify, that is malformed, or whose
  embedded expiry has passed yields no session. A verified token whose payload
  is missing from the store yields an empty session still bound to the key.
  Store failures other than a missing key propagate.

  The context and store must outlive the codec.
*/
class SessionCodec
    {
    public:
        SessionCodec(const SessionContext& context, KeyValueStore& store);

        // Write the session under a new key expiring at `expires` and return
        // the signed token. The session is re-bound to the new key.
        std::string serialize(Session& session, const std::optional<Clock::time_point>& expires);

        // Write the session with its own desired expiry. A session marked for
        // deletion is destroyed instead and the returned token is empty.
        std::string commit(Session& session);

        // nullopt when the token is not authentic or has expired.
        std::optional<Session> try_deserialize(const std::string& token) const;

        // Always returns a usable session; an empty, unbound one when the token
        // is rejected.
        Session deserialize(const std::string& token) const;

        // Verify with an explicit secret instead of the context's, using the
        // context's hash method.
        Session deserialize(const std::string& token, const std::string& secret) const;

    private:
        std::optional<Session> load(const Signer& signer, const std::string& token) const;

        const SessionContext& context_;
        KeyValueStore& store_;
        SessionLifecycle lifecycle_;
        log::Logger logger_{ "SessionCodec" };
    };

} // namespace kvsession
