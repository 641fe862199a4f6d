#include "kvsession/session_codec.hpp"
#include "kvsession/errors.hpp"
#include "kvsession/payload_codec.hpp"
#include "kvsession/session_key.hpp"

namespace kvsession
{

SessionCodec::SessionCodec(const SessionContext& context, KeyValueStore& store)
    : context_(context)
    , store_(store)
    , lifecycle_(context, store)
    {}

std::string SessionCodec::serialize(Session& session, const std::optional<Clock::time_point>& expires)
    {
    std::string payload = encode_payload(session.data());

    std::optional<std::int64_t> expires_epoch;
    if (expires)
        {
        expires_epoch = to_epoch_seconds(*expires);
        }
    std::string key = generate_key(context_.random_source(), expires_epoch, context_.key_bits());

    // Collisions are not checked; put() overwrites.
    std::string stored_key = store_.put(key, payload);
    if (stored_key.empty())
        {
        throw StoreError("store returned an empty key for " + key);
        }

    session.bind_key(stored_key);
    session.set_expires(expires);
    return context_.signer().make_token(stored_key);
    }

std::string SessionCodec::commit(Session& session)
    {
    if (session.marked_for_deletion())
        {
        if (session.store_key())
            {
            lifecycle_.destroy(session);
            session.unbind_key();
            }
        else
            {
            session.clear();
            }
        return std::string();
        }
    return serialize(session, session.expires());
    }

std::optional<Session> SessionCodec::load(const Signer& signer, const std::string& token) const
    {
    auto key = signer.unsign(token);
    if (!key)
        {
        logger_.debug("Rejected session token: malformed or bad signature");
        return std::nullopt;
        }

    auto parts = parse_key(*key);
    if (parts && parts->expired_at(context_.now_epoch()))
        {
        logger_.debug("Rejected session token: key " + *key + " has expired");
        return std::nullopt;
        }

    std::string payload;
    try
        {
        payload = store_.get(*key);
        }
        catch (const KeyNotFound&)
            {
            logger_.debug("No payload stored for " + *key + ", starting empty");
            }

    Session session;
    try
        {
        session.data() = decode_payload(payload);
        }
        catch (const PayloadError& e)
            {
            logger_.warning("Discarding undecodable payload for " + *key + ": " + e.what());
            }

    static const std::uint64_t max_epoch =
        static_cast<std::uint64_t>(to_epoch_seconds(Clock::time_point::max()));
    if (parts && !parts->never_expires() && parts->expires <= max_epoch)
        {
        session.set_expires(from_epoch_seconds(static_cast<std::int64_t>(parts->expires)));
        }
    session.bind_key(*key);
    return session;
    }

std::optional<Session> SessionCodec::try_deserialize(const std::string& token) const
    {
    return load(context_.signer(), token);
    }

Session SessionCodec::deserialize(const std::string& token) const
    {
    auto session = try_deserialize(token);
    return session ? std::move(*session) : Session();
    }

Session SessionCodec::deserialize(const std::string& token, const std::string& secret) const
    {
    Signer signer(secret, context_.signer().hash_method());
    auto session = load(signer, token);
    return session ? std::move(*session) : Session();
    }

} // namespace kvsession
