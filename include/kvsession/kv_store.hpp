#pragma once

#include <memory>
#include <string>
#include <vector>

namespace kvsession
{

/*
  Key-value backend holding session payloads.

  Implementations must be safe to call from concurrent requests and rely on
  their own per-key atomicity; the session layer adds no locking.
*/
class KeyValueStore
    {
    public:
        virtual ~KeyValueStore() = default;

        // Store `data` under `key`, overwriting any previous value.
        // Returns the key actually used.
        virtual std::string put(const std::string& key, const std::string& data) = 0;

        // Throws KeyNotFound when the key is absent.
        virtual std::string get(const std::string& key) = 0;

        // Deleting a missing key is a no-op.
        virtual void del(const std::string& key) = 0;

        // Snapshot of the stored keys.
        virtual std::vector<std::string> keys() = 0;
    };

using KeyValueStorePtr = std::shared_ptr<KeyValueStore>;

} // namespace kvsession
