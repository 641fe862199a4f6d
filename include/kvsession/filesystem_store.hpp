#pragma once

#include "kvsession/kv_store.hpp"
#include <filesystem>

namespace kvsession
{

/*
  One file per key under a root directory.

  Keys are restricted to [A-Za-z0-9_-] plus '.' after the first character so
  they cannot escape the root; put() rejects anything else with
  std::invalid_argument. Writes go to a hidden temp file that is renamed into
  place, so readers never observe a partial payload.
*/
class FilesystemStore : public KeyValueStore
    {
    public:
        explicit FilesystemStore(std::filesystem::path root);

        std::string put(const std::string& key, const std::string& data) override;
        std::string get(const std::string& key) override;
        void del(const std::string& key) override;
        std::vector<std::string> keys() override;

        const std::filesystem::path& root() const
            {
            return root_;
            }

        static bool is_valid_key(const std::string& key);

    private:
        std::filesystem::path path_for(const std::string& key) const;

        std::filesystem::path root_;
    };

} // namespace kvsession
