#pragma once

#include "kvsession/errors.hpp"
#include "kvsession/kv_store.hpp"
#include <mutex>
#include <unordered_map>

namespace kvsession
{

// In-process store; contents vanish with the process.
class MemoryStore : public KeyValueStore
    {
    public:
        std::string put(const std::string& key, const std::string& data) override
            {
            std::lock_guard<std::mutex> lock(mtx_);
            entries_[key] = data;
            return key;
            }

        std::string get(const std::string& key) override
            {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = entries_.find(key);
            if (it == entries_.end())
                {
                throw KeyNotFound(key);
                }
            return it->second;
            }

        void del(const std::string& key) override
            {
            std::lock_guard<std::mutex> lock(mtx_);
            entries_.erase(key);
            }

        std::vector<std::string> keys() override
            {
            std::lock_guard<std::mutex> lock(mtx_);
            std::vector<std::string> result;
            result.reserve(entries_.size());
            for (const auto& [key, data] : entries_)
                {
                result.push_back(key);
                }
            return result;
            }

        bool contains(const std::string& key) const
            {
            std::lock_guard<std::mutex> lock(mtx_);
            return entries_.count(key) != 0;
            }

        std::size_t size() const
            {
            std::lock_guard<std::mutex> lock(mtx_);
            return entries_.size();
            }

    private:
        std::unordered_map<std::string, std::string> entries_;
        mutable std::mutex mtx_;
    };

} // namespace kvsession
