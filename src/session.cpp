#include "kvsession/session.hpp"

namespace kvsession
{

const SessionValue* Session::find(const std::string& key) const
    {
    auto it = data_.find(key);
    if (it == data_.end())
        {
        return nullptr;
        }
    return &it->second;
    }

bool Session::contains(const std::string& key) const
    {
    return data_.count(key) != 0;
    }

bool Session::erase(const std::string& key)
    {
    return data_.erase(key) != 0;
    }

void Session::clear()
    {
    data_.clear();
    }

std::size_t Session::size() const
    {
    return data_.size();
    }

bool Session::empty() const
    {
    return data_.empty();
    }

void Session::bind_key(std::string key)
    {
    store_key_ = std::move(key);
    }

void Session::unbind_key()
    {
    store_key_.reset();
    }

void Session::set_expires(std::optional<Clock::time_point> expires)
    {
    expires_ = expires;
    }

} // namespace kvsession
