#include "kvsession/filesystem_store.hpp"
#include "kvsession/errors.hpp"
#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace kvsession
{

namespace fs = std::filesystem;

namespace
{

bool is_key_char(char c)
    {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
    }

std::string temp_suffix()
    {
    static std::atomic<unsigned long> counter{ 0 };
    return ".tmp." + std::to_string(getpid()) + "." + std::to_string(counter.fetch_add(1));
    }

} // namespace

FilesystemStore::FilesystemStore(fs::path root)
    : root_(std::move(root))
    {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
        {
        throw StoreError("cannot create store directory " + root_.string() + ": " + ec.message());
        }
    }

bool FilesystemStore::is_valid_key(const std::string& key)
    {
    if (key.empty() || key.front() == '.')
        {
        return false;
        }
    for (char c : key)
        {
        if (!is_key_char(c) && c != '.')
            {
            return false;
            }
        }
    return true;
    }

fs::path FilesystemStore::path_for(const std::string& key) const
    {
    return root_ / key;
    }

std::string FilesystemStore::put(const std::string& key, const std::string& data)
    {
    if (!is_valid_key(key))
        {
        throw std::invalid_argument("invalid store key: '" + key + "'");
        }

    fs::path final_path = path_for(key);
    fs::path tmp_path = root_ / ("." + key + temp_suffix());

    {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out)
        {
        throw StoreError("cannot open " + tmp_path.string() + " for writing");
        }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out)
        {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw StoreError("failed writing " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec)
        {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw StoreError("cannot move payload into place for " + key + ": " + ec.message());
        }
    return key;
    }

std::string FilesystemStore::get(const std::string& key)
    {
    if (!is_valid_key(key))
        {
        throw KeyNotFound(key);
        }

    fs::path path = path_for(key);
    std::ifstream in(path, std::ios::binary);
    if (!in)
        {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec)
            {
            throw KeyNotFound(key);
            }
        throw StoreError("cannot open " + path.string() + " for reading");
        }

    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad())
        {
        throw StoreError("failed reading " + path.string());
        }
    return oss.str();
    }

void FilesystemStore::del(const std::string& key)
    {
    if (!is_valid_key(key))
        {
        return;
        }

    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        {
        throw StoreError("cannot delete " + key + ": " + ec.message());
        }
    }

std::vector<std::string> FilesystemStore::keys()
    {
    std::vector<std::string> result;

    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec)
        {
        throw StoreError("cannot list " + root_.string() + ": " + ec.message());
        }

    const fs::directory_iterator end;
    while (it != end)
        {
        std::string name = it->path().filename().string();

        // Entries may disappear mid-listing when a sweep runs concurrently
        std::error_code type_ec;
        if (is_valid_key(name) && it->is_regular_file(type_ec))
            {
            result.push_back(name);
            }

        it.increment(ec);
        if (ec)
            {
            throw StoreError("cannot list " + root_.string() + ": " + ec.message());
            }
        }
    return result;
    }

} // namespace kvsession
