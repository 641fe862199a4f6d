#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

namespace kvsession::config
{

// YAML config parser using yaml-cpp library
class ServiceConfig
    {
    public:
        static ServiceConfig& instance()
            {
            static ServiceConfig config;
            return config;
            }

        // Load config from file
        bool load(const std::string& config_file = "config/kvsession.yaml")
            {
            try
                {
                try
                    {
                    root_ = YAML::LoadFile(config_file);
                    }
                    catch (const YAML::BadFile&)
                        {
                        // Try alternate path when launched from a build directory
                        root_ = YAML::LoadFile("../" + config_file);
                        }
                    loaded_ = true;
                    return true;
                }
                catch (const YAML::Exception&)
                    {
                    loaded_ = false;
                    return false;
                    }
            }

        // Load config from an in-memory YAML document
        bool load_string(const std::string& yaml)
            {
            try
                {
                root_ = YAML::Load(yaml);
                loaded_ = true;
                return true;
                }
                catch (const YAML::Exception&)
                    {
                    root_ = YAML::Node();
                    loaded_ = false;
                    return false;
                    }
            }

        bool loaded() const
            {
            return loaded_;
            }

        bool has(const std::string& key) const
            {
            if (!loaded_) return false;
            YAML::Node node = navigate_to_key(key);
            return node && !node.IsNull();
            }

        // Get string value with default
        std::string get_string(const std::string& key, const std::string& default_val = "") const
            {
            return get_scalar<std::string>(key, default_val);
            }

        // Get int value with default
        int get_int(const std::string& key, int default_val = 0) const
            {
            return get_scalar<int>(key, default_val);
            }

        // Get unsigned long long value with default
        unsigned long long get_ulonglong(const std::string& key, unsigned long long default_val = 0) const
            {
            return get_scalar<unsigned long long>(key, default_val);
            }

        // Get bool value with default
        bool get_bool(const std::string& key, bool default_val = false) const
            {
            return get_scalar<bool>(key, default_val);
            }

    private:
        ServiceConfig() = default;

        template <typename T>
        T get_scalar(const std::string& key, const T& default_val) const
            {
            if (!loaded_) return default_val;

            try
                {
                YAML::Node node = navigate_to_key(key);
                if (node && node.IsScalar())
                    {
                    return node.as<T>();
                    }
                }
                catch (const YAML::Exception&)
                    {
                    // Conversion failed, fall back to the default
                    }
                return default_val;
            }

        // Navigate to a key using dot notation (e.g., "section.subsection.key")
        YAML::Node navigate_to_key(const std::string& key) const
            {
            YAML::Node node;
            node.reset(root_);

            size_t start = 0;
            size_t end = key.find('.');

            while (end != std::string::npos)
                {
                std::string part = key.substr(start, end - start);
                if (!node.IsMap()) return YAML::Node();
                const YAML::Node& parent = node;
                YAML::Node child = parent[part];
                if (!child) return YAML::Node();
                node.reset(child);
                start = end + 1;
                end = key.find('.', start);
                }

            if (!node.IsMap()) return YAML::Node();
            const YAML::Node& parent = node;
            return parent[key.substr(start)];
            }

        YAML::Node root_;
        bool loaded_ = false;
    };

} // namespace kvsession::config
