#include "kvsession/cleanup_options.hpp"
#include "kvsession/errors.hpp"
#include <stdexcept>

namespace kvsession
{

namespace
{

int parse_interval(const std::string& text)
    {
    std::size_t consumed = 0;
    int value = 0;
    try
        {
        value = std::stoi(text, &consumed);
        }
        catch (const std::invalid_argument&)
            {
            throw UsageError("--interval expects a number of seconds, got '" + text + "'");
            }
        catch (const std::out_of_range&)
            {
            throw UsageError("--interval is out of range: " + text);
            }

    if (consumed != text.size())
        {
        throw UsageError("--interval expects a number of seconds, got '" + text + "'");
        }
    if (value < 1)
        {
        throw UsageError("--interval must be at least one second");
        }
    return value;
    }

} // namespace

CleanupOptions parse_cleanup_options(int argc, const char* const* argv)
    {
    CleanupOptions options;

    for (int i = 1; i < argc; ++i)
        {
        std::string a = argv[i];
        if (a == "--config" || a == "--interval")
            {
            if (i + 1 >= argc)
                {
                throw UsageError(a + " requires a value");
                }
            std::string value = argv[++i];
            if (a == "--config")
                {
                options.config_file = value;
                }
            else
                {
                options.interval_seconds = parse_interval(value);
                }
            }
        else if (a == "--once")
            {
            options.once = true;
            }
        else if (a == "-h" || a == "--help")
            {
            options.help = true;
            }
        else
            {
            throw UsageError("unknown option: " + a);
            }
        }
    return options;
    }

} // namespace kvsession
