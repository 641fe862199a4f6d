#pragma once

#include <optional>
#include <string>

namespace kvsession
{

// Command line of kvsession-cleanup.
struct CleanupOptions
    {
    std::string config_file = "config/kvsession.yaml";
    bool once = false;
    bool help = false;
    std::optional<int> interval_seconds;
    };

// Throws UsageError on an unknown option, a missing value or an interval
// that is not a positive whole number of seconds.
CleanupOptions parse_cleanup_options(int argc, const char* const* argv);

} // namespace kvsession
