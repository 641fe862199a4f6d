#include "kvsession/cleanup_options.hpp"
#include "kvsession/errors.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace kvsession;

namespace
{

CleanupOptions parse(std::vector<const char*> args)
    {
    args.insert(args.begin(), "kvsession-cleanup");
    return parse_cleanup_options(static_cast<int>(args.size()), args.data());
    }

} // namespace

TEST(CleanupOptionsTest, DefaultsWithoutArguments)
    {
    CleanupOptions options = parse({});
    EXPECT_EQ(options.config_file, "config/kvsession.yaml");
    EXPECT_FALSE(options.once);
    EXPECT_FALSE(options.help);
    EXPECT_FALSE(options.interval_seconds.has_value());
    }

TEST(CleanupOptionsTest, ParsesEveryOption)
    {
    CleanupOptions options = parse({ "--config", "/etc/kvsession.yaml", "--once", "--interval", "90" });
    EXPECT_EQ(options.config_file, "/etc/kvsession.yaml");
    EXPECT_TRUE(options.once);
    ASSERT_TRUE(options.interval_seconds.has_value());
    EXPECT_EQ(*options.interval_seconds, 90);

    EXPECT_TRUE(parse({ "--help" }).help);
    EXPECT_TRUE(parse({ "-h" }).help);
    }

TEST(CleanupOptionsTest, BadIntervalIsAUsageError)
    {
    EXPECT_THROW(parse({ "--interval", "abc" }), UsageError);
    EXPECT_THROW(parse({ "--interval", "10s" }), UsageError);
    EXPECT_THROW(parse({ "--interval", "0" }), UsageError);
    EXPECT_THROW(parse({ "--interval", "-5" }), UsageError);
    EXPECT_THROW(parse({ "--interval", "99999999999999999999" }), UsageError);
    }

TEST(CleanupOptionsTest, MissingValuesAndUnknownOptionsAreUsageErrors)
    {
    EXPECT_THROW(parse({ "--interval" }), UsageError);
    EXPECT_THROW(parse({ "--config" }), UsageError);
    EXPECT_THROW(parse({ "--verbose" }), UsageError);
    }
