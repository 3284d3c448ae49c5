#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "cli.h"
#include "exceptions.h"

using namespace chkcert;

TEST(CliTest, DefaultsWithInputFile)
{
    CliOptions options = ParseArguments({"-i", "domains.txt"});
    EXPECT_EQ(options.Source(), kSourceFile);
    EXPECT_EQ(options.input_filename, "domains.txt");
    EXPECT_EQ(options.alert_limit_days, 7);
    EXPECT_EQ(options.retries, 1u);
    EXPECT_EQ(options.timeout_secs, 10u);
    EXPECT_EQ(options.parallel, 1u);
    EXPECT_FALSE(options.sensor_mode);
    EXPECT_FALSE(options.only_alerting);
    EXPECT_FALSE(options.only_names);
    EXPECT_FALSE(options.generate_metrics);
    EXPECT_FALSE(options.verbose);
}

TEST(CliTest, LongAndShortFlags)
{
    CliOptions options = ParseArguments({"--domain", "example.com", "-s", "--only-alerting", "-n",
                                         "--alert-limit", "14", "-G", "--retries", "3", "-v",
                                         "--timeout", "5", "-P", "8"});
    EXPECT_EQ(options.Source(), kSourceDomain);
    EXPECT_EQ(options.domain, "example.com");
    EXPECT_TRUE(options.sensor_mode);
    EXPECT_TRUE(options.only_alerting);
    EXPECT_TRUE(options.only_names);
    EXPECT_EQ(options.alert_limit_days, 14);
    EXPECT_TRUE(options.generate_metrics);
    EXPECT_EQ(options.retries, 3u);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.timeout_secs, 5u);
    EXPECT_EQ(options.parallel, 8u);
}

TEST(CliTest, BackendSource)
{
    CliOptions options = ParseArguments({"-b", "pastebin"});
    EXPECT_EQ(options.Source(), kSourceBackend);
    EXPECT_EQ(options.backend_name, "pastebin");
}

TEST(CliTest, NegativeAlertLimitIsAccepted)
{
    EXPECT_EQ(ParseArguments({"-d", "x", "-A", "-2"}).alert_limit_days, -2);
}

TEST(CliTest, SourceIsRequired)
{
    EXPECT_THROW(ParseArguments({}), ConfigException);
    EXPECT_THROW(ParseArguments({"-s", "-l"}), ConfigException);
}

TEST(CliTest, OnlyOneSource)
{
    EXPECT_THROW(ParseArguments({"-i", "f", "-d", "x"}), ConfigException);
    EXPECT_THROW(ParseArguments({"-i", "f", "-b", "pastebin"}), ConfigException);
    EXPECT_THROW(ParseArguments({"-d", "x", "-b", "pastebin"}), ConfigException);
}

TEST(CliTest, RepeatedFlagIsRejected)
{
    EXPECT_THROW(ParseArguments({"-d", "x", "--domain", "y"}), ConfigException);
    EXPECT_THROW(ParseArguments({"-d", "x", "-v", "-v"}), ConfigException);
}

TEST(CliTest, UnknownFlagIsRejected)
{
    EXPECT_THROW(ParseArguments({"-d", "x", "--frobnicate"}), ConfigException);
}

TEST(CliTest, MalformedValuesAreRejected)
{
    EXPECT_THROW(ParseArguments({"-d"}), ConfigException);
    EXPECT_THROW(ParseArguments({"-d", "x", "-A", "seven"}), ConfigException);
    EXPECT_THROW(ParseArguments({"-d", "x", "-R", "0"}), ConfigException);
    EXPECT_THROW(ParseArguments({"-d", "x", "-t", "-5"}), ConfigException);
    EXPECT_THROW(ParseArguments({"-d", "x", "-P", "4x"}), ConfigException);
}

TEST(CliTest, AlertLimitOutsideIntRangeIsRejected)
{
    EXPECT_THROW(ParseArguments({"-d", "x", "-A", "4294967303"}), ConfigException);
    EXPECT_THROW(ParseArguments({"-d", "x", "-A", "-2147483649"}), ConfigException);
    EXPECT_EQ(ParseArguments({"-d", "x", "-A", "2147483647"}).alert_limit_days, 2147483647);
}

TEST(CliTest, HelpNeedsNoSource)
{
    EXPECT_TRUE(ParseArguments({"-h"}).help);
    EXPECT_TRUE(ParseArguments({"--version"}).version);
}

TEST(CliTest, HelpListsEveryFlag)
{
    std::ostringstream os;
    PrintHelp(os, "check_certificates");
    const std::string help = os.str();
    for (const char* flag : {"--backend-name", "--input-filename", "--domain", "--sensor-mode",
                             "--only-alerting", "--only-names", "--alert-limit", "--generate-metrics",
                             "--retries", "--timeout", "--parallel", "--verbose", "--help"})
    {
        EXPECT_NE(help.find(flag), std::string::npos) << flag;
    }
}
