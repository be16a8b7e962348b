// GoogleTest unit tests for mproxy-client argument parsing
#include "mproxy/CommandLine.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace mproxy;

namespace
{

CommandLine parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "mproxy-client");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(CommandLineTest, Defaults)
{
    const CommandLine cmd = parse({"--server-addr", "127.0.0.1:9910"});
    EXPECT_FALSE(cmd.help);
    EXPECT_EQ(cmd.options.inputPath, "-");
    EXPECT_EQ(cmd.options.destinations, std::vector<std::string>{"127.0.0.1:9910"});
    EXPECT_FALSE(cmd.options.tee);
    EXPECT_FALSE(cmd.options.backupEnabled());
    EXPECT_EQ(cmd.options.backupDirectory, std::filesystem::path("ais_backup"));
    EXPECT_EQ(cmd.options.sweepMode, SweepMode::PerWrite);
    EXPECT_FALSE(cmd.ipv6Interface.has_value());
    EXPECT_FALSE(cmd.ipv6Connect.has_value());
}

TEST(CommandLineTest, AllOptions)
{
    const CommandLine cmd =
        parse({"--path", "data.txt", "--server-addr", "224.0.0.1:9922", "--server-addr=[ff02::1]:9923", "-t",
               "--backup-interval", "7", "--backup-dir=/var/backup", "--sweep-interval", "600", "--ipv6-interface",
               "3", "--ipv6-connect=unspecified", "--halt-on-send-error", "-v"});

    EXPECT_EQ(cmd.options.inputPath, "data.txt");
    EXPECT_EQ(cmd.options.destinations, (std::vector<std::string>{"224.0.0.1:9922", "[ff02::1]:9923"}));
    EXPECT_TRUE(cmd.options.tee);
    EXPECT_EQ(cmd.options.retentionDays, 7U);
    EXPECT_TRUE(cmd.options.backupEnabled());
    EXPECT_EQ(cmd.options.backupDirectory, std::filesystem::path("/var/backup"));
    EXPECT_EQ(cmd.options.sweepMode, SweepMode::Interval);
    EXPECT_EQ(cmd.options.sweepInterval, std::chrono::seconds{600});
    EXPECT_EQ(cmd.ipv6Interface, 3U);
    EXPECT_EQ(cmd.ipv6Connect, Ipv6ConnectMode::UnspecifiedAtTargetPort);
    EXPECT_TRUE(cmd.options.haltOnSendError);
    EXPECT_TRUE(cmd.options.verbose);
}

TEST(CommandLineTest, BackupWithoutRetention)
{
    const CommandLine cmd = parse({"--server-addr", "127.0.0.1:1", "--backup"});
    EXPECT_TRUE(cmd.options.backupEnabled());
    EXPECT_FALSE(cmd.options.retentionDays.has_value());
}

TEST(CommandLineTest, HelpNeedsNoTarget)
{
    EXPECT_TRUE(parse({"--help"}).help);
    EXPECT_TRUE(parse({"-h"}).help);
}

TEST(CommandLineTest, UsageErrors)
{
    EXPECT_THROW((void)parse({}), UsageException);
    EXPECT_THROW((void)parse({"--server-addr"}), UsageException);
    EXPECT_THROW((void)parse({"--server-addr", "127.0.0.1:1", "--bogus"}), UsageException);
    EXPECT_THROW((void)parse({"--server-addr", "127.0.0.1:1", "--backup-interval", "0"}), UsageException);
    EXPECT_THROW((void)parse({"--server-addr", "127.0.0.1:1", "--backup-interval", "-3"}), UsageException);
    EXPECT_THROW((void)parse({"--server-addr", "127.0.0.1:1", "--backup-interval", "7d"}), UsageException);
    EXPECT_THROW((void)parse({"--server-addr", "127.0.0.1:1", "--tee=yes"}), UsageException);
    EXPECT_THROW((void)parse({"--server-addr", "127.0.0.1:1", "--path", ""}), UsageException);
    EXPECT_THROW((void)parse({"--server-addr", "127.0.0.1:1", "--ipv6-connect", "any"}), UsageException);
}

TEST(CommandLineTest, UsageMentionsEveryOption)
{
    const std::string text = usage("mproxy-client");
    for (const char* opt : {"--path", "--server-addr", "--tee", "--backup-interval", "--backup-dir", "--backup",
                            "--sweep-interval", "--ipv6-interface", "--ipv6-connect", "--halt-on-send-error",
                            "--verbose", "--help"})
        EXPECT_NE(text.find(opt), std::string::npos) << opt;
}

TEST(CommandLineTest, Ipv6ConnectGroup)
{
    const CommandLine cmd = parse({"--server-addr", "[ff05::1]:9923", "--ipv6-connect", "group"});
    EXPECT_EQ(cmd.ipv6Connect, Ipv6ConnectMode::FullTarget);
    EXPECT_FALSE(cmd.ipv6Interface.has_value());
}
