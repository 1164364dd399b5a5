#pragma once

#include <backend/command_line_options.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace Test
{
    class CommandLineOptionsTests : public ::testing::Test
    {
      protected:
        static std::expected<CommandLineOptions, std::string> parse(std::vector<char const*> arguments)
        {
            arguments.insert(arguments.begin(), "idrive-store");
            return parseCommandLine(static_cast<int>(arguments.size()), arguments.data());
        }
    };

    TEST_F(CommandLineOptionsTests, OptionsUrlCommandAndArgumentsAreSeparated)
    {
        const auto options = parse(
            {"--config", "/etc/idrive.json", "--log-level", "debug", "--json", "idrive:///backups", "put", "a", "b"});

        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->configFile, std::filesystem::path{"/etc/idrive.json"});
        EXPECT_EQ(options->logLevel, "debug");
        EXPECT_TRUE(options->json);
        EXPECT_EQ(options->remoteUrl, "idrive:///backups");
        EXPECT_EQ(options->command, "put");
        EXPECT_EQ(options->arguments, (std::vector<std::string>{"a", "b"}));
    }

    TEST_F(CommandLineOptionsTests, ArgumentsAfterCommandAreNotOptions)
    {
        const auto options = parse({"idrive:///backups", "delete", "--json", "x.gpg"});

        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_FALSE(options->json);
        EXPECT_EQ(options->arguments, (std::vector<std::string>{"--json", "x.gpg"}));
    }

    TEST_F(CommandLineOptionsTests, UsageErrorsAreReported)
    {
        EXPECT_FALSE(parse({}).has_value());
        EXPECT_FALSE(parse({"idrive:///backups"}).has_value());
        EXPECT_FALSE(parse({"idrive:///backups", "upload"}).has_value());
        EXPECT_FALSE(parse({"idrive:///backups", "put", "only-one"}).has_value());
        EXPECT_FALSE(parse({"idrive:///backups", "list", "extra"}).has_value());
        EXPECT_FALSE(parse({"idrive:///backups", "query"}).has_value());
        EXPECT_FALSE(parse({"--unknown", "idrive:///backups", "list"}).has_value());
        EXPECT_FALSE(parse({"idrive:///backups", "list", "--log-level"}).has_value());
        EXPECT_FALSE(parse({"--log-level"}).has_value());
    }

    TEST_F(CommandLineOptionsTests, HelpNeedsNothingElse)
    {
        const auto options = parse({"--help"});
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->help);
    }
}
