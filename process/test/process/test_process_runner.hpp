#pragma once

#include <process/process_runner.hpp>

#include <gtest/gtest.h>

#include <string>

namespace Test
{
    class ProcessRunnerTests : public ::testing::Test
    {
      protected:
        ProcessRunner runner_{};
    };

    TEST_F(ProcessRunnerTests, CapturesStdoutStderrAndExitStatus)
    {
        const auto result = runner_.run(CommandLine{
            .executable = "/bin/sh",
            .arguments = {"-c", "echo out; echo err 1>&2; exit 3"},
        });

        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(result->standardOutput, "out\n");
        EXPECT_EQ(result->standardError, "err\n");
        ASSERT_TRUE(result->exitStatus.has_value());
        EXPECT_EQ(*result->exitStatus, 3);
        EXPECT_FALSE(result->succeeded());
        EXPECT_EQ(result->combinedOutput(), "out\nerr\n");
    }

    TEST_F(ProcessRunnerTests, SuccessfulCommandSucceeds)
    {
        const auto result = runner_.run(CommandLine{
            .executable = "/bin/sh",
            .arguments = {"-c", "true"},
        });

        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_TRUE(result->succeeded());
    }

    TEST_F(ProcessRunnerTests, LargeOutputOnBothStreamsDoesNotStall)
    {
        const auto result = runner_.run(CommandLine{
            .executable = "/bin/sh",
            .arguments = {"-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i 1>&2; i=$((i+1)); done"},
        });

        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_TRUE(result->succeeded());
        EXPECT_GT(result->standardOutput.size(), 100000u);
        EXPECT_GT(result->standardError.size(), 100000u);
    }

    TEST_F(ProcessRunnerTests, MissingExecutableIsReportedAsError)
    {
        const auto result = runner_.run(CommandLine{
            .executable = "/nonexistent/directory/idevsutil",
            .arguments = {"--validate"},
        });

        EXPECT_FALSE(result.has_value());
    }
}
