#pragma once

#include <evs/session.hpp>
#include <process/mocks/command_runner_mock.hpp>
#include <utility/temporary_directory.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

extern std::filesystem::path programDirectory;

namespace Test
{
    struct RecordedCommand
    {
        CommandLine commandLine;
        std::filesystem::path fileListPath;
        // Content of the file list at the time the command ran.
        std::string fileList;
    };

    class OperationTestFixture : public ::testing::Test
    {
      protected:
        using RunResult = std::expected<SharedData::CommandResult, std::string>;

        static SharedData::CommandResult reply(std::string output = {}, int exitStatus = 0)
        {
            return SharedData::CommandResult{.standardOutput = std::move(output), .exitStatus = exitStatus};
        }

        static RunResult spawnFailure()
        {
            return RunResult{std::unexpect, "No such file or directory"};
        }

        static std::string readFile(std::filesystem::path const& path)
        {
            std::ifstream file{path, std::ios_base::binary};
            return std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        }

        static void writeFile(std::filesystem::path const& path, std::string const& content)
        {
            std::filesystem::create_directories(path.parent_path());
            std::ofstream file{path, std::ios_base::binary};
            file << content;
        }

        void recordCommand(CommandLine const& commandLine)
        {
            const std::filesystem::path fileListPath = commandLine.optionValue("--files-from");
            recorded_.push_back(RecordedCommand{
                .commandLine = commandLine,
                .fileListPath = fileListPath,
                .fileList = fileListPath.empty() ? std::string{} : readFile(fileListPath),
            });
        }

        /**
         * @brief Action for the runner mock that records the command and answers with the given result.
         */
        auto recordAndReturn(RunResult result)
        {
            return [this, result](CommandLine const& commandLine) -> RunResult {
                recordCommand(commandLine);
                return result;
            };
        }

        std::vector<std::string> arguments(std::size_t index) const
        {
            return recorded_.at(index).commandLine.arguments;
        }

        std::filesystem::path fileListDirectory() const
        {
            return isolateDirectory_.path() / "lists";
        }

        Evs::Session session_{
            .credentials =
                {
                    .executable = "/opt/idrive/idevsutil",
                    .accountId = "user",
                    .authArguments = {"--password-file=/secrets/password"},
                },
            .serverAddress = "evs1",
        };
        ::testing::StrictMock<CommandRunnerMock> runner_{};
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
        std::vector<RecordedCommand> recorded_{};
    };
}
