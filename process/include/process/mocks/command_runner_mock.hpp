#pragma once

#include <process/command_runner.hpp>

#include <gmock/gmock.h>

namespace Test
{
    class CommandRunnerMock : public CommandRunner
    {
      public:
        MOCK_METHOD(
            (std::expected<SharedData::CommandResult, std::string>),
            run,
            (CommandLine const& commandLine),
            (override));
    };
}
