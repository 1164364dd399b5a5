#pragma once

#include <shared_data/shared_data.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    /**
     * @brief What an external program produced. Always complete, also for failed runs.
     */
    struct CommandResult
    {
        std::string standardOutput{};
        std::string standardError{};
        // Empty if the process did not exit normally.
        std::optional<int> exitStatus{std::nullopt};

        bool succeeded() const
        {
            return exitStatus && *exitStatus == 0;
        }

        /// stdout followed by stderr, the way the transfer tool's replies are evaluated.
        std::string combinedOutput() const
        {
            return standardOutput + standardError;
        }
    };
    BOOST_DESCRIBE_STRUCT(CommandResult, (), (standardOutput, standardError, exitStatus))
}
