#pragma once

#include <shared_data/shared_data.hpp>
#include <utility/enum_string_convert.hpp>
#include <shared_data/command_result.hpp>
#include <shared_data/file_operations/operation_error_type.hpp>
#include <shared_data/file_operations/upload_step.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    struct OperationError
    {
        OperationErrorType type;
        // Set when an upload failed, names the step that did not complete.
        std::optional<UploadStep> step = std::nullopt;
        std::optional<CommandResult> commandResult = std::nullopt;
        std::optional<std::string> extraInfo = std::nullopt;

        std::string toString() const;
    };

    void to_json(nlohmann::json& j, OperationError const& operationError);
}
