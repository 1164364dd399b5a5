#include <shared_data/file_operations/operation_error.hpp>

#include <fmt/format.h>

namespace SharedData
{
    std::string OperationError::toString() const
    {
        std::string result = Utility::enumToString(type);
        if (step)
            result += fmt::format(" in step {} ({})", stepNumber(*step), Utility::enumToString(*step));
        if (extraInfo)
            result += fmt::format(": {}", *extraInfo);
        if (commandResult)
        {
            result += fmt::format(
                ". Exit status: {}",
                commandResult->exitStatus ? std::to_string(*commandResult->exitStatus) : std::string{"none"});
            const auto output = commandResult->combinedOutput();
            if (!output.empty())
                result += fmt::format(", output: {}", output);
        }
        return result;
    }

    void to_json(nlohmann::json& j, OperationError const& operationError)
    {
        j = nlohmann::json::object();
        j["type"] = Utility::enumToString(operationError.type);
        if (operationError.step)
        {
            j["step"] = stepNumber(*operationError.step);
            j["stepName"] = Utility::enumToString(*operationError.step);
        }
        if (operationError.commandResult)
            SharedData::to_json(j["commandResult"], *operationError.commandResult);
        if (operationError.extraInfo)
            j["extraInfo"] = *operationError.extraInfo;
    }
}
