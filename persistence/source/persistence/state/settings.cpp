#include <persistence/state/settings.hpp>

namespace Persistence
{
    namespace
    {
        template <typename T>
        void fillIfEmpty(std::optional<T>& target, std::optional<T> const& source)
        {
            if (!target)
                target = source;
        }

        void pathToJson(nlohmann::json& j, char const* key, std::optional<std::filesystem::path> const& path)
        {
            if (path)
                j[key] = path->generic_string();
        }

        void pathFromJson(nlohmann::json const& j, char const* key, std::optional<std::filesystem::path>& path)
        {
            if (j.contains(key))
                path = std::filesystem::path{j[key].get<std::string>()};
        }
    }

    void Settings::useDefaultsFrom(Settings const& other)
    {
        fillIfEmpty(transferToolDirectory, other.transferToolDirectory);
        fillIfEmpty(accountId, other.accountId);
        fillIfEmpty(passwordFile, other.passwordFile);
        fillIfEmpty(privateKeyFile, other.privateKeyFile);
        fillIfEmpty(logLevel, other.logLevel);
        fillIfEmpty(logFile, other.logFile);
        fillIfEmpty(temporaryDirectory, other.temporaryDirectory);
        fillIfEmpty(evsTempDirectory, other.evsTempDirectory);
    }

    void to_json(nlohmann::json& j, Settings const& settings)
    {
        j = nlohmann::json::object();
        pathToJson(j, "transferToolDirectory", settings.transferToolDirectory);
        if (settings.accountId)
            j["accountId"] = *settings.accountId;
        pathToJson(j, "passwordFile", settings.passwordFile);
        pathToJson(j, "privateKeyFile", settings.privateKeyFile);
        if (settings.logLevel)
            j["logLevel"] = *settings.logLevel;
        pathToJson(j, "logFile", settings.logFile);
        pathToJson(j, "temporaryDirectory", settings.temporaryDirectory);
        pathToJson(j, "evsTempDirectory", settings.evsTempDirectory);
    }

    void from_json(nlohmann::json const& j, Settings& settings)
    {
        pathFromJson(j, "transferToolDirectory", settings.transferToolDirectory);
        if (j.contains("accountId"))
            settings.accountId = j["accountId"].get<std::string>();
        pathFromJson(j, "passwordFile", settings.passwordFile);
        pathFromJson(j, "privateKeyFile", settings.privateKeyFile);
        if (j.contains("logLevel"))
            settings.logLevel = j["logLevel"].get<std::string>();
        pathFromJson(j, "logFile", settings.logFile);
        pathFromJson(j, "temporaryDirectory", settings.temporaryDirectory);
        pathFromJson(j, "evsTempDirectory", settings.evsTempDirectory);
    }
}
