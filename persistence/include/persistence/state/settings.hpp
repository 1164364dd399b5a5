#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Everything the program can be configured with. Every value is optional, missing required values are
     * detected where they are needed.
     */
    struct Settings
    {
        // Directory containing the idevsutil executable.
        std::optional<std::filesystem::path> transferToolDirectory{std::nullopt};
        std::optional<std::string> accountId{std::nullopt};
        // File containing the account password.
        std::optional<std::filesystem::path> passwordFile{std::nullopt};
        // File containing the private encryption key, only needed for accounts with private encryption.
        std::optional<std::filesystem::path> privateKeyFile{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};
        std::optional<std::filesystem::path> logFile{std::nullopt};
        // Where file lists and download scratch directories are created.
        std::optional<std::filesystem::path> temporaryDirectory{std::nullopt};
        // Local working folder the transfer tool leaves behind, removed on close.
        std::optional<std::filesystem::path> evsTempDirectory{std::nullopt};

        void useDefaultsFrom(Settings const& other);
    };
    void to_json(nlohmann::json& j, Settings const& settings);
    void from_json(nlohmann::json const& j, Settings& settings);
}
