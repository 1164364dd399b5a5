#pragma once

#include <log/level.hpp>
#include <log/logger_backend.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace Log
{
    namespace Detail
    {
        extern Logger logger;
    }

    /**
     * @brief Log a message.
     *
     * @tparam Args Format template arguments.
     * @param level Log level.
     * @param fmt Format string.
     * @param args Format string arguments.
     */
    template <typename... Args>
    void log(Log::Level level, std::string_view fmt, Args&&... args)
    {
        Detail::logger.log(level, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Installs the program logger. Messages go to stderr, and to the file if one is given.
     *
     * @param name Logger name shown in the output.
     * @param logFile Optional file to append to.
     */
    void setupLogger(std::string const& name, std::optional<std::filesystem::path> const& logFile = std::nullopt);

    /**
     * @brief Set the log level.
     *
     * @param level
     */
    inline void setLevel(Log::Level level)
    {
        Detail::logger.setLevel(level);
    }

    /**
     * @brief Get the log level.
     *
     * @return Log::Level
     */
    inline Log::Level level()
    {
        return Detail::logger.level();
    }

    /**
     * @brief Convenience function to log at trace level.
     */
    template <typename... Args>
    inline void trace(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Trace, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Convenience function to log at debug level.
     */
    template <typename... Args>
    inline void debug(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Debug, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Convenience function to log at info level.
     */
    template <typename... Args>
    inline void info(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Info, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Convenience function to log at warn level.
     */
    template <typename... Args>
    inline void warn(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Warning, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Convenience function to log at error level.
     */
    template <typename... Args>
    inline void error(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Error, fmt, std::forward<Args>(args)...);
    }

    /**
     * @brief Convenience function to log at critical level.
     */
    template <typename... Args>
    inline void critical(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Critical, fmt, std::forward<Args>(args)...);
    }
}
