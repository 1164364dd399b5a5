#include <log/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void Logger::setup(std::string const& name, std::optional<std::filesystem::path> const& logFile)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (logFile)
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile->string(), false));

        auto created = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

        std::scoped_lock lock{guard_};
        created->set_level(logger_ ? logger_->level() : spdlog::get_level());
        logger_ = std::move(created);
    }

    void setupLogger(std::string const& name, std::optional<std::filesystem::path> const& logFile)
    {
        Detail::logger.setup(name, logFile);
    }
}
