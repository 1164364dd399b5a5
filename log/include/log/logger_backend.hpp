#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    class Logger
    {
      public:
        Logger()
            : guard_{}
            , logger_{}
        {}

        /**
         * @brief Replaces the underlying spdlog logger with one writing to stderr and optionally to a file.
         */
        void setup(std::string const& name, std::optional<std::filesystem::path> const& logFile);

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                logger_->set_level(toSpdlogLevel(level));
            spdlog::set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                return fromSpdlogLevel(logger_->level());
            return fromSpdlogLevel(spdlog::get_level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            const auto spdLevel = toSpdlogLevel(level);
            {
                std::scoped_lock lock{guard_};
                const auto current = logger_ ? logger_->level() : spdlog::get_level();
                if (spdLevel < current)
                    return;
            }
            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::shared_ptr<spdlog::logger> target;
            {
                std::scoped_lock lock{guard_};
                target = logger_;
            }
            if (target)
                target->log(toSpdlogLevel(level), msg);
            else
                spdlog::log(toSpdlogLevel(level), msg);
        }

      private:
        mutable std::recursive_mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
