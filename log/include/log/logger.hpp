#pragma once

#include <log/level.hpp>

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    struct LoggerOptions
    {
        Level level{Level::Info};
        bool logToConsole{true};
        std::optional<std::filesystem::path> logFile{std::nullopt};
        std::size_t maxFileSize{5 * 1024 * 1024};
        std::size_t maxFiles{3};
    };

    class Logger
    {
      public:
        Logger();

        /**
         * @brief Replaces the sinks of the logger. Messages logged before the first setup go to stderr.
         *
         * @param options Sink and level configuration.
         */
        void setup(LoggerOptions const& options);

        void setLevel(Level level);
        Level level() const;

        template <typename... Args>
        void log(Level level, std::string_view fmt, Args&&... args)
        {
            std::shared_ptr<spdlog::logger> target;
            {
                std::scoped_lock lock{guard_};
                target = logger_;
            }
            if (!target || !target->should_log(toSpdlogLevel(level)))
                return;

            target->log(
                toSpdlogLevel(level),
                spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...));
        }

      private:
        mutable std::mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
