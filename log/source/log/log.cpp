#include <log/log.hpp>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};

        constexpr static char const* loggerName = "hostxfer";
        constexpr static char const* pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    }

    Logger::Logger()
        : guard_{}
        , logger_{std::make_shared<spdlog::logger>(
              Detail::loggerName,
              std::make_shared<spdlog::sinks::stderr_color_sink_mt>())}
    {
        logger_->set_pattern(Detail::pattern);
        logger_->set_level(spdlog::level::info);
    }

    void Logger::setup(LoggerOptions const& options)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        if (options.logToConsole)
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (options.logFile)
        {
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    options.logFile->string(), options.maxFileSize, options.maxFiles));
            }
            catch (spdlog::spdlog_ex const& e)
            {
                // The console sink (if any) still gets the messages.
                log(Level::Error, "Cannot open log file '{}': {}", options.logFile->string(), e.what());
            }
        }

        if (sinks.empty())
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());

        auto replacement = std::make_shared<spdlog::logger>(Detail::loggerName, sinks.begin(), sinks.end());
        replacement->set_pattern(Detail::pattern);
        replacement->set_level(toSpdlogLevel(options.level));
        replacement->flush_on(spdlog::level::warn);

        std::scoped_lock lock{guard_};
        logger_ = std::move(replacement);
    }

    void Logger::setLevel(Level level)
    {
        std::scoped_lock lock{guard_};
        logger_->set_level(toSpdlogLevel(level));
    }

    Level Logger::level() const
    {
        std::scoped_lock lock{guard_};
        return fromSpdlogLevel(logger_->level());
    }

    void setup(LoggerOptions const& options)
    {
        Detail::logger.setup(options);
    }
}
