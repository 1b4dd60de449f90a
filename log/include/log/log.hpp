#pragma once

#include <log/level.hpp>
#include <log/logger.hpp>

#include <string_view>
#include <utility>

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
     * @brief Installs the sinks described by the options.
     */
    void setup(LoggerOptions const& options);

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

    template <typename... Args>
    inline void trace(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void warn(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Warning, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(std::string_view fmt, Args&&... args)
    {
        return log(Log::Level::Critical, fmt, std::forward<Args>(args)...);
    }
}
