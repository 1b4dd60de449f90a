#pragma once

#include <spdlog/common.h>

#include <utility/algorithm/case_convert.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    namespace Detail
    {
        struct LevelInfo
        {
            Level level;
            spdlog::level::level_enum spdlogLevel;
            std::string_view name;
        };

        inline constexpr std::array<LevelInfo, 7> levels{{
            {Level::Trace, spdlog::level::trace, "trace"},
            {Level::Debug, spdlog::level::debug, "debug"},
            {Level::Info, spdlog::level::info, "info"},
            {Level::Warning, spdlog::level::warn, "warning"},
            {Level::Error, spdlog::level::err, "error"},
            {Level::Critical, spdlog::level::critical, "critical"},
            {Level::Off, spdlog::level::off, "off"},
        }};
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        for (auto const& info : Detail::levels)
        {
            if (info.level == level)
                return info.spdlogLevel;
        }
        return spdlog::level::info;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum level)
    {
        for (auto const& info : Detail::levels)
        {
            if (info.spdlogLevel == level)
                return info.level;
        }
        return Level::Info;
    }

    /**
     * @brief Parses a level name case insensitively, "warn" is accepted for "warning".
     */
    inline std::optional<Level> parseLevel(std::string_view name)
    {
        const auto lowered = Utility::Algorithm::toLowerCase(std::string{name});
        if (lowered == "warn")
            return Level::Warning;

        for (auto const& info : Detail::levels)
        {
            if (info.name == lowered)
                return info.level;
        }
        return std::nullopt;
    }

    inline std::string_view levelToString(Level level)
    {
        for (auto const& info : Detail::levels)
        {
            if (info.level == level)
                return info.name;
        }
        return "info";
    }
}
