#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace Utility::Algorithm
{
    inline bool isSpace(char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline std::string_view trimLeft(std::string_view str)
    {
        std::size_t start = 0;
        while (start < str.size() && isSpace(str[start]))
            ++start;
        return str.substr(start);
    }

    inline std::string_view trimRight(std::string_view str)
    {
        std::size_t end = str.size();
        while (end > 0 && isSpace(str[end - 1]))
            --end;
        return str.substr(0, end);
    }

    inline std::string_view trim(std::string_view str)
    {
        return trimRight(trimLeft(str));
    }

    /**
     * @brief Splits on runs of whitespace. Leading and trailing whitespace produce no empty fields.
     */
    inline std::vector<std::string> splitWhitespace(std::string_view str)
    {
        std::vector<std::string> fields{};
        std::size_t pos = 0;
        while (pos < str.size())
        {
            while (pos < str.size() && isSpace(str[pos]))
                ++pos;
            if (pos == str.size())
                break;
            const auto begin = pos;
            while (pos < str.size() && !isSpace(str[pos]))
                ++pos;
            fields.emplace_back(str.substr(begin, pos - begin));
        }
        return fields;
    }

    /**
     * @brief Splits text into lines. Accepts "\n", "\r\n" and lone "\r" as terminators.
     *
     * @param keepEmpty Whether empty lines are part of the result.
     */
    inline std::vector<std::string> splitLines(std::string_view str, bool keepEmpty = false)
    {
        std::vector<std::string> lines{};
        std::size_t begin = 0;
        for (std::size_t i = 0; i < str.size(); ++i)
        {
            if (str[i] != '\n' && str[i] != '\r')
                continue;
            if (keepEmpty || i > begin)
                lines.emplace_back(str.substr(begin, i - begin));
            if (str[i] == '\r' && i + 1 < str.size() && str[i + 1] == '\n')
                ++i;
            begin = i + 1;
        }
        if (begin < str.size())
            lines.emplace_back(str.substr(begin));
        return lines;
    }
}
