#include <transfer/shell_escape.hpp>

#include <algorithm>

namespace Transfer
{
    namespace
    {
        bool isPlainShellCharacter(char c)
        {
            if (c >= 'a' && c <= 'z')
                return true;
            if (c >= 'A' && c <= 'Z')
                return true;
            if (c >= '0' && c <= '9')
                return true;
            switch (c)
            {
                case '_':
                case '-':
                case '.':
                case '/':
                case ',':
                case '+':
                case '@':
                case '%':
                case ':':
                case '=':
                    return true;
                default:
                    return false;
            }
        }
    }

    std::string shellEscape(std::string_view str)
    {
        std::string result;
        result.reserve(str.size() + 2);
        result.push_back('\'');
        for (auto c : str)
        {
            if (c == '\'')
                result.append("'\\''");
            else
                result.push_back(c);
        }
        result.push_back('\'');
        return result;
    }

    std::string shellEscapeAll(std::vector<std::string> const& strings)
    {
        std::string result;
        for (auto const& str : strings)
        {
            if (!result.empty())
                result.push_back(' ');
            result.append(shellEscape(str));
        }
        return result;
    }

    std::string shellQuoteIfNeeded(std::string_view str)
    {
        // A leading '=' or '-' would be fine for the shell, but "~" and the empty word are not.
        if (!str.empty() && std::all_of(str.begin(), str.end(), isPlainShellCharacter))
            return std::string{str};
        return shellEscape(str);
    }
}
