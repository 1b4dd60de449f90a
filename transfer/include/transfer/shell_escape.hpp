#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Transfer
{
    /**
     * @brief Quotes a string so that a POSIX shell reads it back as exactly one word with the same content.
     * The result is wrapped in single quotes, every contained single quote becomes '\''.
     */
    std::string shellEscape(std::string_view str);

    /**
     * @brief Escapes every element and joins them with single spaces.
     */
    std::string shellEscapeAll(std::vector<std::string> const& strings);

    /**
     * @brief Leaves words that only consist of characters without special meaning to the shell unquoted,
     * everything else is escaped with shellEscape. Used for tool names and configuration paths,
     * which are not caller input but read better unquoted.
     */
    std::string shellQuoteIfNeeded(std::string_view str);
}
