#pragma once

#include <string>
#include <string_view>

namespace Transfer
{
    /**
     * @brief Renders a remote path as a shell token for the remote side.
     *
     * This is the only place where caller input is not escaped completely: a leading "~/" stays
     * unquoted and only the remainder is escaped, so that the remote shell expands the home directory.
     * A bare "~" is emitted as is. Every other path is escaped in full.
     */
    std::string escapeRemotePath(std::string_view remotePath);

    /**
     * @brief Appends name to parent with exactly one "/" between them.
     */
    std::string joinRemotePath(std::string_view parent, std::string_view name);
}
