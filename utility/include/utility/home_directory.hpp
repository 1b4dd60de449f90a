#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief The home directory of the current user. $HOME is preferred, the passwd entry is the fallback.
     *
     * @throws std::runtime_error if neither is available.
     */
    std::filesystem::path homeDirectory();

    /**
     * @brief Replaces a leading "~" or "~/" with the home directory. "~user" forms are left untouched.
     */
    std::string expandTilde(std::string_view path);

    /**
     * @brief Same as expandTilde, but with an explicit home directory.
     */
    std::string expandTilde(std::string_view path, std::filesystem::path const& home);
}
