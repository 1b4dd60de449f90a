#include <utility/home_directory.hpp>

#include <cstdlib>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace Utility
{
    std::filesystem::path homeDirectory()
    {
        if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0')
            return std::filesystem::path{home};

        if (const auto* entry = getpwuid(getuid()); entry != nullptr && entry->pw_dir != nullptr)
            return std::filesystem::path{entry->pw_dir};

        throw std::runtime_error("Cannot determine the home directory of the current user.");
    }

    std::string expandTilde(std::string_view path, std::filesystem::path const& home)
    {
        if (path == "~")
            return home.string();
        if (path.starts_with("~/"))
        {
            std::string expanded = home.string();
            while (expanded.size() > 1 && expanded.back() == '/')
                expanded.pop_back();
            // A home of "/" already ends with the separator.
            expanded += expanded == "/" ? path.substr(2) : path.substr(1);
            return expanded;
        }
        return std::string{path};
    }

    std::string expandTilde(std::string_view path)
    {
        if (!path.starts_with('~'))
            return std::string{path};
        return expandTilde(path, homeDirectory());
    }
}
