#include <transfer/remote_path.hpp>
#include <transfer/shell_escape.hpp>

namespace Transfer
{
    std::string escapeRemotePath(std::string_view remotePath)
    {
        if (remotePath == "~")
            return "~";

        if (remotePath.starts_with("~/"))
        {
            const auto rest = remotePath.substr(2);
            if (rest.empty())
                return "~/";
            return "~/" + shellEscape(rest);
        }

        return shellEscape(remotePath);
    }

    std::string joinRemotePath(std::string_view parent, std::string_view name)
    {
        while (name.starts_with('/'))
            name.remove_prefix(1);

        std::string result{parent};
        if (result.empty())
            return std::string{name};

        while (result.size() > 1 && result.back() == '/')
            result.pop_back();
        if (result.back() != '/')
            result.push_back('/');
        result.append(name);
        return result;
    }
}
