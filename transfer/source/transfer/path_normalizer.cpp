#include <transfer/path_normalizer.hpp>

#include <log/log.hpp>
#include <utility/home_directory.hpp>

#include <system_error>

using namespace SharedData;

namespace Transfer
{
    std::string stripTrailingSlashes(std::string_view path)
    {
        while (path.size() > 1 && path.ends_with('/'))
            path.remove_suffix(1);
        return std::string{path};
    }

    std::string forceTrailingSlash(std::string_view path)
    {
        auto result = stripTrailingSlashes(path);
        if (!result.empty() && !result.ends_with('/'))
            result.push_back('/');
        return result;
    }

    PathNormalizer::PathNormalizer(std::filesystem::path home)
        : home_{std::move(home)}
    {}

    PathNormalizer::PathNormalizer()
        : PathNormalizer{Utility::homeDirectory()}
    {}

    std::string PathNormalizer::expandLocal(std::string_view localPath) const
    {
        return Utility::expandTilde(localPath, home_);
    }

    TransferRequest PathNormalizer::normalize(TransferRequest request) const
    {
        request.localPath = expandLocal(request.localPath);

        std::error_code ec;
        const auto status = std::filesystem::status(request.localPath, ec);
        if (ec)
        {
            Log::debug("PathNormalizer: '{}' cannot be inspected, paths are used as given.", request.localPath);
            return request;
        }

        if (!std::filesystem::is_directory(status))
            return request;

        switch (request.direction)
        {
            case TransferDirection::Upload:
            {
                request.localPath = stripTrailingSlashes(request.localPath);
                request.remotePath = forceTrailingSlash(request.remotePath);
                break;
            }
            case TransferDirection::Download:
            {
                request.localPath = forceTrailingSlash(request.localPath);
                request.remotePath = stripTrailingSlashes(request.remotePath);
                break;
            }
        }
        return request;
    }
}
