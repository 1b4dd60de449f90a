#pragma once

#include <shared_data/transfer_request.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace Transfer
{
    /**
     * @brief Removes all trailing slashes. "/" is kept as is.
     */
    std::string stripTrailingSlashes(std::string_view path);

    /**
     * @brief Ensures exactly one trailing slash. An empty path stays empty.
     */
    std::string forceTrailingSlash(std::string_view path);

    /**
     * @brief Expands "~" in local paths and applies the trailing slash convention of scp and rsync,
     * so that a directory ends up as a named directory at the destination and is not merged into it.
     *
     * Only the local path is inspected. Remote paths keep their "~" for the remote shell.
     */
    class PathNormalizer
    {
      public:
        explicit PathNormalizer(std::filesystem::path home);

        /**
         * @throws std::runtime_error if the home directory cannot be determined.
         */
        PathNormalizer();

        /**
         * @brief Returns the request with normalized local and remote paths.
         * When the local path cannot be inspected, only "~" is expanded.
         */
        SharedData::TransferRequest normalize(SharedData::TransferRequest request) const;

        std::string expandLocal(std::string_view localPath) const;

      private:
        std::filesystem::path home_;
    };
}
