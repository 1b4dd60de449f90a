#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Creates a unique directory on construction and removes it with all contents on destruction.
     */
    class TemporaryDirectory
    {
      public:
        /**
         * @param parent Directory the unique directory is created in. Created if missing.
         * @param removeParent Also remove the parent on destruction (only succeeds if it is empty then).
         */
        TemporaryDirectory(std::filesystem::path parent, bool removeParent);
        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path m_basePath;
        std::filesystem::path m_path;
        bool m_removeBase;
    };
}
