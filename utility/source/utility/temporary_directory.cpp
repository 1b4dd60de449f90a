#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

#include <unistd.h>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory(std::filesystem::path parent, bool removeParent)
        : m_basePath{std::move(parent)}
        , m_path{}
        , m_removeBase{removeParent}
    {
        if (!std::filesystem::exists(m_basePath))
            std::filesystem::create_directories(m_basePath);

        std::string dirNameAsString{(m_basePath / "dirXXXXXX").string()};
        const bool valid = mkdtemp(dirNameAsString.data()) != nullptr && std::filesystem::is_directory(dirNameAsString);
        if (!valid)
            throw std::runtime_error(std::string{"Could not setup temporary directory in: "} + m_basePath.string());
        m_path = dirNameAsString;
    }

    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "hostxfer_tmpdir", true}
    {}

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
        if (m_removeBase)
            std::filesystem::remove(m_basePath, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return m_path;
    }
}
