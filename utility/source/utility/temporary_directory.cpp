#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>

using namespace std::string_literals;

namespace Utility
{
    namespace
    {
        [[maybe_unused]] std::string generateRandomString(int length)
        {
            std::string characters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
            std::string randomString;

            std::mt19937 rng{std::random_device{}()};
            std::uniform_int_distribution<int> distribution(0, static_cast<int>(characters.length()) - 1);

            for (int i = 0; i < length; ++i)
            {
                randomString += characters[distribution(rng)];
            }

            return randomString;
        }
    }

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBasePath)
        : m_basePath{std::move(basePath)}
        , m_path{}
        , m_removeBasePath{removeBasePath}
    {
        if (!std::filesystem::exists(m_basePath))
            std::filesystem::create_directories(m_basePath);

#if __linux__
        std::string dirNameAsString{(m_basePath / "dirXXXXXX").string()};
        bool valid = mkdtemp(&dirNameAsString[0]) && std::filesystem::is_directory(dirNameAsString);
        if (valid)
            m_path = dirNameAsString;
#else
        int i = 0;
        for (; i != 1000; ++i)
        {
            const auto directoryName = "dir"s + generateRandomString(10);
            const auto path = m_basePath / directoryName;
            if (std::filesystem::create_directory(path))
            {
                m_path = path;
                break;
            }
        }
        bool valid = i != 1000;
#endif
        if (!valid)
            throw std::runtime_error(std::string{"Could not setup temporary directory in: "} + m_basePath.string());
    }
    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
        if (m_removeBasePath)
            std::filesystem::remove(m_basePath, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return m_path;
    }

    std::filesystem::path TemporaryDirectory::defaultBasePath()
    {
        return std::filesystem::temp_directory_path() / "idrive_store_tmpdir";
    }
}
