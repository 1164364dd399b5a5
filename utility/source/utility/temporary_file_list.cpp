#include <utility/temporary_file_list.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string_view>

#include <stdlib.h>
#include <unistd.h>

namespace Utility
{
    namespace
    {
        bool writeAll(int fd, std::string_view data)
        {
            while (!data.empty())
            {
                const auto written = ::write(fd, data.data(), data.size());
                if (written < 0)
                {
                    if (errno == EINTR)
                        continue;
                    return false;
                }
                data.remove_prefix(static_cast<std::size_t>(written));
            }
            return true;
        }
    }

    TemporaryFileList::TemporaryFileList(std::vector<std::string> const& lines, std::filesystem::path const& directory)
        : path_{}
        , size_{lines.size()}
    {
        if (!std::filesystem::exists(directory))
            std::filesystem::create_directories(directory);

        std::string fileNameAsString{(directory / "filelistXXXXXX").string()};
        const int fd = mkstemp(&fileNameAsString[0]);
        if (fd < 0)
            throw std::runtime_error(
                std::string{"Could not create file list in '"} + directory.string() + "': " + std::strerror(errno));
        path_ = fileNameAsString;

        std::string content{};
        for (auto const& line : lines)
        {
            content += line;
            content += '\n';
        }

        const bool wrote = writeAll(fd, content);
        const int writeErrno = errno;
        ::close(fd);

        if (!wrote)
        {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
            throw std::runtime_error(
                std::string{"Could not write file list '"} + fileNameAsString + "': " + std::strerror(writeErrno));
        }
    }

    TemporaryFileList::~TemporaryFileList()
    {
        std::error_code error;
        std::filesystem::remove(path_, error);
    }

    std::filesystem::path const& TemporaryFileList::path() const
    {
        return path_;
    }

    std::size_t TemporaryFileList::size() const
    {
        return size_;
    }
}
