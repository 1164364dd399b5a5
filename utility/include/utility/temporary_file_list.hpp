#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace Utility
{
    /**
     * @brief A text file holding one path per line that exists exactly as long as this object.
     *
     * Used to hand lists of paths to programs that read them from a file ("--files-from=").
     * The file is fully written and closed when the constructor returns.
     */
    class TemporaryFileList
    {
      public:
        /**
         * @brief Creates the file below the given directory and writes the lines into it.
         *
         * @param lines Each entry is written followed by a newline. May be empty, which yields an empty file.
         * @param directory Directory to create the file in. Created if missing.
         * @throws std::runtime_error if the file cannot be created or written.
         */
        explicit TemporaryFileList(
            std::vector<std::string> const& lines,
            std::filesystem::path const& directory = std::filesystem::temp_directory_path());
        ~TemporaryFileList();

        TemporaryFileList(TemporaryFileList const&) = delete;
        TemporaryFileList& operator=(TemporaryFileList const&) = delete;
        TemporaryFileList(TemporaryFileList&&) = delete;
        TemporaryFileList& operator=(TemporaryFileList&&) = delete;

        std::filesystem::path const& path() const;
        std::size_t size() const;

      private:
        std::filesystem::path path_;
        std::size_t size_;
    };
}
