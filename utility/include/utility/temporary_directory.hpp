#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief A uniquely named directory that is removed together with its contents on destruction.
     */
    class TemporaryDirectory
    {
      public:
        /**
         * @brief Creates a fresh directory below the given base path.
         *
         * @param basePath The parent directory, created if missing.
         * @param removeBasePath Also try to remove the base path on destruction (only succeeds when it is empty).
         */
        explicit TemporaryDirectory(std::filesystem::path basePath = defaultBasePath(), bool removeBasePath = false);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

        static std::filesystem::path defaultBasePath();

      private:
        std::filesystem::path m_basePath;
        std::filesystem::path m_path;
        bool m_removeBasePath;
    };
}
