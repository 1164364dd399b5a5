#pragma once

#include <utility/temporary_file_list.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

extern std::filesystem::path programDirectory;

namespace Utility::Test
{
    class TemporaryFileListTests : public ::testing::Test
    {
      protected:
        std::string readFile(std::filesystem::path const& path)
        {
            std::ifstream file{path};
            return std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        }

      protected:
        TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(TemporaryFileListTests, SingleLineIsWritten)
    {
        TemporaryFileList list{{"/tmp/duplicity-abc/file.gpg"}, isolateDirectory_.path()};
        EXPECT_EQ(readFile(list.path()), "/tmp/duplicity-abc/file.gpg\n");
        EXPECT_EQ(list.size(), 1);
    }

    TEST_F(TemporaryFileListTests, MultipleLinesAreWrittenInOrder)
    {
        TemporaryFileList list{{"a.gpg", "b.gpg", "c.gpg"}, isolateDirectory_.path()};
        EXPECT_EQ(readFile(list.path()), "a.gpg\nb.gpg\nc.gpg\n");
    }

    TEST_F(TemporaryFileListTests, EmptyListYieldsEmptyFile)
    {
        TemporaryFileList list{{}, isolateDirectory_.path()};
        EXPECT_TRUE(std::filesystem::exists(list.path()));
        EXPECT_EQ(std::filesystem::file_size(list.path()), 0);
    }

    TEST_F(TemporaryFileListTests, FileIsRemovedOnDestruction)
    {
        std::filesystem::path path{};
        {
            TemporaryFileList list{{"x"}, isolateDirectory_.path()};
            path = list.path();
            ASSERT_TRUE(std::filesystem::exists(path));
        }
        EXPECT_FALSE(std::filesystem::exists(path));
    }

    TEST_F(TemporaryFileListTests, FileIsRemovedWhenScopeIsLeftByException)
    {
        std::filesystem::path path{};
        try
        {
            TemporaryFileList list{{"x"}, isolateDirectory_.path()};
            path = list.path();
            throw std::runtime_error("invocation failed");
        }
        catch (std::runtime_error const&)
        {}
        ASSERT_FALSE(path.empty());
        EXPECT_FALSE(std::filesystem::exists(path));
    }
}
