#include "test_command_line_options.hpp"
#include "test_delete_operation.hpp"
#include "test_download_operation.hpp"
#include "test_idrive_backend.hpp"
#include "test_main.hpp"
#include "test_upload_operation.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

#include <filesystem>

std::filesystem::path programDirectory;

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    programDirectory = std::filesystem::path{argv[0]}.parent_path();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
