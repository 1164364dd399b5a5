#include "test_handshake.hpp"
#include "test_remote_path.hpp"
#include "test_response_parser.hpp"

#include <log/log.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    Log::setLevel(Log::Level::Off);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
