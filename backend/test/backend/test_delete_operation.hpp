#pragma once

#include "operation_test_fixture.hpp"

#include <backend/evs/delete_operation.hpp>
#include <backend/evs/directory_lister.hpp>

#include <gtest/gtest.h>

namespace Test
{
    using namespace ::testing;

    class DeleteOperationTests : public OperationTestFixture
    {
      protected:
        DeleteOperation::DeleteOperationOptions options(std::vector<std::string> names) const
        {
            return {
                .names = std::move(names),
                .remoteDirectory = "backups/host1",
                .temporaryDirectory = fileListDirectory(),
            };
        }
    };

    TEST_F(DeleteOperationTests, NamesAreWrittenWithoutLeadingSlash)
    {
        EXPECT_CALL(runner_, run(_)).WillOnce(recordAndReturn(reply()));

        DeleteOperation operation{session_, runner_, options({"/a.gpg", "b.gpg", "//c.gpg"})};
        ASSERT_TRUE(operation.perform().has_value());

        ASSERT_EQ(recorded_.size(), 1u);
        EXPECT_EQ(
            arguments(0),
            (std::vector<std::string>{
                "--password-file=/secrets/password",
                "--delete-items",
                "--files-from=" + recorded_[0].fileListPath.string(),
                "user@evs1::home/backups/host1"}));
        EXPECT_EQ(recorded_[0].fileList, "a.gpg\nb.gpg\nc.gpg\n");
        EXPECT_FALSE(std::filesystem::exists(recorded_[0].fileListPath));
    }

    TEST_F(DeleteOperationTests, ToolFailureIsNotAnError)
    {
        EXPECT_CALL(runner_, run(_)).WillOnce(recordAndReturn(reply("No such file", 1)));

        DeleteOperation operation{session_, runner_, options({"gone.gpg"})};
        EXPECT_TRUE(operation.perform().has_value());
        EXPECT_EQ(operation.state(), SharedData::OperationState::Completed);
    }

    TEST_F(DeleteOperationTests, SpawnFailureIsTransferError)
    {
        EXPECT_CALL(runner_, run(_)).WillOnce(recordAndReturn(spawnFailure()));

        DeleteOperation operation{session_, runner_, options({"a.gpg"})};
        const auto result = operation.perform();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::OperationErrorType::TransferError);
    }

    class DirectoryListerTests : public OperationTestFixture
    {};

    TEST_F(DirectoryListerTests, ListingRowsAreParsed)
    {
        EXPECT_CALL(runner_, run(_))
            .WillOnce(recordAndReturn(reply("Listing...\n[f] [500] [2024/01/01] [bar.gpg]\n[f] [12] [x] [foo.gpg]\n")));

        DirectoryLister lister{session_, runner_, "backups/host1"};
        const auto entries = lister.perform();

        ASSERT_EQ(entries.size(), 2u);
        EXPECT_EQ(entries[0], (SharedData::RemoteEntry{.size = 500, .name = "bar.gpg"}));
        EXPECT_EQ(entries[1], (SharedData::RemoteEntry{.size = 12, .name = "foo.gpg"}));
        EXPECT_EQ(
            arguments(0),
            (std::vector<std::string>{
                "--password-file=/secrets/password", "--auth-list", "user@evs1::home/backups/host1"}));
    }

    TEST_F(DirectoryListerTests, FailedListingIsEmpty)
    {
        EXPECT_CALL(runner_, run(_))
            .WillOnce(recordAndReturn(reply("[f] [500] [x] [bar.gpg]\n", 1)))
            .WillOnce(recordAndReturn(spawnFailure()));

        DirectoryLister failing{session_, runner_, "backups"};
        EXPECT_TRUE(failing.perform().empty());
        EXPECT_EQ(failing.state(), SharedData::OperationState::Failed);

        DirectoryLister unreachable{session_, runner_, "backups"};
        EXPECT_TRUE(unreachable.perform().empty());
    }
}
