#pragma once

#include "operation_test_fixture.hpp"

#include <backend/evs/upload_operation.hpp>

#include <gtest/gtest.h>

namespace Test
{
    using namespace ::testing;

    class UploadOperationTests : public OperationTestFixture
    {
      protected:
        void SetUp() override
        {
            sourcePath_ = isolateDirectory_.path() / "work" / "duplicity-upload.part";
            writeFile(sourcePath_, "archive content");
            stagedPath_ = std::filesystem::canonical(sourcePath_.parent_path()) / remoteName_;
        }

        UploadOperation::UploadOperationOptions options() const
        {
            return {
                .localPath = sourcePath_,
                .remoteName = remoteName_,
                .remoteDirectory = "backups/host1",
                .temporaryDirectory = fileListDirectory(),
                .stagingPrefix = "stage1",
            };
        }

        std::string const remoteName_{"duplicity-full.20240101T000000Z.vol1.difftar.gpg"};
        std::filesystem::path sourcePath_{};
        std::filesystem::path stagedPath_{};
    };

    TEST_F(UploadOperationTests, SuccessfulUploadRunsFiveInvocationsInOrder)
    {
        EXPECT_CALL(runner_, run(_)).Times(5).WillRepeatedly(recordAndReturn(reply("ok")));

        UploadOperation operation{session_, runner_, options()};
        const auto result = operation.perform();

        ASSERT_TRUE(result.has_value()) << result.error().toString();
        ASSERT_EQ(recorded_.size(), 5u);

        EXPECT_EQ(
            arguments(0),
            (std::vector<std::string>{
                "--password-file=/secrets/password",
                "--files-from=" + recorded_[0].fileListPath.string(),
                "/",
                "user@evs1::home/stage1"}));
        EXPECT_EQ(recorded_[0].fileList, stagedPath_.string() + "\n");

        EXPECT_EQ(
            arguments(1),
            (std::vector<std::string>{
                "--password-file=/secrets/password",
                "--files-from=" + recorded_[1].fileListPath.string(),
                "/",
                "user@evs1::home/backups/host1"}));
        EXPECT_EQ(recorded_[1].fileList, "");

        EXPECT_EQ(
            arguments(2),
            (std::vector<std::string>{
                "--password-file=/secrets/password",
                "--copy-within",
                "--files-from=" + recorded_[2].fileListPath.string(),
                "user@evs1::home/backups/host1"}));
        EXPECT_EQ(recorded_[2].fileList, "/stage1" + stagedPath_.generic_string() + "\n");

        EXPECT_EQ(
            arguments(3),
            (std::vector<std::string>{
                "--password-file=/secrets/password",
                "--delete-items",
                "--files-from=" + recorded_[3].fileListPath.string(),
                "user@evs1::home/"}));
        EXPECT_EQ(recorded_[3].fileList, "/stage1\n");

        EXPECT_EQ(
            arguments(4),
            (std::vector<std::string>{
                "--password-file=/secrets/password",
                "--deletefrom-trash",
                "--files-from=" + recorded_[4].fileListPath.string(),
                "user@evs1::home/"}));
        EXPECT_EQ(recorded_[4].fileList, "/stage1\n");

        EXPECT_EQ(operation.state(), SharedData::OperationState::Completed);
        EXPECT_TRUE(operation.id().isValid());
        ASSERT_EQ(operation.steps().size(), 6u);
        for (auto const& step : operation.steps())
            EXPECT_TRUE(step.succeeded);
        EXPECT_FALSE(operation.steps().front().commandLine.has_value());
    }

    TEST_F(UploadOperationTests, SourceFileKeepsItsNameAfterUpload)
    {
        EXPECT_CALL(runner_, run(_)).Times(5).WillRepeatedly(recordAndReturn(reply()));

        UploadOperation operation{session_, runner_, options()};
        ASSERT_TRUE(operation.perform().has_value());

        EXPECT_TRUE(std::filesystem::exists(sourcePath_));
        EXPECT_FALSE(std::filesystem::exists(stagedPath_));
        EXPECT_EQ(readFile(sourcePath_), "archive content");
    }

    TEST_F(UploadOperationTests, FileListsAreRemovedAfterEachInvocation)
    {
        EXPECT_CALL(runner_, run(_)).Times(5).WillRepeatedly(recordAndReturn(reply()));

        UploadOperation operation{session_, runner_, options()};
        ASSERT_TRUE(operation.perform().has_value());

        for (auto const& command : recorded_)
            EXPECT_FALSE(std::filesystem::exists(command.fileListPath)) << command.fileListPath;
    }

    TEST_F(UploadOperationTests, CopyWithinFailureIsReportedAsStepFourWithoutUndo)
    {
        EXPECT_CALL(runner_, run(_))
            .WillOnce(recordAndReturn(reply()))
            .WillOnce(recordAndReturn(reply()))
            .WillOnce(recordAndReturn(reply("copy failed: quota exceeded", 1)));

        UploadOperation operation{session_, runner_, options()};
        const auto result = operation.perform();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::OperationErrorType::TransferError);
        ASSERT_TRUE(result.error().step.has_value());
        EXPECT_EQ(*result.error().step, SharedData::UploadStep::CopyWithin);
        EXPECT_EQ(SharedData::stepNumber(*result.error().step), 4);
        ASSERT_TRUE(result.error().commandResult.has_value());
        EXPECT_EQ(result.error().commandResult->standardOutput, "copy failed: quota exceeded");

        EXPECT_EQ(recorded_.size(), 3u);
        EXPECT_EQ(operation.state(), SharedData::OperationState::Failed);
        ASSERT_EQ(operation.steps().size(), 4u);
        EXPECT_FALSE(operation.steps().back().succeeded);
        EXPECT_FALSE(std::filesystem::exists(recorded_.back().fileListPath));
    }

    TEST_F(UploadOperationTests, StagingUploadSpawnFailureRestoresSource)
    {
        EXPECT_CALL(runner_, run(_)).WillOnce(recordAndReturn(spawnFailure()));

        UploadOperation operation{session_, runner_, options()};
        const auto result = operation.perform();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::OperationErrorType::TransferError);
        EXPECT_EQ(result.error().step, SharedData::UploadStep::UploadToStaging);
        EXPECT_TRUE(std::filesystem::exists(sourcePath_));
        EXPECT_FALSE(std::filesystem::exists(stagedPath_));
    }

    TEST_F(UploadOperationTests, MissingSourceFailsBeforeRunningTheTool)
    {
        std::filesystem::remove(sourcePath_);

        UploadOperation operation{session_, runner_, options()};
        const auto result = operation.perform();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::OperationErrorType::TransferError);
        EXPECT_EQ(result.error().step, SharedData::UploadStep::StageLocally);
        EXPECT_TRUE(recorded_.empty());
    }

    TEST_F(UploadOperationTests, ExistingFileWithRemoteNameIsNeverOverwritten)
    {
        writeFile(stagedPath_, "unrelated content");

        UploadOperation operation{session_, runner_, options()};
        const auto result = operation.perform();

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::OperationErrorType::TransferError);
        EXPECT_EQ(result.error().step, SharedData::UploadStep::StageLocally);
        ASSERT_TRUE(result.error().extraInfo.has_value());
        EXPECT_NE(result.error().extraInfo->find("already exists"), std::string::npos);
        EXPECT_TRUE(recorded_.empty());
        EXPECT_EQ(readFile(stagedPath_), "unrelated content");
        EXPECT_EQ(readFile(sourcePath_), "archive content");
    }

    TEST_F(UploadOperationTests, OperationCannotBePerformedTwice)
    {
        EXPECT_CALL(runner_, run(_)).Times(5).WillRepeatedly(recordAndReturn(reply()));

        UploadOperation operation{session_, runner_, options()};
        ASSERT_TRUE(operation.perform().has_value());

        const auto second = operation.perform();
        ASSERT_FALSE(second.has_value());
        EXPECT_EQ(second.error().type, SharedData::OperationErrorType::ImplementationError);
        EXPECT_EQ(operation.state(), SharedData::OperationState::Completed);
    }

    TEST_F(UploadOperationTests, StagingPrefixUsesPartOfLocalDirectoryAndRandomPart)
    {
        const auto first = UploadOperation::makeStagingPrefix("/tmp/duplicity-ab_cd-efgh/more");
        const auto second = UploadOperation::makeStagingPrefix("/tmp/duplicity-ab_cd-efgh/more");

        EXPECT_TRUE(first.starts_with("abcdef-")) << first;
        EXPECT_EQ(first.size(), std::string{"abcdef-"}.size() + 8);
        EXPECT_NE(first, second);
    }

    TEST_F(UploadOperationTests, DefaultStagingPrefixUsesResolvedSourceDirectory)
    {
        std::filesystem::create_directories(sourcePath_.parent_path() / "nested");
        auto opts = options();
        opts.localPath = sourcePath_.parent_path() / "nested" / ".." / sourcePath_.filename();
        opts.stagingPrefix = std::nullopt;

        UploadOperation operation{session_, runner_, opts};
        const auto expected = UploadOperation::makeStagingPrefix(std::filesystem::canonical(sourcePath_.parent_path()));

        ASSERT_EQ(operation.stagingPrefix().size(), expected.size());
        EXPECT_EQ(
            operation.stagingPrefix().substr(0, expected.size() - 8), expected.substr(0, expected.size() - 8));
    }

    TEST_F(UploadOperationTests, StagingPrefixOfShortDirectoryIsRandomOnly)
    {
        const auto prefix = UploadOperation::makeStagingPrefix("/tmp");
        EXPECT_EQ(prefix.size(), 8u);
    }
}
