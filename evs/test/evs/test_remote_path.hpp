#pragma once

#include <evs/remote_path.hpp>

#include <gtest/gtest.h>

namespace Evs::Test
{
    TEST(RemotePathTests, UrlPathBecomesRelativeRemoteRoot)
    {
        EXPECT_EQ(remoteRootFromUrl("idrive:///backups/host1"), "backups/host1");
        EXPECT_EQ(remoteRootFromUrl("idrive://account/backups/host1"), "backups/host1");
        EXPECT_EQ(remoteRootFromUrl("/backups/host1"), "backups/host1");
        EXPECT_EQ(remoteRootFromUrl("backups"), "backups");
    }

    TEST(RemotePathTests, UrlWithoutPathYieldsEmptyRoot)
    {
        EXPECT_EQ(remoteRootFromUrl("idrive://"), "");
        EXPECT_EQ(remoteRootFromUrl("idrive://account"), "");
    }

    TEST(RemotePathTests, TrailingWhitespaceIsStrippedAndEscapesDecoded)
    {
        EXPECT_EQ(remoteRootFromUrl("idrive:///my%20backups/host%2F1  \n"), "my backups/host/1");
    }

    TEST(RemotePathTests, MalformedEscapesAreKept)
    {
        EXPECT_EQ(percentDecode("100%"), "100%");
        EXPECT_EQ(percentDecode("%zz%4"), "%zz%4");
        EXPECT_EQ(percentDecode("%41%62"), "Ab");
    }

    TEST(RemotePathTests, JoinUsesSingleSeparator)
    {
        EXPECT_EQ(joinRemotePath("backups", "a.gpg"), "backups/a.gpg");
        EXPECT_EQ(joinRemotePath("backups/", "a.gpg"), "backups/a.gpg");
        EXPECT_EQ(joinRemotePath("", "a.gpg"), "a.gpg");
        EXPECT_EQ(joinRemotePath("backups", "/abs/a.gpg"), "/abs/a.gpg");
    }
}
