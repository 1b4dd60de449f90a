#pragma once

#include <utility/home_directory.hpp>

#include <gtest/gtest.h>

namespace Utility::Test
{
    TEST(HomeDirectoryTests, BareTildeIsTheHomeDirectory)
    {
        EXPECT_EQ(expandTilde("~", "/home/u"), "/home/u");
    }

    TEST(HomeDirectoryTests, TildeSlashIsReplaced)
    {
        EXPECT_EQ(expandTilde("~/a/b", "/home/u"), "/home/u/a/b");
        EXPECT_EQ(expandTilde("~/", "/home/u/"), "/home/u/");
    }

    TEST(HomeDirectoryTests, RootHomeGetsNoDoubleSlash)
    {
        EXPECT_EQ(expandTilde("~/x", "/"), "/x");
        EXPECT_EQ(expandTilde("~/", "/"), "/");
        EXPECT_EQ(expandTilde("~", "/"), "/");
    }

    TEST(HomeDirectoryTests, OtherPathsAreUntouched)
    {
        EXPECT_EQ(expandTilde("/etc/~/x", "/home/u"), "/etc/~/x");
        EXPECT_EQ(expandTilde("~other/x", "/home/u"), "~other/x");
        EXPECT_EQ(expandTilde("relative/path", "/home/u"), "relative/path");
        EXPECT_EQ(expandTilde("", "/home/u"), "");
    }

    TEST(HomeDirectoryTests, HomeDirectoryIsAbsolute)
    {
        EXPECT_TRUE(homeDirectory().is_absolute());
    }
}
