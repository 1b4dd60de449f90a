#pragma once

#include <transfer/progress_parser.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace Transfer::Test
{
    using ::testing::ElementsAre;
    using ::testing::IsEmpty;
    using ::testing::Optional;

    TEST(ProgressParserTests, ProgressLinesAreTranslated)
    {
        EXPECT_THAT(
            parseProgressLine("    1,234,567  67%  123.45MB/s    0:00:05"),
            Optional(std::string{"67% • 123.45MB/s • 0:00:05 remaining"}));
        EXPECT_THAT(
            parseProgressLine("        32,768 100%   31.25kB/s    0:00:00 (xfr#1, to-chk=0/1)"),
            Optional(std::string{"100% • 31.25kB/s • 0:00:00 remaining"}));
    }

    TEST(ProgressParserTests, HumanReadableCountsAreAccepted)
    {
        EXPECT_THAT(
            parseProgressLine("          1.23M  45%    1.00MB/s    0:00:01"),
            Optional(std::string{"45% • 1.00MB/s • 0:00:01 remaining"}));
    }

    TEST(ProgressParserTests, SpeedupSummaryIsTrimmed)
    {
        EXPECT_THAT(
            parseProgressLine("  total size is 1,024  speedup is 0.97  \n"),
            Optional(std::string{"total size is 1,024  speedup is 0.97"}));
    }

    TEST(ProgressParserTests, OtherLinesYieldNothing)
    {
        EXPECT_FALSE(parseProgressLine("sending incremental file list").has_value());
        EXPECT_FALSE(parseProgressLine("docs/readme.md").has_value());
        EXPECT_FALSE(parseProgressLine("").has_value());
    }

    TEST(LineSplitterTests, IncompleteLinesAreCarriedOver)
    {
        LineSplitter splitter;
        EXPECT_THAT(splitter.feed("first li"), IsEmpty());
        EXPECT_THAT(splitter.feed("ne\nsecond"), ElementsAre("first line"));
        EXPECT_THAT(splitter.feed(" line\rthird\r\n"), ElementsAre("second line", "third"));
        EXPECT_FALSE(splitter.finish().has_value());
    }

    TEST(LineSplitterTests, FinishReturnsTheRest)
    {
        LineSplitter splitter;
        EXPECT_THAT(splitter.feed("a\nrest"), ElementsAre("a"));
        EXPECT_THAT(splitter.finish(), Optional(std::string{"rest"}));
        EXPECT_FALSE(splitter.finish().has_value());
    }

    TEST(ProgressThrottleTests, FirstPassesThenOncePerInterval)
    {
        using namespace std::chrono_literals;

        ProgressThrottle throttle{500ms};
        const auto start = std::chrono::steady_clock::time_point{} + 10s;

        EXPECT_TRUE(throttle.admit(start));
        EXPECT_FALSE(throttle.admit(start + 100ms));
        EXPECT_FALSE(throttle.admit(start + 499ms));
        EXPECT_TRUE(throttle.admit(start + 500ms));
        EXPECT_FALSE(throttle.admit(start + 700ms));
        EXPECT_TRUE(throttle.admit(start + 1200ms));
    }

    TEST(SummarizeOutputTests, EmptyOutputHasDefaultMessage)
    {
        EXPECT_EQ(summarizeOutput(""), "Transfer completed successfully");
        EXPECT_EQ(summarizeOutput(" \n\n "), "Transfer completed successfully");
    }

    TEST(SummarizeOutputTests, TotalsSummaryIsPreferred)
    {
        EXPECT_EQ(
            summarizeOutput("sending incremental file list\n"
                            "a.txt\n"
                            "sent 1,234 bytes  received 35 bytes  2,538.00 bytes/sec\n"
                            "total size is 1,024  speedup is 0.81\n"),
            "total size is 1,024  speedup is 0.81");
    }

    TEST(SummarizeOutputTests, LastProgressLineIsNextBest)
    {
        EXPECT_EQ(
            summarizeOutput("a.txt\n"
                            "          1,024 100%    1.00MB/s    0:00:00\n"
                            "sent 1,100 bytes  received 35 bytes\n"
                            "done\n"),
            "sent 1,100 bytes  received 35 bytes");
    }

    TEST(SummarizeOutputTests, SizeLinesComeAfterProgressLines)
    {
        EXPECT_EQ(summarizeOutput("copied 12KB\nfinished\n"), "copied 12KB");
        EXPECT_EQ(summarizeOutput("3 files\nok\n"), "3 files");
    }

    TEST(SummarizeOutputTests, FallsBackToTheLastTwoLines)
    {
        EXPECT_EQ(summarizeOutput("one\ntwo\nthree\n"), "two\nthree");
        EXPECT_EQ(summarizeOutput("only\n"), "only");
    }

    TEST(SummarizeOutputTests, LastLinesIgnoresTrailingNewlines)
    {
        EXPECT_EQ(lastLines("a\nb\nc\n\n", 2), "b\nc");
        EXPECT_EQ(lastLines("", 2), "");
    }
}
