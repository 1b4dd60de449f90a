#pragma once

#include <transfer/process_executor.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <string>
#include <vector>

namespace Transfer::Test
{
    using namespace std::chrono_literals;
    using SharedData::ExecutionErrorType;
    using ::testing::ElementsAre;
    using ::testing::EndsWith;
    using ::testing::HasSubstr;
    using ::testing::StartsWith;

    class ProcessExecutorTests : public ::testing::Test
    {
      protected:
        ProcessExecutor executor_{};
    };

    TEST_F(ProcessExecutorTests, SuccessfulRunIsSummarized)
    {
        const auto result = executor_.run(
            "printf 'sending incremental file list\\na.txt\\ntotal size is 1,024  speedup is 0.81\\n'");

        EXPECT_TRUE(result.success);
        EXPECT_EQ(result.exitCode, 0);
        EXPECT_FALSE(result.errorType.has_value());
        EXPECT_EQ(result.userMessage, "total size is 1,024  speedup is 0.81");
    }

    TEST_F(ProcessExecutorTests, RunsWithTheCLocale)
    {
        const auto result = executor_.run("echo \"$LC_ALL\"");

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.userMessage, "C");
    }

    TEST_F(ProcessExecutorTests, FailureIsClassifiedFromStderr)
    {
        const auto result = executor_.run("echo 'user@web: Permission denied (publickey).' >&2; exit 255");

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.exitCode, 255);
        EXPECT_EQ(result.errorType, ExecutionErrorType::AuthKeyRejected);
        EXPECT_THAT(result.rawStderr.value_or(""), HasSubstr("publickey"));
        EXPECT_THAT(result.userMessage, StartsWith("Authentication failed: SSH key not accepted."));
    }

    TEST_F(ProcessExecutorTests, TransferFailureAppendsTheLastOutputLines)
    {
        const auto result = executor_.run("printf 'one\\ntwo\\nthree\\n'; echo 'strange failure' >&2; exit 23");

        EXPECT_EQ(result.errorType, ExecutionErrorType::Unclassified);
        EXPECT_EQ(result.userMessage, "Transfer failed: strange failure\n\nOutput: two\nthree");
    }

    TEST_F(ProcessExecutorTests, ListingFailureDoesNotAppendOutput)
    {
        const auto result =
            executor_.run("echo partial; exit 2", ExecutionOptions{.context = ClassificationContext::Listing});

        EXPECT_EQ(result.errorType, ExecutionErrorType::Unclassified);
        EXPECT_EQ(result.userMessage, "Failed to list remote files: Process exited with code 2");
    }

    TEST_F(ProcessExecutorTests, SlowCommandTimesOut)
    {
        const auto begin = std::chrono::steady_clock::now();
        const auto result = executor_.run("sleep 30", ExecutionOptions{.timeout = 300ms});

        EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.errorType, ExecutionErrorType::Timeout);
        EXPECT_EQ(
            result.userMessage,
            "Transfer timed out after 300 ms. The server may be unreachable or the transfer is taking too long.");
    }

    TEST_F(ProcessExecutorTests, ProgressArrivesInOrder)
    {
        std::vector<std::string> progress;
        const auto result = executor_.run(
            "printf '      1,024  10%%    1.00MB/s    0:00:09\\r      2,048  20%%    1.00MB/s    0:00:08\\r'; "
            "printf '\\nsent 2,048 bytes  received 35 bytes\\n'",
            ExecutionOptions{.progressThrottle = 0ms},
            [&progress](std::string const& message) {
                progress.push_back(message);
            });

        EXPECT_TRUE(result.success);
        EXPECT_THAT(
            progress,
            ElementsAre("10% • 1.00MB/s • 0:00:09 remaining", "20% • 1.00MB/s • 0:00:08 remaining"));
    }

    TEST_F(ProcessExecutorTests, ProgressIsThrottled)
    {
        std::vector<std::string> progress;
        executor_.run(
            "printf '  1,024  10%%  1.00MB/s  0:00:09\\n  2,048  20%%  1.00MB/s  0:00:08\\n'",
            ExecutionOptions{.progressThrottle = 1h},
            [&progress](std::string const& message) {
                progress.push_back(message);
            });

        EXPECT_THAT(progress, ElementsAre("10% • 1.00MB/s • 0:00:09 remaining"));
    }

    TEST_F(ProcessExecutorTests, ChannelIsClosedOnceTheResultIsReady)
    {
        auto execution = executor_.start("printf '  1,024 100%%  1.00MB/s  0:00:00\\n'", {.progressThrottle = 0ms});
        const auto result = execution.wait();

        EXPECT_TRUE(result.success);
        EXPECT_TRUE(execution.progress().closed());
        EXPECT_EQ(execution.progress().tryNext(), std::optional<std::string>{"100% • 1.00MB/s • 0:00:00 remaining"});
        EXPECT_FALSE(execution.progress().next().has_value());
    }

    TEST_F(ProcessExecutorTests, CancelledExecutionReportsCancelled)
    {
        const auto begin = std::chrono::steady_clock::now();
        auto execution = executor_.start("sleep 30");
        execution.cancel();
        const auto result = execution.wait();

        EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
        EXPECT_EQ(result.errorType, ExecutionErrorType::Cancelled);
        EXPECT_EQ(result.userMessage, "Transfer cancelled.");
    }

    TEST(ProcessExecutorSpawnTests, MissingShellIsASpawnFailure)
    {
        const auto result = ProcessExecutor{"/nonexistent/sh"}.run("true");

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.errorType, ExecutionErrorType::SpawnFailure);
        EXPECT_THAT(result.userMessage, StartsWith("Transfer could not be started: "));
    }

    TEST(FormatTimeoutTests, PicksTheLargestWholeUnit)
    {
        EXPECT_EQ(formatTimeout(std::chrono::minutes{5}), "5 minutes");
        EXPECT_EQ(formatTimeout(std::chrono::minutes{1}), "1 minute");
        EXPECT_EQ(formatTimeout(30s), "30 seconds");
        EXPECT_EQ(formatTimeout(1500ms), "1500 ms");
    }
}
