#pragma once

#include <process/command_runner.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace Subprocess::Test
{
    TEST(CommandRunnerTests, SuccessfulCommandIsCollected)
    {
        CommandRunner runner{};
        const auto outcome = runner.run("printf 'hello\\nworld\\n'");

        EXPECT_TRUE(outcome.exitedNormally());
        EXPECT_EQ(outcome.exitCode, 0);
        EXPECT_EQ(outcome.standardOutput, "hello\nworld\n");
        EXPECT_TRUE(outcome.standardError.empty());
    }

    TEST(CommandRunnerTests, FailingCommandKeepsStderrAndExitCode)
    {
        CommandRunner runner{};
        const auto outcome = runner.run("echo 'broken' >&2; exit 3");

        EXPECT_TRUE(outcome.exitedNormally());
        EXPECT_EQ(outcome.exitCode, 3);
        EXPECT_EQ(outcome.standardError, "broken\n");
    }

    TEST(CommandRunnerTests, OutputIsStreamedInOrder)
    {
        std::string streamed;
        CommandRunner runner{RunOptions{
            .onStdout =
                [&streamed](std::string_view data) {
                    streamed.append(data);
                },
        }};
        const auto outcome = runner.run("echo one; sleep 0.1; echo two");

        EXPECT_EQ(streamed, "one\ntwo\n");
        EXPECT_EQ(outcome.standardOutput, streamed);
    }

    TEST(CommandRunnerTests, TimeoutStopsTheProcess)
    {
        CommandRunner runner{RunOptions{.timeout = 200ms, .killGracePeriod = 500ms}};

        const auto start = std::chrono::steady_clock::now();
        const auto outcome = runner.run("sleep 30");
        const auto elapsed = std::chrono::steady_clock::now() - start;

        EXPECT_TRUE(outcome.timedOut);
        EXPECT_FALSE(outcome.exitedNormally());
        EXPECT_LT(elapsed, 10s);
    }

    TEST(CommandRunnerTests, ProcessIgnoringSigtermIsKilled)
    {
        CommandRunner runner{RunOptions{.timeout = 200ms, .killGracePeriod = 200ms}};

        const auto start = std::chrono::steady_clock::now();
        const auto outcome = runner.run("trap '' TERM; sleep 30");
        const auto elapsed = std::chrono::steady_clock::now() - start;

        EXPECT_TRUE(outcome.timedOut);
        EXPECT_LT(elapsed, 10s);
    }

    TEST(CommandRunnerTests, CancelStopsARunningProcess)
    {
        CommandRunner runner{};
        auto result = std::async(std::launch::async, [&runner]() {
            return runner.run("sleep 30");
        });

        std::this_thread::sleep_for(200ms);
        runner.cancel();

        ASSERT_EQ(result.wait_for(10s), std::future_status::ready);
        const auto outcome = result.get();
        EXPECT_TRUE(outcome.cancelled);
        EXPECT_FALSE(outcome.timedOut);
    }

    TEST(CommandRunnerTests, CancelBeforeRunSkipsTheCommand)
    {
        CommandRunner runner{};
        runner.cancel();
        const auto outcome = runner.run("echo never");

        EXPECT_TRUE(outcome.cancelled);
        EXPECT_FALSE(outcome.exitCode.has_value());
        EXPECT_TRUE(outcome.standardOutput.empty());
    }

    TEST(CommandRunnerTests, MissingShellIsASpawnError)
    {
        CommandRunner runner{RunOptions{.shell = "/nonexistent/hostxfer/sh"}};
        const auto outcome = runner.run("true");

        EXPECT_TRUE(outcome.spawnError.has_value());
        EXPECT_FALSE(outcome.exitCode.has_value());
    }

    TEST(CommandRunnerTests, RunnerRunsOnlyOnce)
    {
        CommandRunner runner{};
        runner.run("true");
        EXPECT_THROW(runner.run("true"), std::logic_error);
    }
}
