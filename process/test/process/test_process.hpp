#pragma once

#include <process/process.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>

#include <gtest/gtest.h>

#include <string>

namespace Subprocess::Test
{
    class ProcessTests : public ::testing::Test
    {
      protected:
        struct Collected
        {
            std::string standardOutput{};
            std::string standardError{};
            std::optional<int> exitCode{};
            bool streamsClosed{false};
        };

        Collected runToCompletion(std::string const& script, Environment environment = Environment::current())
        {
            Collected collected{};
            auto process = std::make_shared<Process>(context_.get_executor());
            process->spawn("/bin/sh", {"-c", script}, std::move(environment));
            process->startReading(
                [&collected](std::string_view data) {
                    collected.standardOutput.append(data);
                    return true;
                },
                [&collected](std::string_view data) {
                    collected.standardError.append(data);
                    return true;
                },
                [&collected]() {
                    collected.streamsClosed = true;
                });
            process->asyncWaitForExit([&collected](int code) {
                collected.exitCode = code;
            });
            context_.run();
            return collected;
        }

      protected:
        boost::asio::io_context context_{};
    };

    TEST_F(ProcessTests, OutputOfBothStreamsIsRead)
    {
        const auto collected = runToCompletion("printf 'out'; printf 'err' >&2");

        EXPECT_EQ(collected.standardOutput, "out");
        EXPECT_EQ(collected.standardError, "err");
        EXPECT_TRUE(collected.streamsClosed);
        EXPECT_EQ(collected.exitCode, 0);
    }

    TEST_F(ProcessTests, ExitCodeIsReported)
    {
        const auto collected = runToCompletion("exit 7");
        EXPECT_EQ(collected.exitCode, 7);
    }

    TEST_F(ProcessTests, EnvironmentIsPassed)
    {
        auto environment = Environment::current();
        environment.set("HOSTXFER_TEST_VALUE", "a b;c");

        const auto collected = runToCompletion("printf '%s' \"$HOSTXFER_TEST_VALUE\"", environment);
        EXPECT_EQ(collected.standardOutput, "a b;c");
    }

    TEST_F(ProcessTests, LargeOutputIsReadCompletely)
    {
        const auto collected = runToCompletion("i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done");
        EXPECT_EQ(collected.standardOutput.size(), 2000 * 11);
    }

    TEST_F(ProcessTests, UnknownExecutableThrows)
    {
        auto process = std::make_shared<Process>(context_.get_executor());
        EXPECT_THROW(
            process->spawn("hostxfer-no-such-executable", {}, Environment::current()), boost::system::system_error);
        EXPECT_FALSE(process->running());
    }
}
