#pragma once

#include <shared_data/built_command.hpp>
#include <shared_data/transfer_result.hpp>
#include <transfer/error_classifier.hpp>
#include <transfer/progress_channel.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace Subprocess
{
    class CommandRunner;
}

namespace Transfer
{
    struct ExecutionOptions
    {
        std::chrono::milliseconds timeout{std::chrono::minutes{5}};
        std::chrono::milliseconds progressThrottle{500};
        ClassificationContext context{ClassificationContext::Transfer};
    };

    /**
     * @brief A command that is running in the background.
     *
     * The progress channel is closed before the result becomes ready. Destroying the
     * execution waits for the command to end.
     */
    class Execution
    {
      public:
        Execution(
            std::shared_ptr<Subprocess::CommandRunner> runner,
            std::shared_ptr<ProgressChannel> progress,
            std::future<SharedData::TransferResult> result);
        ~Execution();
        Execution(Execution&&) = default;
        Execution& operator=(Execution&&) = default;
        Execution(Execution const&) = delete;
        Execution& operator=(Execution const&) = delete;

        ProgressChannel& progress();

        /**
         * @brief Blocks until the command ended. Can only be called once.
         */
        SharedData::TransferResult wait();

        /**
         * @brief Stops the command, the result will have the category Cancelled.
         */
        void cancel();

      private:
        std::shared_ptr<Subprocess::CommandRunner> runner_;
        std::shared_ptr<ProgressChannel> progress_;
        std::future<SharedData::TransferResult> result_;
    };

    /**
     * @brief Runs built command lines through the shell, one child process per call, without retries.
     */
    class ProcessExecutor
    {
      public:
        explicit ProcessExecutor(std::string shell = "/bin/sh");

        Execution start(std::string const& commandLine, ExecutionOptions const& options = {}) const;

        /**
         * @brief Runs the command and blocks until it ended. onProgress is called on the calling thread.
         */
        SharedData::TransferResult run(
            std::string const& commandLine,
            ExecutionOptions const& options = {},
            std::function<void(std::string const&)> const& onProgress = {}) const;

        SharedData::TransferResult run(
            SharedData::BuiltCommand const& command,
            ExecutionOptions const& options = {},
            std::function<void(std::string const&)> const& onProgress = {}) const;

      private:
        std::string shell_;
    };

    /**
     * @brief "5 minutes", "30 seconds" or "1500 ms".
     */
    std::string formatTimeout(std::chrono::milliseconds timeout);
}
