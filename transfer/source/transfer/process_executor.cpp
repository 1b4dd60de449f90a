#include <transfer/process_executor.hpp>
#include <transfer/progress_parser.hpp>

#include <log/log.hpp>
#include <process/command_runner.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

using namespace SharedData;

namespace Transfer
{
    namespace
    {
        /**
         * @brief Turns stdout chunks into throttled progress messages. Lives for one execution.
         */
        class ProgressExtractor
        {
          public:
            ProgressExtractor(std::chrono::milliseconds throttle, std::shared_ptr<ProgressChannel> channel)
                : splitter_{}
                , throttle_{throttle}
                , channel_{std::move(channel)}
            {}

            void feed(std::string_view chunk)
            {
                for (auto const& line : splitter_.feed(chunk))
                    consider(line);
            }

            void finish()
            {
                if (auto rest = splitter_.finish())
                    consider(*rest);
            }

          private:
            void consider(std::string const& line)
            {
                auto message = parseProgressLine(line);
                if (message && throttle_.admit())
                    channel_->push(std::move(*message));
            }

          private:
            LineSplitter splitter_;
            ProgressThrottle throttle_;
            std::shared_ptr<ProgressChannel> channel_;
        };

        TransferResult makeResult(Subprocess::RunOutcome const& outcome, ExecutionOptions const& options)
        {
            TransferResult result{};
            if (!outcome.standardOutput.empty())
                result.rawStdout = outcome.standardOutput;
            if (!outcome.standardError.empty())
                result.rawStderr = outcome.standardError;
            result.exitCode = outcome.exitCode;

            const bool listing = options.context == ClassificationContext::Listing;

            if (outcome.spawnError)
            {
                result.errorType = ExecutionErrorType::SpawnFailure;
                result.userMessage = fmt::format(
                    "{} could not be started: {}", listing ? "Listing" : "Transfer", *outcome.spawnError);
                return result;
            }

            if (outcome.cancelled)
            {
                result.errorType = ExecutionErrorType::Cancelled;
                result.userMessage = listing ? "Listing cancelled." : "Transfer cancelled.";
                return result;
            }

            if (outcome.timedOut)
            {
                result.errorType = ExecutionErrorType::Timeout;
                if (listing)
                    result.userMessage =
                        fmt::format("Listing timed out after {}. The server may be unreachable.", formatTimeout(options.timeout));
                else
                    result.userMessage = fmt::format(
                        "Transfer timed out after {}. The server may be unreachable or the transfer is taking too long.",
                        formatTimeout(options.timeout));
                return result;
            }

            if (outcome.exitCode && *outcome.exitCode == 0)
            {
                result.success = true;
                result.userMessage = summarizeOutput(outcome.standardOutput);
                return result;
            }

            const auto classification = classifyError(
                outcome.standardError,
                fmt::format("Process exited with code {}", outcome.exitCode.value_or(-1)),
                options.context);
            result.errorType = classification.type;
            result.userMessage = classification.userMessage;

            // rsync often explains a failure on stdout as well
            if (!listing && !outcome.standardOutput.empty())
                result.userMessage += "\n\nOutput: " + lastLines(outcome.standardOutput, 2);
            return result;
        }
    }

    std::string formatTimeout(std::chrono::milliseconds timeout)
    {
        const auto count = timeout.count();
        if (count > 0 && count % 60'000 == 0)
        {
            const auto minutes = count / 60'000;
            return fmt::format("{} minute{}", minutes, minutes == 1 ? "" : "s");
        }
        if (count > 0 && count % 1'000 == 0)
        {
            const auto seconds = count / 1'000;
            return fmt::format("{} second{}", seconds, seconds == 1 ? "" : "s");
        }
        return fmt::format("{} ms", count);
    }

    Execution::Execution(
        std::shared_ptr<Subprocess::CommandRunner> runner,
        std::shared_ptr<ProgressChannel> progress,
        std::future<TransferResult> result)
        : runner_{std::move(runner)}
        , progress_{std::move(progress)}
        , result_{std::move(result)}
    {}

    Execution::~Execution() = default;

    ProgressChannel& Execution::progress()
    {
        return *progress_;
    }

    TransferResult Execution::wait()
    {
        return result_.get();
    }

    void Execution::cancel()
    {
        if (runner_)
            runner_->cancel();
    }

    ProcessExecutor::ProcessExecutor(std::string shell)
        : shell_{std::move(shell)}
    {}

    Execution ProcessExecutor::start(std::string const& commandLine, ExecutionOptions const& options) const
    {
        auto channel = std::make_shared<ProgressChannel>();
        auto extractor = std::make_shared<ProgressExtractor>(options.progressThrottle, channel);

        Subprocess::RunOptions runOptions{};
        runOptions.timeout = options.timeout;
        runOptions.shell = shell_;
        // Error classification matches english messages.
        runOptions.environment.set("LC_ALL", "C");
        runOptions.onStdout = [extractor](std::string_view chunk) {
            extractor->feed(chunk);
        };

        auto runner = std::make_shared<Subprocess::CommandRunner>(std::move(runOptions));

        Log::info("Executing: {}", commandLine);
        auto result = std::async(std::launch::async, [runner, extractor, channel, commandLine, options]() {
            try
            {
                const auto outcome = runner->run(commandLine);
                extractor->finish();
                channel->close();

                auto result = makeResult(outcome, options);
                if (result.success)
                    Log::info("Command succeeded: {}", result.userMessage);
                else
                    Log::error(
                        "Command failed ({}): {}",
                        Utility::enumToString(result.errorType.value_or(ExecutionErrorType::Unclassified)),
                        result.userMessage);
                return result;
            }
            catch (...)
            {
                channel->close();
                throw;
            }
        });

        return Execution{std::move(runner), std::move(channel), std::move(result)};
    }

    TransferResult ProcessExecutor::run(
        std::string const& commandLine,
        ExecutionOptions const& options,
        std::function<void(std::string const&)> const& onProgress) const
    {
        auto execution = start(commandLine, options);
        while (auto message = execution.progress().next())
        {
            if (onProgress)
                onProgress(*message);
        }
        return execution.wait();
    }

    TransferResult ProcessExecutor::run(
        BuiltCommand const& command,
        ExecutionOptions const& options,
        std::function<void(std::string const&)> const& onProgress) const
    {
        return run(command.commandLine, options, onProgress);
    }
}
