#include <process/command_runner.hpp>
#include <process/process.hpp>

#include <log/log.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/system_error.hpp>

#include <stdexcept>

namespace Subprocess
{
    CommandRunner::CommandRunner(RunOptions options)
        : options_{std::move(options)}
        , ioContext_{}
        , started_{false}
        , cancelRequested_{false}
        , stopProcess_{}
        , cancelProcess_{}
    {}

    CommandRunner::~CommandRunner() = default;

    RunOutcome CommandRunner::run(std::string const& commandLine)
    {
        if (started_.exchange(true))
            throw std::logic_error("CommandRunner can only run once.");

        RunOutcome outcome{};
        if (cancelRequested_)
        {
            Log::info("CommandRunner: cancelled before start.");
            outcome.cancelled = true;
            return outcome;
        }

        auto process = std::make_shared<Process>(ioContext_.get_executor());
        try
        {
            // Own process group, so that stopping reaches the tools the shell started.
            process->spawn(options_.shell, {"-c", commandLine}, options_.environment, true);
        }
        catch (boost::system::system_error const& e)
        {
            Log::error("CommandRunner: failed to start '{}': {}", options_.shell, e.what());
            outcome.spawnError = e.what();
            return outcome;
        }

        boost::asio::steady_timer timeoutTimer{ioContext_};
        boost::asio::steady_timer killTimer{ioContext_};
        boost::asio::steady_timer drainTimer{ioContext_};
        bool exited = false;
        bool streamsClosed = false;
        bool stopping = false;

        auto finishIfDone = [&]() {
            if (!exited || !streamsClosed)
                return;
            timeoutTimer.cancel();
            killTimer.cancel();
            drainTimer.cancel();
        };

        stopProcess_ = [&]() {
            if (stopping || exited)
                return;
            stopping = true;
            process->requestExit();
            killTimer.expires_after(options_.killGracePeriod);
            killTimer.async_wait([&](boost::system::error_code ec) {
                if (ec || exited)
                    return;
                Log::warn("CommandRunner: process did not end after SIGTERM, killing it.");
                process->terminate();
            });
        };

        process->startReading(
            [&](std::string_view data) {
                outcome.standardOutput.append(data);
                if (options_.onStdout)
                    options_.onStdout(data);
                return true;
            },
            [&](std::string_view data) {
                outcome.standardError.append(data);
                if (options_.onStderr)
                    options_.onStderr(data);
                return true;
            },
            [&]() {
                streamsClosed = true;
                finishIfDone();
            });

        process->asyncWaitForExit([&](int code) {
            exited = true;
            outcome.exitCode = code;
            Log::debug("CommandRunner: process exited with code {}.", code);

            if (!streamsClosed)
            {
                drainTimer.expires_after(options_.drainPeriod);
                drainTimer.async_wait([&](boost::system::error_code ec) {
                    if (ec)
                        return;
                    Log::debug("CommandRunner: output still open after exit, closing pipes.");
                    process->closePipes();
                });
            }
            finishIfDone();
        });

        if (options_.timeout.count() > 0)
        {
            timeoutTimer.expires_after(options_.timeout);
            timeoutTimer.async_wait([&](boost::system::error_code ec) {
                if (ec || exited)
                    return;
                Log::warn("CommandRunner: timeout of {} ms expired, stopping process.", options_.timeout.count());
                outcome.timedOut = true;
                stopProcess_();
            });
        }

        cancelProcess_ = [&]() {
            if (exited)
                return;
            Log::info("CommandRunner: cancelling process.");
            outcome.cancelled = true;
            stopProcess_();
        };

        // A cancel() that raced with the setup above only set the flag.
        if (cancelRequested_)
            cancelProcess_();

        ioContext_.run();
        cancelProcess_ = {};
        stopProcess_ = {};
        return outcome;
    }

    void CommandRunner::cancel()
    {
        if (cancelRequested_.exchange(true))
            return;

        boost::asio::post(ioContext_, [this]() {
            if (cancelProcess_)
                cancelProcess_();
        });
    }
}
