#pragma once

#include <process/environment.hpp>

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace Subprocess
{
    struct RunOptions
    {
        // Zero disables the timeout.
        std::chrono::milliseconds timeout{std::chrono::minutes{5}};
        // Time between SIGTERM and SIGKILL when the process group is stopped.
        std::chrono::milliseconds killGracePeriod{std::chrono::seconds{2}};
        // How long output is still read after the process exited, in case a descendant holds the pipes open.
        std::chrono::milliseconds drainPeriod{std::chrono::seconds{1}};
        std::string shell{"/bin/sh"};
        Environment environment{Environment::current()};
        // Invoked on the thread that called run(), in the order the output arrived.
        std::function<void(std::string_view)> onStdout{};
        std::function<void(std::string_view)> onStderr{};
    };

    struct RunOutcome
    {
        std::optional<int> exitCode{std::nullopt};
        std::string standardOutput{};
        std::string standardError{};
        bool timedOut{false};
        bool cancelled{false};
        // Set when the shell could not be started at all.
        std::optional<std::string> spawnError{std::nullopt};

        bool exitedNormally() const
        {
            return !timedOut && !cancelled && !spawnError && exitCode;
        }
    };

    /**
     * @brief Runs one command line through the shell and collects its output.
     *
     * Each runner runs exactly one command. cancel() may be called from any thread, before or during run().
     */
    class CommandRunner
    {
      public:
        explicit CommandRunner(RunOptions options = {});
        ~CommandRunner();
        CommandRunner(CommandRunner const&) = delete;
        CommandRunner& operator=(CommandRunner const&) = delete;
        CommandRunner(CommandRunner&&) = delete;
        CommandRunner& operator=(CommandRunner&&) = delete;

        /**
         * @brief Runs "shell -c <commandLine>" in a new process group and blocks until it ended and its output was read,
         * or until the timeout expired and the process was stopped.
         *
         * @throws std::logic_error when called a second time.
         */
        RunOutcome run(std::string const& commandLine);

        /**
         * @brief Stops the running process (SIGTERM, SIGKILL after the grace period).
         * A command that has not started yet is not started at all.
         */
        void cancel();

      private:
        RunOptions options_;
        boost::asio::io_context ioContext_;
        std::atomic_bool started_;
        std::atomic_bool cancelRequested_;
        std::function<void()> stopProcess_;
        std::function<void()> cancelProcess_;
    };
}
