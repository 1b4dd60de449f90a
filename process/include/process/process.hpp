#pragma once

#include <process/environment.hpp>

#include <boost/asio/any_io_executor.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Subprocess
{
    /**
     * @brief A child process with stdout and stderr connected to pipes and stdin connected to the null device.
     * All callbacks are invoked on the executor passed to the constructor.
     */
    class Process : public std::enable_shared_from_this<Process>
    {
      public:
        explicit Process(boost::asio::any_io_executor executor);
        ~Process();
        Process(Process const&) = delete;
        Process& operator=(Process const&) = delete;
        Process(Process&&) = delete;
        Process& operator=(Process&&) = delete;

        /**
         * @brief Starts the executable. Names without a slash are looked up in PATH of the given environment.
         *
         * @param ownProcessGroup Start the child as leader of a new process group. Signals are then sent
         * to the whole group, which includes everything the child started.
         *
         * @throws boost::system::system_error if the process cannot be created.
         */
        void spawn(
            std::string const& executable,
            std::vector<std::string> const& arguments,
            Environment environment,
            bool ownProcessGroup = false);

        /**
         * @brief Starts reading both output pipes. A read callback returning false stops reading that pipe.
         *
         * @param onStreamsClosed Called once both pipes reached end of file or were closed.
         */
        void startReading(
            std::function<bool(std::string_view)> onStdout,
            std::function<bool(std::string_view)> onStderr,
            std::function<void()> onStreamsClosed);

        /**
         * @brief Calls onExit with the exit code once the process ended.
         */
        void asyncWaitForExit(std::function<void(int)> onExit);

        /**
         * @brief Asks the process to end (SIGTERM).
         */
        void requestExit();

        /**
         * @brief Kills the process (SIGKILL).
         */
        void terminate();

        /**
         * @brief Closes the read ends of the pipes, pending reads finish with an error.
         */
        void closePipes();

        bool running() const;

      private:
        struct Implementation;
        std::unique_ptr<Implementation> impl_;
    };
}
