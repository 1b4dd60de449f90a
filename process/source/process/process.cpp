#include <process/process.hpp>

#include <log/log.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <cerrno>
#include <csignal>
#include <unordered_map>

#include <signal.h>
#include <unistd.h>

namespace bp2 = boost::process::v2;

namespace Subprocess
{
    namespace
    {
        struct NewProcessGroup
        {
            template <typename Launcher, typename CommandLine>
            boost::system::error_code
            on_exec_setup(Launcher&, bp2::filesystem::path const&, CommandLine&) const
            {
                if (::setpgid(0, 0) != 0)
                    return boost::system::error_code{errno, boost::system::system_category()};
                return {};
            }
        };
    }

    struct Process::Implementation
    {
        boost::asio::any_io_executor executor;
        std::unique_ptr<bp2::process> child;
        std::optional<int> exitCode;
        bool ownProcessGroup;

        std::function<bool(std::string_view)> onStdout;
        std::function<bool(std::string_view)> onStderr;
        std::function<void()> onStreamsClosed;
        int openStreams;

        std::vector<char> stdoutBuffer;
        std::vector<char> stderrBuffer;

        boost::asio::readable_pipe stdoutPipe;
        boost::asio::readable_pipe stderrPipe;

        explicit Implementation(boost::asio::any_io_executor executor)
            : executor{std::move(executor)}
            , child{}
            , exitCode{}
            , ownProcessGroup{false}
            , onStdout{}
            , onStderr{}
            , onStreamsClosed{}
            , openStreams{0}
            , stdoutBuffer(4096)
            , stderrBuffer(4096)
            , stdoutPipe{this->executor}
            , stderrPipe{this->executor}
        {}

        void read(
            std::shared_ptr<Process> proc,
            boost::asio::readable_pipe Process::Implementation::*pipe,
            std::function<bool(std::string_view)> Process::Implementation::*onRead,
            std::vector<char> Process::Implementation::*buffer)
        {
            auto& pipeRef = proc->impl_.get()->*pipe;
            pipeRef.async_read_some(
                boost::asio::buffer(proc->impl_.get()->*buffer),
                [weak = proc->weak_from_this(), pipe, onRead, buffer](
                    boost::system::error_code ec, std::size_t bytesTransferred) mutable {
                    auto self = weak.lock();
                    if (!self)
                        return;

                    auto const& buf = self->impl_.get()->*buffer;
                    auto const& whenRead = self->impl_.get()->*onRead;

                    bool keepReading = true;
                    if (bytesTransferred > 0 && whenRead)
                        keepReading = whenRead(std::string_view{buf.data(), bytesTransferred});

                    if (ec || !keepReading)
                        return self->impl_->streamClosed();

                    self->impl_->read(self, pipe, onRead, buffer);
                });
        }

        void streamClosed()
        {
            if (--openStreams == 0 && onStreamsClosed)
                onStreamsClosed();
        }

        // Not asking the child itself, that would reap it behind the back of async_wait.
        bool isRunning() const
        {
            return child && !exitCode;
        }

        bool signalGroup(int signal) const
        {
            const auto pid = static_cast<pid_t>(child->id());
            if (::kill(-pid, signal) == 0)
                return true;
            // The child may not have reached setpgid yet.
            return errno == ESRCH && ::kill(pid, signal) == 0;
        }
    };

    Process::Process(boost::asio::any_io_executor executor)
        : impl_{std::make_unique<Implementation>(std::move(executor))}
    {}

    Process::~Process()
    {
        if (impl_->isRunning())
        {
            Log::warn("Process: destroyed while child {} is still running, killing it.", impl_->child->id());
            boost::system::error_code ec;
            impl_->child->terminate(ec);
        }
    }

    void Process::spawn(
        std::string const& executable,
        std::vector<std::string> const& arguments,
        Environment environment,
        bool ownProcessGroup)
    {
        if (impl_->child)
            throw std::logic_error("Process was already spawned.");

        std::unordered_map<bp2::environment::key, bp2::environment::value> env;
        for (auto const& [key, value] : environment.variables())
        {
            if (key.empty())
                continue;
            env.emplace(key, value);
        }

        auto resolved = bp2::filesystem::path{executable};
        if (executable.find('/') == std::string::npos)
        {
            resolved = bp2::environment::find_executable(executable, env);
            if (resolved.empty())
                throw boost::system::system_error{
                    boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory),
                    "Executable not found: " + executable};
        }

        if (ownProcessGroup)
        {
            impl_->child = std::make_unique<bp2::process>(
                impl_->executor,
                resolved,
                arguments,
                bp2::process_environment{env},
                bp2::process_stdio{nullptr, impl_->stdoutPipe, impl_->stderrPipe},
                NewProcessGroup{});
        }
        else
        {
            impl_->child = std::make_unique<bp2::process>(
                impl_->executor,
                resolved,
                arguments,
                bp2::process_environment{env},
                bp2::process_stdio{nullptr, impl_->stdoutPipe, impl_->stderrPipe});
        }
        impl_->ownProcessGroup = ownProcessGroup;

        Log::debug("Process: spawned '{}' with pid {}.", executable, impl_->child->id());
    }

    void Process::startReading(
        std::function<bool(std::string_view)> onStdout,
        std::function<bool(std::string_view)> onStderr,
        std::function<void()> onStreamsClosed)
    {
        impl_->onStdout = std::move(onStdout);
        impl_->onStderr = std::move(onStderr);
        impl_->onStreamsClosed = std::move(onStreamsClosed);
        impl_->openStreams = 2;

        impl_->read(
            shared_from_this(),
            &Process::Implementation::stdoutPipe,
            &Process::Implementation::onStdout,
            &Process::Implementation::stdoutBuffer);

        impl_->read(
            shared_from_this(),
            &Process::Implementation::stderrPipe,
            &Process::Implementation::onStderr,
            &Process::Implementation::stderrBuffer);
    }

    void Process::asyncWaitForExit(std::function<void(int)> onExit)
    {
        if (!impl_->child)
            throw std::logic_error("Process was not spawned.");

        impl_->child->async_wait(
            [weak = weak_from_this(), onExit = std::move(onExit)](boost::system::error_code ec, int code) {
                auto self = weak.lock();
                if (!self)
                    return;

                if (ec)
                {
                    Log::warn("Process: waiting for exit failed: {}", ec.message());
                    code = -1;
                }
                self->impl_->exitCode = code;
                onExit(code);
            });
    }

    void Process::requestExit()
    {
        if (!impl_->isRunning())
            return;

        if (impl_->ownProcessGroup)
        {
            if (!impl_->signalGroup(SIGTERM))
                Log::warn("Process: SIGTERM to process group {} failed.", impl_->child->id());
            return;
        }

        boost::system::error_code ec;
        impl_->child->request_exit(ec);
        if (ec)
            Log::warn("Process: request_exit for pid {} failed: {}", impl_->child->id(), ec.message());
    }

    void Process::terminate()
    {
        if (!impl_->isRunning())
            return;

        if (impl_->ownProcessGroup)
        {
            if (!impl_->signalGroup(SIGKILL))
                Log::warn("Process: SIGKILL to process group {} failed.", impl_->child->id());
            return;
        }

        boost::system::error_code ec;
        impl_->child->terminate(ec);
        if (ec)
            Log::warn("Process: terminate for pid {} failed: {}", impl_->child->id(), ec.message());
    }

    void Process::closePipes()
    {
        boost::system::error_code ec;
        if (impl_->stdoutPipe.is_open())
            impl_->stdoutPipe.close(ec);
        if (impl_->stderrPipe.is_open())
            impl_->stderrPipe.close(ec);
    }

    bool Process::running() const
    {
        return impl_->isRunning();
    }
}
