/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Reel.
 *
 * Reel is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Reel is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Reel.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>
#include <system_error>

#include <boost/asio/buffer.hpp>

#include "core/ILogger.hpp"

namespace reel::core
{
    namespace
    {
        class SystemException : public ChildProcessException
        {
        public:
            SystemException(std::error_code err, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + err.message() }
            {
            }

            SystemException(boost::system::error_code ec, const std::string& errMsg)
                : ChildProcessException{ errMsg + ": " + ec.message() }
            {
            }
        };

        struct Pipe
        {
            int readFd{ -1 };
            int writeFd{ -1 };
        };

        Pipe createPipe()
        {
            int pipefd[2];

            // Use 'pipe' instead of 'pipe2', more portable
            if (::pipe(pipefd) == -1)
                throw SystemException{ std::error_code{ errno, std::generic_category() }, "pipe failed" };

            // Only set O_NONBLOCK on read end, programs don't expect their output to be non-blocking
            if (::fcntl(pipefd[0], F_SETFL, O_NONBLOCK) == -1)
            {
                const std::error_code ec{ errno, std::generic_category() };
                ::close(pipefd[0]);
                ::close(pipefd[1]);
                throw SystemException{ ec, "fcntl failed to set O_NONBLOCK" };
            }

            return Pipe{ pipefd[0], pipefd[1] };
        }
    } // namespace

    ChildProcess::ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args)
        : _childStdout{ ioContext }
        , _childStderr{ ioContext }
    {
        // make sure only one thread is forking at once, so that pipe ends don't leak into other children
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        const Pipe outPipe{ createPipe() };
        Pipe errPipe;
        try
        {
            errPipe = createPipe();
        }
        catch (const ChildProcessException&)
        {
            ::close(outPipe.readFd);
            ::close(outPipe.writeFd);
            throw;
        }

        // prepared before forking, only async-signal-safe calls are allowed in the child
        const std::string execPath{ path.string() };
        std::vector<const char*> execArgs;
        execArgs.push_back(execPath.c_str());
        std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return arg.c_str(); });
        execArgs.push_back(nullptr);

        const ::pid_t res{ ::fork() };
        if (res == -1)
        {
            const std::error_code ec{ errno, std::generic_category() };
            for (int fd : { outPipe.readFd, outPipe.writeFd, errPipe.readFd, errPipe.writeFd })
                ::close(fd);
            throw SystemException{ ec, "fork failed" };
        }

        if (res == 0) // CHILD
        {
            // Never close stdin, rather connect it to /dev/null
            const int nullFd{ ::open("/dev/null", O_RDONLY) };
            if (nullFd != -1)
            {
                ::dup2(nullFd, STDIN_FILENO);
                ::close(nullFd);
            }

            if (::dup2(outPipe.writeFd, STDOUT_FILENO) == -1 || ::dup2(errPipe.writeFd, STDERR_FILENO) == -1)
                ::_exit(127);

            for (int fd : { outPipe.readFd, outPipe.writeFd, errPipe.readFd, errPipe.writeFd })
                ::close(fd);

            ::execv(execPath.c_str(), const_cast<char* const*>(execArgs.data()));
            ::_exit(127);
        }

        // PARENT
        ::close(outPipe.writeFd);
        ::close(errPipe.writeFd);
        _childPID = res;

        boost::system::error_code assignError;
        _childStdout.assign(outPipe.readFd, assignError);
        if (!assignError)
            _childStderr.assign(errPipe.readFd, assignError);
        if (assignError)
        {
            kill();
            wait(true);
            throw SystemException{ assignError, "assigning read end of pipe to asio stream failed" };
        }

        _childStdout.non_blocking(true);
        _childStderr.non_blocking(true);

        REEL_LOG(CHILDPROCESS, DEBUG, "Spawned '" << path.string() << "', pid = " << _childPID);
    }

    ChildProcess::~ChildProcess()
    {
        for (FileDescriptor* fd : { &_childStdout, &_childStderr })
        {
            boost::system::error_code closeError;
            fd->close(closeError);
            if (closeError)
                REEL_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());
        }

        if (_waited)
            return;

        kill();
        try
        {
            wait(true);
        }
        catch (const ChildProcessException& e)
        {
            REEL_LOG(CHILDPROCESS, ERROR, "Cannot reap child process " << _childPID << ": " << e.what());
        }
    }

    ChildProcess::FileDescriptor& ChildProcess::getDescriptor(OutputChannel channel)
    {
        return channel == OutputChannel::StdOut ? _childStdout : _childStderr;
    }

    std::size_t ChildProcess::readSome(OutputChannel channel, std::byte* data, std::size_t bufferSize)
    {
        FileDescriptor& fd{ getDescriptor(channel) };
        if (!fd.is_open())
            return 0;

        boost::system::error_code ec;
        const std::size_t res{ fd.read_some(boost::asio::buffer(data, bufferSize), ec) };
        if (ec == boost::asio::error::would_block || ec == boost::asio::error::try_again)
            return 0;

        if (ec)
        {
            if (ec != boost::asio::error::eof)
                REEL_LOG(CHILDPROCESS, DEBUG, "Read failed: " << ec.message());

            boost::system::error_code closeError;
            fd.close(closeError);
        }

        return res;
    }

    bool ChildProcess::hasExited()
    {
        if (_waited)
            return true;

        return wait(false);
    }

    std::optional<int> ChildProcess::getExitCode() const
    {
        return _exitCode;
    }

    void ChildProcess::kill()
    {
        if (_waited)
            return;

        // process may already have finished
        REEL_LOG(CHILDPROCESS, DEBUG, "Killing child process " << _childPID << "...");
        if (::kill(_childPID, SIGKILL) == -1)
        {
            const int err{ errno };
            REEL_LOG(CHILDPROCESS, DEBUG, "Kill failed: " << (std::error_code{ err, std::generic_category() }.message()));
        }
    }

    bool ChildProcess::wait(bool block)
    {
        int wstatus{};
        ::pid_t pid;
        do
        {
            pid = ::waitpid(_childPID, &wstatus, block ? 0 : WNOHANG);
        } while (pid == -1 && errno == EINTR);

        if (pid == -1)
            throw SystemException{ std::error_code{ errno, std::generic_category() }, "waitpid failed" };
        if (pid == 0)
            return false;

        if (WIFEXITED(wstatus))
        {
            _exitCode = WEXITSTATUS(wstatus);
            REEL_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " exited, exit code = " << *_exitCode);
        }
        else if (WIFSIGNALED(wstatus))
        {
            REEL_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " killed by signal " << WTERMSIG(wstatus));
        }

        _waited = true;
        return true;
    }
} // namespace reel::core
