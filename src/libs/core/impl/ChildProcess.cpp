/*
 * Copyright (C) 2025 The Audex authors
 *
 * This file is part of Audex.
 *
 * Audex is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Audex is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Audex.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "ChildProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include "core/ILogger.hpp"

namespace audex::core
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

        std::error_code lastError()
        {
            return std::error_code{ errno, std::generic_category() };
        }

        struct Pipe
        {
            Pipe()
            {
                int fds[2];
                if (::pipe(fds) == -1)
                    throw SystemException{ lastError(), "pipe failed!" };

                readEnd = fds[0];
                writeEnd = fds[1];

                // Never leak into other children spawned concurrently, dup2 clears the flag on the target fd
                for (const int fd : fds)
                {
                    if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1)
                        throw SystemException{ lastError(), "fcntl failed to set FD_CLOEXEC!" };
                }
            }

            ~Pipe()
            {
                closeWriteEnd();
                if (readEnd != -1)
                    ::close(readEnd);
            }

            Pipe(const Pipe&) = delete;
            Pipe& operator=(const Pipe&) = delete;

            void closeWriteEnd()
            {
                if (writeEnd != -1)
                {
                    ::close(writeEnd);
                    writeEnd = -1;
                }
            }

            int releaseReadEnd()
            {
                return std::exchange(readEnd, -1);
            }

            int readEnd{ -1 };
            int writeEnd{ -1 };
        };
    } // namespace

    ChildProcess::ChildProcess(const std::filesystem::path& path, const Args& args)
        : _childStdout{ _ioContext }
        , _childStderr{ _ioContext }
    {
        // Everything the child needs is prepared before fork
        const std::string program{ path.string() };
        const std::string execErrorMessage{ "Cannot execute '" + program + "'\n" };

        std::vector<char*> execArgs;
        std::transform(std::cbegin(args), std::cend(args), std::back_inserter(execArgs), [](const std::string& arg) { return const_cast<char*>(arg.c_str()); });
        execArgs.push_back(nullptr);

        // make sure only one thread is executing this part of code
        static std::mutex mutex;
        const std::scoped_lock lock{ mutex };

        Pipe stdoutPipe;
        Pipe stderrPipe;

        const ::pid_t res{ ::fork() };
        if (res == -1)
            throw SystemException{ lastError(), "fork failed!" };

        if (res == 0) // CHILD
        {
            // own process group: a terminal interrupt only reaches the parent, which decides what to do
            ::setpgid(0, 0);

            // Never close stdin, most programs expect it to exist
            const int nullFd{ ::open("/dev/null", O_RDONLY) };
            if (nullFd != -1)
            {
                ::dup2(nullFd, STDIN_FILENO);
                ::close(nullFd);
            }

            if (::dup2(stdoutPipe.writeEnd, STDOUT_FILENO) == -1 || ::dup2(stderrPipe.writeEnd, STDERR_FILENO) == -1)
                ::_exit(127);

            ::execv(program.c_str(), execArgs.data());

            [[maybe_unused]] const ::ssize_t written{ ::write(STDERR_FILENO, execErrorMessage.data(), execErrorMessage.size()) };
            ::_exit(127);
        }

        // PARENT
        _childPID = res;

        // also done here so that the group is set once the constructor returns, EACCES means the child already did it and exec'ed
        if (::setpgid(res, res) == -1 && errno != EACCES)
            AUDEX_LOG(CHILDPROCESS, ERROR, "setpgid failed for child " << res << ": " << lastError().message());

        stdoutPipe.closeWriteEnd();
        stderrPipe.closeWriteEnd();

        auto assignDescriptor{ [](FileDescriptor& descriptor, Pipe& pipe) {
            boost::system::error_code assignError;
            descriptor.assign(pipe.readEnd, assignError);
            if (assignError)
                throw SystemException{ assignError, "assigning read end of pipe to asio stream failed!" };
            pipe.releaseReadEnd();
        } };

        try
        {
            assignDescriptor(_childStdout, stdoutPipe);
            assignDescriptor(_childStderr, stderrPipe);
        }
        catch (const SystemException&)
        {
            closeDescriptors();
            kill();
            waitForExit();
            throw;
        }
    }

    ChildProcess::~ChildProcess()
    {
        if (_waited)
            return;

        AUDEX_LOG(CHILDPROCESS, DEBUG, "Child process " << _childPID << " not waited for, killing it...");
        closeDescriptors();
        kill();

        int wstatus{};
        ::pid_t pid;
        do
        {
            pid = ::waitpid(_childPID, &wstatus, 0);
        } while (pid == -1 && errno == EINTR);

        if (pid == -1)
            AUDEX_LOG(CHILDPROCESS, ERROR, "waitpid failed: " << lastError().message());
    }

    const IChildProcess::Output& ChildProcess::wait()
    {
        if (_waited)
            return _output;

        asyncReadSome(_childStdout, _stdoutBuffer, _output.standardOutput);
        asyncReadSome(_childStderr, _stderrBuffer, _output.standardError);

        // returns once both pipes reached end of file
        _ioContext.run();

        waitForExit();
        return _output;
    }

    void ChildProcess::asyncReadSome(FileDescriptor& fd, ReadBuffer& buffer, std::string& output)
    {
        fd.async_read_some(boost::asio::buffer(buffer), [this, &fd, &buffer, &output](const boost::system::error_code& error, std::size_t bytesTransferred) {
            output.append(buffer.data(), bytesTransferred);

            if (error)
            {
                if (error != boost::asio::error::eof)
                    AUDEX_LOG(CHILDPROCESS, ERROR, "Read from child " << _childPID << " failed: " << error.message());

                boost::system::error_code closeError;
                fd.close(closeError);
                return;
            }

            asyncReadSome(fd, buffer, output);
        });
    }

    void ChildProcess::closeDescriptors()
    {
        for (FileDescriptor* descriptor : { &_childStdout, &_childStderr })
        {
            boost::system::error_code closeError;
            descriptor->close(closeError);
            if (closeError)
                AUDEX_LOG(CHILDPROCESS, ERROR, "Close failed: " << closeError.message());
        }
    }

    void ChildProcess::kill()
    {
        // process may already have finished
        if (::kill(_childPID, SIGKILL) == -1)
            AUDEX_LOG(CHILDPROCESS, DEBUG, "Kill failed: " << lastError().message());
    }

    void ChildProcess::waitForExit()
    {
        int wstatus{};
        ::pid_t pid;
        do
        {
            pid = ::waitpid(_childPID, &wstatus, 0);
        } while (pid == -1 && errno == EINTR);

        if (pid == -1)
            throw SystemException{ lastError(), "waitpid failed!" };

        _waited = true;

        if (WIFEXITED(wstatus))
        {
            _output.exitCode = WEXITSTATUS(wstatus);
            AUDEX_LOG(CHILDPROCESS, DEBUG, "Child " << _childPID << " exit code = " << *_output.exitCode);
        }
        else if (WIFSIGNALED(wstatus))
        {
            AUDEX_LOG(CHILDPROCESS, DEBUG, "Child " << _childPID << " terminated by signal " << WTERMSIG(wstatus));
        }
    }
} // namespace audex::core
