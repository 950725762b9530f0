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

#pragma once

#include <sys/types.h>
#include <unistd.h>

#include <array>
#include <filesystem>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "core/IChildProcess.hpp"

namespace audex::core
{
    class ChildProcess : public IChildProcess
    {
    public:
        ChildProcess(const std::filesystem::path& path, const Args& args);
        ~ChildProcess() override;

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

    private:
        const Output& wait() override;

        using FileDescriptor = boost::asio::posix::stream_descriptor;
        using ReadBuffer = std::array<char, 16 * 1024>;

        void asyncReadSome(FileDescriptor& fd, ReadBuffer& buffer, std::string& output);
        void closeDescriptors();
        void kill();
        void waitForExit();

        // each child has its own context: reads are driven by the thread calling wait()
        boost::asio::io_context _ioContext;
        FileDescriptor _childStdout;
        FileDescriptor _childStderr;
        ReadBuffer _stdoutBuffer;
        ReadBuffer _stderrBuffer;
        ::pid_t _childPID{};
        bool _waited{};
        Output _output;
    };
} // namespace audex::core
