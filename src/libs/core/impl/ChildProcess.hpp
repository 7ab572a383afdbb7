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

#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "core/IChildProcess.hpp"

namespace reel::core
{
    class ChildProcess : public IChildProcess
    {
    public:
        ChildProcess(boost::asio::io_context& ioContext, const std::filesystem::path& path, const Args& args);
        ~ChildProcess() override;

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

    private:
        std::size_t readSome(OutputChannel channel, std::byte* data, std::size_t bufferSize) override;
        bool hasExited() override;
        std::optional<int> getExitCode() const override;
        void kill() override;

        bool wait(bool block); // return true if waited

        using FileDescriptor = boost::asio::posix::stream_descriptor;
        FileDescriptor& getDescriptor(OutputChannel channel);

        FileDescriptor _childStdout;
        FileDescriptor _childStderr;
        ::pid_t _childPID{};
        bool _waited{};
        std::optional<int> _exitCode;
    };
} // namespace reel::core
