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

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace reel::core
{
    class ChildProcessException : public ReelException
    {
    public:
        using ReelException::ReelException;
    };

    // A running child process, with its stdout and stderr captured through pipes
    // The process is killed and reaped on destruction if still running
    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>;

        virtual ~IChildProcess() = default;

        enum class OutputChannel
        {
            StdOut,
            StdErr,
        };

        // Never blocks, returns 0 if no data is currently available or if the channel is closed
        virtual std::size_t readSome(OutputChannel channel, std::byte* data, std::size_t bufferSize) = 0;

        // Never blocks, reaps the process if it has exited
        virtual bool hasExited() = 0;

        // Only set if the process exited normally
        virtual std::optional<int> getExitCode() const = 0;

        virtual void kill() = 0;
    };
} // namespace reel::core
