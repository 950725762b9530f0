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

#include <optional>
#include <string>
#include <vector>

#include "core/Exception.hpp"

namespace audex::core
{
    class ChildProcessException : public AudexException
    {
    public:
        using AudexException::AudexException;
    };

    class IChildProcess
    {
    public:
        using Args = std::vector<std::string>; // Args[0] is the program name

        struct Output
        {
            std::optional<int> exitCode; // not set if terminated by a signal
            std::string standardOutput;
            std::string standardError;
        };

        virtual ~IChildProcess() = default;

        // Blocks until the child has exited, collecting everything it wrote
        // Calling it again returns the same output
        virtual const Output& wait() = 0;
    };
} // namespace audex::core
