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

#include <filesystem>
#include <string>

#include "core/Exception.hpp"

namespace audex::av
{
    class Exception : public core::AudexException
    {
    public:
        using AudexException::AudexException;
    };

    class ToolNotFoundException : public Exception
    {
    public:
        ToolNotFoundException(std::string_view tool, std::string_view reason)
            : Exception{ "Cannot use " + std::string{ tool } + ": " + std::string{ reason } }
        {
        }
    };
} // namespace audex::av
