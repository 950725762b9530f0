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

#include <string_view>

namespace audex::core
{
    class IJob
    {
    public:
        virtual ~IJob() = default;

        virtual std::string_view getName() const = 0;

        // Exactly one of these is called by the scheduler, on one of its threads
        virtual void run() = 0;
        virtual void abort() = 0; // the job was not started because the scheduler was asked to abort
    };
} // namespace audex::core
