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

#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>

namespace audex::extractor
{
    // Outcome of one input file, produced exactly once per file
    struct TaskResult
    {
        std::filesystem::path source;
        bool success{};
        std::string message; // output path on success, diagnostic otherwise
    };

    struct BatchSummary
    {
        std::size_t total{};
        std::size_t completed{};
        std::size_t succeeded{};
        std::size_t failed{};
        bool cancelled{};
    };

    struct LogEvent
    {
        std::string message;
    };

    struct StatusEvent
    {
        std::string text;
    };

    struct ProgressEvent
    {
        std::size_t done{};
        std::size_t total{};
    };

    using Event = std::variant<LogEvent, StatusEvent, ProgressEvent, TaskResult, BatchSummary>;
} // namespace audex::extractor
