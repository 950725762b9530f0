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

#include <atomic>
#include <cstddef>
#include <mutex>

#include "extractor/Events.hpp"

namespace audex::extractor
{
    // State of a single batch, shared between the dispatcher and its jobs
    class BatchContext
    {
    public:
        BatchContext(std::size_t total);
        BatchContext(const BatchContext&) = delete;
        BatchContext& operator=(const BatchContext&) = delete;

        void cancel();
        bool isCancelled() const;

        // returns the updated counters
        BatchSummary onTaskCompleted(bool success);
        BatchSummary getSummary() const;

    private:
        std::atomic<bool> _cancelled{};

        mutable std::mutex _mutex;
        BatchSummary _summary;
    };
} // namespace audex::extractor
