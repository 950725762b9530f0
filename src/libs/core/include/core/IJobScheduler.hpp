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

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace audex::core
{
    class IJob;
    class IJobScheduler
    {
    public:
        virtual ~IJobScheduler() = default;

        // Checked before each job starts: if it returns true, the job is aborted instead of run
        using ShouldAbortCallback = std::function<bool()>;
        virtual void setShouldAbortCallback(ShouldAbortCallback callback) = 0;

        virtual std::size_t getThreadCount() const = 0;
        virtual void scheduleJob(std::unique_ptr<IJob> job) = 0;

        // Done jobs (run or aborted) are handed back in completion order
        // Blocks until at least one job is done, returns 0 only if there is nothing left to wait for
        virtual std::size_t waitJobsDone(std::vector<std::unique_ptr<IJob>>& jobs, std::size_t maxCount) = 0;
    };

    std::unique_ptr<IJobScheduler> createJobScheduler(std::string_view name, std::size_t threadCount);
} // namespace audex::core
