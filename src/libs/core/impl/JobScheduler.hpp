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

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

#include "core/IJobScheduler.hpp"
#include "core/IOContextRunner.hpp"

namespace audex::core
{
    class JobScheduler : public IJobScheduler
    {
    public:
        JobScheduler(std::string_view name, std::size_t threadCount);
        ~JobScheduler() override;
        JobScheduler(const JobScheduler&) = delete;
        JobScheduler& operator=(const JobScheduler&) = delete;

    private:
        void setShouldAbortCallback(ShouldAbortCallback callback) override;

        std::size_t getThreadCount() const override;
        void scheduleJob(std::unique_ptr<IJob> job) override;

        std::size_t waitJobsDone(std::vector<std::unique_ptr<IJob>>& jobs, std::size_t maxCount) override;

        const std::string _name;
        boost::asio::io_context _ioContext;

        ShouldAbortCallback _abortCallback;

        mutable std::mutex _mutex;
        std::size_t _ongoingJobCount{};
        std::deque<std::unique_ptr<IJob>> _doneJobs;
        std::condition_variable _condVar;

        // last member: threads are joined before the state they use is destroyed
        IOContextRunner _ioContextRunner;
    };
} // namespace audex::core
