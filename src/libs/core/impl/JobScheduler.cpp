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

#include "JobScheduler.hpp"

#include <boost/asio/post.hpp>

#include "core/IJob.hpp"
#include "core/ILogger.hpp"

namespace audex::core
{
    std::unique_ptr<IJobScheduler> createJobScheduler(std::string_view name, std::size_t threadCount)
    {
        return std::make_unique<JobScheduler>(name, threadCount);
    }

    JobScheduler::JobScheduler(std::string_view name, std::size_t threadCount)
        : _name{ name }
        , _ioContextRunner{ _ioContext, threadCount, name }
    {
    }

    JobScheduler::~JobScheduler() = default;

    void JobScheduler::setShouldAbortCallback(ShouldAbortCallback callback)
    {
        _abortCallback = callback;
    }

    std::size_t JobScheduler::getThreadCount() const
    {
        return _ioContextRunner.getThreadCount();
    }

    void JobScheduler::scheduleJob(std::unique_ptr<IJob> job)
    {
        {
            std::scoped_lock lock{ _mutex };
            _ongoingJobCount += 1;
        }

        auto jobHandler{ [job = std::move(job), this]() mutable {
            if (_abortCallback && _abortCallback())
            {
                AUDEX_LOG(UTILS, DEBUG, "[" << _name << "] Aborting job '" << job->getName() << "'");
                job->abort();
            }
            else
            {
                job->run();
            }

            {
                std::scoped_lock lock{ _mutex };

                _doneJobs.emplace_back(std::move(job));
                _ongoingJobCount -= 1;
            }

            _condVar.notify_all();
        } };

        boost::asio::post(_ioContext, std::move(jobHandler));
    }

    std::size_t JobScheduler::waitJobsDone(std::vector<std::unique_ptr<IJob>>& doneJobs, std::size_t maxCount)
    {
        std::unique_lock lock{ _mutex };
        _condVar.wait(lock, [this] { return !_doneJobs.empty() || _ongoingJobCount == 0; });

        doneJobs.clear();
        doneJobs.reserve(maxCount);

        while (doneJobs.size() < maxCount && !_doneJobs.empty())
        {
            doneJobs.push_back(std::move(_doneJobs.front()));
            _doneJobs.pop_front();
        }

        return doneJobs.size();
    }
} // namespace audex::core
