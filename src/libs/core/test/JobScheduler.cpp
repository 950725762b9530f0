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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "core/IJob.hpp"
#include "core/IJobScheduler.hpp"

namespace audex::core
{
    namespace
    {
        class TestJob : public IJob
        {
        public:
            TestJob(std::atomic<std::size_t>& runCount, std::atomic<std::size_t>& abortCount)
                : _runCount{ runCount }
                , _abortCount{ abortCount } {}

        private:
            std::string_view getName() const override { return "test"; };
            void run() override
            {
                // Simulate some work
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                ++_runCount;
            }
            void abort() override { ++_abortCount; }

            std::atomic<std::size_t>& _runCount;
            std::atomic<std::size_t>& _abortCount;
        };

        std::size_t waitAllJobsDone(IJobScheduler& scheduler)
        {
            std::size_t doneCount{};

            std::vector<std::unique_ptr<IJob>> doneJobs;
            while (const std::size_t count{ scheduler.waitJobsDone(doneJobs, 4) })
                doneCount += count;

            return doneCount;
        }
    } // namespace

    TEST(JobScheduler, basic)
    {
        std::atomic<std::size_t> runCount{ 0 };
        std::atomic<std::size_t> abortCount{ 0 };

        auto scheduler{ createJobScheduler("TestScheduler", 2) };
        ASSERT_NE(scheduler, nullptr);
        EXPECT_EQ(scheduler->getThreadCount(), 2);

        for (int i = 0; i < 10; ++i)
            scheduler->scheduleJob(std::make_unique<TestJob>(runCount, abortCount));

        EXPECT_EQ(waitAllJobsDone(*scheduler), 10);
        EXPECT_EQ(runCount.load(), 10);
        EXPECT_EQ(abortCount.load(), 0);
    }

    TEST(JobScheduler, abort)
    {
        std::atomic<std::size_t> runCount{ 0 };
        std::atomic<std::size_t> abortCount{ 0 };

        auto scheduler{ createJobScheduler("TestScheduler", 2) };
        ASSERT_NE(scheduler, nullptr);

        scheduler->setShouldAbortCallback([] { return true; });

        for (int i = 0; i < 10; ++i)
            scheduler->scheduleJob(std::make_unique<TestJob>(runCount, abortCount));

        // aborted jobs are reported as done too
        EXPECT_EQ(waitAllJobsDone(*scheduler), 10);
        EXPECT_EQ(runCount.load(), 0);
        EXPECT_EQ(abortCount.load(), 10);
    }

    TEST(JobScheduler, waitJobsDone)
    {
        std::atomic<std::size_t> runCount{ 0 };
        std::atomic<std::size_t> abortCount{ 0 };

        auto scheduler{ createJobScheduler("TestScheduler", 3) };

        std::vector<std::unique_ptr<IJob>> doneJobs;
        // nothing scheduled: must not block
        EXPECT_EQ(scheduler->waitJobsDone(doneJobs, 1), 0);

        constexpr std::size_t jobCount{ 7 };
        for (std::size_t i{}; i < jobCount; ++i)
            scheduler->scheduleJob(std::make_unique<TestJob>(runCount, abortCount));

        std::size_t collected{};
        while (const std::size_t count{ scheduler->waitJobsDone(doneJobs, 2) })
        {
            EXPECT_LE(count, 2);
            collected += count;
        }

        EXPECT_EQ(collected, jobCount);
        EXPECT_EQ(runCount.load(), jobCount);
    }
} // namespace audex::core
