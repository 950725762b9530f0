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

#include "JobDispatcher.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "core/IJobScheduler.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"

#include "extractor/EventChannel.hpp"
#include "extractor/PathResolver.hpp"

#include "BatchContext.hpp"
#include "ExtractJob.hpp"

namespace audex::extractor
{
    namespace
    {
        std::string formatCounts(const BatchSummary& summary)
        {
            return "OK: " + std::to_string(summary.succeeded) + ", Failed: " + std::to_string(summary.failed);
        }

        void emitTaskCompleted(EventChannel& channel, const TaskResult& result, const BatchSummary& counters)
        {
            const std::string name{ result.source.filename().string() };
            if (result.success)
                channel.push(LogEvent{ "[OK] " + name + " -> " + result.message });
            else
                channel.push(LogEvent{ "[FAIL] " + name + " :: " + result.message });

            channel.push(result);
            channel.push(ProgressEvent{ counters.completed, counters.total });
            channel.push(StatusEvent{ "Processing: " + std::to_string(counters.completed) + "/" + std::to_string(counters.total)
                                      + " | OK: " + std::to_string(counters.succeeded) + " | Failed: " + std::to_string(counters.failed) });
        }
    } // namespace

    std::unique_ptr<IJobDispatcher> createJobDispatcher(core::IChildProcessManager& childProcessManager, const av::FFmpegTools& tools)
    {
        return std::make_unique<JobDispatcher>(childProcessManager, tools);
    }

    JobDispatcher::JobDispatcher(core::IChildProcessManager& childProcessManager, const av::FFmpegTools& tools)
        : _childProcessManager{ childProcessManager }
        , _tools{ tools }
        , _mediaInspector{ av::createMediaInspector(childProcessManager, tools.ffprobe) }
    {
    }

    JobDispatcher::~JobDispatcher() = default;

    BatchSummary JobDispatcher::run(std::span<const InputFile> files, const JobConfig& config, EventChannel& channel)
    {
        std::scoped_lock runLock{ _runMutex };

        validateJobConfig(config);
        core::pathUtils::ensureDirectoryTree(config.outputRoot);

        BatchContext context{ files.size() };

        struct ScopedActiveContext
        {
            ScopedActiveContext(JobDispatcher& dispatcher, BatchContext& context)
                : _dispatcher{ dispatcher }
            {
                _dispatcher.setActiveContext(&context);
            }
            ~ScopedActiveContext() { _dispatcher.setActiveContext(nullptr); }

            JobDispatcher& _dispatcher;
        };
        const ScopedActiveContext activeContext{ *this, context };

        const PathResolver pathResolver{ *_mediaInspector };
        const std::size_t workerCount{ std::max<std::size_t>(1, config.workers) };

        channel.push(StatusEvent{ "Found " + std::to_string(files.size()) + " files. Starting..." });

        {
            // destroyed before the context and resolver it refers to
            auto scheduler{ core::createJobScheduler("Extract", workerCount) };
            scheduler->setShouldAbortCallback([&context] { return context.isCancelled(); });

            AUDEX_LOG(DISPATCHER, INFO, "Processing " << files.size() << " files using " << scheduler->getThreadCount() << " workers, mode = " << av::transcodeModeToString(config.transcode.mode));

            for (const InputFile& file : files)
                scheduler->scheduleJob(std::make_unique<ExtractJob>(file, config, pathResolver, _childProcessManager, _tools.ffmpeg));

            std::vector<std::unique_ptr<core::IJob>> doneJobs;
            while (scheduler->waitJobsDone(doneJobs, files.size()) > 0)
            {
                for (const std::unique_ptr<core::IJob>& job : doneJobs)
                {
                    const TaskResult& result{ static_cast<const ExtractJob&>(*job).getResult() };
                    const BatchSummary counters{ context.onTaskCompleted(result.success) };

                    if (result.success)
                        AUDEX_LOG(DISPATCHER, DEBUG, "'" << result.source.string() << "' -> '" << result.message << "'");
                    else
                        AUDEX_LOG(DISPATCHER, WARNING, "Failed to process '" << result.source.string() << "': " << result.message);

                    emitTaskCompleted(channel, result, counters);
                }
            }
        }

        const BatchSummary summary{ context.getSummary() };
        channel.push(summary);
        if (summary.cancelled)
        {
            channel.push(StatusEvent{ "Cancelled. " + formatCounts(summary) });
            channel.push(LogEvent{ "== Cancelled ==" });
        }
        else
        {
            channel.push(StatusEvent{ "Done. " + formatCounts(summary) });
            channel.push(LogEvent{ "== Done ==" });
        }

        AUDEX_LOG(DISPATCHER, INFO, (summary.cancelled ? "Cancelled" : "Done") << ": " << summary.completed << "/" << summary.total << " files processed, " << summary.succeeded << " succeeded, " << summary.failed << " failed");

        return summary;
    }

    void JobDispatcher::cancel()
    {
        std::scoped_lock lock{ _contextMutex };
        if (!_activeContext)
            return;

        AUDEX_LOG(DISPATCHER, INFO, "Cancelling batch...");
        _activeContext->cancel();
    }

    void JobDispatcher::setActiveContext(BatchContext* context)
    {
        std::scoped_lock lock{ _contextMutex };
        _activeContext = context;
    }
} // namespace audex::extractor
