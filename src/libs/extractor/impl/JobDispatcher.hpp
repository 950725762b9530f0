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

#include <memory>
#include <mutex>

#include "av/IMediaInspector.hpp"
#include "av/ToolLocator.hpp"

#include "extractor/IJobDispatcher.hpp"

namespace audex::extractor
{
    class BatchContext;

    class JobDispatcher : public IJobDispatcher
    {
    public:
        JobDispatcher(core::IChildProcessManager& childProcessManager, const av::FFmpegTools& tools);
        ~JobDispatcher() override;
        JobDispatcher(const JobDispatcher&) = delete;
        JobDispatcher& operator=(const JobDispatcher&) = delete;

    private:
        BatchSummary run(std::span<const InputFile> files, const JobConfig& config, EventChannel& channel) override;
        void cancel() override;

        void setActiveContext(BatchContext* context);

        core::IChildProcessManager& _childProcessManager;
        const av::FFmpegTools _tools;
        const std::unique_ptr<av::IMediaInspector> _mediaInspector;

        std::mutex _runMutex;

        std::mutex _contextMutex;
        BatchContext* _activeContext{};
    };
} // namespace audex::extractor
