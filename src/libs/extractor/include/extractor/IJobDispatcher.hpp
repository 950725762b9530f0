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
#include <span>

#include "extractor/Events.hpp"
#include "extractor/FileScanner.hpp"
#include "extractor/JobConfig.hpp"

namespace audex::core
{
    class IChildProcessManager;
}

namespace audex::av
{
    struct FFmpegTools;
}

namespace audex::extractor
{
    class EventChannel;

    class IJobDispatcher
    {
    public:
        virtual ~IJobDispatcher() = default;

        // Processes all the files on a pool of config.workers threads, blocks until the batch is over
        // Events are pushed to channel in completion order, the channel is not closed
        // Concurrent calls are serialized
        // Throws ConfigException if config is invalid
        virtual BatchSummary run(std::span<const InputFile> files, const JobConfig& config, EventChannel& channel) = 0;

        // Files not yet started are reported as cancelled, running ones go to completion
        // No effect if no batch is running
        virtual void cancel() = 0;
    };

    std::unique_ptr<IJobDispatcher> createJobDispatcher(core::IChildProcessManager& childProcessManager, const av::FFmpegTools& tools);
} // namespace audex::extractor
