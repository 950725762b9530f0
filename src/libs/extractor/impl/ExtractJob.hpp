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

#include <filesystem>

#include "core/IJob.hpp"

#include "extractor/Events.hpp"
#include "extractor/FileScanner.hpp"
#include "extractor/JobConfig.hpp"

namespace audex::core
{
    class IChildProcessManager;
}

namespace audex::extractor
{
    class PathResolver;

    // Extracts the audio of one input file
    class ExtractJob : public core::IJob
    {
    public:
        ExtractJob(const InputFile& file, const JobConfig& config, const PathResolver& pathResolver, core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpeg);
        ~ExtractJob() override = default;
        ExtractJob(const ExtractJob&) = delete;
        ExtractJob& operator=(const ExtractJob&) = delete;

        const TaskResult& getResult() const { return _result; }

    private:
        std::string_view getName() const override { return "Extract audio"; }
        void run() override;
        void abort() override;

        std::filesystem::path process();

        const InputFile _file;
        const JobConfig& _config;
        const PathResolver& _pathResolver;
        core::IChildProcessManager& _childProcessManager;
        const std::filesystem::path _ffmpeg;
        TaskResult _result;
    };
} // namespace audex::extractor
