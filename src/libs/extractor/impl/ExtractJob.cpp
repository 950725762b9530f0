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

#include "ExtractJob.hpp"

#include <string>

#include "av/TranscodeCommand.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "extractor/Exception.hpp"
#include "extractor/PathResolver.hpp"

namespace audex::extractor
{
    ExtractJob::ExtractJob(const InputFile& file, const JobConfig& config, const PathResolver& pathResolver, core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpeg)
        : _file{ file }
        , _config{ config }
        , _pathResolver{ pathResolver }
        , _childProcessManager{ childProcessManager }
        , _ffmpeg{ ffmpeg }
    {
        _result.source = _file.file;
    }

    void ExtractJob::run()
    {
        try
        {
            const std::filesystem::path outputPath{ process() };

            _result.success = true;
            _result.message = outputPath.string();
        }
        catch (const std::exception& e)
        {
            AUDEX_LOG(DISPATCHER, DEBUG, "Failed to process '" << _file.file.string() << "': " << e.what());

            _result.success = false;
            _result.message = e.what();
        }
    }

    void ExtractJob::abort()
    {
        _result.success = false;
        _result.message = "Cancelled";
    }

    std::filesystem::path ExtractJob::process()
    {
        const std::filesystem::path outputPath{ _pathResolver.resolveOutputPath(_file.file, _config.inputRoot, _config.outputRoot, _config.preserveTree, _config.transcode.mode, _config.transcode.stream) };
        const core::IChildProcess::Args args{ av::buildTranscodeCommand(_ffmpeg, _file.file, outputPath, _config.transcode) };

        AUDEX_LOG(DISPATCHER, DEBUG, "Running '" << core::stringUtils::joinStrings(args, " ") << "'");

        auto process{ _childProcessManager.spawnChildProcess(_ffmpeg, args) };
        const core::IChildProcess::Output& output{ process->wait() };

        if (!output.exitCode)
            throw Exception{ "ffmpeg was terminated by a signal" };

        if (*output.exitCode != 0)
        {
            const std::string_view error{ core::stringUtils::stringTrim(output.standardError) };
            if (error.empty())
                throw Exception{ "ffmpeg exited with code " + std::to_string(*output.exitCode) };

            throw Exception{ error };
        }

        return outputPath;
    }
} // namespace audex::extractor
