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

#include "av/ToolLocator.hpp"

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"

#include "av/Exception.hpp"

namespace audex::av
{
    std::filesystem::path locateTool(core::IChildProcessManager& childProcessManager, std::string_view name, const std::filesystem::path& location)
    {
        std::filesystem::path toolPath;
        if (location.empty())
        {
            toolPath = core::pathUtils::findExecutable(name);
            if (toolPath.empty())
                throw ToolNotFoundException{ name, "not found in PATH" };
        }
        else
        {
            toolPath = core::pathUtils::findExecutable(location.string());
            if (toolPath.empty())
                throw ToolNotFoundException{ name, "'" + location.string() + "' is not an executable file" };
        }

        AUDEX_LOG(AV, DEBUG, "Checking " << name << " at '" << toolPath.string() << "'");

        try
        {
            auto process{ childProcessManager.spawnChildProcess(toolPath, core::IChildProcess::Args{ toolPath.string(), "-version" }) };
            const core::IChildProcess::Output& output{ process->wait() };
            if (output.exitCode != 0)
            {
                const std::string_view error{ core::stringUtils::stringTrim(output.standardError) };
                throw ToolNotFoundException{ name, "'" + toolPath.string() + " -version' failed" + (error.empty() ? std::string{} : ": " + std::string{ error }) };
            }

            AUDEX_LOG(AV, INFO, "Using " << core::stringUtils::firstLine(output.standardOutput) << " at '" << toolPath.string() << "'");
        }
        catch (const core::ChildProcessException& e)
        {
            throw ToolNotFoundException{ name, e.what() };
        }

        return toolPath;
    }

    FFmpegTools locateTools(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegLocation, const std::filesystem::path& ffprobeLocation)
    {
        FFmpegTools tools;
        tools.ffmpeg = locateTool(childProcessManager, "ffmpeg", ffmpegLocation);
        tools.ffprobe = locateTool(childProcessManager, "ffprobe", ffprobeLocation);

        return tools;
    }
} // namespace audex::av
