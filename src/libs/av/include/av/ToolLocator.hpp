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
#include <string_view>

namespace audex::core
{
    class IChildProcessManager;
}

namespace audex::av
{
    struct FFmpegTools
    {
        std::filesystem::path ffmpeg;
        std::filesystem::path ffprobe;
    };

    // Resolves a tool from an explicit location, or from PATH if location is empty,
    // then makes sure "<tool> -version" runs successfully
    // Throws ToolNotFoundException
    std::filesystem::path locateTool(core::IChildProcessManager& childProcessManager, std::string_view name, const std::filesystem::path& location = {});

    FFmpegTools locateTools(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffmpegLocation = {}, const std::filesystem::path& ffprobeLocation = {});
} // namespace audex::av
