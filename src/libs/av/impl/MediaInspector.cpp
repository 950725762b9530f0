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

#include "MediaInspector.hpp"

#include "core/IChildProcessManager.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace audex::av
{
    std::unique_ptr<IMediaInspector> createMediaInspector(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffprobe)
    {
        return std::make_unique<MediaInspector>(childProcessManager, ffprobe);
    }

    MediaInspector::MediaInspector(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffprobe)
        : _childProcessManager{ childProcessManager }
        , _ffprobe{ ffprobe }
    {
    }

    std::optional<std::string> MediaInspector::detectAudioCodec(const std::filesystem::path& file, const StreamSelector& stream)
    {
        const core::IChildProcess::Args args{
            _ffprobe.string(),
            "-v", "error",
            "-select_streams", stream.toSpecifier(),
            "-show_entries", "stream=codec_name",
            "-of", "default=noprint_wrappers=1:nokey=1",
            file.string()
        };

        try
        {
            auto process{ _childProcessManager.spawnChildProcess(_ffprobe, args) };
            const core::IChildProcess::Output& output{ process->wait() };
            if (output.exitCode != 0)
            {
                AUDEX_LOG(AV, DEBUG, "ffprobe failed on '" << file.string() << "': " << core::stringUtils::stringTrim(output.standardError));
                return std::nullopt;
            }

            const std::string_view codec{ core::stringUtils::stringTrim(core::stringUtils::firstLine(core::stringUtils::stringTrim(output.standardOutput))) };
            if (codec.empty())
            {
                AUDEX_LOG(AV, DEBUG, "No audio stream matching '" << stream.toSpecifier() << "' in '" << file.string() << "'");
                return std::nullopt;
            }

            return std::string{ codec };
        }
        catch (const core::ChildProcessException& e)
        {
            AUDEX_LOG(AV, ERROR, "Cannot run ffprobe on '" << file.string() << "': " << e.what());
        }

        return std::nullopt;
    }
} // namespace audex::av
