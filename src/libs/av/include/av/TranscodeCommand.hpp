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
#include <optional>

#include "core/IChildProcess.hpp"

#include "av/Types.hpp"

namespace audex::av
{
    struct TranscodeOptions
    {
        TranscodeMode mode{ TranscodeMode::Copy };
        StreamSelector stream;
        bool loudnessNormalization{}; // EBU R128, fixed targets
        std::optional<unsigned> sampleRate; // Hz
        std::optional<unsigned> bitrate;    // kbps
        bool hardwareAcceleration{};        // cuda decoding
    };

    // Full ffmpeg argument list, args[0] being the ffmpeg executable
    // Only the selected audio stream is mapped, the output is always overwritten
    core::IChildProcess::Args buildTranscodeCommand(const std::filesystem::path& ffmpeg, const std::filesystem::path& src, const std::filesystem::path& dst, const TranscodeOptions& options);
} // namespace audex::av
