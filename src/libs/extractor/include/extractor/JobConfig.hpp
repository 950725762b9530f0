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

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

#include "av/TranscodeCommand.hpp"

namespace audex::extractor
{
    struct JobConfig
    {
        std::filesystem::path inputRoot;
        std::filesystem::path outputRoot;
        bool recursive{ true };
        bool preserveTree{ true }; // mirror the input hierarchy, flatten otherwise
        av::TranscodeOptions transcode;
        std::size_t workers{ 1 };
    };

    // Throws ConfigException
    void validateJobConfig(const JobConfig& config);

    // User provided sample rate or bitrate, must fit in an unsigned
    // Throws ConfigException, naming the option in the message
    unsigned toPositiveValue(long value, std::string_view optionName);

    // max(2, half the hardware threads)
    std::size_t getDefaultWorkerCount();

    enum class Preset
    {
        MusicGpu, // high quality normalized mp3, gpu decoding
    };

    std::optional<Preset> presetFromString(std::string_view str);
    void applyPreset(JobConfig& config, Preset preset);
} // namespace audex::extractor
