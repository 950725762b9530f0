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

#include "extractor/JobConfig.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <system_error>
#include <thread>

#include "core/String.hpp"

#include "extractor/Exception.hpp"

namespace audex::extractor
{
    void validateJobConfig(const JobConfig& config)
    {
        std::error_code ec;
        if (config.inputRoot.empty() || !std::filesystem::is_directory(config.inputRoot, ec))
            throw ConfigException{ "Input directory '" + config.inputRoot.string() + "' is not valid" };

        if (config.outputRoot.empty())
            throw ConfigException{ "Output directory must be set" };

        if (config.workers == 0)
            throw ConfigException{ "Worker count must be positive" };

        if (config.transcode.sampleRate && *config.transcode.sampleRate == 0)
            throw ConfigException{ "Sample rate must be positive" };

        if (config.transcode.bitrate && *config.transcode.bitrate == 0)
            throw ConfigException{ "Bitrate must be positive" };
    }

    unsigned toPositiveValue(long value, std::string_view optionName)
    {
        if (value <= 0 || static_cast<unsigned long>(value) > std::numeric_limits<unsigned>::max())
            throw ConfigException{ std::string{ optionName } + " must be a positive integer, at most " + std::to_string(std::numeric_limits<unsigned>::max()) };

        return static_cast<unsigned>(value);
    }

    std::size_t getDefaultWorkerCount()
    {
        return std::max<std::size_t>(2, std::thread::hardware_concurrency() / 2);
    }

    std::optional<Preset> presetFromString(std::string_view str)
    {
        if (core::stringUtils::stringCaseInsensitiveEqual(str, "music-gpu"))
            return Preset::MusicGpu;

        return std::nullopt;
    }

    void applyPreset(JobConfig& config, Preset preset)
    {
        switch (preset)
        {
        case Preset::MusicGpu:
            config.transcode.mode = av::TranscodeMode::Mp3;
            config.transcode.stream = av::StreamSelector::fromIndex(0);
            config.transcode.loudnessNormalization = true;
            config.transcode.sampleRate = 44'100;
            config.transcode.bitrate = 320;
            config.transcode.hardwareAcceleration = true;
            config.workers = std::clamp<std::size_t>(getDefaultWorkerCount(), 4, 6);
            config.recursive = false;
            break;
        }
    }
} // namespace audex::extractor
