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
#include <memory>
#include <optional>
#include <string>

#include "av/Types.hpp"

namespace audex::core
{
    class IChildProcessManager;
}

namespace audex::av
{
    class IMediaInspector
    {
    public:
        virtual ~IMediaInspector() = default;

        // Codec name of the selected audio stream (ex: "aac", "ac3")
        // Any failure to probe the file results in no codec
        virtual std::optional<std::string> detectAudioCodec(const std::filesystem::path& file, const StreamSelector& stream) = 0;
    };

    std::unique_ptr<IMediaInspector> createMediaInspector(core::IChildProcessManager& childProcessManager, const std::filesystem::path& ffprobe);
} // namespace audex::av
