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

#include "av/Types.hpp"

namespace audex::av
{
    class IMediaInspector;
}

namespace audex::extractor
{
    // Extension of a stream copied as is, defaults to ".m4a" for unknown codecs
    std::string_view getCopyExtension(std::string_view codec);

    class PathResolver
    {
    public:
        PathResolver(av::IMediaInspector& mediaInspector);

        // Computes the output file and creates its parent directories
        // Throws Exception if src is not within inputRoot while preserving the tree
        std::filesystem::path resolveOutputPath(const std::filesystem::path& src,
            const std::filesystem::path& inputRoot,
            const std::filesystem::path& outputRoot,
            bool preserveTree,
            av::TranscodeMode mode,
            const av::StreamSelector& stream) const;

    private:
        std::string_view getOutputExtension(const std::filesystem::path& src, av::TranscodeMode mode, const av::StreamSelector& stream) const;

        av::IMediaInspector& _mediaInspector;
    };
} // namespace audex::extractor
