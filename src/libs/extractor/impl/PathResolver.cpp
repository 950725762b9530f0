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

#include "extractor/PathResolver.hpp"

#include <array>
#include <string>
#include <utility>

#include "av/IMediaInspector.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"

#include "extractor/Exception.hpp"

namespace audex::extractor
{
    namespace
    {
        constexpr std::string_view defaultCopyExtension{ ".m4a" };

        constexpr std::array<std::pair<std::string_view, std::string_view>, 10> copyExtensions{ {
            { "aac", ".m4a" },
            { "mp3", ".mp3" },
            { "ac3", ".ac3" },
            { "eac3", ".eac3" },
            { "dts", ".dts" },
            { "opus", ".opus" },
            { "vorbis", ".ogg" },
            { "flac", ".flac" },
            { "pcm_s16le", ".wav" },
            { "truehd", ".thd" },
        } };

        std::filesystem::path computeRelativeStem(const std::filesystem::path& src, const std::filesystem::path& inputRoot)
        {
            const std::filesystem::path normalizedSrc{ std::filesystem::absolute(src).lexically_normal() };
            const std::filesystem::path normalizedRoot{ std::filesystem::absolute(inputRoot).lexically_normal() };

            const std::filesystem::path relativePath{ normalizedSrc.lexically_relative(normalizedRoot) };
            if (relativePath.empty() || relativePath == "." || *relativePath.begin() == "..")
                throw Exception{ "'" + src.string() + "' is not inside '" + inputRoot.string() + "'" };

            std::filesystem::path stem{ relativePath };
            stem.replace_extension();
            return stem;
        }
    } // namespace

    std::string_view getCopyExtension(std::string_view codec)
    {
        for (const auto& [codecName, extension] : copyExtensions)
        {
            if (codecName == codec)
                return extension;
        }

        return defaultCopyExtension;
    }

    PathResolver::PathResolver(av::IMediaInspector& mediaInspector)
        : _mediaInspector{ mediaInspector }
    {
    }

    std::filesystem::path PathResolver::resolveOutputPath(const std::filesystem::path& src,
        const std::filesystem::path& inputRoot,
        const std::filesystem::path& outputRoot,
        bool preserveTree,
        av::TranscodeMode mode,
        const av::StreamSelector& stream) const
    {
        const std::filesystem::path stem{ preserveTree ? computeRelativeStem(src, inputRoot) : src.stem() };

        // append rather than replace: stems may contain dots ("movie.part1")
        std::filesystem::path outputPath{ outputRoot / stem };
        outputPath += getOutputExtension(src, mode, stream);

        core::pathUtils::ensureDirectoryTree(outputPath.parent_path());

        return outputPath;
    }

    std::string_view PathResolver::getOutputExtension(const std::filesystem::path& src, av::TranscodeMode mode, const av::StreamSelector& stream) const
    {
        switch (mode)
        {
        case av::TranscodeMode::Copy:
            if (const std::optional<std::string> codec{ _mediaInspector.detectAudioCodec(src, stream) })
                return getCopyExtension(*codec);

            AUDEX_LOG(DISPATCHER, DEBUG, "Cannot detect audio codec of '" << src.string() << "', using '" << defaultCopyExtension << "'");
            return defaultCopyExtension;

        case av::TranscodeMode::Mp3:
            return ".mp3";
        case av::TranscodeMode::Aac:
            return ".m4a";
        case av::TranscodeMode::Wav:
            return ".wav";
        }

        throw Exception{ "Unhandled transcode mode" };
    }
} // namespace audex::extractor
