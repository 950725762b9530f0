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

#include "av/TranscodeCommand.hpp"

#include <string>

namespace audex::av
{
    namespace
    {
        constexpr std::string_view loudnormFilter{ "loudnorm=I=-16:TP=-1.5:LRA=11" };
        constexpr std::string_view hardwareAccelerationApi{ "cuda" };

        void addSampleRate(core::IChildProcess::Args& args, const TranscodeOptions& options)
        {
            if (options.sampleRate)
            {
                args.emplace_back("-ar");
                args.emplace_back(std::to_string(*options.sampleRate));
            }
        }

        void addBitrate(core::IChildProcess::Args& args, unsigned bitrate)
        {
            args.emplace_back("-b:a");
            args.emplace_back(std::to_string(bitrate) + "k");
        }
    } // namespace

    core::IChildProcess::Args buildTranscodeCommand(const std::filesystem::path& ffmpeg, const std::filesystem::path& src, const std::filesystem::path& dst, const TranscodeOptions& options)
    {
        core::IChildProcess::Args args;

        args.emplace_back(ffmpeg.string());

        // Make sure:
        // - stderr only contains actual errors, to be reported as is
        // - we do not rely on input
        // - we never prompt before overwriting the output
        args.emplace_back("-hide_banner");
        args.emplace_back("-loglevel");
        args.emplace_back("error");
        args.emplace_back("-nostdin");
        args.emplace_back("-y");

        if (options.hardwareAcceleration)
        {
            args.emplace_back("-hwaccel");
            args.emplace_back(hardwareAccelerationApi);
        }

        // Input file
        args.emplace_back("-i");
        args.emplace_back(src.string());

        // Skip video, subtitle and data flows (including covers)
        args.emplace_back("-vn");
        args.emplace_back("-sn");
        args.emplace_back("-dn");

        // Only the selected audio stream
        args.emplace_back("-map");
        args.emplace_back("0:" + options.stream.toSpecifier());

        switch (options.mode)
        {
        case TranscodeMode::Copy:
            args.emplace_back("-c:a");
            args.emplace_back("copy");
            break;

        case TranscodeMode::Mp3:
            args.emplace_back("-c:a");
            args.emplace_back("libmp3lame");
            if (options.bitrate)
                addBitrate(args, *options.bitrate);
            addSampleRate(args, options);
            break;

        case TranscodeMode::Aac:
            args.emplace_back("-c:a");
            args.emplace_back("aac");
            if (options.bitrate)
            {
                addBitrate(args, *options.bitrate);
            }
            else
            {
                args.emplace_back("-q:a");
                args.emplace_back("2");
            }
            addSampleRate(args, options);
            break;

        case TranscodeMode::Wav:
            args.emplace_back("-c:a");
            args.emplace_back("pcm_s16le");
            args.emplace_back("-ac");
            args.emplace_back("2");
            addSampleRate(args, options);
            break;
        }

        if (options.loudnessNormalization)
        {
            args.emplace_back("-af");
            args.emplace_back(loudnormFilter);
        }

        args.emplace_back(dst.string());

        return args;
    }
} // namespace audex::av
