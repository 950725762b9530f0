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

#include <gtest/gtest.h>

#include <algorithm>

#include "av/TranscodeCommand.hpp"

namespace audex::av::tests
{
    namespace
    {
        using Args = core::IChildProcess::Args;

        Args concat(std::initializer_list<Args> parts)
        {
            Args res;
            for (const Args& part : parts)
                res.insert(std::end(res), std::cbegin(part), std::cend(part));
            return res;
        }

        const Args prefix{ "/usr/bin/ffmpeg", "-hide_banner", "-loglevel", "error", "-nostdin", "-y" };
        const Args input{ "-i", "/in/movie.mkv", "-vn", "-sn", "-dn" };
    } // namespace

    TEST(TranscodeCommand, modes)
    {
        struct TestCase
        {
            TranscodeOptions options;
            Args expectedCodecArgs;
        };

        TestCase tests[]{
            { { .mode = TranscodeMode::Copy }, { "-c:a", "copy" } },
            { { .mode = TranscodeMode::Copy, .sampleRate = 48000, .bitrate = 192 }, { "-c:a", "copy" } },
            { { .mode = TranscodeMode::Mp3 }, { "-c:a", "libmp3lame" } },
            { { .mode = TranscodeMode::Mp3, .bitrate = 192 }, { "-c:a", "libmp3lame", "-b:a", "192k" } },
            { { .mode = TranscodeMode::Mp3, .sampleRate = 44100, .bitrate = 320 }, { "-c:a", "libmp3lame", "-b:a", "320k", "-ar", "44100" } },
            { { .mode = TranscodeMode::Aac }, { "-c:a", "aac", "-q:a", "2" } },
            { { .mode = TranscodeMode::Aac, .bitrate = 256 }, { "-c:a", "aac", "-b:a", "256k" } },
            { { .mode = TranscodeMode::Aac, .sampleRate = 48000 }, { "-c:a", "aac", "-q:a", "2", "-ar", "48000" } },
            { { .mode = TranscodeMode::Wav }, { "-c:a", "pcm_s16le", "-ac", "2" } },
            { { .mode = TranscodeMode::Wav, .sampleRate = 22050, .bitrate = 128 }, { "-c:a", "pcm_s16le", "-ac", "2", "-ar", "22050" } },
        };

        for (const TestCase& test : tests)
        {
            const Args args{ buildTranscodeCommand("/usr/bin/ffmpeg", "/in/movie.mkv", "/out/movie.mp3", test.options) };
            const Args expected{ concat({ prefix, input, { "-map", "0:a:0" }, test.expectedCodecArgs, { "/out/movie.mp3" } }) };
            EXPECT_EQ(args, expected) << "mode = " << transcodeModeToString(test.options.mode);
        }
    }

    TEST(TranscodeCommand, hardwareAcceleration)
    {
        const TranscodeOptions options{ .mode = TranscodeMode::Copy, .hardwareAcceleration = true };

        const Args args{ buildTranscodeCommand("/usr/bin/ffmpeg", "/in/movie.mkv", "/out/movie.m4a", options) };
        const Args expected{ concat({ prefix, { "-hwaccel", "cuda" }, input, { "-map", "0:a:0", "-c:a", "copy", "/out/movie.m4a" } }) };
        EXPECT_EQ(args, expected);
    }

    TEST(TranscodeCommand, loudnessNormalization)
    {
        const TranscodeOptions options{ .mode = TranscodeMode::Mp3, .loudnessNormalization = true, .bitrate = 320 };

        const Args args{ buildTranscodeCommand("/usr/bin/ffmpeg", "/in/movie.mkv", "/out/movie.mp3", options) };
        const Args expected{ concat({ prefix, input, { "-map", "0:a:0", "-c:a", "libmp3lame", "-b:a", "320k", "-af", "loudnorm=I=-16:TP=-1.5:LRA=11", "/out/movie.mp3" } }) };
        EXPECT_EQ(args, expected);

        const Args argsNoFilter{ buildTranscodeCommand("/usr/bin/ffmpeg", "/in/movie.mkv", "/out/movie.mp3", TranscodeOptions{ .mode = TranscodeMode::Mp3 }) };
        EXPECT_EQ(std::count(std::cbegin(argsNoFilter), std::cend(argsNoFilter), "-af"), 0);
    }

    TEST(TranscodeCommand, streamSelection)
    {
        {
            const TranscodeOptions options{ .mode = TranscodeMode::Wav, .stream = StreamSelector::fromIndex(2) };
            const Args args{ buildTranscodeCommand("ffmpeg", "in.mp4", "out.wav", options) };
            EXPECT_EQ(std::count(std::cbegin(args), std::cend(args), "0:a:2"), 1);
        }

        {
            const TranscodeOptions options{ .mode = TranscodeMode::Wav, .stream = *StreamSelector::fromLanguage("jpn") };
            const Args args{ buildTranscodeCommand("ffmpeg", "in.mp4", "out.wav", options) };
            EXPECT_EQ(std::count(std::cbegin(args), std::cend(args), "0:a:m:language:jpn"), 1);
            EXPECT_EQ(std::count(std::cbegin(args), std::cend(args), "-map"), 1);
        }
    }

    TEST(TranscodeCommand, pathsKeptAsSingleArguments)
    {
        const Args args{ buildTranscodeCommand("/opt/my tools/ffmpeg", "/in/My Movie; part 1.mkv", "/out/My Movie; part 1.m4a", TranscodeOptions{}) };

        ASSERT_FALSE(args.empty());
        EXPECT_EQ(args.front(), "/opt/my tools/ffmpeg");
        EXPECT_EQ(args.back(), "/out/My Movie; part 1.m4a");
        EXPECT_EQ(std::count(std::cbegin(args), std::cend(args), "/in/My Movie; part 1.mkv"), 1);
    }
} // namespace audex::av::tests
