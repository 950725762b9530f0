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

#include <limits>
#include <string_view>

#include <gtest/gtest.h>

#include "extractor/Exception.hpp"
#include "extractor/JobConfig.hpp"

#include "Common.hpp"

namespace audex::extractor::tests
{
    using audex::tests::TemporaryDirectory;
    using audex::tests::writeFile;

    TEST(JobConfig, validate)
    {
        const TemporaryDirectory tmpDir;

        JobConfig config;
        config.inputRoot = tmpDir.getPath();
        config.outputRoot = tmpDir.getPath() / "out";
        EXPECT_NO_THROW(validateJobConfig(config));

        {
            JobConfig invalidConfig{ config };
            invalidConfig.inputRoot = tmpDir.getPath() / "missing";
            EXPECT_THROW(validateJobConfig(invalidConfig), ConfigException);
        }

        {
            writeFile(tmpDir.getPath() / "file.mp4");
            JobConfig invalidConfig{ config };
            invalidConfig.inputRoot = tmpDir.getPath() / "file.mp4";
            EXPECT_THROW(validateJobConfig(invalidConfig), ConfigException);
        }

        {
            JobConfig invalidConfig{ config };
            invalidConfig.workers = 0;
            EXPECT_THROW(validateJobConfig(invalidConfig), ConfigException);
        }

        {
            JobConfig invalidConfig{ config };
            invalidConfig.transcode.sampleRate = 0;
            EXPECT_THROW(validateJobConfig(invalidConfig), ConfigException);
        }

        {
            JobConfig invalidConfig{ config };
            invalidConfig.transcode.bitrate = 0;
            EXPECT_THROW(validateJobConfig(invalidConfig), ConfigException);
        }

        {
            JobConfig invalidConfig{ config };
            invalidConfig.outputRoot.clear();
            EXPECT_THROW(validateJobConfig(invalidConfig), ConfigException);
        }
    }

    TEST(JobConfig, toPositiveValue)
    {
        EXPECT_EQ(toPositiveValue(1, "--bitrate"), 1u);
        EXPECT_EQ(toPositiveValue(192, "--bitrate"), 192u);
        EXPECT_EQ(toPositiveValue(48'000, "--sample-rate"), 48000u);

        EXPECT_THROW(toPositiveValue(0, "--bitrate"), ConfigException);
        EXPECT_THROW(toPositiveValue(-192, "--bitrate"), ConfigException);

        if constexpr (sizeof(long) > sizeof(unsigned))
        {
            constexpr long maxValue{ std::numeric_limits<unsigned>::max() };
            EXPECT_EQ(toPositiveValue(maxValue, "--sample-rate"), std::numeric_limits<unsigned>::max());

            // would wrap to 192
            EXPECT_THROW(toPositiveValue(maxValue + 193, "--bitrate"), ConfigException);
            EXPECT_THROW(toPositiveValue(std::numeric_limits<long>::max(), "--sample-rate"), ConfigException);
        }

        try
        {
            toPositiveValue(0, "--sample-rate");
            FAIL() << "Expected ConfigException";
        }
        catch (const ConfigException& e)
        {
            EXPECT_NE(std::string_view{ e.what() }.find("--sample-rate"), std::string_view::npos);
        }
    }

    TEST(JobConfig, defaultWorkerCount)
    {
        EXPECT_GE(getDefaultWorkerCount(), 2);
    }

    TEST(JobConfig, musicGpuPreset)
    {
        EXPECT_EQ(presetFromString("music-gpu"), Preset::MusicGpu);
        EXPECT_EQ(presetFromString("MUSIC-GPU"), Preset::MusicGpu);
        EXPECT_EQ(presetFromString("podcast"), std::nullopt);

        JobConfig config;
        config.inputRoot = "/videos";
        config.outputRoot = "/music";
        config.preserveTree = false;
        config.transcode.stream = *av::StreamSelector::fromLanguage("jpn");

        applyPreset(config, Preset::MusicGpu);

        EXPECT_EQ(config.transcode.mode, av::TranscodeMode::Mp3);
        EXPECT_EQ(config.transcode.stream, av::StreamSelector::fromIndex(0));
        EXPECT_TRUE(config.transcode.loudnessNormalization);
        EXPECT_EQ(config.transcode.sampleRate, 44100u);
        EXPECT_EQ(config.transcode.bitrate, 320u);
        EXPECT_TRUE(config.transcode.hardwareAcceleration);
        EXPECT_FALSE(config.recursive);
        EXPECT_GE(config.workers, 4);
        EXPECT_LE(config.workers, 6);

        // untouched
        EXPECT_EQ(config.inputRoot, "/videos");
        EXPECT_EQ(config.outputRoot, "/music");
        EXPECT_FALSE(config.preserveTree);
    }
} // namespace audex::extractor::tests
