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

#include "core/Exception.hpp"
#include "core/IConfig.hpp"

#include "Common.hpp"

namespace audex::core::tests
{
    using audex::tests::TemporaryDirectory;
    using audex::tests::writeFile;

    TEST(Config, values)
    {
        const TemporaryDirectory tmpDir;
        const std::filesystem::path confFile{ tmpDir.getPath() / "audex.conf" };
        writeFile(confFile, "log-min-severity = \"debug\";\n"
                            "ffmpeg-file = \"/opt/ffmpeg/bin/ffmpeg\";\n"
                            "workers = 6;\n");

        auto config{ createConfig(confFile) };
        ASSERT_NE(config, nullptr);

        EXPECT_EQ(config->getString("log-min-severity", "info"), "debug");
        EXPECT_EQ(config->getPath("ffmpeg-file", ""), "/opt/ffmpeg/bin/ffmpeg");
        EXPECT_EQ(config->getULong("workers", 1), 6);
    }

    TEST(Config, defaults)
    {
        const TemporaryDirectory tmpDir;
        const std::filesystem::path confFile{ tmpDir.getPath() / "audex.conf" };
        writeFile(confFile, "workers = \"not a number\";\n");

        auto config{ createConfig(confFile) };

        EXPECT_EQ(config->getString("missing", "def"), "def");
        EXPECT_EQ(config->getPath("missing", "/tmp/out"), "/tmp/out");
        EXPECT_EQ(config->getULong("missing", 4), 4);
        // wrong type
        EXPECT_EQ(config->getULong("workers", 3), 3);
    }

    TEST(Config, errors)
    {
        const TemporaryDirectory tmpDir;
        EXPECT_THROW(createConfig(tmpDir.getPath() / "missing.conf"), AudexException);

        const std::filesystem::path confFile{ tmpDir.getPath() / "bad.conf" };
        writeFile(confFile, "workers = ;\n");
        EXPECT_THROW(createConfig(confFile), AudexException);
    }
} // namespace audex::core::tests
