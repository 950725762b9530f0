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

#include "extractor/FileScanner.hpp"

#include "Common.hpp"

namespace audex::extractor::tests
{
    using audex::tests::TemporaryDirectory;
    using audex::tests::writeFile;

    namespace
    {
        std::vector<std::filesystem::path> scan(const std::filesystem::path& root, bool recursive)
        {
            std::vector<std::filesystem::path> res;
            for (const InputFile& inputFile : scanInputFiles(root, recursive))
                res.push_back(inputFile.file.lexically_relative(root));

            std::sort(std::begin(res), std::end(res));
            return res;
        }
    } // namespace

    TEST(FileScanner, filtersExtensions)
    {
        const TemporaryDirectory tmpDir;
        const std::filesystem::path& root{ tmpDir.getPath() };

        writeFile(root / "a.mp4");
        writeFile(root / "b.MKV");
        writeFile(root / "c.mov");
        writeFile(root / "d.avi");
        writeFile(root / "e.webm");
        writeFile(root / "f.m4v");
        writeFile(root / "g.mp3");
        writeFile(root / "h.txt");
        writeFile(root / "mp4");
        std::filesystem::create_directories(root / "dir.mkv");

        const std::vector<std::filesystem::path> expected{ "a.mp4", "b.MKV", "c.mov", "d.avi", "e.webm", "f.m4v" };
        EXPECT_EQ(scan(root, false), expected);
    }

    TEST(FileScanner, recursive)
    {
        const TemporaryDirectory tmpDir;
        const std::filesystem::path& root{ tmpDir.getPath() };

        writeFile(root / "top.mp4");
        writeFile(root / "season1" / "ep1.mkv");
        writeFile(root / "season1" / "extras" / "making.of.mov");
        writeFile(root / "season1" / "notes.txt");

        {
            const std::vector<std::filesystem::path> expected{ "season1/ep1.mkv", "season1/extras/making.of.mov", "top.mp4" };
            EXPECT_EQ(scan(root, true), expected);
        }

        {
            const std::vector<std::filesystem::path> expected{ "top.mp4" };
            EXPECT_EQ(scan(root, false), expected);
        }
    }

    TEST(FileScanner, keepsFileNameCase)
    {
        const TemporaryDirectory tmpDir;
        writeFile(tmpDir.getPath() / "Movie.Part1.MKV");

        const std::vector<InputFile> files{ scanInputFiles(tmpDir.getPath(), false) };
        ASSERT_EQ(files.size(), 1);
        EXPECT_EQ(files.front().file, tmpDir.getPath() / "Movie.Part1.MKV");
    }

    TEST(FileScanner, missingRoot)
    {
        const TemporaryDirectory tmpDir;

        EXPECT_TRUE(scanInputFiles(tmpDir.getPath() / "missing", true).empty());
        EXPECT_TRUE(scanInputFiles(tmpDir.getPath() / "missing", false).empty());
    }
} // namespace audex::extractor::tests
