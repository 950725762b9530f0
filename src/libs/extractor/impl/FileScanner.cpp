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

#include "extractor/FileScanner.hpp"

#include <array>

#include "core/ILogger.hpp"
#include "core/Path.hpp"

namespace audex::extractor
{
    namespace
    {
        const std::array<std::filesystem::path, 6> supportedExtensions{ ".mp4", ".mkv", ".mov", ".avi", ".webm", ".m4v" };
    }

    std::span<const std::filesystem::path> getSupportedExtensions()
    {
        return supportedExtensions;
    }

    std::vector<InputFile> scanInputFiles(const std::filesystem::path& inputRoot, bool recursive)
    {
        std::vector<InputFile> res;

        auto visitFile{ [&](std::error_code ec, const std::filesystem::path& path) {
            if (ec)
            {
                AUDEX_LOG(SCANNER, ERROR, "Cannot process entry '" << path.string() << "': " << ec.message());
                return true;
            }

            if (core::pathUtils::hasFileAnyExtension(path, getSupportedExtensions()))
                res.push_back(InputFile{ path });

            return true;
        } };

        if (recursive)
            core::pathUtils::exploreFilesRecursive(inputRoot, visitFile);
        else
            core::pathUtils::exploreFiles(inputRoot, visitFile);

        AUDEX_LOG(SCANNER, DEBUG, "Found " << res.size() << " video files in '" << inputRoot.string() << "'" << (recursive ? " (recursive)" : ""));

        return res;
    }
} // namespace audex::extractor
