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
#include <span>
#include <vector>

namespace audex::extractor
{
    struct InputFile
    {
        std::filesystem::path file;
    };

    // Video container extensions, lower case
    std::span<const std::filesystem::path> getSupportedExtensions();

    // Regular files with a supported extension (case insensitive), in no particular order
    // Unreadable directories are logged and skipped
    std::vector<InputFile> scanInputFiles(const std::filesystem::path& inputRoot, bool recursive);
} // namespace audex::extractor
