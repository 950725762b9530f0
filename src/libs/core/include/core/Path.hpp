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
#include <functional>
#include <span>
#include <string_view>
#include <system_error>

namespace audex::core::pathUtils
{
    // Make sure the given directory and all its parents exist, create them if needed
    // Safe to be called concurrently on the same or overlapping directories
    // Throws AudexException if the path exists and is not a directory
    void ensureDirectoryTree(const std::filesystem::path& dir);

    // returns false if aborted by user
    bool exploreFilesRecursive(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb);

    // Only the direct children of directory, regular files only
    bool exploreFiles(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb);

    // Check if file's extension is one of provided extensions (case insensitive, extensions must be lower case)
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> extensions);

    // Look for an executable file, in the PATH directories if name has no directory part
    // Returns an empty path if not found
    std::filesystem::path findExecutable(std::string_view name);
} // namespace audex::core::pathUtils
