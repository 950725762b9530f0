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

#include "core/Path.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <string>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace audex::core::pathUtils
{
    namespace
    {
        bool isExecutableFile(const std::filesystem::path& p)
        {
            std::error_code ec;
            return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
        }
    } // namespace

    void ensureDirectoryTree(const std::filesystem::path& dir)
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);

        // another thread may have created it in the meantime
        if (ec && !std::filesystem::is_directory(dir))
            throw AudexException{ "Cannot create directory '" + dir.string() + "': " + ec.message() };

        if (!std::filesystem::is_directory(dir))
            throw AudexException{ "'" + dir.string() + "' exists and is not a directory" };
    }

    bool exploreFilesRecursive(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb)
    {
        std::error_code ec;
        std::filesystem::directory_iterator itPath{ directory, std::filesystem::directory_options::follow_directory_symlink, ec };

        if (ec)
        {
            cb(ec, directory);
            return true; // try to continue exploring anyway
        }

        std::filesystem::directory_iterator itEnd;
        while (itPath != itEnd)
        {
            bool continueExploring{ true };

            if (ec)
            {
                continueExploring = cb(ec, *itPath);
            }
            else
            {
                if (std::filesystem::is_regular_file(*itPath, ec))
                {
                    continueExploring = cb(ec, *itPath);
                }
                else if (std::filesystem::is_directory(*itPath, ec))
                {
                    if (!ec)
                        continueExploring = exploreFilesRecursive(*itPath, cb);
                    else
                        continueExploring = cb(ec, *itPath);
                }
            }

            if (!continueExploring)
                return false;

            itPath.increment(ec);
        }

        return true;
    }

    bool exploreFiles(const std::filesystem::path& directory, std::function<bool(std::error_code, const std::filesystem::path&)> cb)
    {
        std::error_code ec;
        std::filesystem::directory_iterator itPath{ directory, ec };

        if (ec)
        {
            cb(ec, directory);
            return true;
        }

        std::filesystem::directory_iterator itEnd;
        while (itPath != itEnd)
        {
            if (ec)
            {
                if (!cb(ec, *itPath))
                    return false;
            }
            else if (std::filesystem::is_regular_file(*itPath, ec) || ec)
            {
                if (!cb(ec, *itPath))
                    return false;
            }

            itPath.increment(ec);
        }

        return true;
    }

    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> supportedExtensions)
    {
        const std::filesystem::path extension{ stringUtils::stringToLower(file.extension().string()) };

        return (std::find(std::cbegin(supportedExtensions), std::cend(supportedExtensions), extension) != std::cend(supportedExtensions));
    }

    std::filesystem::path findExecutable(std::string_view name)
    {
        const std::filesystem::path program{ name };
        if (program.empty())
            return {};

        if (program.has_parent_path())
            return isExecutableFile(program) ? program : std::filesystem::path{};

        const char* envPath{ std::getenv("PATH") };
        const std::string_view searchPath{ envPath && *envPath ? envPath : "/usr/local/bin:/usr/bin:/bin" };

        for (std::string_view directory : stringUtils::splitString(searchPath, ':'))
        {
            // empty entries stand for the current directory
            const std::filesystem::path candidate{ (directory.empty() ? std::filesystem::path{ "." } : std::filesystem::path{ directory }) / program };
            if (isExecutableFile(candidate))
            {
                AUDEX_LOG(UTILS, DEBUG, "Found '" << name << "' at '" << candidate.string() << "'");
                return candidate;
            }
        }

        return {};
    }
} // namespace audex::core::pathUtils
