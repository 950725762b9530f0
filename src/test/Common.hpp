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

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>

#include <unistd.h>

#include <gtest/gtest.h>

namespace audex::tests
{
    // Unique directory created under the system temp dir, removed with all its content on destruction
    class [[nodiscard]] TemporaryDirectory
    {
    public:
        TemporaryDirectory()
        {
            static std::atomic<unsigned> counter{};

            std::random_device rd;
            const std::string name{ "audex-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + "-" + std::to_string(rd()) };

            _path = std::filesystem::temp_directory_path() / name;
            std::filesystem::create_directories(_path);
        }

        ~TemporaryDirectory()
        {
            std::error_code ec;
            std::filesystem::remove_all(_path, ec);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    inline void writeFile(const std::filesystem::path& p, std::string_view content = "")
    {
        if (p.has_parent_path())
            std::filesystem::create_directories(p.parent_path());

        std::ofstream ofs{ p, std::ios::binary | std::ios::trunc };
        ASSERT_TRUE(ofs.is_open()) << "Cannot write " << p;
        ofs << content;
    }

    inline std::string readFile(const std::filesystem::path& p)
    {
        std::ifstream ifs{ p, std::ios::binary };
        return std::string{ std::istreambuf_iterator<char>{ ifs }, std::istreambuf_iterator<char>{} };
    }

    // Writes a /bin/sh script and makes it executable
    inline std::filesystem::path writeScript(const std::filesystem::path& p, std::string_view body)
    {
        writeFile(p, std::string{ "#!/bin/sh\n" } + std::string{ body } + "\n");
        std::filesystem::permissions(p, std::filesystem::perms::owner_all | std::filesystem::perms::group_read | std::filesystem::perms::group_exec, std::filesystem::perm_options::replace);
        return p;
    }
} // namespace audex::tests
