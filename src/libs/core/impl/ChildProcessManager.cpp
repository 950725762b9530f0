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

#include "ChildProcessManager.hpp"

#include "core/ILogger.hpp"

#include "ChildProcess.hpp"

namespace audex::core
{
    std::unique_ptr<IChildProcessManager> createChildProcessManager()
    {
        return std::make_unique<ChildProcessManager>();
    }

    std::unique_ptr<IChildProcess> ChildProcessManager::spawnChildProcess(const std::filesystem::path& path, const IChildProcess::Args& args)
    {
        const std::size_t id{ _spawnCount++ };
        AUDEX_LOG(CHILDPROCESS, DEBUG, "[" << id << "] Spawning '" << path.string() << "' with " << args.size() << " args");

        return std::make_unique<ChildProcess>(path, args);
    }
} // namespace audex::core
