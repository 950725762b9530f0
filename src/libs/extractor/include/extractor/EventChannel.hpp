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

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "extractor/Events.hpp"

namespace audex::extractor
{
    // Unbounded multi producer / multi consumer queue of events
    // Producers never block on consumers
    class EventChannel
    {
    public:
        EventChannel() = default;
        EventChannel(const EventChannel&) = delete;
        EventChannel& operator=(const EventChannel&) = delete;

        // Events pushed after close are dropped
        void push(Event event);

        // Blocks until an event is available
        // Returns nothing once the channel is closed and drained
        std::optional<Event> pop();
        std::optional<Event> tryPop();

        void close();
        bool isClosed() const;

    private:
        mutable std::mutex _mutex;
        std::condition_variable _condVar;
        std::deque<Event> _events;
        bool _closed{};
    };
} // namespace audex::extractor
