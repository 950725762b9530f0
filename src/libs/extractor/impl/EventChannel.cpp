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

#include "extractor/EventChannel.hpp"

namespace audex::extractor
{
    void EventChannel::push(Event event)
    {
        {
            std::scoped_lock lock{ _mutex };
            if (_closed)
                return;

            _events.push_back(std::move(event));
        }

        _condVar.notify_one();
    }

    std::optional<Event> EventChannel::pop()
    {
        std::unique_lock lock{ _mutex };
        _condVar.wait(lock, [this] { return !_events.empty() || _closed; });

        if (_events.empty())
            return std::nullopt;

        Event event{ std::move(_events.front()) };
        _events.pop_front();
        return event;
    }

    std::optional<Event> EventChannel::tryPop()
    {
        std::scoped_lock lock{ _mutex };
        if (_events.empty())
            return std::nullopt;

        Event event{ std::move(_events.front()) };
        _events.pop_front();
        return event;
    }

    void EventChannel::close()
    {
        {
            std::scoped_lock lock{ _mutex };
            _closed = true;
        }

        _condVar.notify_all();
    }

    bool EventChannel::isClosed() const
    {
        std::scoped_lock lock{ _mutex };
        return _closed;
    }
} // namespace audex::extractor
