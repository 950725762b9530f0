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

#include "BatchContext.hpp"

namespace audex::extractor
{
    BatchContext::BatchContext(std::size_t total)
    {
        _summary.total = total;
    }

    void BatchContext::cancel()
    {
        _cancelled = true;
    }

    bool BatchContext::isCancelled() const
    {
        return _cancelled;
    }

    BatchSummary BatchContext::onTaskCompleted(bool success)
    {
        std::scoped_lock lock{ _mutex };

        _summary.completed += 1;
        if (success)
            _summary.succeeded += 1;
        else
            _summary.failed += 1;

        return _summary;
    }

    BatchSummary BatchContext::getSummary() const
    {
        std::scoped_lock lock{ _mutex };

        BatchSummary summary{ _summary };
        summary.cancelled = _cancelled;
        return summary;
    }
} // namespace audex::extractor
