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

#include "av/Types.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "core/String.hpp"

namespace audex::av
{
    namespace
    {
        struct ModeName
        {
            TranscodeMode mode;
            std::string_view name;
        };

        constexpr std::array<ModeName, 4> modeNames{ {
            { TranscodeMode::Copy, "copy" },
            { TranscodeMode::Mp3, "mp3" },
            { TranscodeMode::Aac, "aac" },
            { TranscodeMode::Wav, "wav" },
        } };
    } // namespace

    std::string_view transcodeModeToString(TranscodeMode mode)
    {
        for (const ModeName& modeName : modeNames)
        {
            if (modeName.mode == mode)
                return modeName.name;
        }

        return "unknown";
    }

    std::optional<TranscodeMode> transcodeModeFromString(std::string_view str)
    {
        for (const ModeName& modeName : modeNames)
        {
            if (core::stringUtils::stringCaseInsensitiveEqual(modeName.name, str))
                return modeName.mode;
        }

        return std::nullopt;
    }

    StreamSelector StreamSelector::fromIndex(std::size_t index)
    {
        StreamSelector res;
        res._value = index;
        return res;
    }

    std::optional<StreamSelector> StreamSelector::fromLanguage(std::string_view language)
    {
        if (language.empty())
            language = defaultLanguage;

        if (language.size() != 3 || !std::all_of(std::cbegin(language), std::cend(language), [](unsigned char c) { return c < 0x80 && std::isalpha(c); }))
            return std::nullopt;

        StreamSelector res;
        res._value = core::stringUtils::stringToLower(language);
        return res;
    }

    std::optional<std::size_t> StreamSelector::getIndex() const
    {
        if (const std::size_t* index{ std::get_if<std::size_t>(&_value) })
            return *index;

        return std::nullopt;
    }

    std::optional<std::string_view> StreamSelector::getLanguage() const
    {
        if (const std::string* language{ std::get_if<std::string>(&_value) })
            return *language;

        return std::nullopt;
    }

    std::string StreamSelector::toSpecifier() const
    {
        if (const std::string* language{ std::get_if<std::string>(&_value) })
            return "a:m:language:" + *language;

        return "a:" + std::to_string(std::get<std::size_t>(_value));
    }
} // namespace audex::av
