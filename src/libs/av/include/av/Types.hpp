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

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace audex::av
{
    enum class TranscodeMode
    {
        Copy, // stream copy, no re-encoding
        Mp3,
        Aac,
        Wav,
    };

    std::string_view transcodeModeToString(TranscodeMode mode);
    // case insensitive
    std::optional<TranscodeMode> transcodeModeFromString(std::string_view str);

    // Selects exactly one audio stream of the input, either by its position
    // among the audio streams or by its declared language
    class StreamSelector
    {
    public:
        static constexpr std::string_view defaultLanguage{ "eng" };

        StreamSelector() = default;

        static StreamSelector fromIndex(std::size_t index);
        // language must be an ISO-639-2 code (3 ASCII letters), empty means defaultLanguage
        static std::optional<StreamSelector> fromLanguage(std::string_view language);

        std::optional<std::size_t> getIndex() const;
        std::optional<std::string_view> getLanguage() const;

        // ffmpeg stream specifier: "a:<index>" or "a:m:language:<lang>"
        std::string toSpecifier() const;

        bool operator==(const StreamSelector& other) const = default;

    private:
        std::variant<std::size_t, std::string> _value;
    };
} // namespace audex::av
