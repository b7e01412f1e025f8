#pragma once

#include "bubbles/radius_model.h"
#include "color.h"
#include "instrument.h"

#include <cctype>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <string>
#include <string_view>

// Config and output spellings of the project enums.
// Timeframe labels are not identifiers ("24h"), so they get a hand-written table;
// everything else is derived from the enumerator name with magic_enum.

constexpr const char* toString(Timeframe tf) {
    switch (tf) {
    case Timeframe::Hour1:
        return "1h";
    case Timeframe::Hour24:
        return "24h";
    case Timeframe::Day7:
        return "7d";
    case Timeframe::Day30:
        return "30d";
    case Timeframe::Day365:
        return "365d";
    }
    return "24h";
}

namespace enum_strings {

// "StrongGain" -> "strong_gain"
inline std::string toSnakeCase(std::string_view pascal) {
    std::string result;
    result.reserve(pascal.size() + 4);
    for (size_t i = 0; i < pascal.size(); ++i) {
        char c = pascal[i];
        if (std::isupper(static_cast<unsigned char>(c))) {
            if (i > 0) {
                result += '_';
            }
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            result += c;
        }
    }
    return result;
}

// Accepts "strong_gain", "StrongGain" or "stronggain"
template <typename E>
std::optional<E> fromString(std::string_view str) {
    for (auto value : magic_enum::enum_values<E>()) {
        if (toSnakeCase(magic_enum::enum_name(value)) == str) {
            return value;
        }
    }
    return magic_enum::enum_cast<E>(str, magic_enum::case_insensitive);
}

// "cap|percent|volume", for usage text and warnings
template <typename E>
std::string choices() {
    std::string result;
    for (auto value : magic_enum::enum_values<E>()) {
        if (!result.empty()) {
            result += '|';
        }
        result += toSnakeCase(magic_enum::enum_name(value));
    }
    return result;
}

} // namespace enum_strings

inline std::string toString(bubbles::SizeMode mode) {
    return enum_strings::toSnakeCase(magic_enum::enum_name(mode));
}

inline std::string toString(BubbleTone tone) {
    return enum_strings::toSnakeCase(magic_enum::enum_name(tone));
}

// Strict timeframe parse for config input; the core's lenient variant falls back to 24h
inline std::optional<Timeframe> parseTimeframe(std::string_view label) {
    for (auto tf : magic_enum::enum_values<Timeframe>()) {
        if (label == toString(tf)) {
            return tf;
        }
    }
    return std::nullopt;
}
