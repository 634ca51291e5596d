#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aseplay::strings {

inline std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

inline std::string trim_copy(std::string_view value) {
    std::size_t start = 0;
    std::size_t end = value.size();

    while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }

    return std::string(value.substr(start, end - start));
}

// Backslashes become forward slashes; nothing else about the path changes.
inline std::string normalize_separators(std::string value) {
    std::replace(value.begin(), value.end(), '\\', '/');
    return value;
}

// Parses "#RRGGBBAA" (or any run of up to 16 hex digits, with or without the
// leading '#') into an integer. Empty or non-hex input yields nullopt.
inline std::optional<std::uint64_t> parse_hex(std::string_view text) {
    std::string trimmed = trim_copy(text);
    std::string_view digits(trimmed);
    if (!digits.empty() && digits.front() == '#') {
        digits.remove_prefix(1);
    } else if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.remove_prefix(2);
    }
    if (digits.empty() || digits.size() > 16) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char ch : digits) {
        int nibble = 0;
        if (ch >= '0' && ch <= '9') {
            nibble = ch - '0';
        } else if (ch >= 'a' && ch <= 'f') {
            nibble = ch - 'a' + 10;
        } else if (ch >= 'A' && ch <= 'F') {
            nibble = ch - 'A' + 10;
        } else {
            return std::nullopt;
        }
        value = (value << 4) | static_cast<std::uint64_t>(nibble);
    }
    return value;
}

}
