/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * **Shell quoting** follows the POSIX single-quote rule: inside '...' nothing
 * is special, so an embedded quote is written as '"'"' (close, quoted quote,
 * reopen). This is what remote commands rely on when environment variables
 * are passed inline as KEY=value prefixes.
 *
 * **ANSI stripping** removes both two-byte escapes (ESC followed by a single
 * character in @-Z, \, -, _) and CSI sequences (ESC [ params intermediates
 * final), which is the shape IPython uses for colored tracebacks.
 *
 * @date 2025
 */

#include "vmbench/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace vmbench {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

// Split into lines, keeping blanks
std::vector<std::string> StringUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;

    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        start = end + 1;
    }

    return lines;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                   const std::string& from,
                                   const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// Truncate string
std::string StringUtils::Truncate(const std::string& str,
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

// ============================================================================
// BASE64
// ============================================================================

std::string StringUtils::FromBase64(const std::string& base64) {
    static const std::string base64_chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::array<int, 256> lookup;
    lookup.fill(-1);
    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<unsigned char>(base64_chars[i])] = i;
    }

    std::string result;
    int val = 0;
    int valb = -8;

    for (unsigned char c : base64) {
        if (c == '=') {
            break;
        }
        if (std::isspace(c)) {
            continue;
        }
        if (lookup[c] == -1) {
            throw std::invalid_argument("Invalid base64 character in payload");
        }
        // Keep only the bits not yet emitted so val never overflows
        val = ((val << 6) + lookup[c]) & 0xFFFFFF;
        valb += 6;

        if (valb >= 0) {
            result.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    return result;
}

// ============================================================================
// SHELL / URL ENCODING
// ============================================================================

std::string StringUtils::ShellQuote(const std::string& value) {
    if (value.empty()) {
        return "''";
    }

    bool safe = std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == '/' ||
               c == ':' || c == '@' || c == '%' || c == '+' || c == '=' || c == ',';
    });
    if (safe) {
        return value;
    }

    return "'" + ReplaceAll(value, "'", "'\"'\"'") + "'";
}

bool StringUtils::IsIdentifier(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(str[0]);
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    return std::all_of(str.begin() + 1, str.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

std::string StringUtils::UrlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return oss.str();
}

std::string StringUtils::BuildQuery(const std::map<std::string, std::string>& params) {
    if (params.empty()) {
        return "";
    }

    std::vector<std::string> parts;
    parts.reserve(params.size());
    for (const auto& [key, value] : params) {
        parts.push_back(UrlEncode(key) + "=" + UrlEncode(value));
    }
    return "?" + Join(parts, "&");
}

std::string StringUtils::StripAnsi(const std::string& text) {
    static const std::regex ansi_pattern(
        "\x1B(?:[@-Z\\\\_-]|\\[[0-?]*[ -/]*[@-~])");
    return std::regex_replace(text, ansi_pattern, "");
}

} // namespace utils
} // namespace vmbench
