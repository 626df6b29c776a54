/**
 * @file string_utils.hpp
 * @brief String helpers shared by the shell, kernel and orchestration layers
 *
 * Provides trimming, splitting, case folding, base64 armoring, POSIX shell
 * quoting, URL query encoding and ANSI escape stripping. Everything needed to
 * build remote command lines and decode kernel payloads lives here.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>

namespace vmbench {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * // Build an inline environment prefix for a remote command
 * std::string cmd = "TASK_SETUP_LOG=" + StringUtils::ShellQuote(log) + " ./setup.sh";
 *
 * // Decode a base64 armored payload printed by the kernel
 * std::string json_text = StringUtils::FromBase64(payload);
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert ASCII letters to lowercase
     * @param str Input string
     * @return Lowercased copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, dropping empty tokens
     * @param str Input string
     * @param delimiter Separator character
     * @return Non-empty tokens in order
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split text into lines, keeping empty lines
     *
     * A trailing newline does not produce a final empty line. Carriage
     * returns preceding a newline are removed.
     *
     * @param text Input text
     * @return Lines without terminators
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    /**
     * @brief Join strings with delimiter
     * @param strings Parts to join
     * @param delimiter Separator
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings,
                           const std::string& delimiter);

    /**
     * @brief Replace every occurrence of a substring
     * @param str Input string
     * @param from Substring to replace (empty means no-op)
     * @param to Replacement
     * @return Modified copy
     */
    static std::string ReplaceAll(const std::string& str,
                                 const std::string& from,
                                 const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Truncate string, appending suffix if shortened
     * @param str Input string
     * @param max_length Maximum result length including suffix
     * @param suffix Marker for truncated text
     * @return Possibly shortened copy
     */
    static std::string Truncate(const std::string& str,
                               std::size_t max_length,
                               const std::string& suffix = "...");

    /***************************************************************************
     * Encoding
     ***************************************************************************/

    /**
     * @brief Decode standard base64
     *
     * Whitespace is ignored; decoding stops at the first padding character.
     *
     * @throws std::invalid_argument on characters outside the base64 alphabet
     */
    static std::string FromBase64(const std::string& base64);

    /**
     * @brief Quote a value for a POSIX shell
     *
     * Values made only of safe characters are returned unchanged; anything
     * else is wrapped in single quotes with embedded quotes escaped as '"'"'.
     * Empty strings become ''.
     */
    static std::string ShellQuote(const std::string& value);

    /**
     * @brief Check whether a string is a valid shell variable name
     * @return true for [A-Za-z_][A-Za-z0-9_]*
     */
    static bool IsIdentifier(const std::string& str);

    /**
     * @brief Percent-encode a query component (RFC 3986 unreserved kept)
     */
    static std::string UrlEncode(const std::string& value);

    /**
     * @brief Build "?k=v&k2=v2" from parameters, empty map yields ""
     */
    static std::string BuildQuery(const std::map<std::string, std::string>& params);

    /**
     * @brief Remove ANSI terminal escape sequences (colors, cursor movement)
     */
    static std::string StripAnsi(const std::string& text);
};

} // namespace utils
} // namespace vmbench
