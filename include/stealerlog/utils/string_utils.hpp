/**
 * @file string_utils.hpp
 * @brief String manipulation utilities for stealer log text
 * 
 * Provides the low-level text helpers shared by the line grammar, the
 * family adapters and the credential extractor: trimming, case folding,
 * splitting, address shape checks and encoding repair for text recovered
 * from stealer archives.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace stealerlog {
namespace utils {

/**
 * @class StringUtils
 * @brief String utilities for stealer log processing
 * 
 * Provides static methods for:
 * - String manipulation (trim, split, join, replace)
 * - Case-insensitive comparisons
 * - Address shape checks (IPv4, IPv6)
 * - Encoding normalization and binary content detection
 * 
 * All methods are static - no instantiation required.
 * 
 * **Usage Example**:
 * @code
 * auto content = StringUtils::NormalizeEncoding(raw_bytes);
 * for (const auto& line : StringUtils::SplitLines(content)) {
 *     if (StringUtils::StartsWith(StringUtils::ToLower(line), "ip:")) {
 *         // ...
 *     }
 * }
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
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);
    
    /**
     * @brief Remove leading whitespace only
     */
    static std::string TrimLeft(const std::string& str);
    
    /**
     * @brief Convert ASCII letters to lowercase
     */
    static std::string ToLower(const std::string& str);
    
    /**
     * @brief Convert ASCII letters to uppercase
     */
    static std::string ToUpper(const std::string& str);
    
    /**
     * @brief Split string by delimiter
     * 
     * Empty tokens are skipped.
     * 
     * @param str Input string
     * @param delimiter Delimiter character
     * @return Vector of non-empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);
    
    /**
     * @brief Split text into lines
     * 
     * Splits on LF and drops a trailing CR from each line. Unlike Split(),
     * empty lines are kept because blank lines are block boundaries in
     * stealer logs.
     * 
     * @param text Input text
     * @return Lines in order, without terminators
     */
    static std::vector<std::string> SplitLines(const std::string& text);
    
    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings,
                           const std::string& delimiter);
    
    /**
     * @brief Replace all occurrences of a substring
     */
    static std::string ReplaceAll(const std::string& str,
                                 const std::string& from,
                                 const std::string& to);
    
    /***************************************************************************
     * String Comparison
     ***************************************************************************/
    
    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);
    
    /**
     * @brief Case-insensitive substring check
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);
    
    /**
     * @brief Check whether any ASCII letter is present
     */
    static bool ContainsLetter(const std::string& str);
    
    /**
     * @brief Check whether the string is non-empty and made of digits only
     */
    static bool IsAllDigits(const std::string& str);
    
    /**
     * @brief Width of the leading whitespace run (tab counts as 4)
     */
    static std::size_t IndentWidth(const std::string& str);
    
    /***************************************************************************
     * Address Checks
     ***************************************************************************/
    
    /**
     * @brief Check for a valid IPv4 or full-form IPv6 address
     * 
     * IPv4 octets must be in 0-255. IPv6 must be the uncompressed
     * eight-group form.
     * 
     * @param str String to check
     * @return true if str is an IP address
     */
    static bool IsIPAddress(const std::string& str);
    
    /**
     * @brief Check for an IPv4-shaped literal (four dotted 1-3 digit groups)
     * 
     * Does not range-check octets.
     */
    static bool IsIPv4Shaped(const std::string& str);
    
    /***************************************************************************
     * Encoding
     ***************************************************************************/
    
    /**
     * @brief Normalize raw file bytes to clean UTF-8 text
     * 
     * Strips a UTF-8 BOM, decodes UTF-16 (BOM-marked, or LE text whose odd
     * bytes are all zero), replaces invalid UTF-8 sequences with U+FFFD and
     * folds CRLF and lone CR line endings to LF. NUL bytes in 8-bit input
     * are kept so that binary content stays detectable.
     * 
     * @param raw Raw file content
     * @return Normalized UTF-8 text
     */
    static std::string NormalizeEncoding(const std::string& raw);
    
    /**
     * @brief Heuristic binary content check
     * 
     * Content is binary if it contains a NUL byte or if fewer than
     * @p printable_ratio of its characters are printable ASCII or
     * whitespace. Characters are counted per UTF-8 sequence, and any
     * non-ASCII character counts as non-printable.
     * 
     * @param content Content to check
     * @param printable_ratio Minimum printable fraction for text
     * @return true if the content looks binary
     */
    static bool IsLikelyBinary(const std::string& content, double printable_ratio = 0.8);
    
    /**
     * @brief Truncate string to maximum length
     * @param str Input string
     * @param max_length Maximum length including the ellipsis
     * @param ellipsis Appended when truncated
     */
    static std::string Truncate(const std::string& str,
                               std::size_t max_length,
                               const std::string& ellipsis = "...");
};

} // namespace utils
} // namespace stealerlog
