/**
 * @file line_grammar.hpp
 * @brief Shared line and section grammar for stealer log text
 * 
 * Every format adapter and the credential extractor read their input
 * through these helpers: dash and indent stripping, separator detection,
 * section header extraction, "Label: Value" splitting, junk value
 * cleaning and small substring extractors.
 * 
 * All functions are total over string input and never throw.
 * 
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stealerlog {
namespace parsers {

/**
 * @struct SeparatorProfile
 * @brief Controls which lines count as block separators
 * 
 * Branded banners such as "========Daisy========" are separators only when
 * they carry none of the profile's field labels.
 */
struct SeparatorProfile {
    std::vector<std::string> field_labels;  ///< Lowercase labels that veto a banner
    bool allow_titled_dividers{true};       ///< Accept "--- Title ---" forms
    
    /**
     * @brief Profile for system information files
     */
    static const SeparatorProfile& System();
    
    /**
     * @brief Profile for password dump files
     */
    static const SeparatorProfile& Credential();
};

/**
 * @class LineGrammar
 * @brief Static line-level helpers
 */
class LineGrammar {
public:
    /// Longest text the pattern-based helpers will examine
    static constexpr std::size_t kMaxPatternInput = 4096;
    
    /***************************************************************************
     * Line Shape
     ***************************************************************************/
    
    /**
     * @brief Strip one leading "- " prefix and surrounding whitespace
     * 
     * "  - IP: 1.2.3.4" becomes "IP: 1.2.3.4".
     */
    static std::string NormalizeLine(const std::string& line);
    
    /**
     * @brief Check whether a line is a block separator
     * 
     * Separators are blank lines, runs of 8 or more '=' or '-', titled
     * dividers ("--- Network ---", "=== System ==="), and branded banners
     * ("=====Daisy=====") that do not contain a field label.
     * 
     * @param line Raw line
     * @param profile Label guard to apply
     * @return true if the line separates blocks
     */
    static bool IsSeparatorLine(const std::string& line,
                                const SeparatorProfile& profile = SeparatorProfile::System());
    
    /**
     * @brief Pull the title out of a "--- Title ---" divider
     * @return Title text, or std::nullopt if the line is not a titled divider
     */
    static std::optional<std::string> ExtractSectionFromSeparator(const std::string& line);
    
    /**
     * @brief Extract the name of an INI header "[Name]"
     */
    static std::optional<std::string> ExtractIniHeader(const std::string& line);
    
    /**
     * @brief Map a section title to its canonical tag
     * 
     * Titles mentioning geolocation, hardware, network, system, machine,
     * miscellaneous or report map to that word; anything else maps to its
     * lowercase form.
     */
    static std::string CanonicalSection(const std::string& title);
    
    /***************************************************************************
     * Label / Value
     ***************************************************************************/
    
    /**
     * @brief Value part of a "Label: Value" line
     * 
     * Splits on the first ':'; failing that on the first '-' past position
     * 0; failing that on the first '='. Lines without a separator are
     * returned trimmed.
     */
    static std::string ExtractValue(const std::string& line);
    
    /**
     * @brief Value after the first ':' only (credential grammar)
     */
    static std::string ExtractColonValue(const std::string& line);
    
    /**
     * @brief Label part before the first ':' (lowercase, trimmed)
     */
    static std::string ExtractLabel(const std::string& line);
    
    /**
     * @brief Reject junk values
     * 
     * Returns std::nullopt for empty values and for "unknown",
     * "[redacted]", "n/a", "none" and "null" in any case; otherwise the
     * trimmed value with its original case.
     */
    static std::optional<std::string> CleanValue(const std::string& value);
    
    /***************************************************************************
     * Value Extractors
     ***************************************************************************/
    
    /**
     * @brief Leading date/time run of a value
     * 
     * Cuts trailing annotations such as "(sig:...)" or "[UTC+3]" while
     * keeping zone words: "29 Jun 25 21:02 CEST (sig:abc)" yields
     * "29 Jun 25 21:02 CEST". Only the first kMaxPatternInput characters
     * are examined.
     */
    static std::string CaptureDateText(const std::string& value);
    
    /**
     * @brief Address part of "1.2.3.4/Country" style values
     */
    static std::string ExtractIP(const std::string& value);
    
    /**
     * @brief Account part of "DOMAIN/user" or "DOMAIN\\user" values
     */
    static std::string ExtractUsername(const std::string& value);
    
    /**
     * @brief Join an OS name with its version
     * 
     * "N/A Build" noise is removed from the version. Results shorter than
     * five characters fall back to whichever part is set.
     * 
     * **Example**:
     * @code
     * CombineOS("Microsoft Windows 10 Pro", "10.0.19045 N/A Build 19045");
     * // "Microsoft Windows 10 Pro 10.0.19045 19045"
     * @endcode
     */
    static std::optional<std::string> CombineOS(const std::optional<std::string>& name,
                                                const std::optional<std::string>& version);
    
    /**
     * @brief Express "N MB" memory sizes in GB
     * 
     * "8142.99 MB" becomes "7.95 GB" and "16,326 MB" becomes "15.94 GB".
     * Values already in GB, and anything else, are returned unchanged.
     */
    static std::string NormalizeRAM(const std::string& value);
    
    /**
     * @brief IPv4 (octets 0-255) or full-form IPv6 check
     */
    static bool IsValidIP(const std::string& value);
};

} // namespace parsers
} // namespace stealerlog
