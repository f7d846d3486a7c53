/**
 * @file label_scanner.hpp
 * @brief Table-driven line scanner shared by all format adapters
 * 
 * A family adapter is described by an AdapterLayout: an ordered table of
 * label rules plus optional hooks for the few things a table cannot say
 * (list blocks, next-line captures, family-specific section markers). The
 * scanner folds the input lines through the layout into a
 * ParsedSystemInfo.
 * 
 * **Per-line flow**:
 * 0. Lines longer than LineGrammar::kMaxPatternInput are skipped
 * 1. Pending next-line capture is tried on the raw line
 * 2. Blank lines close open lists and blocks
 * 3. Separators close lists and may update or reset the section
 * 4. INI headers update the section (if enabled)
 * 5. Open list consumes continuation lines
 * 6. Layout hook sees the line and may consume it
 * 7. Every matching rule assigns its field (first write wins)
 * 
 * @date 2025
 */

#pragma once

#include "stealerlog/parsers/country_resolver.hpp"
#include "stealerlog/parsers/system_info.hpp"

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace stealerlog {
namespace parsers {

/**
 * @enum MatchMode
 * @brief How a rule's labels are tested against the lowercase line
 */
enum class MatchMode {
    STARTS_WITH,    ///< Line starts with any label
    CONTAINS,       ///< Line contains any label
    CONTAINS_ALL    ///< Line contains every label
};

/**
 * @enum Slot
 * @brief Where a rule's value lands
 */
enum class Slot {
    FIELD,          ///< The rule's record field
    OS_NAME,        ///< OS name part, combined with the version at the end
    OS_VERSION      ///< OS version part
};

/**
 * @struct ScanLine
 * @brief One input line in its different shapes
 */
struct ScanLine {
    std::string raw;            ///< Line as read
    std::string trimmed;        ///< Whitespace trimmed
    std::string normalized;     ///< Dash prefix and indent stripped
    std::string lower;          ///< Lowercase normalized
    std::size_t index{0};       ///< Zero-based line number
};

/**
 * @brief Value transform applied after extraction
 * 
 * Returns std::nullopt to reject the value (the field stays open for a
 * later line).
 */
using ValueTransform = std::function<std::optional<std::string>(const std::string& value,
                                                                const CountryResolver& countries)>;

/**
 * @struct LabelRule
 * @brief Label pattern to field mapping
 */
struct LabelRule {
    Field field;                        ///< Target field
    MatchMode mode;                     ///< Label test
    std::vector<std::string> labels;    ///< Lowercase labels
    ValueTransform transform;           ///< Optional value transform
    std::string section;                ///< Required section, empty for any
    Slot slot{Slot::FIELD};             ///< Destination
};

/**
 * @enum ListStyle
 * @brief Which lines continue an open list
 */
enum class ListStyle {
    INDENTED,   ///< Lines indented deeper than the header (see ListCollector::Open)
    NUMBERED,   ///< "1) item" lines
    ANY_LINE    ///< Every non-blank line
};

/**
 * @enum ListJoin
 * @brief How a finished list collapses to one value
 */
enum class ListJoin {
    FIRST,      ///< First item
    COMMA       ///< Items joined with ", "
};

/**
 * @class ListCollector
 * @brief Accumulates list items following a header line
 */
class ListCollector {
public:
    /**
     * @brief Start collecting items for a field
     * 
     * An undashed header also takes "- item" lines at its own indent.
     */
    void Open(Field field, ListStyle style, ListJoin join,
              std::size_t header_indent, std::string header_label,
              bool header_dashed = false);
    
    bool IsOpen() const { return open_; }
    
    /**
     * @brief Try to consume a continuation line
     * @return true if the line belonged to the list
     */
    bool Consume(const ScanLine& line);
    
    /**
     * @brief Close the list and assign its value (first write wins)
     */
    void Commit(ParsedSystemInfo& info);
    
private:
    bool open_{false};
    Field field_{Field::GPU};
    ListStyle style_{ListStyle::INDENTED};
    ListJoin join_{ListJoin::FIRST};
    std::size_t header_indent_{0};
    bool header_dashed_{false};
    std::string header_label_;
    std::vector<std::string> items_;
};

/**
 * @struct ScanState
 * @brief Mutable state threaded through one scan
 */
struct ScanState {
    std::string section;                        ///< Canonical section in effect
    ListCollector list;                         ///< Open list block, if any
    std::optional<std::string> os_name;         ///< OS name part
    std::optional<std::string> os_version;      ///< OS version part
    std::optional<Field> pending_field;         ///< Field awaiting the next line
    const std::regex* pending_pattern{nullptr}; ///< Pattern for the next line
    bool in_block{false};                       ///< Family-specific block flag
};

/**
 * @struct AdapterContext
 * @brief What hooks get to work with
 */
struct AdapterContext {
    ParsedSystemInfo& info;
    ScanState& state;
    const CountryResolver& countries;
};

using LineHook = std::function<bool(const ScanLine& line, AdapterContext& ctx)>;
using FinishHook = std::function<void(AdapterContext& ctx)>;

/**
 * @struct AdapterLayout
 * @brief Complete description of one family's log layout
 */
struct AdapterLayout {
    std::vector<LabelRule> rules;           ///< Evaluated in order on every line
    bool ini_sections{false};               ///< "[Section]" headers set the section
    bool separator_sections{false};         ///< "--- Title ---" sets the section
    bool separators_reset_section{false};   ///< Any separator clears the section
    LineHook on_line;                       ///< Runs before the rules
    FinishHook on_finish;                   ///< Runs after the last line
};

/**
 * @class LabelScanner
 * @brief Folds text through an AdapterLayout
 */
class LabelScanner {
public:
    /**
     * @brief Scan content with a layout
     * @param content Normalized file text
     * @param layout Family layout
     * @param countries Country resolver for country transforms
     * @return Partially filled record (stealer type not set)
     */
    static ParsedSystemInfo Scan(const std::string& content,
                                 const AdapterLayout& layout,
                                 const CountryResolver& countries);
    
    /**
     * @brief Test a rule's labels against a line
     */
    static bool Matches(const LabelRule& rule, const ScanLine& line);
    
    /**
     * @brief Apply every matching rule to a line
     */
    static void ApplyRules(const std::vector<LabelRule>& rules,
                           const ScanLine& line,
                           AdapterContext& ctx);
    
    /**
     * @brief Handle a list header line
     * 
     * If the line starts with one of @p labels: an inline value is assigned
     * directly, an empty value opens a list. Lines for an already-set
     * field are left to the rules.
     * 
     * @return true if the line was consumed
     */
    static bool HandleListHeader(const ScanLine& line, AdapterContext& ctx,
                                 Field field, const std::vector<std::string>& labels,
                                 ListStyle style, ListJoin join);
    
    /**
     * @brief Arrange for the next line to be matched against a pattern
     * 
     * Group 1 of @p pattern becomes the field value.
     */
    static void CaptureNextLine(AdapterContext& ctx, Field field, const std::regex& pattern);
};

/**
 * @class ValueTransforms
 * @brief Reusable value transforms for label rules
 */
class ValueTransforms {
public:
    /// "DOMAIN\\user" -> "user"
    static ValueTransform Username();
    
    /// "1.2.3.4/Country" -> "1.2.3.4"
    static ValueTransform IpAddress();
    
    /// Free text -> country code, or the text itself
    static ValueTransform Country();
    
    /// Country code, but values that are IP addresses are rejected
    static ValueTransform CountryUnlessIP();
    
    /// Leading date run
    static ValueTransform DateText();
    
    /// Reject values containing @p needle (case-insensitive)
    static ValueTransform Reject(const std::string& needle);
    
    /// Reject all-digit values
    static ValueTransform RejectAllDigits();
    
    /// Remove matches of @p pattern (case-insensitive), then trim
    static ValueTransform Strip(const std::string& pattern);
    
    /// Group 1 of @p pattern, or rejection when it does not match
    static ValueTransform Capture(const std::string& pattern, bool ignore_case = false);
    
    /// Regex replacement with a format string (case-insensitive)
    static ValueTransform Rewrite(const std::string& pattern, const std::string& format);
    
    /// Apply @p first, then @p second on its result
    static ValueTransform Then(ValueTransform first, ValueTransform second);
    
    /// Try @p first; on rejection use @p second on the original value
    static ValueTransform OrElse(ValueTransform first, ValueTransform second);
};

} // namespace parsers
} // namespace stealerlog
