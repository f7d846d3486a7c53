/**
 * @file date_normalizer.hpp
 * @brief Raw log date text to canonical date and time
 * 
 * Stealer logs carry their timestamps in whatever format the infected
 * machine's locale and the malware author chose. The normalizer resolves
 * them to a canonical YYYY-MM-DD date and HH:mm:ss time.
 * 
 * **Resolution order** (first match wins):
 * 1. Blank or junk input: fallback timestamp, or no date
 * 2. ISO "YYYY-MM-DD[ HH:mm:ss]" (a 'T' separator is accepted too)
 * 3. Numeric "P1.P2.P3 [time] [AM/PM]" with '.', '/' or '-' separators
 * 4. Text month forms ("Jun 29, 2025", "29 June 2024")
 * 5. Calendar parse of any remaining text, years 2000-2100 only
 * 6. Fallback timestamp, or no date
 * 
 * Ambiguous numeric dates such as 01/02/2024 resolve day-first.
 * 
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace stealerlog {
namespace parsers {

/**
 * @struct NormalizedDateTime
 * @brief Canonical date/time pair
 */
struct NormalizedDateTime {
    std::optional<std::string> date;    ///< YYYY-MM-DD, absent if unresolvable
    std::string time{"00:00:00"};       ///< Always HH:mm:ss
};

/**
 * @struct CalendarDate
 * @brief Broken-down calendar date
 */
struct CalendarDate {
    int year{0};
    int month{0};   ///< 1-12
    int day{0};     ///< 1-31
};

/**
 * @class DateNormalizer
 * @brief Stateless date/time normalizer
 * 
 * **Usage**:
 * @code
 * auto result = DateNormalizer::Normalize("13/02/2024 09:15:00 PM");
 * // result.date == "2024-02-13", result.time == "21:15:00"
 * @endcode
 */
class DateNormalizer {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    
    /**
     * @brief Normalize raw date text
     * @param raw Raw date text (may be empty)
     * @param fallback Timestamp used when nothing can be resolved
     * @return Canonical date/time
     */
    static NormalizedDateTime Normalize(const std::optional<std::string>& raw,
                                        const std::optional<TimePoint>& fallback = std::nullopt);
    
    /**
     * @brief Calendar parse of free text containing a month name
     * 
     * Tokens are split on whitespace and commas. Weekday names, zone words
     * and time tokens are skipped; the month is found by its three-letter
     * prefix. A four-digit number is the year and the first other number is
     * the day; without one, the first number is the day and the second a
     * two-digit year (2000+). The day is checked against the month length.
     * 
     * @param text Text such as "Sat Jul 06 3:43:57 2024" or "09 Dec 23"
     * @return Date, or std::nullopt
     */
    static std::optional<CalendarDate> ParseCalendarText(const std::string& text);
    
    /**
     * @brief Find an "HH:mm[:ss][ AM/PM]" time anywhere in the text
     * @return Canonical time, or std::nullopt
     */
    static std::optional<std::string> ExtractTime(const std::string& text);
    
    /**
     * @brief Format a date as YYYY-MM-DD
     */
    static std::string FormatDate(const CalendarDate& date);
    
    /**
     * @brief Format a time as HH:mm:ss
     */
    static std::string FormatTime(int hour, int minute, int second);
    
    /**
     * @brief Days in a month, leap years included
     */
    static int DaysInMonth(int year, int month);
};

} // namespace parsers
} // namespace stealerlog
