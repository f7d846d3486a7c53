/**
 * @file date_normalizer.cpp
 * @brief Date/time disambiguation for stealer log timestamps
 * 
 * @date 2025
 */

#include "stealerlog/parsers/date_normalizer.hpp"
#include "stealerlog/parsers/line_grammar.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <cstdio>
#include <ctime>
#include <regex>
#include <sstream>
#include <vector>

namespace stealerlog {
namespace parsers {

using utils::StringUtils;

namespace {

NormalizedDateTime FromFallback(const std::optional<DateNormalizer::TimePoint>& fallback) {
    NormalizedDateTime result;
    if (!fallback) {
        return result;
    }
    
    std::time_t seconds = std::chrono::system_clock::to_time_t(*fallback);
    std::tm local{};
    localtime_r(&seconds, &local);
    
    result.date = DateNormalizer::FormatDate({local.tm_year + 1900, local.tm_mon + 1, local.tm_mday});
    result.time = DateNormalizer::FormatTime(local.tm_hour, local.tm_min, local.tm_sec);
    return result;
}

bool IsJunkDate(const std::string& lower) {
    return lower == "disabled" || lower == "none" || lower == "n/a" ||
           lower == "null" || lower == "unknown" || lower == "[redacted]";
}

int ApplyMeridiem(int hour, const std::string& meridiem) {
    std::string upper = StringUtils::ToUpper(meridiem);
    if (upper == "PM" && hour < 12) {
        return hour + 12;
    }
    if (upper == "AM" && hour == 12) {
        return 0;
    }
    return hour;
}

int MonthFromWord(const std::string& word) {
    static const char* const months[] = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    };
    
    if (word.size() < 3) {
        return 0;
    }
    
    for (int i = 0; i < 12; ++i) {
        if (StringUtils::StartsWith(months[i], word)) {
            return i + 1;
        }
    }
    return 0;
}

std::string StripOrdinal(const std::string& token) {
    static const std::regex ordinal(R"(^(\d{1,2})(st|nd|rd|th)$)", std::regex::icase);
    std::smatch match;
    if (std::regex_match(token, match, ordinal)) {
        return match[1].str();
    }
    return token;
}

// ISO "YYYY-MM-DD[ HH:mm[:ss]]"
std::optional<NormalizedDateTime> TryIso(const std::string& text) {
    static const std::regex iso(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T\s]+(\d{2}):(\d{2})(?::(\d{2}))?)?)");
    
    std::smatch match;
    if (!std::regex_search(text, match, iso)) {
        return std::nullopt;
    }
    
    CalendarDate date{std::stoi(match[1].str()), std::stoi(match[2].str()), std::stoi(match[3].str())};
    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        return std::nullopt;
    }
    
    NormalizedDateTime result;
    result.date = DateNormalizer::FormatDate(date);
    if (match[4].matched) {
        result.time = DateNormalizer::FormatTime(
            std::stoi(match[4].str()), std::stoi(match[5].str()),
            match[6].matched ? std::stoi(match[6].str()) : 0);
    }
    return result;
}

// Numeric "P1 sep P2 sep P3 [H:m[:s]] [AM/PM]"
std::optional<NormalizedDateTime> TryNumeric(const std::string& text) {
    static const std::regex numeric(
        R"(^(\d{1,4})[./-](\d{1,2})[./-](\d{2,4})(?:\s+(\d{1,2}):(\d{1,2})(?::(\d{1,2}))?(?:\s*(AM|PM))?)?)",
        std::regex::icase);
    
    std::smatch match;
    if (!std::regex_search(text, match, numeric)) {
        return std::nullopt;
    }
    
    const std::string p1 = match[1].str();
    const std::string p2 = match[2].str();
    const std::string p3 = match[3].str();
    const int n1 = std::stoi(p1);
    const int n2 = std::stoi(p2);
    const int n3 = std::stoi(p3);
    
    CalendarDate date;
    if (p3.size() == 4) {
        date.year = n3;
        if (n1 > 12) {
            date.day = n1;
            date.month = n2;
        } else if (n2 > 12) {
            date.month = n1;
            date.day = n2;
        } else {
            date.day = n1;
            date.month = n2;
        }
    } else if (p1.size() == 4) {
        date.year = n1;
        date.month = n2;
        date.day = n3;
    } else if (n1 > 12) {
        date.day = n1;
        date.month = n2;
        date.year = n3;
    } else if (n2 > 12) {
        date.month = n1;
        date.day = n2;
        date.year = n3;
    } else {
        date.day = n1;
        date.month = n2;
        date.year = n3;
    }
    
    if (date.year < 100) {
        date.year += 2000;
    }
    
    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        return std::nullopt;
    }
    
    NormalizedDateTime result;
    result.date = DateNormalizer::FormatDate(date);
    
    if (match[4].matched) {
        int hour = std::stoi(match[4].str());
        int minute = std::stoi(match[5].str());
        int second = match[6].matched ? std::stoi(match[6].str()) : 0;
        if (match[7].matched) {
            hour = ApplyMeridiem(hour, match[7].str());
        }
        result.time = DateNormalizer::FormatTime(hour, minute, second);
    }
    
    return result;
}

} // anonymous namespace

// ============================================================================
// NORMALIZATION PIPELINE
// ============================================================================

NormalizedDateTime DateNormalizer::Normalize(const std::optional<std::string>& raw,
                                             const std::optional<TimePoint>& fallback) {
    if (!raw) {
        return FromFallback(fallback);
    }
    
    std::string text = StringUtils::Trim(*raw);
    if (text.empty() || text.size() > LineGrammar::kMaxPatternInput ||
        IsJunkDate(StringUtils::ToLower(text))) {
        return FromFallback(fallback);
    }
    
    if (auto iso = TryIso(text)) {
        return *iso;
    }
    
    if (auto numeric = TryNumeric(text)) {
        return *numeric;
    }
    
    // Text month forms, any year
    static const std::regex month_first(R"(([a-zA-Z]{3,9})\s+(\d{1,2}),?\s+(\d{4}))");
    static const std::regex day_first(R"((\d{1,2})\s+([a-zA-Z]{3,9})\s+(\d{4}))");
    
    if (std::regex_search(text, month_first) || std::regex_search(text, day_first)) {
        if (auto date = ParseCalendarText(text)) {
            NormalizedDateTime result;
            result.date = FormatDate(*date);
            result.time = ExtractTime(text).value_or("00:00:00");
            return result;
        }
    }
    
    // Generic calendar parse, plausible years only
    if (auto date = ParseCalendarText(text)) {
        if (date->year >= 2000 && date->year <= 2100) {
            NormalizedDateTime result;
            result.date = FormatDate(*date);
            result.time = ExtractTime(text).value_or("00:00:00");
            return result;
        }
    }
    
    return FromFallback(fallback);
}

// ============================================================================
// CALENDAR PARSING
// ============================================================================

std::optional<CalendarDate> DateNormalizer::ParseCalendarText(const std::string& text) {
    std::istringstream tokens(StringUtils::ReplaceAll(text, ",", " "));
    std::string token;
    
    int month = 0;
    std::vector<std::string> numbers;
    
    while (tokens >> token) {
        if (StringUtils::Contains(token, ":")) {
            continue;  // time component
        }
        
        while (!token.empty() && token.back() == '.') {
            token.pop_back();
        }
        token = StripOrdinal(token);
        
        if (StringUtils::IsAllDigits(token)) {
            numbers.push_back(token);
            continue;
        }
        
        std::string lower = StringUtils::ToLower(token);
        bool alphabetic = !lower.empty() &&
            lower.find_first_not_of("abcdefghijklmnopqrstuvwxyz") == std::string::npos;
        if (alphabetic && month == 0) {
            month = MonthFromWord(lower);
        }
    }
    
    if (month == 0) {
        return std::nullopt;
    }
    
    CalendarDate date;
    date.month = month;
    
    std::size_t year_index = numbers.size();
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (numbers[i].size() == 4) {
            year_index = i;
            break;
        }
    }
    
    if (year_index < numbers.size()) {
        date.year = std::stoi(numbers[year_index]);
        for (std::size_t i = 0; i < numbers.size(); ++i) {
            if (i != year_index && numbers[i].size() <= 2) {
                date.day = std::stoi(numbers[i]);
                break;
            }
        }
    } else if (numbers.size() >= 2 && numbers[0].size() <= 2 && numbers[1].size() <= 2) {
        date.day = std::stoi(numbers[0]);
        date.year = 2000 + std::stoi(numbers[1]);
    } else {
        return std::nullopt;
    }
    
    if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) {
        return std::nullopt;
    }
    
    return date;
}

std::optional<std::string> DateNormalizer::ExtractTime(const std::string& text) {
    static const std::regex time_pattern(
        R"((\d{1,2}):(\d{1,2})(?::(\d{1,2}))?(?:\s*(AM|PM))?)", std::regex::icase);
    
    std::smatch match;
    if (!std::regex_search(text, match, time_pattern)) {
        return std::nullopt;
    }
    
    int hour = std::stoi(match[1].str());
    int minute = std::stoi(match[2].str());
    int second = match[3].matched ? std::stoi(match[3].str()) : 0;
    if (match[4].matched) {
        hour = ApplyMeridiem(hour, match[4].str());
    }
    
    if (hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }
    
    return FormatTime(hour, minute, second);
}

std::string DateNormalizer::FormatDate(const CalendarDate& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
                  date.year % 10000, date.month, date.day);
    return buffer;
}

std::string DateNormalizer::FormatTime(int hour, int minute, int second) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d",
                  hour % 100, minute % 100, second % 100);
    return buffer;
}

int DateNormalizer::DaysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return days[month - 1];
}

} // namespace parsers
} // namespace stealerlog
