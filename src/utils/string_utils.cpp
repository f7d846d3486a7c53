/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation utilities
 * 
 * Implements trimming, splitting, case folding, address checks and the
 * encoding repair applied to every artifact before it reaches the parsers.
 * 
 * **Encoding Handling**:
 * - UTF-8 BOM stripped
 * - UTF-16 LE/BE decoded to UTF-8 (BOM or zero-byte heuristic)
 * - Invalid UTF-8 sequences replaced with U+FFFD
 * - CRLF and CR folded to LF
 * 
 * @date 2025
 */

#include "stealerlog/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>
#include <sstream>

namespace stealerlog {
namespace utils {

namespace {

const char kReplacementChar[] = "\xEF\xBF\xBD";

void AppendUtf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

std::string DecodeUtf16(const std::string& raw, std::size_t offset, bool little_endian) {
    std::string out;
    out.reserve(raw.size() / 2);
    
    auto unit_at = [&](std::size_t i) -> uint32_t {
        auto lo = static_cast<unsigned char>(raw[i]);
        auto hi = static_cast<unsigned char>(raw[i + 1]);
        return little_endian ? (static_cast<uint32_t>(hi) << 8 | lo)
                             : (static_cast<uint32_t>(lo) << 8 | hi);
    };
    
    std::size_t i = offset;
    while (i + 1 < raw.size()) {
        uint32_t unit = unit_at(i);
        i += 2;
        
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            // High surrogate needs a following low surrogate
            if (i + 1 < raw.size()) {
                uint32_t low = unit_at(i);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    i += 2;
                    AppendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                    continue;
                }
            }
            out += kReplacementChar;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            out += kReplacementChar;
        } else {
            AppendUtf8(out, unit);
        }
    }
    
    return out;
}

bool LooksLikeUtf16LE(const std::string& raw) {
    if (raw.size() < 4 || raw.size() % 2 != 0) {
        return false;
    }
    
    std::size_t zero_high = 0;
    std::size_t zero_low = 0;
    for (std::size_t i = 0; i + 1 < raw.size(); i += 2) {
        if (raw[i] == '\0') ++zero_low;
        if (raw[i + 1] == '\0') ++zero_high;
    }
    
    std::size_t units = raw.size() / 2;
    return zero_high * 10 >= units * 9 && zero_low == 0;
}

// Length of the valid UTF-8 sequence starting at i, or 0 if invalid
std::size_t ValidSequenceLength(const std::string& s, std::size_t i) {
    auto c = static_cast<unsigned char>(s[i]);
    std::size_t length = 0;
    uint32_t min_value = 0;
    uint32_t value = 0;
    
    if (c < 0x80) {
        return 1;
    } else if ((c & 0xE0) == 0xC0) {
        length = 2; min_value = 0x80; value = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        length = 3; min_value = 0x800; value = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        length = 4; min_value = 0x10000; value = c & 0x07;
    } else {
        return 0;
    }
    
    if (i + length > s.size()) {
        return 0;
    }
    
    for (std::size_t k = 1; k < length; ++k) {
        auto cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) {
            return 0;
        }
        value = (value << 6) | (cc & 0x3F);
    }
    
    // Reject overlong forms, surrogates and out-of-range values
    if (value < min_value || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        return 0;
    }
    
    return length;
}

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), 
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(), 
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::TrimLeft(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    return std::string(start, str.end());
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string StringUtils::ToUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::toupper(c); });
    return result;
}

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

std::vector<std::string> StringUtils::SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        
        start = end + 1;
    }
    
    return lines;
}

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

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && 
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return ToLower(str).find(ToLower(substring)) != std::string::npos;
}

bool StringUtils::ContainsLetter(const std::string& str) {
    return std::any_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isalpha(c); });
}

bool StringUtils::IsAllDigits(const std::string& str) {
    return !str.empty() &&
           std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

std::size_t StringUtils::IndentWidth(const std::string& str) {
    std::size_t width = 0;
    for (char c : str) {
        if (c == ' ') {
            width += 1;
        } else if (c == '\t') {
            width += 4;
        } else {
            break;
        }
    }
    return width;
}

// ============================================================================
// ADDRESS CHECKS
// ============================================================================

bool StringUtils::IsIPAddress(const std::string& str) {
    static const std::regex ipv4_pattern(
        R"(^(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)"
    );
    
    static const std::regex ipv6_pattern(
        R"(^([0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}$)"
    );
    
    return std::regex_match(str, ipv4_pattern) || std::regex_match(str, ipv6_pattern);
}

bool StringUtils::IsIPv4Shaped(const std::string& str) {
    static const std::regex ipv4_shape(R"(^(\d{1,3}\.){3}\d{1,3}$)");
    return std::regex_match(str, ipv4_shape);
}

// ============================================================================
// ENCODING
// ============================================================================

std::string StringUtils::NormalizeEncoding(const std::string& raw) {
    std::string text;
    
    if (raw.size() >= 2 && static_cast<unsigned char>(raw[0]) == 0xFF &&
        static_cast<unsigned char>(raw[1]) == 0xFE) {
        text = DecodeUtf16(raw, 2, true);
    } else if (raw.size() >= 2 && static_cast<unsigned char>(raw[0]) == 0xFE &&
               static_cast<unsigned char>(raw[1]) == 0xFF) {
        text = DecodeUtf16(raw, 2, false);
    } else if (LooksLikeUtf16LE(raw)) {
        text = DecodeUtf16(raw, 0, true);
    } else {
        std::size_t offset = 0;
        if (raw.size() >= 3 && raw.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            offset = 3;
        }
        
        text.reserve(raw.size() - offset);
        std::size_t i = offset;
        while (i < raw.size()) {
            std::size_t length = ValidSequenceLength(raw, i);
            if (length == 0) {
                text += kReplacementChar;
                ++i;
            } else {
                text.append(raw, i, length);
                i += length;
            }
        }
    }
    
    // Fold line endings
    std::string result;
    result.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            result += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            result += text[i];
        }
    }
    
    return result;
}

bool StringUtils::IsLikelyBinary(const std::string& content, double printable_ratio) {
    if (content.empty()) {
        return false;
    }
    
    if (content.find('\0') != std::string::npos) {
        return true;
    }
    
    std::size_t characters = 0;
    std::size_t printable = 0;
    for (char ch : content) {
        auto c = static_cast<unsigned char>(ch);
        if ((c & 0xC0) == 0x80) {
            continue;  // UTF-8 continuation byte
        }
        ++characters;
        if ((c >= 0x20 && c <= 0x7E) || c >= 0xC0 || c == '\n' || c == '\r' || c == '\t') {
            ++printable;
        }
    }
    
    return static_cast<double>(printable) / static_cast<double>(characters) < printable_ratio;
}

std::string StringUtils::Truncate(const std::string& str, 
                                 std::size_t max_length,
                                 const std::string& ellipsis) {
    if (str.length() <= max_length) {
        return str;
    }
    
    if (max_length <= ellipsis.length()) {
        return str.substr(0, max_length);
    }
    
    return str.substr(0, max_length - ellipsis.length()) + ellipsis;
}

} // namespace utils
} // namespace stealerlog
