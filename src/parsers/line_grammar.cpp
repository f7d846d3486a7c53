/**
 * @file line_grammar.cpp
 * @brief Implementation of the shared line and section grammar
 * 
 * @date 2025
 */

#include "stealerlog/parsers/line_grammar.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <regex>

namespace stealerlog {
namespace parsers {

using utils::StringUtils;

namespace {

// Text between divider fences: whitespace, at least one character, whitespace
bool IsPaddedTitle(const std::string& middle) {
    return middle.size() >= 3 &&
           std::isspace(static_cast<unsigned char>(middle.front())) &&
           std::isspace(static_cast<unsigned char>(middle.back()));
}

} // anonymous namespace

// ============================================================================
// SEPARATOR PROFILES
// ============================================================================

const SeparatorProfile& SeparatorProfile::System() {
    static const SeparatorProfile profile{
        {"os:", "ip:", "user:", "cpu:", "ram:", "gpu:", "country:", "hwid:", "path:"},
        true
    };
    return profile;
}

const SeparatorProfile& SeparatorProfile::Credential() {
    static const SeparatorProfile profile{
        {"url:", "host:", "hostname:", "username:", "user:", "login:",
         "password:", "pass:", "browser:", "soft:", "application:"},
        false
    };
    return profile;
}

// ============================================================================
// LINE SHAPE
// ============================================================================

std::string LineGrammar::NormalizeLine(const std::string& line) {
    std::string result = StringUtils::Trim(line);
    
    if (!result.empty() && result[0] == '-') {
        result = result.substr(1);
    }
    
    return StringUtils::Trim(result);
}

bool LineGrammar::IsSeparatorLine(const std::string& line, const SeparatorProfile& profile) {
    std::string trimmed = StringUtils::Trim(line);
    if (trimmed.empty()) {
        return true;
    }
    
    const char fence = trimmed[0];
    if (fence != '=' && fence != '-') {
        return false;
    }
    
    const char fence_set[] = {fence, '\0'};
    const std::size_t lead = std::min(trimmed.find_first_not_of(fence_set), trimmed.size());
    if (lead == trimmed.size()) {
        return lead >= 8;
    }
    
    // Non-fence text is present, so the trailing run cannot overlap the leading one
    const std::size_t trail = trimmed.size() - 1 - trimmed.find_last_not_of(fence_set);
    const std::string middle = trimmed.substr(lead, trimmed.size() - lead - trail);
    
    std::string lower = StringUtils::ToLower(trimmed);
    bool has_field_label = std::any_of(profile.field_labels.begin(), profile.field_labels.end(),
                                       [&lower](const std::string& label) {
                                           return StringUtils::Contains(lower, label);
                                       });
    
    if (profile.allow_titled_dividers && lead >= 3 && trail >= 3 && IsPaddedTitle(middle)) {
        return !has_field_label;
    }
    
    if (lead >= 8 && trail >= 8) {
        return !has_field_label;
    }
    
    return false;
}

std::optional<std::string> LineGrammar::ExtractSectionFromSeparator(const std::string& line) {
    static const char fences[] = "-=";
    
    std::string trimmed = StringUtils::Trim(line);
    const std::size_t lead = trimmed.find_first_not_of(fences);
    if (lead == std::string::npos || lead < 3) {
        return std::nullopt;
    }
    
    const std::size_t trail = trimmed.size() - 1 - trimmed.find_last_not_of(fences);
    if (trail < 3) {
        return std::nullopt;
    }
    
    const std::string middle = trimmed.substr(lead, trimmed.size() - lead - trail);
    if (!IsPaddedTitle(middle)) {
        return std::nullopt;
    }
    
    std::string title = StringUtils::Trim(middle);
    if (title.empty()) {
        return std::nullopt;
    }
    return title;
}

std::optional<std::string> LineGrammar::ExtractIniHeader(const std::string& line) {
    std::string trimmed = StringUtils::Trim(line);
    if (trimmed.size() < 3 || trimmed.front() != '[' || trimmed.back() != ']') {
        return std::nullopt;
    }
    
    std::string name = trimmed.substr(1, trimmed.size() - 2);
    if (name.find_first_of("[]") != std::string::npos) {
        return std::nullopt;
    }
    
    name = StringUtils::Trim(name);
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::string LineGrammar::CanonicalSection(const std::string& title) {
    static const char* const canonical[] = {
        "geolocation", "hardware", "network", "system", "machine", "miscellaneous", "report"
    };
    
    std::string lower = StringUtils::ToLower(StringUtils::Trim(title));
    for (const char* tag : canonical) {
        if (StringUtils::Contains(lower, tag)) {
            return tag;
        }
    }
    return lower;
}

// ============================================================================
// LABEL / VALUE
// ============================================================================

std::string LineGrammar::ExtractValue(const std::string& line) {
    std::size_t pos = line.find(':');
    
    if (pos == std::string::npos) {
        std::size_t dash = line.find('-');
        if (dash != std::string::npos && dash > 0) {
            pos = dash;
        } else {
            pos = line.find('=');
        }
    }
    
    if (pos == std::string::npos) {
        return StringUtils::Trim(line);
    }
    
    return StringUtils::Trim(line.substr(pos + 1));
}

std::string LineGrammar::ExtractColonValue(const std::string& line) {
    std::size_t pos = line.find(':');
    if (pos == std::string::npos) {
        return StringUtils::Trim(line);
    }
    return StringUtils::Trim(line.substr(pos + 1));
}

std::string LineGrammar::ExtractLabel(const std::string& line) {
    std::size_t pos = line.find(':');
    if (pos == std::string::npos) {
        return "";
    }
    return StringUtils::ToLower(StringUtils::Trim(line.substr(0, pos)));
}

std::optional<std::string> LineGrammar::CleanValue(const std::string& value) {
    static const char* const junk_tokens[] = {
        "unknown", "[redacted]", "n/a", "none", "null"
    };
    
    std::string trimmed = StringUtils::Trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    
    std::string lower = StringUtils::ToLower(trimmed);
    for (const char* junk : junk_tokens) {
        if (lower == junk) {
            return std::nullopt;
        }
    }
    
    return trimmed;
}

// ============================================================================
// VALUE EXTRACTORS
// ============================================================================

std::string LineGrammar::CaptureDateText(const std::string& value) {
    static const std::regex day_first(
        R"(^(\d+\s+\w+\s+[\d\s:]+(?:\s+[A-Z]{2,})?))", std::regex::icase);
    static const std::regex month_first(
        R"(^(\w+\s+\d+,?\s+[\d\s:]+(?:\s+[A-Z]{2,})?))", std::regex::icase);
    static const std::regex numeric_run(R"(^([\d./\-\s:,]+))");
    
    std::string trimmed = StringUtils::Trim(value);
    if (trimmed.size() > kMaxPatternInput) {
        trimmed = StringUtils::Trim(trimmed.substr(0, kMaxPatternInput));
    }
    std::smatch match;
    
    if (StringUtils::ContainsLetter(trimmed)) {
        for (const auto* pattern : {&day_first, &month_first}) {
            if (std::regex_search(trimmed, match, *pattern)) {
                std::string candidate = StringUtils::Trim(match[1].str());
                if (candidate.size() > 5) {
                    return candidate;
                }
            }
        }
        
        std::string before_annotation = StringUtils::Trim(trimmed.substr(0, trimmed.find_first_of("([")));
        if (before_annotation.size() > 5) {
            return before_annotation;
        }
        return trimmed;
    }
    
    if (std::regex_search(trimmed, match, numeric_run)) {
        std::string candidate = StringUtils::Trim(match[1].str());
        if (candidate.size() > 5) {
            return candidate;
        }
    }
    return trimmed;
}

std::string LineGrammar::ExtractIP(const std::string& value) {
    std::size_t slash = value.find('/');
    return StringUtils::Trim(slash == std::string::npos ? value : value.substr(0, slash));
}

std::string LineGrammar::ExtractUsername(const std::string& value) {
    std::size_t pos = value.find('/');
    if (pos == std::string::npos) {
        pos = value.find('\\');
    }
    return StringUtils::Trim(pos == std::string::npos ? value : value.substr(pos + 1));
}

std::optional<std::string> LineGrammar::CombineOS(const std::optional<std::string>& name,
                                                  const std::optional<std::string>& version) {
    static const std::regex na_build(R"(N/A\s+Build\s+)", std::regex::icase);
    static const std::regex build_word(R"(\s+Build\s+)", std::regex::icase);
    static const std::regex na_token(R"(N/A)", std::regex::icase);
    
    if (!name && !version) {
        return std::nullopt;
    }
    if (!name) {
        return version;
    }
    if (!version) {
        return name;
    }
    
    std::string cleaned = std::regex_replace(version->substr(0, kMaxPatternInput), na_build, "");
    cleaned = std::regex_replace(cleaned, build_word, " ", std::regex_constants::format_first_only);
    cleaned = std::regex_replace(cleaned, na_token, "");
    cleaned = StringUtils::Trim(cleaned);
    
    std::string combined = StringUtils::Trim(*name + " " + cleaned);
    if (combined.size() < 5) {
        return name;
    }
    return combined;
}

std::string LineGrammar::NormalizeRAM(const std::string& value) {
    static const std::regex thousands(R"((\d),(\d{3})(?!\d))");
    static const std::regex size_pattern(R"((\d+(?:\.\d+)?)\s*(MB|GB))", std::regex::icase);
    
    if (value.size() > kMaxPatternInput) {
        return value;
    }
    
    std::string compact = value;
    std::string previous;
    while (compact != previous) {
        previous = compact;
        compact = std::regex_replace(compact, thousands, "$1$2");
    }
    
    std::smatch match;
    if (!std::regex_search(compact, match, size_pattern)) {
        return value;
    }
    
    if (StringUtils::ToUpper(match[2].str()) != "MB") {
        return value;
    }
    
    double gigabytes = std::stod(match[1].str()) / 1024.0;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f GB", gigabytes);
    return buffer;
}

bool LineGrammar::IsValidIP(const std::string& value) {
    return StringUtils::IsIPAddress(StringUtils::Trim(value));
}

} // namespace parsers
} // namespace stealerlog
