/**
 * @file label_scanner.cpp
 * @brief Line fold over adapter layouts, list collection and transforms
 * 
 * @date 2025
 */

#include "stealerlog/parsers/label_scanner.hpp"
#include "stealerlog/parsers/line_grammar.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace stealerlog {
namespace parsers {

using utils::StringUtils;

// ============================================================================
// LIST COLLECTION
// ============================================================================

void ListCollector::Open(Field field, ListStyle style, ListJoin join,
                         std::size_t header_indent, std::string header_label,
                         bool header_dashed) {
    open_ = true;
    field_ = field;
    style_ = style;
    join_ = join;
    header_indent_ = header_indent;
    header_dashed_ = header_dashed;
    header_label_ = std::move(header_label);
    items_.clear();
}

bool ListCollector::Consume(const ScanLine& line) {
    if (!open_) {
        return false;
    }
    
    switch (style_) {
        case ListStyle::INDENTED: {
            std::size_t indent = StringUtils::IndentWidth(line.raw);
            bool sibling_item = !header_dashed_ && indent == header_indent_ &&
                                !line.trimmed.empty() && line.trimmed[0] == '-';
            if (indent < 2 || (indent <= header_indent_ && !sibling_item)) {
                return false;
            }
            if (!line.normalized.empty() &&
                (header_label_.empty() || !StringUtils::Contains(line.lower, header_label_))) {
                items_.push_back(line.normalized);
            }
            return true;
        }
        case ListStyle::NUMBERED: {
            // "<digits>) <item>"
            const std::string& text = line.trimmed;
            std::size_t digits = text.find_first_not_of("0123456789");
            if (digits == 0 || digits == std::string::npos || text[digits] != ')' ||
                digits + 1 >= text.size() || !std::isspace(static_cast<unsigned char>(text[digits + 1]))) {
                return false;
            }
            std::string item = StringUtils::Trim(text.substr(digits + 1));
            if (item.empty()) {
                return false;
            }
            items_.push_back(item);
            return true;
        }
        case ListStyle::ANY_LINE:
            if (!line.normalized.empty()) {
                items_.push_back(line.normalized);
            }
            return true;
    }
    
    return false;
}

void ListCollector::Commit(ParsedSystemInfo& info) {
    if (!open_) {
        return;
    }
    open_ = false;
    
    if (items_.empty()) {
        return;
    }
    
    if (join_ == ListJoin::FIRST) {
        info.SetIfEmpty(field_, items_.front());
    } else {
        info.SetIfEmpty(field_, StringUtils::Join(items_, ", "));
    }
    items_.clear();
}

// ============================================================================
// SCAN LOOP
// ============================================================================

ParsedSystemInfo LabelScanner::Scan(const std::string& content,
                                    const AdapterLayout& layout,
                                    const CountryResolver& countries) {
    ParsedSystemInfo info;
    ScanState state;
    AdapterContext ctx{info, state, countries};
    
    const auto lines = StringUtils::SplitLines(content);
    
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& raw = lines[i];
        
        if (raw.size() > LineGrammar::kMaxPatternInput) {
            spdlog::debug("Line {}: skipped, {} bytes long", i + 1, raw.size());
            state.pending_pattern = nullptr;
            state.pending_field.reset();
            state.list.Commit(info);
            continue;
        }
        
        if (state.pending_pattern) {
            std::smatch match;
            if (std::regex_search(raw, match, *state.pending_pattern) && state.pending_field) {
                info.SetIfEmpty(*state.pending_field, StringUtils::Trim(match[1].str()));
            }
            state.pending_pattern = nullptr;
            state.pending_field.reset();
        }
        
        std::string trimmed = StringUtils::Trim(raw);
        if (trimmed.empty()) {
            state.list.Commit(info);
            state.in_block = false;
            continue;
        }
        
        if (LineGrammar::IsSeparatorLine(trimmed)) {
            state.list.Commit(info);
            state.in_block = false;
            if (layout.separators_reset_section) {
                state.section.clear();
            }
            if (layout.separator_sections) {
                if (auto title = LineGrammar::ExtractSectionFromSeparator(trimmed)) {
                    state.section = LineGrammar::CanonicalSection(*title);
                }
            }
            continue;
        }
        
        if (layout.ini_sections) {
            if (auto header = LineGrammar::ExtractIniHeader(trimmed)) {
                state.list.Commit(info);
                state.in_block = false;
                state.section = LineGrammar::CanonicalSection(*header);
                continue;
            }
        }
        
        ScanLine line;
        line.raw = raw;
        line.trimmed = trimmed;
        line.normalized = LineGrammar::NormalizeLine(trimmed);
        line.lower = StringUtils::ToLower(line.normalized);
        line.index = i;
        
        if (state.list.IsOpen()) {
            if (state.list.Consume(line)) {
                continue;
            }
            state.list.Commit(info);
        }
        
        if (layout.on_line && layout.on_line(line, ctx)) {
            continue;
        }
        
        ApplyRules(layout.rules, line, ctx);
    }
    
    state.list.Commit(info);
    
    if (layout.on_finish) {
        layout.on_finish(ctx);
    }
    
    if (state.os_name || state.os_version) {
        info.SetIfEmpty(Field::OS, LineGrammar::CombineOS(state.os_name, state.os_version));
    }
    
    return info;
}

bool LabelScanner::Matches(const LabelRule& rule, const ScanLine& line) {
    switch (rule.mode) {
        case MatchMode::STARTS_WITH:
            return std::any_of(rule.labels.begin(), rule.labels.end(),
                               [&line](const std::string& label) {
                                   return StringUtils::StartsWith(line.lower, label);
                               });
        case MatchMode::CONTAINS:
            return std::any_of(rule.labels.begin(), rule.labels.end(),
                               [&line](const std::string& label) {
                                   return StringUtils::Contains(line.lower, label);
                               });
        case MatchMode::CONTAINS_ALL:
            return !rule.labels.empty() &&
                   std::all_of(rule.labels.begin(), rule.labels.end(),
                               [&line](const std::string& label) {
                                   return StringUtils::Contains(line.lower, label);
                               });
    }
    return false;
}

void LabelScanner::ApplyRules(const std::vector<LabelRule>& rules,
                              const ScanLine& line,
                              AdapterContext& ctx) {
    for (const auto& rule : rules) {
        if (!rule.section.empty() && rule.section != ctx.state.section) {
            continue;
        }
        
        bool filled = false;
        switch (rule.slot) {
            case Slot::FIELD:      filled = ctx.info.Has(rule.field); break;
            case Slot::OS_NAME:    filled = ctx.state.os_name.has_value(); break;
            case Slot::OS_VERSION: filled = ctx.state.os_version.has_value(); break;
        }
        if (filled || !Matches(rule, line)) {
            continue;
        }
        
        std::string value = LineGrammar::ExtractValue(line.normalized);
        if (value.empty()) {
            continue;
        }
        
        std::optional<std::string> result = rule.transform
            ? rule.transform(value, ctx.countries)
            : std::optional<std::string>(value);
        if (!result) {
            continue;
        }
        
        switch (rule.slot) {
            case Slot::FIELD:
                if (ctx.info.SetIfEmpty(rule.field, result)) {
                    spdlog::debug("Line {}: {} = {}", line.index + 1, ToString(rule.field),
                                  *ctx.info.Get(rule.field));
                }
                break;
            case Slot::OS_NAME:
                ctx.state.os_name = LineGrammar::CleanValue(*result);
                break;
            case Slot::OS_VERSION:
                ctx.state.os_version = LineGrammar::CleanValue(*result);
                break;
        }
    }
}

bool LabelScanner::HandleListHeader(const ScanLine& line, AdapterContext& ctx,
                                    Field field, const std::vector<std::string>& labels,
                                    ListStyle style, ListJoin join) {
    auto label = std::find_if(labels.begin(), labels.end(),
                              [&line](const std::string& l) {
                                  return StringUtils::StartsWith(line.lower, l);
                              });
    if (label == labels.end() || ctx.info.Has(field)) {
        return false;
    }
    
    std::string value = LineGrammar::ExtractColonValue(line.normalized);
    if (!value.empty()) {
        ctx.info.SetIfEmpty(field, value);
        return true;
    }
    
    ctx.state.list.Open(field, style, join, StringUtils::IndentWidth(line.raw), *label,
                        !line.trimmed.empty() && line.trimmed[0] == '-');
    return true;
}

void LabelScanner::CaptureNextLine(AdapterContext& ctx, Field field, const std::regex& pattern) {
    ctx.state.pending_field = field;
    ctx.state.pending_pattern = &pattern;
}

// ============================================================================
// VALUE TRANSFORMS
// ============================================================================

ValueTransform ValueTransforms::Username() {
    return [](const std::string& value, const CountryResolver&) -> std::optional<std::string> {
        return LineGrammar::ExtractUsername(value);
    };
}

ValueTransform ValueTransforms::IpAddress() {
    return [](const std::string& value, const CountryResolver&) -> std::optional<std::string> {
        return LineGrammar::ExtractIP(value);
    };
}

ValueTransform ValueTransforms::Country() {
    return [](const std::string& value, const CountryResolver& countries) -> std::optional<std::string> {
        return ExtractCountryCode(value, countries);
    };
}

ValueTransform ValueTransforms::CountryUnlessIP() {
    return [](const std::string& value, const CountryResolver& countries) -> std::optional<std::string> {
        if (LineGrammar::IsValidIP(value)) {
            return std::nullopt;
        }
        return ExtractCountryCode(value, countries);
    };
}

ValueTransform ValueTransforms::DateText() {
    return [](const std::string& value, const CountryResolver&) -> std::optional<std::string> {
        return LineGrammar::CaptureDateText(value);
    };
}

ValueTransform ValueTransforms::Reject(const std::string& needle) {
    std::string lower_needle = StringUtils::ToLower(needle);
    return [lower_needle](const std::string& value, const CountryResolver&) -> std::optional<std::string> {
        if (StringUtils::Contains(StringUtils::ToLower(value), lower_needle)) {
            return std::nullopt;
        }
        return value;
    };
}

ValueTransform ValueTransforms::RejectAllDigits() {
    return [](const std::string& value, const CountryResolver&) -> std::optional<std::string> {
        if (StringUtils::IsAllDigits(value)) {
            return std::nullopt;
        }
        return value;
    };
}

ValueTransform ValueTransforms::Strip(const std::string& pattern) {
    auto regex = std::make_shared<std::regex>(pattern, std::regex::icase);
    return [regex](const std::string& value, const CountryResolver&) -> std::optional<std::string> {
        return StringUtils::Trim(std::regex_replace(value, *regex, ""));
    };
}

ValueTransform ValueTransforms::Capture(const std::string& pattern, bool ignore_case) {
    auto regex = std::make_shared<std::regex>(
        pattern, ignore_case ? std::regex::ECMAScript | std::regex::icase : std::regex::ECMAScript);
    return [regex](const std::string& value, const CountryResolver&) -> std::optional<std::string> {
        std::smatch match;
        if (!std::regex_search(value, match, *regex)) {
            return std::nullopt;
        }
        return StringUtils::Trim(match[1].str());
    };
}

ValueTransform ValueTransforms::Rewrite(const std::string& pattern, const std::string& format) {
    auto regex = std::make_shared<std::regex>(pattern, std::regex::icase);
    return [regex, format](const std::string& value, const CountryResolver&) -> std::optional<std::string> {
        return std::regex_replace(value, *regex, format);
    };
}

ValueTransform ValueTransforms::Then(ValueTransform first, ValueTransform second) {
    return [first, second](const std::string& value,
                           const CountryResolver& countries) -> std::optional<std::string> {
        auto intermediate = first(value, countries);
        if (!intermediate) {
            return std::nullopt;
        }
        return second(*intermediate, countries);
    };
}

ValueTransform ValueTransforms::OrElse(ValueTransform first, ValueTransform second) {
    return [first, second](const std::string& value,
                           const CountryResolver& countries) -> std::optional<std::string> {
        auto result = first(value, countries);
        if (result) {
            return result;
        }
        return second(value, countries);
    };
}

} // namespace parsers
} // namespace stealerlog
