/**
 * @file sectioned_adapters.cpp
 * @brief Adapters whose labels are scoped by sections or blocks
 * 
 * Sections come from INI headers ("[Hardware]"), titled dividers
 * ("----- Geolocation Data -----") or family-specific marker lines
 * ("Network Info:", "System Information:"). RedLine-derived layouts add a
 * "Hardwares:" block of "Name:" lines and a free-form antivirus list.
 * 
 * @date 2025
 */

#include "stealerlog/parsers/family_adapters.hpp"
#include "stealerlog/parsers/label_scanner.hpp"
#include "stealerlog/parsers/line_grammar.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <regex>

namespace stealerlog {
namespace parsers {

using utils::StringUtils;
using T = ValueTransforms;

namespace {

const MatchMode kStarts = MatchMode::STARTS_WITH;
const MatchMode kHas = MatchMode::CONTAINS;

ValueTransform Redacted() {
    return T::Reject("[redacted]");
}

/**
 * Classify one "Name:" line of a RedLine "Hardwares:" block by its value.
 */
void ApplyHardwareName(const std::string& value, AdapterContext& ctx) {
    static const std::regex ram_size(R"((\d+\.?\d*)\s*(mb|gb|bytes))", std::regex::icase);
    static const std::regex core_suffix(R"(\s*,\s*\d+\s+cores?$)", std::regex::icase);
    static const std::regex bytes_suffix(R"(\s*,\s*\d+\s+bytes$)", std::regex::icase);
    
    std::string lower = StringUtils::ToLower(value);
    std::smatch match;
    
    if (StringUtils::Contains(lower, "ram")) {
        if (std::regex_search(value, match, ram_size)) {
            ctx.info.SetIfEmpty(Field::RAM, match[1].str() + " " + StringUtils::ToUpper(match[2].str()));
        }
    } else if (StringUtils::Contains(lower, "cpu") || StringUtils::Contains(lower, "processor")) {
        ctx.info.SetIfEmpty(Field::CPU, std::regex_replace(value, core_suffix, ""));
    } else if (StringUtils::Contains(lower, "graphics") || StringUtils::Contains(lower, "gpu") ||
               std::regex_search(value, bytes_suffix)) {
        ctx.info.SetIfEmpty(Field::GPU, std::regex_replace(value, bytes_suffix, ""));
    }
}

AdapterLayout RedLineLayout(bool with_machine_fields) {
    AdapterLayout layout;
    layout.rules = {
        {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
        {Field::FILE_PATH, with_machine_fields ? kHas : kStarts, {"filelocation:"}},
        {Field::USERNAME, kStarts, {"username:"}, T::Username()},
        {Field::COUNTRY, kStarts, {"country:"}, T::Country()},
        {Field::HWID, kStarts, {"hwid:"}},
        {Field::OS, kHas, {"operation system:"}},
    };
    if (with_machine_fields) {
        layout.rules.push_back({Field::COMPUTER_NAME, kStarts, {"machinename:"}});
        layout.rules.push_back({Field::LOG_DATE, kHas, {"log date:"}});
    }
    
    layout.on_line = [](const ScanLine& line, AdapterContext& ctx) {
        if (ctx.state.in_block) {
            if (StringUtils::StartsWith(line.lower, "name:")) {
                ApplyHardwareName(LineGrammar::ExtractColonValue(line.normalized), ctx);
                return true;
            }
            ctx.state.in_block = false;
        }
        
        if (StringUtils::Contains(line.lower, "hardwares:") ||
            StringUtils::Contains(line.lower, "hardware:")) {
            ctx.state.in_block = true;
            return true;
        }
        
        return LabelScanner::HandleListHeader(line, ctx, Field::ANTIVIRUS,
                                              {"anti-viruses:", "antiviruses:"},
                                              ListStyle::ANY_LINE, ListJoin::COMMA);
    };
    return layout;
}

} // anonymous namespace

// ============================================================================
// INI SECTION LAYOUTS
// ============================================================================

ParsedSystemInfo FamilyAdapters::ParseAstris(const std::string& content, const std::string&,
                                             const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.ini_sections = true;
        l.rules = {
            {Field::HWID, kStarts, {"hwid:"}, nullptr, "general"},
            {Field::LOG_DATE, kStarts, {"date:"}, T::DateText(), "general"},
            {Field::COMPUTER_NAME, kStarts, {"computer name:"}, nullptr, "machine"},
            {Field::USERNAME, kStarts, {"user name:"}, T::Username(), "machine"},
            {Field::OS, kStarts, {"system:"}, nullptr, "machine"},
            {Field::ANTIVIRUS, kStarts, {"antiviruses:"}, nullptr, "machine"},
            {Field::COUNTRY, kStarts, {"country:"}, T::Country(), "geolocation"},
            {Field::IP_ADDRESS, kStarts, {"public ip address:"}, T::IpAddress(), "network"},
            {Field::IP_ADDRESS, kStarts, {"private ip address:"}, T::IpAddress(), "network"},
            {Field::CPU, kStarts, {"cpu:"}, nullptr, "hardware"},
            {Field::GPU, kStarts, {"gpu:"}, nullptr, "hardware"},
            {Field::RAM, kStarts, {"ram:"}, nullptr, "hardware"},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseRisePro(const std::string& content, const std::string&,
                                              const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.ini_sections = true;
        l.rules = {
            {Field::LOG_DATE, kStarts, {"date:"}, T::DateText()},
            {Field::HWID, kHas, {"machineid:"}},
            {Field::HWID, kStarts, {"hwid:"}},
            {Field::FILE_PATH, kStarts, {"path:"}},
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
            {Field::COUNTRY, kStarts, {"location:"}, T::Capture(R"(^([A-Z]{2}))")},
            {Field::OS, kStarts, {"windows:"}},
            {Field::COMPUTER_NAME, kStarts, {"computer name:"}, T::Strip(R"(\s*\[[^\]]*\]\s*$)")},
            {Field::USERNAME, kStarts, {"user name:"}, T::Username()},
            {Field::LOG_DATE, kHas, {"local time:"}, T::DateText()},
            {Field::CPU, kStarts, {"processor:"}, nullptr, "hardware"},
            {Field::RAM, kStarts, {"ram:"}, nullptr, "hardware"},
            {Field::GPU, kHas, {"videocard"}, T::Strip(R"(^#\d+:\s*)"), "hardware"},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseStealerium(const std::string& content, const std::string&,
                                                 const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.ini_sections = true;
        l.rules = {
            {Field::IP_ADDRESS, kHas, {"external ip:"}, T::IpAddress(), "ip"},
            {Field::IP_ADDRESS, kHas, {"internal ip:"}, T::IpAddress(), "ip"},
            {Field::USERNAME, kStarts, {"username:"}, T::Username(), "machine"},
            {Field::COMPUTER_NAME, kStarts, {"compname:"}, nullptr, "machine"},
            {Field::OS, kStarts, {"system:"}, nullptr, "machine"},
            {Field::CPU, kStarts, {"cpu:"}, nullptr, "machine"},
            {Field::GPU, kStarts, {"gpu:"}, nullptr, "machine"},
            {Field::RAM, kStarts, {"ram:"}, nullptr, "machine"},
            {Field::LOG_DATE, kStarts, {"date:"}, T::DateText(), "machine"},
            {Field::ANTIVIRUS, kStarts, {"antivirus:"}, nullptr, "virtualization"},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseVidar(const std::string& content, const std::string&,
                                            const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.ini_sections = true;
        l.rules = {
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::Then(Redacted(), T::IpAddress())},
            {Field::COUNTRY, kStarts, {"country:"}, T::Then(Redacted(), T::Country())},
            {Field::LOG_DATE, kStarts, {"date:"}, T::Then(Redacted(), T::DateText())},
            {Field::HWID, kHas, {"machineid:"}, Redacted()},
            {Field::HWID, kStarts, {"hwid:"}, Redacted()},
            {Field::FILE_PATH, kStarts, {"path:"}, Redacted()},
            {Field::OS, kStarts, {"windows:"}, Redacted()},
            {Field::COMPUTER_NAME, kStarts, {"computer name:"}, Redacted()},
            {Field::USERNAME, kStarts, {"user name:"}, T::Then(Redacted(), T::Username())},
            {Field::LOG_DATE, kHas, {"local time:"}, T::Then(Redacted(), T::DateText())},
            {Field::CPU, kStarts, {"processor:"}, nullptr, "hardware"},
            {Field::RAM, kStarts, {"ram:"}, nullptr, "hardware"},
            {Field::GPU, kHas, {"videocard:"}, nullptr, "hardware"},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

// ============================================================================
// DIVIDER AND MARKER SECTION LAYOUTS
// ============================================================================

ParsedSystemInfo FamilyAdapters::ParsePhemedrone(const std::string& content, const std::string&,
                                                 const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.separator_sections = true;
        l.rules = {
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress(), "geolocation"},
            {Field::COUNTRY, kStarts, {"country:"}, T::Country(), "geolocation"},
            {Field::USERNAME, kStarts, {"username:"}, T::Username(), "hardware"},
            {Field::OS, kHas, {"windows name:"}, nullptr, "hardware"},
            {Field::HWID, kHas, {"hardware id:"}, nullptr, "hardware"},
            {Field::GPU, kStarts, {"gpu:"}, nullptr, "hardware"},
            {Field::CPU, kStarts, {"cpu:"}, nullptr, "hardware"},
            {Field::RAM, kStarts, {"ram:"}, nullptr, "hardware"},
            {Field::ANTIVIRUS, kHas, {"antivirus products:"}, nullptr, "miscellaneous"},
            {Field::FILE_PATH, kHas, {"file location:"}, nullptr, "miscellaneous"},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseStealC(const std::string& content, const std::string&,
                                             const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress(), "network"},
            {Field::COUNTRY, kStarts, {"country:"}, T::Country(), "network"},
            {Field::HWID, kStarts, {"hwid:"}, nullptr, "system"},
            {Field::OS, kStarts, {"os:"}, nullptr, "system"},
            {Field::USERNAME, kStarts, {"username:"}, T::Username(), "system"},
            {Field::COMPUTER_NAME, kStarts, {"computer name:"}, nullptr, "system"},
            {Field::LOG_DATE, kHas, {"local time:"}, T::DateText(), "system"},
            {Field::FILE_PATH, kHas, {"running path:"}, nullptr, "system"},
            {Field::CPU, kStarts, {"cpu:"}, nullptr, "system"},
            {Field::RAM, kStarts, {"ram:"}, nullptr, "system"},
        };
        l.on_line = [](const ScanLine& line, AdapterContext& ctx) {
            if (StringUtils::Contains(line.lower, "network info")) {
                ctx.state.section = "network";
                return true;
            }
            if (StringUtils::Contains(line.lower, "system summary")) {
                ctx.state.section = "system";
                return true;
            }
            // GPU list: header, then indented "-Adapter" lines
            return ctx.state.section == "system" &&
                   LabelScanner::HandleListHeader(line, ctx, Field::GPU, {"gpu:"},
                                                  ListStyle::INDENTED, ListJoin::FIRST);
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseRaccoon(const std::string& content, const std::string&,
                                              const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.separators_reset_section = true;
        l.rules = {
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress(), "system"},
            {Field::COUNTRY, kStarts, {"location:"},
             T::OrElse(T::Then(T::Capture(R"(,\s*([^,]+?)\s*\()"), T::Country()), T::Country()),
             "system"},
            {Field::COMPUTER_NAME, kHas, {"computername:"}, nullptr, "system"},
            {Field::USERNAME, kStarts, {"username:"}, T::Username(), "system"},
            {Field::OS, kHas, {"product name:"}, nullptr, "system"},
            {Field::OS, kStarts, {"os:"}, nullptr, "system"},
            {Field::CPU, kStarts, {"cpu:"}, T::Strip(R"(\s*\(\d+\s+cores?\)$)"), "system"},
            {Field::RAM, kStarts, {"ram:"}, T::Strip(R"(\s*\([^)]*\)$)"), "system"},
            {Field::IP_ADDRESS, kHas, {"ip info:"}, T::Capture(R"((\d+\.\d+\.\d+\.\d+))")},
        };
        l.on_line = [](const ScanLine& line, AdapterContext& ctx) {
            if (StringUtils::Contains(line.lower, "system information:") ||
                StringUtils::Contains(line.lower, "system info:")) {
                ctx.state.section = "system";
                return true;
            }
            if (StringUtils::Contains(line.lower, "display devices:") ||
                StringUtils::Contains(line.lower, "display device:")) {
                ctx.state.section = "display";
                ctx.state.list.Open(Field::GPU, ListStyle::NUMBERED, ListJoin::FIRST, 0, "");
                return true;
            }
            return false;
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseAtomicMac(const std::string& content, const std::string&,
                                                const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::OS, kStarts, {"productname:"}, nullptr, "", Slot::OS_NAME},
            {Field::OS, kStarts, {"productversion:"}, nullptr, "", Slot::OS_VERSION},
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
            {Field::COUNTRY, kStarts, {"country:"}, T::Country()},
            {Field::COMPUTER_NAME, kStarts, {"model name:"}, nullptr, "hardware"},
            {Field::CPU, kStarts, {"chip:", "processor name:"}, nullptr, "hardware"},
            {Field::RAM, kStarts, {"memory:"}, nullptr, "hardware"},
            {Field::HWID, kHas, {"serial number", "hardware uuid:"}, nullptr, "hardware"},
            {Field::GPU, kStarts, {"chipset model:"}, nullptr, "graphics"},
        };
        // system_profiler nests "Label:" headers with no value; only the
        // top-level categories switch the section
        l.on_line = [](const ScanLine& line, AdapterContext& ctx) {
            if (StringUtils::StartsWith(line.lower, "buildversion:")) {
                std::string build = LineGrammar::ExtractColonValue(line.normalized);
                if (ctx.state.os_version && !build.empty()) {
                    *ctx.state.os_version += " (" + build + ")";
                }
                return true;
            }
            
            if (line.lower.empty() || line.lower.back() != ':') {
                return false;
            }
            
            if (StringUtils::Contains(line.lower, "hardware")) {
                ctx.state.section = "hardware";
            } else if (StringUtils::Contains(line.lower, "graphics") ||
                       StringUtils::Contains(line.lower, "displays")) {
                ctx.state.section = "graphics";
            } else if (StringUtils::Contains(line.lower, "software")) {
                ctx.state.section = "software";
            } else if (StringUtils::Contains(line.lower, "network")) {
                ctx.state.section = "network";
            } else {
                return false;
            }
            return true;
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

// ============================================================================
// REDLINE-STYLE LAYOUTS
// ============================================================================

ParsedSystemInfo FamilyAdapters::ParseRedLine(const std::string& content, const std::string&,
                                              const CountryResolver& countries) {
    static const AdapterLayout layout = RedLineLayout(true);
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseArechClient(const std::string& content, const std::string&,
                                                  const CountryResolver& countries) {
    static const AdapterLayout layout = RedLineLayout(false);
    return LabelScanner::Scan(content, layout, countries);
}

} // namespace parsers
} // namespace stealerlog
