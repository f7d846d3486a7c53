/**
 * @file family_adapters.cpp
 * @brief Family dispatch and flat label layouts
 * 
 * Flat layouts are one "Label: Value" per line with no sections. Each
 * adapter is its rule table plus, where needed, a small line hook.
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
const MatchMode kHasAll = MatchMode::CONTAINS_ALL;

ValueTransform Redacted() {
    return T::Reject("[redacted]");
}

/**
 * Windows `systeminfo` output. Processor and address values sit on the
 * line after their header as "[01]: value".
 */
AdapterLayout SystemInfoCommandLayout(std::vector<LabelRule> extra_rules) {
    AdapterLayout layout;
    layout.rules = {
        {Field::COMPUTER_NAME, kStarts, {"host name:"}},
        {Field::OS, kStarts, {"os name:"}, nullptr, "", Slot::OS_NAME},
        {Field::OS, kStarts, {"os version:"}, nullptr, "", Slot::OS_VERSION},
        {Field::USERNAME, kStarts, {"registered owner:"}, T::Username()},
        {Field::RAM, kStarts, {"total physical memory:"}},
    };
    layout.rules.insert(layout.rules.end(), extra_rules.begin(), extra_rules.end());
    
    layout.on_line = [](const ScanLine& line, AdapterContext& ctx) {
        static const std::regex first_processor(R"(\[01\]:\s*(.+))");
        static const std::regex first_address(R"(\[01\]:\s*([0-9.]+))");
        
        if (StringUtils::StartsWith(line.lower, "processor(s):") && !ctx.info.Has(Field::CPU)) {
            LabelScanner::CaptureNextLine(ctx, Field::CPU, first_processor);
        } else if (StringUtils::Contains(line.lower, "ip address(es)") &&
                   !ctx.info.Has(Field::IP_ADDRESS)) {
            LabelScanner::CaptureNextLine(ctx, Field::IP_ADDRESS, first_address);
        }
        return false;
    };
    return layout;
}

} // anonymous namespace

// ============================================================================
// DISPATCH
// ============================================================================

ParsedSystemInfo FamilyAdapters::Parse(StealerFamily family,
                                       const std::string& content,
                                       const std::string& file_name,
                                       const CountryResolver& countries) {
    switch (family) {
        case StealerFamily::LUMMA:              return ParseLumma(content, file_name, countries);
        case StealerFamily::EXELA_STEALER:      return ParseExela(content, file_name, countries);
        case StealerFamily::ASTRIS:             return ParseAstris(content, file_name, countries);
        case StealerFamily::ATOMIC_MAC:         return ParseAtomicMac(content, file_name, countries);
        case StealerFamily::CRYPTBOT:           return ParseCryptBot(content, file_name, countries);
        case StealerFamily::PREDATOR_THE_THIEF: return ParsePredator(content, file_name, countries);
        case StealerFamily::RACCOON:            return ParseRaccoon(content, file_name, countries);
        case StealerFamily::REDLINE_META:       return ParseRedLine(content, file_name, countries);
        case StealerFamily::RHADAMANTHYS:       return ParseRhadamanthys(content, file_name, countries);
        case StealerFamily::RISEPRO:            return ParseRisePro(content, file_name, countries);
        case StealerFamily::STEALC:             return ParseStealC(content, file_name, countries);
        case StealerFamily::STEALERIUM:         return ParseStealerium(content, file_name, countries);
        case StealerFamily::VIDAR:              return ParseVidar(content, file_name, countries);
        case StealerFamily::XFILES:             return ParseXFiles(content, file_name, countries);
        case StealerFamily::AILUROPHILE:        return ParseAilurophile(content, file_name, countries);
        case StealerFamily::ARECH_CLIENT_V2:    return ParseArechClient(content, file_name, countries);
        case StealerFamily::BANSHEE:            return ParseBanshee(content, file_name, countries);
        case StealerFamily::DARKCRYSTAL_RAT:    return ParseDarkCrystal(content, file_name, countries);
        case StealerFamily::MEDUZA:             return ParseMeduza(content, file_name, countries);
        case StealerFamily::NOXTY:              return ParseNoxty(content, file_name, countries);
        case StealerFamily::PHEMEDRONE:         return ParsePhemedrone(content, file_name, countries);
        case StealerFamily::RL_STEALER:         return ParseRLStealer(content, file_name, countries);
        case StealerFamily::SKALKA:             return ParseSkalka(content, file_name, countries);
        case StealerFamily::BLANK_GRABBER:      return ParseBlankGrabber(content, file_name, countries);
        case StealerFamily::GENERIC:            return ParseGeneric(content, file_name, countries);
    }
    return ParseGeneric(content, file_name, countries);
}

// ============================================================================
// FLAT LAYOUTS
// ============================================================================

ParsedSystemInfo FamilyAdapters::ParseLumma(const std::string& content, const std::string&,
                                            const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::OS, kStarts, {"os version:"}},
            {Field::IP_ADDRESS, kStarts, {"ip address:"}, T::IpAddress()},
            {Field::USERNAME, kStarts, {"user:", "username:"}, T::Username()},
            {Field::CPU, kStarts, {"cpu name:"}},
            {Field::RAM, kStarts, {"ram size:"}},
            {Field::COMPUTER_NAME, kStarts, {"computer:", "hostname:", "pc:"}},
            {Field::COUNTRY, kStarts, {"country:"}, T::CountryUnlessIP()},
            {Field::LOG_DATE, kStarts, {"local date:"}, T::RejectAllDigits()},
            {Field::LOG_DATE, kStarts, {"time:"}, T::DateText()},
            {Field::HWID, kStarts, {"hwid:"}},
            {Field::FILE_PATH, kStarts, {"path:"}},
        };
        // GPU and antivirus come as a header followed by indented items
        l.on_line = [](const ScanLine& line, AdapterContext& ctx) {
            return LabelScanner::HandleListHeader(line, ctx, Field::GPU, {"gpu:"},
                                                  ListStyle::INDENTED, ListJoin::FIRST) ||
                   LabelScanner::HandleListHeader(line, ctx, Field::ANTIVIRUS,
                                                  {"anti virus:", "antivirus:"},
                                                  ListStyle::INDENTED, ListJoin::COMMA);
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseAilurophile(const std::string& content, const std::string&,
                                                  const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::Then(Redacted(), T::IpAddress())},
            {Field::COUNTRY, kStarts, {"country:"}, T::Then(Redacted(), T::Country())},
            {Field::COMPUTER_NAME, kStarts, {"hostname:"}, Redacted()},
            {Field::OS, kHas, {"pc type:"}, Redacted()},
            {Field::FILE_PATH, kHas, {"file path:"}, Redacted()},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseBanshee(const std::string& content, const std::string&,
                                              const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::HWID, kStarts, {"hwid:"}},
            {Field::LOG_DATE, kHas, {"log date:"}, T::DateText()},
            {Field::COUNTRY, kHas, {"country code:"}, T::Country()},
            {Field::USERNAME, kStarts, {"user name:"},
             T::Then(T::Strip(R"(\s*\([^)]*\)\s*$)"), T::Username())},
            {Field::COMPUTER_NAME, kStarts, {"computer name:"}},
            {Field::OS, kHas, {"operation system:"}},
            {Field::CPU, kStarts, {"cpu:"}, T::Strip(R"(\s*,\s*\d+\.\d+\s*ghz$)")},
            {Field::RAM, kStarts, {"ram:"}},
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseCryptBot(const std::string& content, const std::string&,
                                               const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::OS, kStarts, {"os:"}},
            {Field::LOG_DATE, kHas, {"local date and time:", "local date:", "date and time:"},
             T::DateText()},
            {Field::USERNAME, kStarts, {"username:", "user name:"}, T::Username()},
            {Field::COMPUTER_NAME, kStarts, {"computername:", "computer name:"}},
            {Field::CPU, kStarts, {"cpu:"}, T::Strip(R"(\s*\[.*$)")},
            {Field::RAM, kStarts, {"ram:"}},
            {Field::GPU, kStarts, {"gpu:"}},
        };
        // "UserName (ComputerName): john (DESKTOP-1)"
        l.on_line = [](const ScanLine& line, AdapterContext& ctx) {
            static const std::regex pair(R"(^(.+?)\s*\((.+?)\))");
            
            if (!StringUtils::Contains(line.lower, "username") ||
                !StringUtils::Contains(line.lower, "computername") ||
                ctx.info.Has(Field::USERNAME) || ctx.info.Has(Field::COMPUTER_NAME)) {
                return false;
            }
            
            std::string value = LineGrammar::ExtractColonValue(line.normalized);
            std::smatch match;
            if (std::regex_search(value, match, pair)) {
                ctx.info.SetIfEmpty(Field::USERNAME, LineGrammar::ExtractUsername(match[1].str()));
                ctx.info.SetIfEmpty(Field::COMPUTER_NAME, StringUtils::Trim(match[2].str()));
            } else {
                ctx.info.SetIfEmpty(Field::USERNAME, LineGrammar::ExtractUsername(value));
            }
            return true;
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseDarkCrystal(const std::string& content, const std::string&,
                                                  const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::COMPUTER_NAME, kStarts, {"pc name:"}},
            {Field::USERNAME, kStarts, {"user name:"}, T::Username()},
            {Field::OS, kStarts, {"windows:"}},
            {Field::CPU, kStarts, {"cpu name:"}, T::Reject("unknown")},
            {Field::GPU, kStarts, {"gpu name:"}, T::Reject("unknown")},
            {Field::RAM, kStarts, {"ram:"}, T::Reject("unknown")},
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
            {Field::COUNTRY, kStarts, {"country:"},
             T::OrElse(T::Capture(R"(^([A-Z]{2}))"), T::Country())},
            {Field::LOG_DATE, kHas, {"save time:"}, T::DateText()},
            {Field::FILE_PATH, kStarts, {"path:"}},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseMeduza(const std::string& content, const std::string&,
                                             const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::HWID, kStarts, {"hwid:"}},
            {Field::LOG_DATE, kHas, {"log date:"}, T::DateText()},
            {Field::COUNTRY, kHas, {"country code:"}, T::Country()},
            {Field::USERNAME, kStarts, {"user name:"}, T::Username()},
            {Field::COMPUTER_NAME, kStarts, {"computer name:"}},
            {Field::OS, kHas, {"operation system:", "operating system:"}},
            {Field::CPU, kStarts, {"cpu:"}, T::Strip(R"(\s*,\s*\d+\s+cores?$)")},
            {Field::GPU, kStarts, {"gpu:"}},
            {Field::RAM, kStarts, {"ram:"}},
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
            {Field::FILE_PATH, kHas, {"execute path:"}},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseNoxty(const std::string& content, const std::string&,
                                            const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::USERNAME, kStarts, {"user:"}, T::Username()},
            {Field::OS, kHas, {"operating system:"}},
            {Field::FILE_PATH, kHas, {"process executable path:"}},
            {Field::CPU, kStarts, {"cpu:"}, T::Strip(R"(\s+\d+\.\d+\s*ghz$)")},
            {Field::RAM, kStarts, {"ram:"}},
            {Field::GPU, kStarts, {"gpu:"}, T::Strip(R"(\s*\([^)]*\)$)")},
            {Field::HWID, kHas, {"serial number:"}},
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
            {Field::COUNTRY, kStarts, {"country:"}, T::Country()},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParsePredator(const std::string& content, const std::string&,
                                               const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::USERNAME, kStarts, {"user name:"}, T::Username()},
            {Field::COMPUTER_NAME, kStarts, {"machine name:"}},
            {Field::OS, kHas, {"os version:"}},
            {Field::LOG_DATE, kHas, {"launch time:"}, T::DateText()},
            {Field::CPU, kHas, {"cpu info:"}},
            {Field::RAM, kHas, {"amount of ram:"}, T::Strip(R"(\s*\([^)]*\)$)")},
            {Field::GPU, kHas, {"gpu info:"}},
            {Field::FILE_PATH, kHas, {"startup folder:"}},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseRhadamanthys(const std::string& content, const std::string&,
                                                   const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::LOG_DATE, kHas, {"install date:"}, T::DateText()},
            {Field::HWID, kStarts, {"hwid:"}, Redacted()},
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::Then(Redacted(), T::IpAddress())},
            {Field::COUNTRY, kStarts, {"country:"}, T::Then(Redacted(), T::Country())},
            {Field::CPU, kStarts, {"processor:"}, Redacted()},
            {Field::RAM, kHas, {"installed ram:"}, Redacted()},
            {Field::OS, kStarts, {"os:"}, Redacted()},
            {Field::GPU, kHas, {"video card:"}, Redacted()},
            {Field::COMPUTER_NAME, kStarts, {"computer name:"}, Redacted()},
            {Field::USERNAME, kStarts, {"user name:"}, T::Then(Redacted(), T::Username())},
            {Field::HWID, kHas, {"machineid:"}, Redacted()},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseRLStealer(const std::string& content, const std::string&,
                                                const CountryResolver& countries) {
    // Labels are padded ("Operating System : ..."), so no colon in the patterns
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::OS, kHas, {"operating system"}},
            {Field::USERNAME, kHas, {"pc user"},
             T::OrElse(T::Then(T::Capture(R"(/(.+)$)"), T::Username()), T::Username())},
            {Field::FILE_PATH, kHas, {"launch"}},
            {Field::LOG_DATE, kHas, {"current time"}, T::DateText()},
            {Field::HWID, kHas, {"hwid"}},
            {Field::CPU, kStarts, {"cpu"}},
            {Field::RAM, kStarts, {"ram"}},
            {Field::GPU, kStarts, {"gpu"}},
            {Field::IP_ADDRESS, kHas, {"ip geolocation"}, T::Capture(R"(^([\d.]+))")},
            {Field::LOG_DATE, kHas, {"log date"}, T::DateText()},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseSkalka(const std::string& content, const std::string&,
                                             const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::OS, kHas, {"operation system:"}, T::Rewrite(R"(^win(\d+))", "Windows $1")},
            {Field::FILE_PATH, kHas, {"current jarfile path:"}, T::Rewrite("/", "\\")},
            {Field::USERNAME, kStarts, {"username:"}, T::Username()},
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
            {Field::LOG_DATE, kStarts, {"timezone:"}, T::Capture(R"(^([\d\-T:.]+))")},
            {Field::COUNTRY, kHas, {"language & country:", "language and country:"},
             T::OrElse(T::Capture(R"(_([A-Z]{2})$)"), T::Country())},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseXFiles(const std::string& content, const std::string&,
                                             const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        AdapterLayout l;
        l.rules = {
            {Field::IP_ADDRESS, kStarts, {"ip:"}, T::IpAddress()},
            {Field::COUNTRY, kStarts, {"country:"}, T::Country()},
            {Field::OS, kHas, {"operating system:"}},
            {Field::USERNAME, kStarts, {"username:"}, T::Username()},
            {Field::COMPUTER_NAME, kStarts, {"computer name:"}},
            {Field::HWID, kHas, {"hardware id:"}},
            {Field::CPU, kHasAll, {"cpu", "processor"}},
            {Field::GPU, kHasAll, {"gpu", "display devices"}},
            {Field::RAM, kHasAll, {"ram", "memory"}},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

// ============================================================================
// SYSTEMINFO LAYOUTS
// ============================================================================

ParsedSystemInfo FamilyAdapters::ParseBlankGrabber(const std::string& content, const std::string&,
                                                   const CountryResolver& countries) {
    static const AdapterLayout layout = SystemInfoCommandLayout({});
    return LabelScanner::Scan(content, layout, countries);
}

ParsedSystemInfo FamilyAdapters::ParseExela(const std::string& content, const std::string&,
                                            const CountryResolver& countries) {
    // Exela prepends its own banner block to the systeminfo dump
    static const AdapterLayout layout = SystemInfoCommandLayout({
        {Field::IP_ADDRESS, kStarts, {"ip:", "ip address:"}, T::IpAddress()},
        {Field::COUNTRY, kStarts, {"country:"}, T::CountryUnlessIP()},
        {Field::USERNAME, kStarts, {"user name:", "username:"}, T::Username()},
        {Field::HWID, kStarts, {"hwid:"}},
        {Field::LOG_DATE, kStarts, {"log date:"}, T::DateText()},
    });
    return LabelScanner::Scan(content, layout, countries);
}

} // namespace parsers
} // namespace stealerlog
