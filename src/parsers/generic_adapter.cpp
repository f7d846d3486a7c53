/**
 * @file generic_adapter.cpp
 * @brief Fallback adapter for logs no signature recognized
 * 
 * Broad label synonyms per field. Values land first-write-wins like every
 * other adapter, so the earliest plausible line for a field decides it.
 * 
 * @date 2025
 */

#include "stealerlog/parsers/family_adapters.hpp"
#include "stealerlog/parsers/label_scanner.hpp"
#include "stealerlog/parsers/line_grammar.hpp"

#include <regex>

namespace stealerlog {
namespace parsers {

using T = ValueTransforms;

namespace {

const MatchMode kStarts = MatchMode::STARTS_WITH;
const MatchMode kHas = MatchMode::CONTAINS;

/**
 * Country values: a code in "(DE)" or "[DE]" wins; IP addresses that
 * ended up in the country field are dropped; anything else is resolved.
 */
ValueTransform GenericCountry() {
    return [](const std::string& value, const CountryResolver& countries) -> std::optional<std::string> {
        static const std::regex embedded_code(R"(\(([A-Z]{2})\)|\[([A-Z]{2,})\])");
        
        std::smatch match;
        if (std::regex_search(value, match, embedded_code)) {
            return match[1].matched ? match[1].str() : match[2].str();
        }
        if (LineGrammar::IsValidIP(value)) {
            return std::nullopt;
        }
        return ExtractCountryCode(value, countries);
    };
}

} // anonymous namespace

ParsedSystemInfo FamilyAdapters::ParseGeneric(const std::string& content, const std::string&,
                                              const CountryResolver& countries) {
    static const AdapterLayout layout = [] {
        const ValueTransform no_unknown = T::Reject("unknown");
        
        AdapterLayout l;
        l.ini_sections = true;
        l.separator_sections = true;
        l.rules = {
            // OS: name and version parts are combined at the end when no
            // single-line OS value was found
            {Field::OS, kHas, {"os name:", "productname:"}, no_unknown, "", Slot::OS_NAME},
            {Field::OS, kHas, {"windows name:"}, no_unknown, "hardware", Slot::OS_NAME},
            {Field::OS, kHas, {"os version:", "productversion:"}, nullptr, "", Slot::OS_VERSION},
            {Field::OS, kHas, {"os:", "operation system:", "operating system:", "system:",
                               "windows:", "pc type:"}, no_unknown},
            
            {Field::IP_ADDRESS, kStarts, {"ip:", "ip address:", "ip info:", "public ip address:",
                                          "external ip:", "private ip address:", "internal ip:",
                                          "ip geolocation"},
             T::OrElse(T::Capture(R"(^([\d.]+))"), T::IpAddress())},
            
            {Field::USERNAME, kHas, {"user:", "user name:", "username:", "pc user:",
                                     "registered owner:"}, T::Username()},
            
            {Field::CPU, kHas, {"cpu:", "cpu (processor):", "cpu info:", "cpu name:",
                                "processor:", "processor(s):"}},
            
            {Field::RAM, kHas, {"ram:", "ram (memory):", "ram size:", "amount of ram:",
                                "installed ram:", "total physical memory:", "memory:"}},
            
            {Field::COMPUTER_NAME, kHas, {"computer:", "computer name:", "compname:", "host name:",
                                          "hostname:", "machine name:", "netbios:", "pc:",
                                          "pc name:"}},
            
            {Field::GPU, kHas, {"gpu:", "gpu (display devices):", "gpu info:", "gpu name:",
                                "display devices:", "video card:", "videocard:",
                                "chipset model:"}},
            
            {Field::COUNTRY, kHas, {"country:", "country code:"}, GenericCountry()},
            {Field::COUNTRY, kHas, {"location:"}, GenericCountry(), "geolocation"},
            
            {Field::LOG_DATE, kHas, {"date:", "local date:", "current time:", "log date:",
                                     "save time:", "time:"}, T::DateText()},
            
            {Field::HWID, kHas, {"hwid:", "hardware id:", "hardware uuid:", "machineid:",
                                 "bot_id:", "user id:", "serial number:"},
             T::Then(no_unknown, T::Reject("[redacted]"))},
            
            {Field::FILE_PATH, kHas, {"file location:", "path:", "execute path:", "running path:",
                                      "current jarfile path:", "process executable path:",
                                      "startup folder:", "launch:", "work dir:", "file path:"}},
            
            {Field::ANTIVIRUS, kHas, {"av:", "anti virus:", "anti-viruses:", "antivirus:",
                                      "antivirus products:"}},
        };
        return l;
    }();
    return LabelScanner::Scan(content, layout, countries);
}

} // namespace parsers
} // namespace stealerlog
