/**
 * @file country_resolver.cpp
 * @brief ISO 3166-1 alpha-2 table and free-text country resolution
 * 
 * @date 2025
 */

#include "stealerlog/parsers/country_resolver.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <cctype>
#include <regex>

namespace stealerlog {
namespace parsers {

using utils::StringUtils;

namespace {

struct CountryEntry {
    const char* code;
    const char* name;
};

// ISO 3166-1 alpha-2, English short names
const CountryEntry kCountries[] = {
    {"AD", "Andorra"}, {"AE", "United Arab Emirates"}, {"AF", "Afghanistan"},
    {"AG", "Antigua and Barbuda"}, {"AI", "Anguilla"}, {"AL", "Albania"},
    {"AM", "Armenia"}, {"AO", "Angola"}, {"AQ", "Antarctica"},
    {"AR", "Argentina"}, {"AS", "American Samoa"}, {"AT", "Austria"},
    {"AU", "Australia"}, {"AW", "Aruba"}, {"AX", "Aland Islands"},
    {"AZ", "Azerbaijan"}, {"BA", "Bosnia and Herzegovina"}, {"BB", "Barbados"},
    {"BD", "Bangladesh"}, {"BE", "Belgium"}, {"BF", "Burkina Faso"},
    {"BG", "Bulgaria"}, {"BH", "Bahrain"}, {"BI", "Burundi"},
    {"BJ", "Benin"}, {"BL", "Saint Barthelemy"}, {"BM", "Bermuda"},
    {"BN", "Brunei Darussalam"}, {"BO", "Bolivia"}, {"BQ", "Bonaire, Sint Eustatius and Saba"},
    {"BR", "Brazil"}, {"BS", "Bahamas"}, {"BT", "Bhutan"},
    {"BV", "Bouvet Island"}, {"BW", "Botswana"}, {"BY", "Belarus"},
    {"BZ", "Belize"}, {"CA", "Canada"}, {"CC", "Cocos (Keeling) Islands"},
    {"CD", "Democratic Republic of the Congo"}, {"CF", "Central African Republic"}, {"CG", "Republic of the Congo"},
    {"CH", "Switzerland"}, {"CI", "Cote d'Ivoire"}, {"CK", "Cook Islands"},
    {"CL", "Chile"}, {"CM", "Cameroon"}, {"CN", "China"},
    {"CO", "Colombia"}, {"CR", "Costa Rica"}, {"CU", "Cuba"},
    {"CV", "Cabo Verde"}, {"CW", "Curacao"}, {"CX", "Christmas Island"},
    {"CY", "Cyprus"}, {"CZ", "Czechia"}, {"DE", "Germany"},
    {"DJ", "Djibouti"}, {"DK", "Denmark"}, {"DM", "Dominica"},
    {"DO", "Dominican Republic"}, {"DZ", "Algeria"}, {"EC", "Ecuador"},
    {"EE", "Estonia"}, {"EG", "Egypt"}, {"EH", "Western Sahara"},
    {"ER", "Eritrea"}, {"ES", "Spain"}, {"ET", "Ethiopia"},
    {"FI", "Finland"}, {"FJ", "Fiji"}, {"FK", "Falkland Islands"},
    {"FM", "Micronesia"}, {"FO", "Faroe Islands"}, {"FR", "France"},
    {"GA", "Gabon"}, {"GB", "United Kingdom"}, {"GD", "Grenada"},
    {"GE", "Georgia"}, {"GF", "French Guiana"}, {"GG", "Guernsey"},
    {"GH", "Ghana"}, {"GI", "Gibraltar"}, {"GL", "Greenland"},
    {"GM", "Gambia"}, {"GN", "Guinea"}, {"GP", "Guadeloupe"},
    {"GQ", "Equatorial Guinea"}, {"GR", "Greece"}, {"GS", "South Georgia and the South Sandwich Islands"},
    {"GT", "Guatemala"}, {"GU", "Guam"}, {"GW", "Guinea-Bissau"},
    {"GY", "Guyana"}, {"HK", "Hong Kong"}, {"HM", "Heard Island and McDonald Islands"},
    {"HN", "Honduras"}, {"HR", "Croatia"}, {"HT", "Haiti"},
    {"HU", "Hungary"}, {"ID", "Indonesia"}, {"IE", "Ireland"},
    {"IL", "Israel"}, {"IM", "Isle of Man"}, {"IN", "India"},
    {"IO", "British Indian Ocean Territory"}, {"IQ", "Iraq"}, {"IR", "Iran"},
    {"IS", "Iceland"}, {"IT", "Italy"}, {"JE", "Jersey"},
    {"JM", "Jamaica"}, {"JO", "Jordan"}, {"JP", "Japan"},
    {"KE", "Kenya"}, {"KG", "Kyrgyzstan"}, {"KH", "Cambodia"},
    {"KI", "Kiribati"}, {"KM", "Comoros"}, {"KN", "Saint Kitts and Nevis"},
    {"KP", "North Korea"}, {"KR", "South Korea"}, {"KW", "Kuwait"},
    {"KY", "Cayman Islands"}, {"KZ", "Kazakhstan"}, {"LA", "Laos"},
    {"LB", "Lebanon"}, {"LC", "Saint Lucia"}, {"LI", "Liechtenstein"},
    {"LK", "Sri Lanka"}, {"LR", "Liberia"}, {"LS", "Lesotho"},
    {"LT", "Lithuania"}, {"LU", "Luxembourg"}, {"LV", "Latvia"},
    {"LY", "Libya"}, {"MA", "Morocco"}, {"MC", "Monaco"},
    {"MD", "Moldova"}, {"ME", "Montenegro"}, {"MF", "Saint Martin"},
    {"MG", "Madagascar"}, {"MH", "Marshall Islands"}, {"MK", "North Macedonia"},
    {"ML", "Mali"}, {"MM", "Myanmar"}, {"MN", "Mongolia"},
    {"MO", "Macao"}, {"MP", "Northern Mariana Islands"}, {"MQ", "Martinique"},
    {"MR", "Mauritania"}, {"MS", "Montserrat"}, {"MT", "Malta"},
    {"MU", "Mauritius"}, {"MV", "Maldives"}, {"MW", "Malawi"},
    {"MX", "Mexico"}, {"MY", "Malaysia"}, {"MZ", "Mozambique"},
    {"NA", "Namibia"}, {"NC", "New Caledonia"}, {"NE", "Niger"},
    {"NF", "Norfolk Island"}, {"NG", "Nigeria"}, {"NI", "Nicaragua"},
    {"NL", "Netherlands"}, {"NO", "Norway"}, {"NP", "Nepal"},
    {"NR", "Nauru"}, {"NU", "Niue"}, {"NZ", "New Zealand"},
    {"OM", "Oman"}, {"PA", "Panama"}, {"PE", "Peru"},
    {"PF", "French Polynesia"}, {"PG", "Papua New Guinea"}, {"PH", "Philippines"},
    {"PK", "Pakistan"}, {"PL", "Poland"}, {"PM", "Saint Pierre and Miquelon"},
    {"PN", "Pitcairn"}, {"PR", "Puerto Rico"}, {"PS", "Palestine"},
    {"PT", "Portugal"}, {"PW", "Palau"}, {"PY", "Paraguay"},
    {"QA", "Qatar"}, {"RE", "Reunion"}, {"RO", "Romania"},
    {"RS", "Serbia"}, {"RU", "Russia"}, {"RW", "Rwanda"},
    {"SA", "Saudi Arabia"}, {"SB", "Solomon Islands"}, {"SC", "Seychelles"},
    {"SD", "Sudan"}, {"SE", "Sweden"}, {"SG", "Singapore"},
    {"SH", "Saint Helena"}, {"SI", "Slovenia"}, {"SJ", "Svalbard and Jan Mayen"},
    {"SK", "Slovakia"}, {"SL", "Sierra Leone"}, {"SM", "San Marino"},
    {"SN", "Senegal"}, {"SO", "Somalia"}, {"SR", "Suriname"},
    {"SS", "South Sudan"}, {"ST", "Sao Tome and Principe"}, {"SV", "El Salvador"},
    {"SX", "Sint Maarten"}, {"SY", "Syria"}, {"SZ", "Eswatini"},
    {"TC", "Turks and Caicos Islands"}, {"TD", "Chad"}, {"TF", "French Southern Territories"},
    {"TG", "Togo"}, {"TH", "Thailand"}, {"TJ", "Tajikistan"},
    {"TK", "Tokelau"}, {"TL", "Timor-Leste"}, {"TM", "Turkmenistan"},
    {"TN", "Tunisia"}, {"TO", "Tonga"}, {"TR", "Turkey"},
    {"TT", "Trinidad and Tobago"}, {"TV", "Tuvalu"}, {"TW", "Taiwan"},
    {"TZ", "Tanzania"}, {"UA", "Ukraine"}, {"UG", "Uganda"},
    {"UM", "United States Minor Outlying Islands"}, {"US", "United States"}, {"UY", "Uruguay"},
    {"UZ", "Uzbekistan"}, {"VA", "Holy See"}, {"VC", "Saint Vincent and the Grenadines"},
    {"VE", "Venezuela"}, {"VG", "British Virgin Islands"}, {"VI", "U.S. Virgin Islands"},
    {"VN", "Vietnam"}, {"VU", "Vanuatu"}, {"WF", "Wallis and Futuna"},
    {"WS", "Samoa"}, {"XK", "Kosovo"}, {"YE", "Yemen"},
    {"YT", "Mayotte"}, {"ZA", "South Africa"}, {"ZM", "Zambia"},
    {"ZW", "Zimbabwe"}
};

// Alternate names and spellings seen in stealer logs
const CountryEntry kVariations[] = {
    {"US", "usa"}, {"US", "u.s.a"}, {"US", "u.s.a."}, {"US", "u.s."}, {"US", "america"},
    {"US", "united states of america"},
    {"GB", "uk"}, {"GB", "u.k."}, {"GB", "great britain"}, {"GB", "britain"},
    {"GB", "england"}, {"GB", "scotland"}, {"GB", "wales"}, {"GB", "northern ireland"},
    {"AE", "uae"}, {"AE", "u.a.e"}, {"AE", "dubai"}, {"AE", "emirates"},
    {"RU", "russian federation"}, {"RU", "rossiya"},
    {"CN", "prc"}, {"CN", "people's republic of china"}, {"CN", "mainland china"},
    {"KR", "korea"}, {"KR", "republic of korea"}, {"KR", "korea, republic of"},
    {"KP", "dprk"}, {"KP", "korea, democratic people's republic of"},
    {"DE", "deutschland"},
    {"NL", "holland"}, {"NL", "the netherlands"},
    {"SA", "ksa"},
    {"ZA", "rsa"},
    {"BR", "brasil"},
    {"MM", "burma"},
    {"CI", "ivory coast"}, {"CI", "cote divoire"},
    {"ES", "espana"},
    {"IT", "italia"},
    {"TR", "turkiye"}, {"TR", "t\xC3\xBCrkiye"},
    {"IR", "islamic republic of iran"}, {"IR", "iran, islamic republic of"},
    {"SY", "syrian arab republic"},
    {"VN", "viet nam"},
    {"TW", "republic of china"}, {"TW", "taiwan, province of china"},
    {"BO", "plurinational state of bolivia"},
    {"VE", "bolivarian republic of venezuela"},
    {"TZ", "united republic of tanzania"},
    {"MD", "republic of moldova"},
    {"LA", "lao people's democratic republic"}, {"LA", "lao pdr"},
    {"CZ", "czech republic"},
    {"MK", "macedonia"},
    {"SZ", "swaziland"},
    {"CV", "cape verde"},
    {"CD", "dr congo"}, {"CD", "drc"}, {"CD", "congo (kinshasa)"},
    {"CG", "congo"}, {"CG", "congo (brazzaville)"},
    {"PS", "palestinian territories"},
    {"VA", "vatican"}, {"VA", "vatican city"},
    {"BN", "brunei"},
    {"FM", "federated states of micronesia"},
    {"TL", "east timor"},
    {"MO", "macau"},
    {"UA", "ukraina"}
};

bool IsTwoUpper(const std::string& s) {
    return s.size() == 2 && std::isupper(static_cast<unsigned char>(s[0])) &&
           std::isupper(static_cast<unsigned char>(s[1]));
}

} // anonymous namespace

IsoCountryResolver::IsoCountryResolver() {
    for (const auto& entry : kCountries) {
        code_to_name_.emplace(entry.code, entry.name);
        name_to_code_.emplace(StringUtils::ToLower(entry.name), entry.code);
    }
    for (const auto& entry : kVariations) {
        name_to_code_.emplace(entry.name, entry.code);
    }
}

const IsoCountryResolver& IsoCountryResolver::Default() {
    static const IsoCountryResolver resolver;
    return resolver;
}

bool IsoCountryResolver::IsValidCode(const std::string& code) const {
    return code_to_name_.count(code) > 0;
}

std::optional<std::string> IsoCountryResolver::NameForCode(const std::string& code) const {
    auto it = code_to_name_.find(StringUtils::ToUpper(code));
    if (it == code_to_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> IsoCountryResolver::ResolveCode(const std::string& country) const {
    static const std::regex parenthesized(R"(\(([A-Z]{2})\))");
    static const std::regex leading(R"(^([A-Z]{2})[,/\s])");
    static const std::regex locale_suffix(R"(_([A-Z]{2})$)");
    
    std::string value = StringUtils::Trim(country);
    if (value.empty()) {
        return std::nullopt;
    }
    
    if (IsTwoUpper(value) && IsValidCode(value)) {
        return value;
    }
    
    std::smatch match;
    for (const auto* pattern : {&parenthesized, &leading, &locale_suffix}) {
        if (std::regex_search(value, match, *pattern) && IsValidCode(match[1].str())) {
            return match[1].str();
        }
    }
    
    auto it = name_to_code_.find(StringUtils::ToLower(value));
    if (it != name_to_code_.end()) {
        return it->second;
    }
    
    return std::nullopt;
}

std::string ExtractCountryCode(const std::string& value, const CountryResolver& resolver) {
    auto code = resolver.ResolveCode(value);
    return code ? *code : value;
}

} // namespace parsers
} // namespace stealerlog
