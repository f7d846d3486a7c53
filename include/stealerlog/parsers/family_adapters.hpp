/**
 * @file family_adapters.hpp
 * @brief Per-family system information adapters
 * 
 * One adapter per stealer family, each a pure function of the file text.
 * Adapters are thin: they declare their family's label layout and let
 * LabelScanner do the work. Parse() dispatches over the closed
 * StealerFamily enum, so adding a family without an adapter is a compile
 * warning rather than a silent fallback.
 * 
 * @date 2025
 */

#pragma once

#include "stealerlog/parsers/country_resolver.hpp"
#include "stealerlog/parsers/system_info.hpp"

#include <string>

namespace stealerlog {
namespace parsers {

/**
 * @class FamilyAdapters
 * @brief Static adapter functions, one per family
 * 
 * Every adapter has the signature
 * `(content, file_name, countries) -> ParsedSystemInfo` and leaves
 * `stealer_type`, `log_date` and `log_time` to the dispatcher. The raw log
 * date text goes to Field::LOG_DATE.
 */
class FamilyAdapters {
public:
    /**
     * @brief Run the adapter for a family
     */
    static ParsedSystemInfo Parse(StealerFamily family,
                                  const std::string& content,
                                  const std::string& file_name,
                                  const CountryResolver& countries);
    
    /***************************************************************************
     * Flat label layouts
     ***************************************************************************/
    
    static ParsedSystemInfo ParseLumma(const std::string& content, const std::string& file_name,
                                       const CountryResolver& countries);
    static ParsedSystemInfo ParseAilurophile(const std::string& content, const std::string& file_name,
                                             const CountryResolver& countries);
    static ParsedSystemInfo ParseBanshee(const std::string& content, const std::string& file_name,
                                         const CountryResolver& countries);
    static ParsedSystemInfo ParseCryptBot(const std::string& content, const std::string& file_name,
                                          const CountryResolver& countries);
    static ParsedSystemInfo ParseDarkCrystal(const std::string& content, const std::string& file_name,
                                             const CountryResolver& countries);
    static ParsedSystemInfo ParseMeduza(const std::string& content, const std::string& file_name,
                                        const CountryResolver& countries);
    static ParsedSystemInfo ParseNoxty(const std::string& content, const std::string& file_name,
                                       const CountryResolver& countries);
    static ParsedSystemInfo ParsePredator(const std::string& content, const std::string& file_name,
                                          const CountryResolver& countries);
    static ParsedSystemInfo ParseRhadamanthys(const std::string& content, const std::string& file_name,
                                              const CountryResolver& countries);
    static ParsedSystemInfo ParseRLStealer(const std::string& content, const std::string& file_name,
                                           const CountryResolver& countries);
    static ParsedSystemInfo ParseSkalka(const std::string& content, const std::string& file_name,
                                        const CountryResolver& countries);
    static ParsedSystemInfo ParseXFiles(const std::string& content, const std::string& file_name,
                                        const CountryResolver& countries);
    
    /***************************************************************************
     * Windows systeminfo layouts ("Host Name:", "[01]: ..." continuations)
     ***************************************************************************/
    
    static ParsedSystemInfo ParseBlankGrabber(const std::string& content, const std::string& file_name,
                                              const CountryResolver& countries);
    static ParsedSystemInfo ParseExela(const std::string& content, const std::string& file_name,
                                       const CountryResolver& countries);
    
    /***************************************************************************
     * Sectioned layouts
     ***************************************************************************/
    
    static ParsedSystemInfo ParseAstris(const std::string& content, const std::string& file_name,
                                        const CountryResolver& countries);
    static ParsedSystemInfo ParseAtomicMac(const std::string& content, const std::string& file_name,
                                           const CountryResolver& countries);
    static ParsedSystemInfo ParsePhemedrone(const std::string& content, const std::string& file_name,
                                            const CountryResolver& countries);
    static ParsedSystemInfo ParseRaccoon(const std::string& content, const std::string& file_name,
                                         const CountryResolver& countries);
    static ParsedSystemInfo ParseRisePro(const std::string& content, const std::string& file_name,
                                         const CountryResolver& countries);
    static ParsedSystemInfo ParseStealC(const std::string& content, const std::string& file_name,
                                        const CountryResolver& countries);
    static ParsedSystemInfo ParseStealerium(const std::string& content, const std::string& file_name,
                                            const CountryResolver& countries);
    static ParsedSystemInfo ParseVidar(const std::string& content, const std::string& file_name,
                                       const CountryResolver& countries);
    
    /***************************************************************************
     * RedLine-style layouts ("Hardwares:" name blocks, antivirus lists)
     ***************************************************************************/
    
    static ParsedSystemInfo ParseRedLine(const std::string& content, const std::string& file_name,
                                         const CountryResolver& countries);
    static ParsedSystemInfo ParseArechClient(const std::string& content, const std::string& file_name,
                                             const CountryResolver& countries);
    
    /***************************************************************************
     * Fallback
     ***************************************************************************/
    
    /**
     * @brief Best-effort adapter with broad label synonyms
     * 
     * Accepts "[Section]" and "--- Section ---" markers, combines OS name
     * and version lines, and never assigns an IP address to the country
     * field.
     */
    static ParsedSystemInfo ParseGeneric(const std::string& content, const std::string& file_name,
                                         const CountryResolver& countries);
};

} // namespace parsers
} // namespace stealerlog
