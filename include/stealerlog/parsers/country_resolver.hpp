/**
 * @file country_resolver.hpp
 * @brief Free-text country to ISO 3166-1 alpha-2 code
 * 
 * Adapters receive the resolver as a dependency, so callers can plug in
 * their own lookup (for example one backed by a geo database) without
 * touching the parsing code.
 * 
 * @date 2025
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace stealerlog {
namespace parsers {

/**
 * @class CountryResolver
 * @brief Abstract country lookup
 */
class CountryResolver {
public:
    virtual ~CountryResolver() = default;
    
    /**
     * @brief Resolve free text to a two-letter code
     * @param country Country text ("Germany", "US", "Moscow, RU", "en_GB")
     * @return Uppercase alpha-2 code, or std::nullopt
     */
    virtual std::optional<std::string> ResolveCode(const std::string& country) const = 0;
};

/**
 * @class IsoCountryResolver
 * @brief Table-driven resolver over the ISO 3166-1 list
 * 
 * **Lookup order**:
 * 1. Bare two-letter code ("DE")
 * 2. Code in parentheses ("Germany (DE)")
 * 3. Leading code followed by ',', '/' or a space ("DE, Berlin")
 * 4. Locale suffix ("de_DE")
 * 5. Country name or common variation ("Deutschland", "USA"), any case
 */
class IsoCountryResolver : public CountryResolver {
public:
    IsoCountryResolver();
    
    std::optional<std::string> ResolveCode(const std::string& country) const override;
    
    /**
     * @brief Check whether a code is an assigned alpha-2 code
     */
    bool IsValidCode(const std::string& code) const;
    
    /**
     * @brief English name for a code
     */
    std::optional<std::string> NameForCode(const std::string& code) const;
    
    /**
     * @brief Process-wide shared instance
     */
    static const IsoCountryResolver& Default();
    
private:
    std::map<std::string, std::string> code_to_name_;   ///< "DE" -> "Germany"
    std::map<std::string, std::string> name_to_code_;   ///< lowercase names and variations
};

/**
 * @brief Code for a country value, or the value itself when unresolvable
 */
std::string ExtractCountryCode(const std::string& value, const CountryResolver& resolver);

} // namespace parsers
} // namespace stealerlog
