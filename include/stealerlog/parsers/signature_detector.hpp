/**
 * @file signature_detector.hpp
 * @brief Stealer family detection from log text
 * 
 * Classifies a system information file by textual fingerprints: literal
 * phrases, label combinations and file name hints unique to a family.
 * Fingerprints overlap, so rules are evaluated in a fixed priority order
 * with specific fingerprints ahead of broad ones; the first match wins.
 * 
 * @date 2025
 */

#pragma once

#include "stealerlog/parsers/system_info.hpp"

#include <functional>
#include <string>
#include <vector>

namespace stealerlog {
namespace parsers {

/**
 * @struct SignatureRule
 * @brief One family fingerprint
 */
struct SignatureRule {
    StealerFamily family;       ///< Family reported on match
    std::string description;    ///< Fingerprint summary for debug logs
    std::function<bool(const std::string& lower_content,
                       const std::string& lower_file_name)> matches;
};

/**
 * @class SignatureDetector
 * @brief Ordered fingerprint matcher
 * 
 * **Usage**:
 * @code
 * SignatureDetector detector;
 * auto family = detector.Detect(content, "UserInformation.txt");
 * spdlog::info("Detected {}", ToString(family));
 * @endcode
 */
class SignatureDetector {
public:
    SignatureDetector();
    
    /**
     * @brief Classify a file
     * 
     * Binary-looking content is always Generic.
     * 
     * @param content File text
     * @param file_name File name (secondary hint)
     * @return Detected family, GENERIC if no rule matched
     */
    StealerFamily Detect(const std::string& content, const std::string& file_name) const;
    
    /**
     * @brief Rules in evaluation order
     */
    const std::vector<SignatureRule>& GetRules() const { return rules_; }
    
private:
    std::vector<SignatureRule> rules_;
};

} // namespace parsers
} // namespace stealerlog
