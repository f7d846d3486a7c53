/**
 * @file credential_extractor.hpp
 * @brief Credential block grammar for browser password dumps
 * 
 * Password dump files list one credential per block:
 * 
 * @code
 * URL: https://accounts.example.com/login
 * Username: alice
 * Password: hunter2
 * Application: Google_[Chrome]_Default
 * ===============
 * @endcode
 * 
 * Blocks end at separator lines (blank, dashed, or branded banners) or
 * implicitly when a second URL label shows up in the same block.
 * 
 * @date 2025
 */

#pragma once

#include "stealerlog/parsers/credential_record.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stealerlog {
namespace parsers {

/**
 * @struct UrlInfo
 * @brief Domain and TLD of a credential URL
 */
struct UrlInfo {
    std::optional<std::string> domain;
    std::optional<std::string> tld;
};

/**
 * @struct ParsedUrl
 * @brief URL decomposition for domain reconnaissance
 */
struct ParsedUrl {
    std::optional<std::string> protocol;    ///< "http" or "https"
    std::string full_hostname;              ///< Lowercase host without www.
    std::optional<std::string> subdomain;   ///< Host labels left of base_domain
    std::string domain;                     ///< Same as base_domain
    std::string base_domain;                ///< domain.tld, or the IP literal
    std::optional<std::string> tld;
    std::optional<int> port;
    std::string path{"/"};                  ///< Without query or fragment
    std::optional<std::string> query;
    std::optional<std::string> fragment;
};

/**
 * @struct CredentialFileSummary
 * @brief Pre-analysis of a password dump
 */
struct CredentialFileSummary {
    std::size_t credential_count{0};               ///< Non-empty password lines
    std::size_t url_count{0};                      ///< Non-empty URL lines
    std::size_t domain_count{0};                   ///< URL lines with a named host
    std::map<std::string, std::size_t> password_counts;
    std::vector<CredentialRecord> credentials;
};

/**
 * @class CredentialExtractor
 * @brief Splits password dumps into credential records
 * 
 * Invalid blocks (no URL, or missing username or password line) are
 * dropped silently.
 */
class CredentialExtractor {
public:
    struct Config {
        std::size_t max_username_length{500};  ///< Storage column limit
        bool log_password_info{false};         ///< Debug log per stored password
    };
    
    explicit CredentialExtractor(const Config& config);
    CredentialExtractor() : CredentialExtractor(Config{}) {}
    
    /**
     * @brief Extract credential records
     * 
     * @param content Password file text
     * @param file_path Source path recorded on each record (may be empty)
     * @return Valid records in file order
     */
    std::vector<CredentialRecord> Extract(const std::string& content,
                                          const std::string& file_path = "") const;
    
    /**
     * @brief Count passwords, URLs and domains, then extract records
     */
    CredentialFileSummary Analyze(const std::string& content,
                                  const std::string& file_path = "") const;
    
    /**
     * @brief Convert records to their stored form
     * 
     * Escapes passwords, truncates long usernames and defaults the browser.
     */
    std::vector<StoredCredential> PrepareForStorage(const std::vector<CredentialRecord>& records) const;
    
    /**
     * @brief Separator check using the credential label guard
     */
    static bool IsSeparatorLine(const std::string& line);
    
    /**
     * @brief Derive domain and TLD from a URL
     * 
     * "https://v1.api.example.com:8080/path" gives example.com / com.
     * IPv4 hosts give the address as domain and no TLD.
     */
    static UrlInfo ExtractUrlInfo(const std::string& url);
    
    /**
     * @brief Full URL decomposition
     */
    static ParsedUrl ParseUrl(const std::string& url);
    
    /**
     * @brief Check for well-known password dump file names
     */
    static bool IsPasswordFileName(const std::string& file_name);
    
private:
    Config config_;
};

} // namespace parsers
} // namespace stealerlog
