/**
 * @file credential_escaper.hpp
 * @brief Reversible escaping for credential values
 * 
 * Passwords are stored with backslash, quotes, line breaks, tabs and NUL
 * replaced by two-character escape sequences. Escape handles backslash
 * first so existing sequences in the input are never mistaken for escapes.
 * Unescape decodes in one left-to-right pass, which makes
 * Unescape(Escape(s)) == s hold for every string.
 * 
 * @date 2025
 */

#pragma once

#include "stealerlog/parsers/credential_record.hpp"

#include <cstddef>
#include <string>

namespace stealerlog {
namespace parsers {

/**
 * @class CredentialEscaper
 * @brief Static escaping and persistence helpers
 */
class CredentialEscaper {
public:
    /// Column limit for usernames in persistent storage
    static constexpr std::size_t kMaxUsernameLength = 500;
    
    /**
     * @brief Escape special characters
     * 
     * @param password Raw value
     * @return Escaped value (empty input stays empty)
     */
    static std::string Escape(const std::string& password);
    
    /**
     * @brief Decode escape sequences
     * 
     * Backslashes not followed by a known escape character are kept.
     */
    static std::string Unescape(const std::string& escaped);
    
    /**
     * @brief Bound a username to max_length characters
     * 
     * Characters are UTF-8 code points. A warning with a short preview is
     * logged when truncation happens.
     * 
     * @param username Raw username
     * @param max_length Character limit
     * @param context Optional location shown in the warning (url, file)
     */
    static UsernameTruncation TruncateUsername(const std::string& username,
                                               std::size_t max_length = kMaxUsernameLength,
                                               const std::string& context = "");
    
    /**
     * @brief Check for punctuation that needs care downstream
     */
    static bool HasSpecialCharacters(const std::string& password);
    
    /**
     * @brief Log length and character class of a password at debug level
     * 
     * The password itself is never logged.
     */
    static void LogPasswordInfo(const std::string& password, const std::string& context);
    
    /**
     * @brief Convert an extracted record to its stored form
     * 
     * Never throws: escaping and truncation always produce output.
     */
    static StoredCredential PrepareForStorage(const CredentialRecord& record,
                                              std::size_t max_username_length = kMaxUsernameLength);
};

} // namespace parsers
} // namespace stealerlog
