/**
 * @file credential_record.hpp
 * @brief Credential records extracted from password dump files
 * 
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace stealerlog {
namespace parsers {

/**
 * @struct CredentialRecord
 * @brief One entry of a browser password dump
 * 
 * A record is only emitted when url is non-empty and both the username
 * and password lines were present. Empty username or password values are
 * legitimate and kept as empty strings.
 */
struct CredentialRecord {
    std::string url;
    std::string username;
    std::string password;
    std::optional<std::string> browser;
    std::optional<std::string> domain;     ///< Registrable domain derived from url
    std::optional<std::string> tld;        ///< Last host label, null for IP hosts
    std::optional<std::string> file_path;  ///< Source file for traceability
};

/**
 * @struct UsernameTruncation
 * @brief Outcome of the username length guard
 */
struct UsernameTruncation {
    std::string value;
    bool was_truncated{false};
    std::size_t original_length{0};  ///< Length in characters before truncation
};

/**
 * @struct StoredCredential
 * @brief Credential in the form handed to persistence
 */
struct StoredCredential {
    std::string url;
    std::string username;                  ///< Possibly truncated
    std::string password;                  ///< Escaped
    std::string browser{"Unknown"};
    std::optional<std::string> domain;
    std::optional<std::string> tld;
    std::optional<std::string> file_path;
    bool username_truncated{false};
};

} // namespace parsers
} // namespace stealerlog
