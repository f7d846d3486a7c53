/**
 * @file credential_escaper.cpp
 * @brief Credential escaping and username truncation
 * 
 * @date 2025
 */

#include "stealerlog/parsers/credential_escaper.hpp"

#include <spdlog/spdlog.h>

#include <regex>

namespace stealerlog {
namespace parsers {

namespace {

bool IsContinuationByte(char ch) {
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

std::size_t CountCharacters(const std::string& text) {
    std::size_t count = 0;
    for (char ch : text) {
        if (!IsContinuationByte(ch)) {
            ++count;
        }
    }
    return count;
}

// Byte offset where the character at index `characters` starts
std::size_t ByteOffsetOf(const std::string& text, std::size_t characters) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (IsContinuationByte(text[i])) {
            continue;
        }
        if (seen == characters) {
            return i;
        }
        ++seen;
    }
    return text.size();
}

std::string Prefix(const std::string& text, std::size_t characters) {
    return text.substr(0, ByteOffsetOf(text, characters));
}

} // anonymous namespace

// ============================================================================
// ESCAPING
// ============================================================================

std::string CredentialEscaper::Escape(const std::string& password) {
    std::string escaped;
    escaped.reserve(password.size() + password.size() / 4);
    
    for (char ch : password) {
        switch (ch) {
            case '\\': escaped += "\\\\"; break;
            case '\'': escaped += "\\'"; break;
            case '"':  escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            case '\0': escaped += "\\0"; break;
            default:   escaped += ch; break;
        }
    }
    
    return escaped;
}

std::string CredentialEscaper::Unescape(const std::string& escaped) {
    std::string result;
    result.reserve(escaped.size());
    
    for (std::size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] != '\\' || i + 1 == escaped.size()) {
            result += escaped[i];
            continue;
        }
        
        char next = escaped[i + 1];
        switch (next) {
            case '\\': result += '\\'; break;
            case '\'': result += '\''; break;
            case '"':  result += '"'; break;
            case 'n':  result += '\n'; break;
            case 'r':  result += '\r'; break;
            case 't':  result += '\t'; break;
            case '0':  result += '\0'; break;
            default:
                result += '\\';
                continue;
        }
        ++i;
    }
    
    return result;
}

// ============================================================================
// USERNAME GUARD
// ============================================================================

UsernameTruncation CredentialEscaper::TruncateUsername(const std::string& username,
                                                       std::size_t max_length,
                                                       const std::string& context) {
    UsernameTruncation result;
    result.original_length = CountCharacters(username);
    
    if (result.original_length <= max_length) {
        result.value = username;
        return result;
    }
    
    result.value = Prefix(username, max_length);
    result.was_truncated = true;
    
    spdlog::warn("Username truncated from {} to {} characters{}. Original: \"{}...\"",
                 result.original_length, max_length,
                 context.empty() ? "" : " (" + context + ")",
                 Prefix(username, 50));
    
    return result;
}

// ============================================================================
// DIAGNOSTICS
// ============================================================================

bool CredentialEscaper::HasSpecialCharacters(const std::string& password) {
    static const std::regex special(R"([!@#$%^&*()_+\-=\[\]{};':"\\|,.<>\/?`~])");
    return std::regex_search(password, special);
}

void CredentialEscaper::LogPasswordInfo(const std::string& password, const std::string& context) {
    if (password.empty()) {
        return;
    }
    
    spdlog::debug("{}: {} password (length: {})", context,
                  HasSpecialCharacters(password) ? "Special-character" : "Standard",
                  CountCharacters(password));
}

StoredCredential CredentialEscaper::PrepareForStorage(const CredentialRecord& record,
                                                      std::size_t max_username_length) {
    StoredCredential stored;
    
    auto username = TruncateUsername(record.username, max_username_length, record.url);
    
    stored.url = record.url;
    stored.username = std::move(username.value);
    stored.username_truncated = username.was_truncated;
    stored.password = Escape(record.password);
    if (record.browser.has_value() && !record.browser->empty()) {
        stored.browser = *record.browser;
    }
    stored.domain = record.domain;
    stored.tld = record.tld;
    stored.file_path = record.file_path;
    
    return stored;
}

} // namespace parsers
} // namespace stealerlog
