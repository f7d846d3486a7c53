/**
 * @file credential_extractor.cpp
 * @brief Password dump block parsing and URL decomposition
 * 
 * @date 2025
 */

#include "stealerlog/parsers/credential_extractor.hpp"
#include "stealerlog/parsers/credential_escaper.hpp"
#include "stealerlog/parsers/line_grammar.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <utility>

namespace stealerlog {
namespace parsers {

using utils::StringUtils;

namespace {

enum class CredentialLabel {
    NONE,
    URL,
    USERNAME,
    PASSWORD,
    BROWSER
};

const std::array<std::pair<CredentialLabel, std::vector<std::string>>, 4>& LabelSynonyms() {
    static const std::array<std::pair<CredentialLabel, std::vector<std::string>>, 4> synonyms = {{
        {CredentialLabel::URL,      {"url", "host", "hostname"}},
        {CredentialLabel::USERNAME, {"username", "user", "login"}},
        {CredentialLabel::PASSWORD, {"password", "pass"}},
        {CredentialLabel::BROWSER,  {"browser", "soft", "application"}},
    }};
    return synonyms;
}

// "Login URL" ends in "url" on a word boundary, "Curl" does not
bool LabelIs(const std::string& label, const std::string& synonym) {
    if (label == synonym) {
        return true;
    }
    if (!StringUtils::EndsWith(label, synonym)) {
        return false;
    }
    auto before = static_cast<unsigned char>(label[label.size() - synonym.size() - 1]);
    return !std::isalnum(before);
}

CredentialLabel Classify(const std::string& line) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
        return CredentialLabel::NONE;
    }
    
    const std::string label = StringUtils::ToLower(StringUtils::Trim(line.substr(0, colon)));
    if (label.empty()) {
        return CredentialLabel::NONE;
    }
    
    for (const auto& [kind, names] : LabelSynonyms()) {
        for (const auto& name : names) {
            if (LabelIs(label, name)) {
                return kind;
            }
        }
    }
    return CredentialLabel::NONE;
}

std::string StripSchemeAndWww(const std::string& url) {
    std::string clean = StringUtils::Trim(url);
    std::string lower = StringUtils::ToLower(clean);
    
    if (StringUtils::StartsWith(lower, "https://")) {
        clean = clean.substr(8);
    } else if (StringUtils::StartsWith(lower, "http://")) {
        clean = clean.substr(7);
    }
    if (StringUtils::StartsWith(StringUtils::ToLower(clean), "www.")) {
        clean = clean.substr(4);
    }
    return clean;
}

std::string HostOf(const std::string& url) {
    std::string rest = StripSchemeAndWww(url);
    std::string host = rest.substr(0, rest.find('/'));
    host = host.substr(0, host.find(':'));
    return StringUtils::ToLower(host);
}

std::vector<std::string> HostLabels(const std::string& host) {
    std::vector<std::string> labels;
    std::size_t start = 0;
    while (true) {
        auto dot = host.find('.', start);
        labels.push_back(host.substr(start, dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return labels;
}

/**
 * Partially filled block
 */
struct CredentialAccumulator {
    std::optional<std::string> url;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> browser;
    
    bool IsValid() const {
        return url.has_value() && !url->empty() && username.has_value() && password.has_value();
    }
    
    void Reset() { *this = CredentialAccumulator{}; }
};

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

CredentialExtractor::CredentialExtractor(const Config& config)
    : config_(config) {
}

// ============================================================================
// BLOCK GRAMMAR
// ============================================================================

bool CredentialExtractor::IsSeparatorLine(const std::string& line) {
    return LineGrammar::IsSeparatorLine(line, SeparatorProfile::Credential());
}

std::vector<CredentialRecord> CredentialExtractor::Extract(const std::string& content,
                                                           const std::string& file_path) const {
    std::vector<CredentialRecord> records;
    CredentialAccumulator current;
    std::size_t dropped = 0;
    
    auto flush = [&]() {
        if (current.IsValid()) {
            CredentialRecord record;
            record.url = *current.url;
            record.username = *current.username;
            record.password = *current.password;
            record.browser = current.browser;
            
            auto info = ExtractUrlInfo(record.url);
            record.domain = info.domain;
            record.tld = info.tld;
            if (!file_path.empty()) {
                record.file_path = file_path;
            }
            records.push_back(std::move(record));
        } else if (current.url.has_value() || current.username.has_value() ||
                   current.password.has_value()) {
            ++dropped;
        }
        current.Reset();
    };
    
    for (const auto& raw_line : StringUtils::SplitLines(content)) {
        const std::string line = StringUtils::Trim(raw_line);
        
        if (IsSeparatorLine(line)) {
            flush();
            continue;
        }
        
        switch (Classify(line)) {
            case CredentialLabel::URL:
                if (current.url.has_value() && !current.url->empty()) {
                    flush();
                }
                current.url = LineGrammar::ExtractColonValue(line);
                break;
            case CredentialLabel::USERNAME:
                current.username = LineGrammar::ExtractColonValue(line);
                break;
            case CredentialLabel::PASSWORD:
                current.password = LineGrammar::ExtractColonValue(line);
                break;
            case CredentialLabel::BROWSER:
                current.browser = LineGrammar::ExtractColonValue(line);
                break;
            case CredentialLabel::NONE:
                break;
        }
    }
    flush();
    
    spdlog::debug("Extracted {} credentials ({} incomplete blocks dropped){}",
                  records.size(), dropped, file_path.empty() ? "" : " from " + file_path);
    
    return records;
}

CredentialFileSummary CredentialExtractor::Analyze(const std::string& content,
                                                   const std::string& file_path) const {
    CredentialFileSummary summary;
    
    if (StringUtils::Trim(content).empty()) {
        return summary;
    }
    
    for (const auto& raw_line : StringUtils::SplitLines(content)) {
        const std::string line = StringUtils::Trim(raw_line);
        if (line.empty()) {
            continue;
        }
        
        auto kind = Classify(line);
        if (kind == CredentialLabel::PASSWORD) {
            auto password = LineGrammar::ExtractColonValue(line);
            if (!password.empty()) {
                summary.credential_count++;
                summary.password_counts[password]++;
            }
        } else if (kind == CredentialLabel::URL) {
            auto url = LineGrammar::ExtractColonValue(line);
            if (!url.empty()) {
                summary.url_count++;
                if (!StringUtils::IsIPv4Shaped(HostOf(url))) {
                    summary.domain_count++;
                }
            }
        }
    }
    
    summary.credentials = Extract(content, file_path);
    
    spdlog::info("Password file analysis: {} passwords, {} URLs, {} domains, {} records",
                 summary.credential_count, summary.url_count, summary.domain_count,
                 summary.credentials.size());
    
    return summary;
}

std::vector<StoredCredential> CredentialExtractor::PrepareForStorage(
    const std::vector<CredentialRecord>& records) const {
    
    std::vector<StoredCredential> stored;
    stored.reserve(records.size());
    
    for (const auto& record : records) {
        if (config_.log_password_info) {
            CredentialEscaper::LogPasswordInfo(record.password, record.url);
        }
        stored.push_back(CredentialEscaper::PrepareForStorage(record, config_.max_username_length));
    }
    
    return stored;
}

// ============================================================================
// URL HELPERS
// ============================================================================

UrlInfo CredentialExtractor::ExtractUrlInfo(const std::string& url) {
    UrlInfo info;
    
    if (StringUtils::Trim(url).empty()) {
        return info;
    }
    
    const std::string host = HostOf(url);
    
    if (StringUtils::IsIPv4Shaped(host)) {
        info.domain = host;
        return info;
    }
    
    auto labels = HostLabels(host);
    if (labels.size() >= 2) {
        info.tld = labels.back();
        info.domain = labels.size() > 2
            ? labels[labels.size() - 2] + "." + labels.back()
            : host;
        return info;
    }
    
    info.domain = host;
    return info;
}

ParsedUrl CredentialExtractor::ParseUrl(const std::string& url) {
    ParsedUrl parsed;
    
    std::string clean = StringUtils::Trim(url);
    if (clean.empty()) {
        return parsed;
    }
    
    if (StringUtils::StartsWith(clean, "https://")) {
        parsed.protocol = "https";
        clean = clean.substr(8);
    } else if (StringUtils::StartsWith(clean, "http://")) {
        parsed.protocol = "http";
        clean = clean.substr(7);
    }
    if (StringUtils::StartsWith(clean, "www.")) {
        clean = clean.substr(4);
    }
    
    const auto path_start = clean.find('/');
    const std::string host_part = clean.substr(0, path_start);
    
    const auto colon = host_part.rfind(':');
    if (colon != std::string::npos && StringUtils::IsAllDigits(host_part.substr(colon + 1))) {
        try {
            parsed.port = std::stoi(host_part.substr(colon + 1));
        } catch (const std::out_of_range&) {
            spdlog::debug("Port out of range in {}", url);
        }
    }
    
    parsed.full_hostname = StringUtils::ToLower(host_part.substr(0, host_part.find(':')));
    
    if (path_start != std::string::npos) {
        std::string rest = clean.substr(path_start);
        
        auto query_pos = rest.find('?');
        auto fragment_pos = rest.find('#');
        if (query_pos != std::string::npos && (fragment_pos == std::string::npos || query_pos < fragment_pos)) {
            if (fragment_pos != std::string::npos) {
                parsed.query = rest.substr(query_pos + 1, fragment_pos - query_pos - 1);
                parsed.fragment = rest.substr(fragment_pos + 1);
            } else {
                parsed.query = rest.substr(query_pos + 1);
            }
        } else if (fragment_pos != std::string::npos) {
            parsed.fragment = rest.substr(fragment_pos + 1);
        }
        
        std::string path = rest.substr(0, std::min(query_pos, fragment_pos));
        parsed.path = path.empty() ? "/" : path;
    }
    
    const std::string& host = parsed.full_hostname;
    auto labels = HostLabels(host);
    
    if (StringUtils::IsIPAddress(host) || labels.size() < 2) {
        parsed.domain = host;
        parsed.base_domain = host;
        return parsed;
    }
    
    parsed.tld = labels.back();
    parsed.base_domain = labels[labels.size() - 2] + "." + labels.back();
    parsed.domain = parsed.base_domain;
    
    if (host != parsed.base_domain && StringUtils::EndsWith(host, "." + parsed.base_domain)) {
        parsed.subdomain = host.substr(0, host.size() - parsed.base_domain.size() - 1);
    }
    
    return parsed;
}

bool CredentialExtractor::IsPasswordFileName(const std::string& file_name) {
    static const std::vector<std::string> known_names = {
        "all passwords.txt",
        "all_passwords.txt",
        "passwords.txt",
        "allpasswords_list.txt",
        "_allpasswords_list",
    };
    
    const std::string leaf = StringUtils::ToLower(std::filesystem::path(file_name).filename().string());
    for (const auto& name : known_names) {
        if (leaf == name) {
            return true;
        }
    }
    return false;
}

} // namespace parsers
} // namespace stealerlog
