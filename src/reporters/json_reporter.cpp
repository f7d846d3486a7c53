/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON extraction reports
 * 
 * @date 2025
 */

#include "stealerlog/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>

using json = nlohmann::json;

namespace stealerlog {
namespace reporters {

namespace {

json OptionalToJson(const std::optional<std::string>& value) {
    if (value.has_value()) {
        return *value;
    }
    return nullptr;
}

} // anonymous namespace

// ============================================================================
// PASSWORD STATS
// ============================================================================

void PasswordStats::Add(const parsers::CredentialFileSummary& summary) {
    files++;
    credential_count += summary.credential_count;
    url_count += summary.url_count;
    domain_count += summary.domain_count;
    for (const auto& [password, count] : summary.password_counts) {
        password_counts[password] += count;
    }
}

// ============================================================================
// SINK
// ============================================================================

void JsonReportSink::SaveSystemInformation(const std::string& device_id,
                                           const parsers::ParsedSystemInfo& info,
                                           const std::string& source_file_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back({device_id, source_file_name, info});
}

std::vector<StoredSystemInfo> JsonReportSink::Records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t JsonReportSink::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// ============================================================================
// REPORTER
// ============================================================================

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

JsonReporter::JsonReporter()
    : JsonReporter(JsonReporterConfig{}) {
}

json JsonReporter::SystemInfoToJson(const StoredSystemInfo& record) const {
    const auto& info = record.info;
    
    json j = {
        {"deviceId", record.device_id},
        {"sourceFile", record.source_file_name},
        {"stealerType", info.stealer_type}
    };
    
    for (std::size_t i = 0; i < parsers::kFieldCount; ++i) {
        auto field = static_cast<parsers::Field>(i);
        if (field == parsers::Field::LOG_DATE) {
            continue;  // raw text, replaced by logDate below
        }
        j[parsers::ToString(field)] = OptionalToJson(info.Get(field));
    }
    
    j["logDate"] = OptionalToJson(info.log_date);
    j["logTime"] = info.log_time;
    
    return j;
}

json JsonReporter::CredentialToJson(const parsers::StoredCredential& credential) const {
    return {
        {"url", credential.url},
        {"domain", OptionalToJson(credential.domain)},
        {"tld", OptionalToJson(credential.tld)},
        {"username", credential.username},
        {"password", credential.password},
        {"browser", credential.browser},
        {"filePath", OptionalToJson(credential.file_path)},
        {"usernameTruncated", credential.username_truncated}
    };
}

json JsonReporter::BuildReport(const ExtractionReport& report) const {
    json j;
    
    j["device_id"] = report.device_id;
    j["generated_at"] = FormatTimestamp(std::chrono::system_clock::now());
    
    // Batch summary
    json errors = json::array();
    for (const auto& error : report.batch.errors) {
        errors.push_back({{"file", error.file_name}, {"error", error.error}});
    }
    j["batch"] = {
        {"success", report.batch.success},
        {"failed", report.batch.failed},
        {"skipped", report.batch.skipped},
        {"errors", errors}
    };
    
    json records = json::array();
    for (const auto& record : report.records) {
        records.push_back(SystemInfoToJson(record));
    }
    j["system_information"] = records;
    
    json digests = json::object();
    for (const auto& [path, sha256] : report.file_digests) {
        digests[path] = sha256;
    }
    j["source_files"] = digests;
    
    if (config_.include_credentials) {
        json credentials = json::array();
        for (const auto& credential : report.credentials) {
            credentials.push_back(CredentialToJson(credential));
        }
        j["credentials"] = credentials;
    }
    
    if (config_.include_password_stats) {
        const auto& stats = report.password_stats;
        
        std::vector<std::pair<std::string, std::size_t>> ranked(
            stats.password_counts.begin(), stats.password_counts.end());
        std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            return a.second > b.second;
        });
        if (ranked.size() > config_.top_password_count) {
            ranked.resize(config_.top_password_count);
        }
        
        json top = json::array();
        for (const auto& [password, count] : ranked) {
            top.push_back({{"password", password}, {"count", count}});
        }
        
        j["password_stats"] = {
            {"files", stats.files},
            {"credential_count", stats.credential_count},
            {"url_count", stats.url_count},
            {"domain_count", stats.domain_count},
            {"unique_passwords", stats.password_counts.size()},
            {"top_passwords", top}
        };
    }
    
    return j;
}

std::string JsonReporter::GenerateReport(const ExtractionReport& report) const {
    json j = BuildReport(report);
    // Raw passwords may carry invalid UTF-8
    return config_.pretty_print
        ? j.dump(config_.indent_size, ' ', false, json::error_handler_t::replace)
        : j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::filesystem::path JsonReporter::WriteReport(const ExtractionReport& report,
                                                const std::filesystem::path& output_directory) const {
    try {
        std::filesystem::create_directories(output_directory);
        
        auto output_path = output_directory / GenerateFilename(report.device_id);
        
        std::ofstream file(output_path);
        if (!file) {
            spdlog::error("Failed to open file for writing: {}", output_path.string());
            return {};
        }
        
        file << GenerateReport(report);
        file.close();
        
        spdlog::debug("JSON report written: {} records, {} credentials",
                      report.records.size(), report.credentials.size());
        return output_path;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to save JSON report: {}", e.what());
        return {};
    }
}

std::string JsonReporter::GenerateFilename(const std::string& device_id) const {
    std::string device = device_id.empty() ? "device" : device_id;
    std::replace_if(device.begin(), device.end(), [](char c) {
        return !std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_';
    }, '_');
    
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::ostringstream timestamp;
    timestamp << std::put_time(std::localtime(&t), "%Y%m%d_%H%M%S");
    
    std::string filename = config_.filename_pattern;
    filename = std::regex_replace(filename, std::regex("\\{device\\}"), device);
    filename = std::regex_replace(filename, std::regex("\\{timestamp\\}"), timestamp.str());
    
    return filename;
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&t), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace reporters
} // namespace stealerlog
