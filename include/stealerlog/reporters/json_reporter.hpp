/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON extraction reports
 * 
 * Serializes parsed system information records, stored credentials and
 * batch outcomes for one device into a single JSON document.
 * 
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "stealerlog/core/parser_dispatch.hpp"
#include "stealerlog/parsers/credential_extractor.hpp"
#include "stealerlog/parsers/credential_record.hpp"
#include "stealerlog/parsers/system_info.hpp"

namespace stealerlog {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON report generation
 */
struct JsonReporterConfig {
    // Content Options
    bool include_credentials{true};       ///< Include stored credentials
    bool include_password_stats{true};    ///< Include password file statistics
    std::size_t top_password_count{10};   ///< Most frequent passwords listed
    
    // Formatting
    bool pretty_print{true};              ///< Pretty print JSON
    int indent_size{2};                   ///< Indentation spaces
    
    // Output
    std::string filename_pattern{"stealerlog_{device}_{timestamp}.json"};  ///< Report file name
};

/**
 * @struct StoredSystemInfo
 * @brief Record as accepted by the storage collaborator
 */
struct StoredSystemInfo {
    std::string device_id;
    std::string source_file_name;
    parsers::ParsedSystemInfo info;
};

/**
 * @struct PasswordStats
 * @brief Aggregated password file pre-analysis
 */
struct PasswordStats {
    std::size_t files{0};
    std::size_t credential_count{0};
    std::size_t url_count{0};          ///< URL lines, repeats included
    std::size_t domain_count{0};
    std::map<std::string, std::size_t> password_counts;
    
    void Add(const parsers::CredentialFileSummary& summary);
};

/**
 * @struct ExtractionReport
 * @brief Everything extracted for one device
 */
struct ExtractionReport {
    std::string device_id;
    core::BatchResult batch;
    std::vector<StoredSystemInfo> records;
    std::map<std::string, std::string> file_digests;   ///< File path to SHA-256
    std::vector<parsers::StoredCredential> credentials;
    PasswordStats password_stats;
};

/**
 * @class JsonReportSink
 * @brief Storage collaborator that keeps records for the report
 * 
 * **Thread Safety**: SaveSystemInformation() may be called from several
 * dispatch workers at once.
 */
class JsonReportSink : public core::SystemInfoSink {
public:
    void SaveSystemInformation(const std::string& device_id,
                               const parsers::ParsedSystemInfo& info,
                               const std::string& source_file_name) override;
    
    /**
     * @brief Snapshot of stored records, in arrival order
     */
    std::vector<StoredSystemInfo> Records() const;
    
    std::size_t Count() const;
    
private:
    mutable std::mutex mutex_;
    std::vector<StoredSystemInfo> records_;
};

/**
 * @class JsonReporter
 * @brief Renders extraction reports as JSON
 * 
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * auto path = reporter.WriteReport(report, "./reports");
 * if (!path.empty()) {
 *     spdlog::info("Report saved: {}", path.string());
 * }
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config);
    JsonReporter();
    
    /**
     * @brief One system information record
     * 
     * Absent fields are emitted as null.
     */
    nlohmann::json SystemInfoToJson(const StoredSystemInfo& record) const;
    
    /**
     * @brief One stored credential (password stays escaped)
     */
    nlohmann::json CredentialToJson(const parsers::StoredCredential& credential) const;
    
    /**
     * @brief Full report document
     */
    nlohmann::json BuildReport(const ExtractionReport& report) const;
    
    /**
     * @brief Report serialized with the configured formatting
     */
    std::string GenerateReport(const ExtractionReport& report) const;
    
    /**
     * @brief Write the report into a directory
     * 
     * @param report Report contents
     * @param output_directory Target directory (created if missing)
     * @return Path of the written file, empty on failure
     */
    std::filesystem::path WriteReport(const ExtractionReport& report,
                                      const std::filesystem::path& output_directory) const;
    
    /**
     * @brief ISO 8601 UTC timestamp
     */
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);
    
    const JsonReporterConfig& GetConfig() const { return config_; }
    
private:
    std::string GenerateFilename(const std::string& device_id) const;
    
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace stealerlog
