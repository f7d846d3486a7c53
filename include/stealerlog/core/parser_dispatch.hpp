/**
 * @file parser_dispatch.hpp
 * @brief Batch orchestration for system information files
 *
 * Routes each file through encoding normalization, family detection, the
 * matching format adapter and the value cleaner, then hands the finished
 * record to a storage collaborator. Failures are isolated per file: one
 * malformed log never aborts the batch.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stealerlog/parsers/country_resolver.hpp"
#include "stealerlog/parsers/date_normalizer.hpp"
#include "stealerlog/parsers/system_info.hpp"

namespace stealerlog {

namespace core {

/**
 * @class SystemInfoSink
 * @brief Storage collaborator for finished records
 *
 * Implementations may throw; the dispatcher records the failure against
 * the source file. Sinks used with more than one worker must be
 * thread-safe.
 */
class SystemInfoSink {
public:
    virtual ~SystemInfoSink() = default;

    /**
     * @brief Persist one parsed record
     * @param device_id Owning device
     * @param info Cleaned record
     * @param source_file_name File the record came from
     */
    virtual void SaveSystemInformation(const std::string& device_id,
                                       const parsers::ParsedSystemInfo& info,
                                       const std::string& source_file_name) = 0;
};

/**
 * @struct FileError
 * @brief Failure recorded for one file
 */
struct FileError {
    std::string file_name;
    std::string error;
};

/**
 * @struct BatchResult
 * @brief Counters and error list for one batch
 */
struct BatchResult {
    std::size_t success{0};           ///< Files parsed and stored
    std::size_t failed{0};            ///< Files that raised an error
    std::size_t skipped{0};           ///< Files filtered out by name
    std::vector<FileError> errors;    ///< Failures in file order

    /**
     * @brief Append another worker's result
     */
    void Merge(const BatchResult& other);
};

/// Adapter signature used for per-family overrides
using AdapterFunction = std::function<parsers::ParsedSystemInfo(
    const std::string& content,
    const std::string& file_name,
    const parsers::CountryResolver& countries)>;

/**
 * @class ParserDispatch
 * @brief Detects, parses, cleans and stores system information files
 *
 * **Pipeline per file**:
 * 1. Name filter (system/information/userinfo/... files only)
 * 2. Encoding normalization
 * 3. Signature detection
 * 4. Format adapter (Generic when no family matched)
 * 5. Date normalization and value cleaning
 * 6. Storage collaborator
 *
 * **Usage Example**:
 * @code
 * reporters::JsonReportSink sink;
 * ParserDispatch dispatch(sink, parsers::IsoCountryResolver::Default());
 *
 * auto result = dispatch.ProcessFiles("device-42", files);
 * spdlog::info("{} parsed, {} failed", result.success, result.failed);
 * @endcode
 */
class ParserDispatch {
public:
    /**
     * @struct Config
     * @brief Dispatch settings
     */
    struct Config {
        std::size_t worker_count{1};      ///< Parallel workers (1 = sequential)
        bool normalize_ram_units{false};  ///< Convert "N MB" RAM values to GB
        std::optional<parsers::DateNormalizer::TimePoint> fallback_timestamp;  ///< Used for unparseable dates
    };

    /**
     * @brief Construct dispatcher
     * @param sink Storage collaborator (must outlive the dispatcher)
     * @param countries Country resolver (must outlive the dispatcher)
     * @param config Dispatch configuration
     */
    ParserDispatch(SystemInfoSink& sink,
                   const parsers::CountryResolver& countries,
                   const Config& config);

    ParserDispatch(SystemInfoSink& sink, const parsers::CountryResolver& countries);

    ~ParserDispatch();

    ParserDispatch(const ParserDispatch&) = delete;
    ParserDispatch& operator=(const ParserDispatch&) = delete;

    /**
     * @brief Parse and store a batch of files
     *
     * Files whose names do not look like system information files are
     * counted as skipped. Every other file ends up in success or failed.
     *
     * @param device_id Owning device passed to the sink
     * @param files Raw files in batch order
     * @return Batch counters and per-file errors
     */
    BatchResult ProcessFiles(const std::string& device_id,
                             const std::vector<parsers::SourceFile>& files);

    /**
     * @brief Parse one file without storing it
     *
     * @param file Raw file
     * @return Cleaned record
     * @throws std::runtime_error "Parse failed: ..." if the adapter throws
     */
    parsers::ParsedSystemInfo ParseFile(const parsers::SourceFile& file) const;

    /**
     * @brief Replace the adapter used for one family
     */
    void OverrideAdapter(parsers::StealerFamily family, AdapterFunction adapter);

    /**
     * @brief Check the system information naming convention
     */
    static bool IsSystemInfoFileName(const std::string& file_name);

    const Config& GetConfig() const { return config_; }

private:
    BatchResult ProcessRange(const std::string& device_id,
                             const std::vector<const parsers::SourceFile*>& files,
                             std::size_t begin, std::size_t end);

    Config config_;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace core

} // namespace stealerlog
