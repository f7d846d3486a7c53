/**
 * @file log_loader.hpp
 * @brief Stealer log intake from disk
 *
 * Reads text artifacts from a single file or an extracted log directory,
 * validates them and records their SHA-256 digests for traceability.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "stealerlog/parsers/system_info.hpp"

namespace stealerlog {
namespace core {

/**
 * @struct ValidationResult
 * @brief Result of file validation
 */
struct ValidationResult {
    bool valid{true};                    ///< Overall validation status
    std::string error_message;           ///< Error description (if invalid)
    std::vector<std::string> warnings;   ///< Non-fatal warnings
};

/**
 * @struct LoadedFile
 * @brief One artifact read into memory
 */
struct LoadedFile {
    parsers::SourceFile source;          ///< Leaf file name and raw content
    std::filesystem::path path;          ///< Location on disk
    std::size_t size{0};                 ///< Size in bytes
    std::string sha256;                  ///< Content digest (empty if hashing disabled)
};

/**
 * @class LogLoader
 * @brief Loads and validates stealer log files
 *
 * Invalid files are skipped with a warning so a single unreadable entry
 * never aborts the intake of a whole log directory.
 *
 * **Usage Example**:
 * @code
 * LogLoader loader;
 * auto files = loader.LoadPath("./logs/device-42");
 * for (const auto& file : files) {
 *     spdlog::info("{} ({} bytes)", file.source.file_name, file.size);
 * }
 * @endcode
 */
class LogLoader {
public:
    /**
     * @struct Config
     * @brief Loader configuration
     */
    struct Config {
        std::size_t max_file_size{50 * 1024 * 1024};  ///< Max size (50MB default)
        std::size_t min_file_size{1};                  ///< Min size (1 byte)
        bool recursive{true};                          ///< Walk subdirectories
        bool compute_hashes{true};                     ///< SHA-256 per file
    };

    explicit LogLoader(const Config& config);
    explicit LogLoader();

    LogLoader(const LogLoader&) = delete;
    LogLoader& operator=(const LogLoader&) = delete;

    /**
     * @brief Load a file or every regular file below a directory
     *
     * Directory entries are returned sorted by path.
     *
     * @param path File or directory
     * @return Loaded files
     * @throws std::runtime_error if path does not exist
     */
    std::vector<LoadedFile> LoadPath(const std::filesystem::path& path) const;

    /**
     * @brief Load a single file
     * @return Loaded file, nullopt if validation or reading failed
     */
    std::optional<LoadedFile> LoadFile(const std::filesystem::path& path) const;

    /**
     * @brief Check existence, type and size limits
     */
    ValidationResult ValidateFile(const std::filesystem::path& path) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace core
} // namespace stealerlog
