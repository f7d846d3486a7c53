/**
 * @file log_loader.cpp
 * @brief Implementation of stealer log intake
 *
 * @date 2025
 */

#include "stealerlog/core/log_loader.hpp"
#include "stealerlog/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace stealerlog {
namespace core {

LogLoader::LogLoader(const Config& config)
    : config_(config) {
}

LogLoader::LogLoader()
    : LogLoader(Config{}) {
}

// ============================================================================
// VALIDATION
// ============================================================================

ValidationResult LogLoader::ValidateFile(const std::filesystem::path& path) const {
    ValidationResult result;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        result.valid = false;
        result.error_message = "File does not exist";
        return result;
    }

    if (!std::filesystem::is_regular_file(path, ec)) {
        result.valid = false;
        result.error_message = "Not a regular file";
        return result;
    }

    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        result.valid = false;
        result.error_message = "Cannot read file size: " + ec.message();
        return result;
    }

    if (file_size < config_.min_file_size) {
        result.valid = false;
        result.error_message = "File too small (minimum: " +
                               std::to_string(config_.min_file_size) + " bytes)";
        return result;
    }

    if (file_size > config_.max_file_size) {
        result.valid = false;
        result.error_message = "File too large (maximum: " +
                               std::to_string(config_.max_file_size) + " bytes)";
        return result;
    }

    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
    if (!extension.empty() && extension != ".txt" && extension != ".log" && extension != ".ini") {
        result.warnings.push_back("Unexpected extension " + extension);
    }

    return result;
}

// ============================================================================
// LOADING
// ============================================================================

std::optional<LoadedFile> LogLoader::LoadFile(const std::filesystem::path& path) const {
    auto validation = ValidateFile(path);
    if (!validation.valid) {
        spdlog::warn("Skipping {}: {}", path.string(), validation.error_message);
        return std::nullopt;
    }

    for (const auto& warning : validation.warnings) {
        spdlog::debug("{}: {}", path.filename().string(), warning);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::warn("Skipping {}: cannot open file", path.string());
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    LoadedFile loaded;
    loaded.path = path;
    loaded.source.file_name = path.filename().string();
    loaded.source.content = buffer.str();
    loaded.size = loaded.source.content.size();

    if (config_.compute_hashes) {
        loaded.sha256 = utils::HashUtils::ComputeSHA256(loaded.source.content);
    }

    spdlog::debug("Loaded {} ({} bytes)", path.string(), loaded.size);
    return loaded;
}

std::vector<LoadedFile> LogLoader::LoadPath(const std::filesystem::path& path) const {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Input path does not exist: " + path.string());
    }

    std::vector<LoadedFile> files;

    if (!std::filesystem::is_directory(path)) {
        if (auto loaded = LoadFile(path)) {
            files.push_back(std::move(*loaded));
        }
        return files;
    }

    std::vector<std::filesystem::path> candidates;
    const auto options = std::filesystem::directory_options::skip_permission_denied;

    if (config_.recursive) {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(path, options)) {
            if (entry.is_regular_file()) {
                candidates.push_back(entry.path());
            }
        }
    } else {
        for (const auto& entry : std::filesystem::directory_iterator(path, options)) {
            if (entry.is_regular_file()) {
                candidates.push_back(entry.path());
            }
        }
    }

    std::sort(candidates.begin(), candidates.end());

    for (const auto& candidate : candidates) {
        if (auto loaded = LoadFile(candidate)) {
            files.push_back(std::move(*loaded));
        }
    }

    spdlog::info("Loaded {} of {} files from {}", files.size(), candidates.size(), path.string());
    return files;
}

} // namespace core
} // namespace stealerlog
