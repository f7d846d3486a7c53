/**
 * @file hash_utils.hpp
 * @brief Content fingerprinting for loaded log artifacts
 * 
 * SHA-256 digests identify every artifact that went into a report, so a
 * report entry can be traced back to the exact file content it came from.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <filesystem>

namespace stealerlog {
namespace utils {

/**
 * @class HashUtils
 * @brief SHA-256 helpers backed by OpenSSL
 * 
 * **Usage**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256(content);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of in-memory data
     * @param data Data to hash
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);
    
    /**
     * @brief Compute SHA-256 of a file, streamed in 8 KiB blocks
     * @param file_path File to hash
     * @return Lowercase hex digest
     * @throws std::runtime_error if the file cannot be opened
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);
    
    /**
     * @brief Convert bytes to lowercase hex
     */
    static std::string ToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace stealerlog
