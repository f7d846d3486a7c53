/**
 * @file system_info.hpp
 * @brief Normalized host metadata record and stealer family tags
 * 
 * Defines the record every format adapter fills in, the closed set of
 * stealer families the signature detector can report, and the raw input
 * file type shared by dispatch and loading.
 * 
 * @date 2025
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace stealerlog {
namespace parsers {

/**
 * @enum StealerFamily
 * @brief Stealer families with a dedicated format adapter
 */
enum class StealerFamily {
    GENERIC,            ///< No fingerprint matched
    LUMMA,
    EXELA_STEALER,
    ASTRIS,
    ATOMIC_MAC,
    CRYPTBOT,
    PREDATOR_THE_THIEF,
    RACCOON,
    REDLINE_META,       ///< RedLine and its META fork share one layout
    RHADAMANTHYS,
    RISEPRO,
    STEALC,
    STEALERIUM,
    VIDAR,
    XFILES,
    AILUROPHILE,
    ARECH_CLIENT_V2,
    BANSHEE,
    DARKCRYSTAL_RAT,
    MEDUZA,
    NOXTY,
    PHEMEDRONE,
    RL_STEALER,
    SKALKA,
    BLANK_GRABBER
};

/**
 * @brief Family tag as stored with the record (e.g. "RedLine/META")
 */
std::string ToString(StealerFamily family);

/**
 * @brief Parse a family tag back to the enum
 * @return Family, or std::nullopt for an unknown tag
 */
std::optional<StealerFamily> StealerFamilyFromString(const std::string& tag);

/**
 * @enum Field
 * @brief Optional fields of ParsedSystemInfo
 */
enum class Field {
    OS,
    IP_ADDRESS,
    USERNAME,
    CPU,
    RAM,
    COMPUTER_NAME,
    GPU,
    COUNTRY,
    HWID,
    FILE_PATH,
    ANTIVIRUS,
    LOG_DATE            ///< Raw log date text, normalized by dispatch
};

constexpr std::size_t kFieldCount = 12;

/**
 * @brief JSON-style field name (e.g. "ipAddress", "computerName")
 */
std::string ToString(Field field);

/**
 * @struct SourceFile
 * @brief Raw input artifact, never mutated by the engine
 */
struct SourceFile {
    std::string file_name;      ///< Name used for routing and signature hints
    std::string content;        ///< File text
};

/**
 * @struct ParsedSystemInfo
 * @brief Host metadata extracted from one system information file
 * 
 * Every optional field is either absent or a non-empty cleaned string.
 * Adapters write through SetIfEmpty(), so the first value found for a
 * field is kept and later matches are ignored.
 * 
 * **Usage**:
 * @code
 * ParsedSystemInfo info;
 * info.SetIfEmpty(Field::OS, "Windows 10 Pro");
 * info.SetIfEmpty(Field::OS, "Windows 11");   // ignored
 * info.SetIfEmpty(Field::CPU, "Unknown");     // junk, stays empty
 * @endcode
 */
struct ParsedSystemInfo {
    std::string stealer_type{"Generic"};                    ///< Family tag
    std::array<std::optional<std::string>, kFieldCount> fields;  ///< Indexed by Field
    std::optional<std::string> log_date;                    ///< Canonical YYYY-MM-DD
    std::string log_time{"00:00:00"};                       ///< Canonical HH:mm:ss
    
    /**
     * @brief Assign a field only if it is still empty
     * 
     * The value is cleaned first; junk values leave the field empty so a
     * later, better value can still be taken.
     * 
     * @param field Target field
     * @param value Candidate value
     * @return true if the field was assigned
     */
    bool SetIfEmpty(Field field, const std::optional<std::string>& value);
    
    bool Has(Field field) const;
    const std::optional<std::string>& Get(Field field) const;
    
    /**
     * @brief Overwrite a field unconditionally (cleaning pass only)
     */
    void Replace(Field field, const std::optional<std::string>& value);
    
    /**
     * @brief Re-run the value cleaner over every field
     */
    void CleanAll();
    
    /**
     * @brief Number of populated optional fields (log date excluded)
     */
    std::size_t PopulatedCount() const;
};

} // namespace parsers
} // namespace stealerlog
