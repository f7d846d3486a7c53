/**
 * @file system_info.cpp
 * @brief ParsedSystemInfo setters and family tag mapping
 * 
 * @date 2025
 */

#include "stealerlog/parsers/system_info.hpp"
#include "stealerlog/parsers/line_grammar.hpp"

#include <map>

namespace stealerlog {
namespace parsers {

namespace {

std::size_t IndexOf(Field field) {
    return static_cast<std::size_t>(field);
}

} // anonymous namespace

std::string ToString(StealerFamily family) {
    switch (family) {
        case StealerFamily::GENERIC:            return "Generic";
        case StealerFamily::LUMMA:              return "Lumma";
        case StealerFamily::EXELA_STEALER:      return "ExelaStealer";
        case StealerFamily::ASTRIS:             return "Astris";
        case StealerFamily::ATOMIC_MAC:         return "Atomic Mac";
        case StealerFamily::CRYPTBOT:           return "CryptBot";
        case StealerFamily::PREDATOR_THE_THIEF: return "PredatorTheThief";
        case StealerFamily::RACCOON:            return "Raccoon";
        case StealerFamily::REDLINE_META:       return "RedLine/META";
        case StealerFamily::RHADAMANTHYS:       return "Rhadamanthys";
        case StealerFamily::RISEPRO:            return "RisePro";
        case StealerFamily::STEALC:             return "StealC";
        case StealerFamily::STEALERIUM:         return "Stealerium";
        case StealerFamily::VIDAR:              return "Vidar";
        case StealerFamily::XFILES:             return "XFiles";
        case StealerFamily::AILUROPHILE:        return "Ailurophile";
        case StealerFamily::ARECH_CLIENT_V2:    return "ArechClientV2";
        case StealerFamily::BANSHEE:            return "Banshee";
        case StealerFamily::DARKCRYSTAL_RAT:    return "DarkCrystal RAT";
        case StealerFamily::MEDUZA:             return "Meduza";
        case StealerFamily::NOXTY:              return "Noxty";
        case StealerFamily::PHEMEDRONE:         return "Phemedrone";
        case StealerFamily::RL_STEALER:         return "RL Stealer";
        case StealerFamily::SKALKA:             return "Skalka";
        case StealerFamily::BLANK_GRABBER:      return "Blank Grabber";
    }
    return "Generic";
}

std::optional<StealerFamily> StealerFamilyFromString(const std::string& tag) {
    static const std::map<std::string, StealerFamily> families = [] {
        std::map<std::string, StealerFamily> m;
        for (int i = static_cast<int>(StealerFamily::GENERIC);
             i <= static_cast<int>(StealerFamily::BLANK_GRABBER); ++i) {
            auto family = static_cast<StealerFamily>(i);
            m.emplace(ToString(family), family);
        }
        return m;
    }();
    
    auto it = families.find(tag);
    if (it == families.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ToString(Field field) {
    switch (field) {
        case Field::OS:            return "os";
        case Field::IP_ADDRESS:    return "ipAddress";
        case Field::USERNAME:      return "username";
        case Field::CPU:           return "cpu";
        case Field::RAM:           return "ram";
        case Field::COMPUTER_NAME: return "computerName";
        case Field::GPU:           return "gpu";
        case Field::COUNTRY:       return "country";
        case Field::HWID:          return "hwid";
        case Field::FILE_PATH:     return "filePath";
        case Field::ANTIVIRUS:     return "antivirus";
        case Field::LOG_DATE:      return "logDateRaw";
    }
    return "unknown";
}

// ============================================================================
// ParsedSystemInfo
// ============================================================================

bool ParsedSystemInfo::SetIfEmpty(Field field, const std::optional<std::string>& value) {
    auto& slot = fields[IndexOf(field)];
    if (slot.has_value() || !value.has_value()) {
        return false;
    }
    
    auto cleaned = LineGrammar::CleanValue(*value);
    if (!cleaned) {
        return false;
    }
    
    slot = std::move(cleaned);
    return true;
}

bool ParsedSystemInfo::Has(Field field) const {
    return fields[IndexOf(field)].has_value();
}

const std::optional<std::string>& ParsedSystemInfo::Get(Field field) const {
    return fields[IndexOf(field)];
}

void ParsedSystemInfo::Replace(Field field, const std::optional<std::string>& value) {
    fields[IndexOf(field)] = value;
}

void ParsedSystemInfo::CleanAll() {
    for (auto& slot : fields) {
        if (slot) {
            slot = LineGrammar::CleanValue(*slot);
        }
    }
    if (log_date) {
        log_date = LineGrammar::CleanValue(*log_date);
    }
}

std::size_t ParsedSystemInfo::PopulatedCount() const {
    std::size_t count = 0;
    for (std::size_t i = 0; i < kFieldCount; ++i) {
        if (i != IndexOf(Field::LOG_DATE) && fields[i]) {
            ++count;
        }
    }
    return count;
}

} // namespace parsers
} // namespace stealerlog
