/**
 * @file signature_detector.cpp
 * @brief Ordered family fingerprints
 * 
 * @date 2025
 */

#include "stealerlog/parsers/signature_detector.hpp"
#include "stealerlog/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace stealerlog {
namespace parsers {

using utils::StringUtils;

namespace {

bool Has(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

} // anonymous namespace

SignatureDetector::SignatureDetector() {
    using C = const std::string&;
    
    // Order matters: earlier fingerprints shadow later, broader ones
    rules_ = {
        {StealerFamily::LUMMA, "LummaC2 banner or LID label",
         [](C c, C) { return Has(c, "lummac2") || Has(c, "lid:"); }},
        
        {StealerFamily::EXELA_STEALER, "Exela Telegram channel",
         [](C c, C) { return Has(c, "t.me/exelastealer"); }},
        
        {StealerFamily::ASTRIS, "[General] with recaptcha-verify build",
         [](C c, C) { return Has(c, "[general]") && Has(c, "build: recaptcha-verify"); }},
        
        {StealerFamily::ATOMIC_MAC, "sw_vers ProductName on macOS",
         [](C c, C) { return Has(c, "productname:") && Has(c, "macos"); }},
        
        {StealerFamily::CRYPTBOT, "_Information.txt or UserName (ComputerName) label",
         [](C c, C f) {
             return Has(f, "_information.txt") ||
                    (Has(c, "os:") && Has(c, "local date and time:") &&
                     Has(c, "username (computername):"));
         }},
        
        {StealerFamily::PREDATOR_THE_THIEF, "Predator The Thief banner",
         [](C c, C) {
             return Has(c, "predator the thief") || Has(c, "predatorthethief") ||
                    (Has(c, "predator") && Has(c, "v3.0.0 release"));
         }},
        
        {StealerFamily::RACCOON, "Build compile date, bot_id or user id with last seen",
         [](C c, C) {
             return Has(c, "build compile date") || Has(c, "bot_id:") ||
                    (Has(c, "user id:") && Has(c, "last seen:"));
         }},
        
        {StealerFamily::REDLINE_META, "Build ID or UserInformation.txt hardware block",
         [](C c, C) {
             return Has(c, "build id:") ||
                    (Has(c, "userinformation.txt") && Has(c, "machinename:") && Has(c, "hardwares:"));
         }},
        
        {StealerFamily::RHADAMANTHYS, "Install date with traffic name",
         [](C c, C) { return Has(c, "install date:") && Has(c, "traffic name:"); }},
        
        {StealerFamily::RISEPRO, "Build with MachineID, or information.txt with location and [Hardware]",
         [](C c, C) {
             return (Has(c, "build:") && Has(c, "machineid:")) ||
                    (Has(c, "information.txt") && Has(c, "location:") && Has(c, "[hardware]"));
         }},
        
        {StealerFamily::STEALC, "Network Info and System Summary blocks",
         [](C c, C) { return Has(c, "network info:") && Has(c, "system summary:"); }},
        
        {StealerFamily::STEALERIUM, "[IP] and [Machine] sections",
         [](C c, C) { return Has(c, "[ip]") && Has(c, "[machine]"); }},
        
        {StealerFamily::VIDAR, "information.txt with version or videocard",
         [](C c, C) {
             return (Has(c, "ip:") && Has(c, "version:") && Has(c, "information.txt")) ||
                    (Has(c, "information.txt") && Has(c, "[hardware]") && Has(c, "videocard:"));
         }},
        
        {StealerFamily::XFILES, "Operation ID label",
         [](C c, C) { return Has(c, "operation id:"); }},
        
        {StealerFamily::AILUROPHILE, "PC type with allowed extensions",
         [](C c, C) { return Has(c, "pc type: microsoft windows") && Has(c, "allowed extensions:"); }},
        
        {StealerFamily::ARECH_CLIENT_V2, "UserInformation.txt or RedLine-style hardware block",
         [](C c, C) {
             return Has(c, "userinformation.txt") ||
                    (Has(c, "filelocation:") && Has(c, "current language:") && Has(c, "hardwares:"));
         }},
        
        {StealerFamily::BANSHEE, "HWID with build name, or macOS system_information.txt",
         [](C c, C) {
             return (Has(c, "hwid:") && Has(c, "log date:") && Has(c, "build name:")) ||
                    (Has(c, "system_information.txt") && Has(c, "operation system:") && Has(c, "macos"));
         }},
        
        {StealerFamily::DARKCRYSTAL_RAT, "PC name on Windows Server",
         [](C c, C) { return Has(c, "pc name:") && Has(c, "windows server"); }},
        
        {StealerFamily::MEDUZA, "UserInfo.txt with build name or execute path",
         [](C c, C) {
             return (Has(c, "hwid:") && Has(c, "build name:") && Has(c, "userinfo.txt")) ||
                    (Has(c, "userinfo.txt") && Has(c, "country code:") && Has(c, "execute path:"));
         }},
        
        {StealerFamily::NOXTY, "Identification.txt",
         [](C c, C) {
             return (Has(c, "user:") && Has(c, "operating system:") && Has(c, "identification.txt")) ||
                    (Has(c, "identification.txt") && Has(c, "uptime:") && Has(c, "screenresolution:"));
         }},
        
        {StealerFamily::PHEMEDRONE, "Geolocation Data and Hardware Info dividers",
         [](C c, C) { return Has(c, "geolocation data") && Has(c, "hardware info"); }},
        
        {StealerFamily::RL_STEALER, "Padded Operating System and PC User labels",
         [](C c, C) { return Has(c, "operating system :") && Has(c, "pc user :"); }},
        
        {StealerFamily::SKALKA, "Operation system with jar file path",
         [](C c, C) { return Has(c, "operation system:") && Has(c, "current jarfile path:"); }},
        
        {StealerFamily::EXELA_STEALER, "systeminfo host, OS name and version",
         [](C c, C) { return Has(c, "host name:") && Has(c, "os name:") && Has(c, "os version:"); }},
        
        {StealerFamily::BLANK_GRABBER, "systeminfo host, manufacturer and memory",
         [](C c, C) {
             return Has(c, "host name:") && Has(c, "system manufacturer:") &&
                    Has(c, "total physical memory:");
         }},
    };
}

StealerFamily SignatureDetector::Detect(const std::string& content, const std::string& file_name) const {
    if (StringUtils::IsLikelyBinary(content)) {
        spdlog::debug("Binary content in {}, using generic adapter", file_name);
        return StealerFamily::GENERIC;
    }
    
    const std::string lower_content = StringUtils::ToLower(content);
    const std::string lower_name = StringUtils::ToLower(file_name);
    
    for (const auto& rule : rules_) {
        if (rule.matches(lower_content, lower_name)) {
            spdlog::debug("{} matched {} ({})", file_name, ToString(rule.family), rule.description);
            return rule.family;
        }
    }
    
    return StealerFamily::GENERIC;
}

} // namespace parsers
} // namespace stealerlog
