/*
 * ============================================================================
 * Stealerlog Family Adapter Unit Tests
 * ============================================================================
 *
 * Field extraction for every family layout: flat, sectioned, systeminfo
 * and RedLine-style. Covers first-write-wins, list blocks, next-line
 * captures, section scoping, value transforms and OS name/version
 * combination.
 *
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "stealerlog/parsers/family_adapters.hpp"

#include <string>

using namespace stealerlog::parsers;

// ============================================================================
// Test Fixture
// ============================================================================

class FamilyAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
    }

    void TearDown() override {
    }

    static std::string Value(const ParsedSystemInfo& info, Field field) {
        return info.Get(field).value_or("<null>");
    }

    const CountryResolver& countries_ = IsoCountryResolver::Default();
};

// ============================================================================
// Flat Layouts
// ============================================================================

TEST_F(FamilyAdapterTest, Lumma_ExtractsFieldsAndLists) {
    const std::string content =
        "- IP Address: 84.1.2.3\n"
        "- Country: DE\n"
        "- OS Version: Windows 10 Pro\n"
        "- HWID: ABC123\n"
        "- CPU Name: Intel Core i7\n"
        "- RAM Size: 16 GB\n"
        "- User: DESKTOP\\john\n"
        "- Computer: DESKTOP-1\n"
        "- Local Date: 29.06.2025 21:02:11\n"
        "- GPU:\n"
        "    -NVIDIA GeForce RTX 3060\n"
        "    -Intel UHD Graphics\n"
        "- Anti Virus:\n"
        "    -Windows Defender\n"
        "    -Avast\n";

    auto info = FamilyAdapters::ParseLumma(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "84.1.2.3");
    EXPECT_EQ(Value(info, Field::COUNTRY), "DE");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::HWID), "ABC123");
    EXPECT_EQ(Value(info, Field::CPU), "Intel Core i7");
    EXPECT_EQ(Value(info, Field::RAM), "16 GB");
    EXPECT_EQ(Value(info, Field::USERNAME), "john");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "DESKTOP-1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_EQ(Value(info, Field::GPU), "NVIDIA GeForce RTX 3060");
    EXPECT_EQ(Value(info, Field::ANTIVIRUS), "Windows Defender, Avast");
}

TEST_F(FamilyAdapterTest, Lumma_FirstWriteWins) {
    auto info = FamilyAdapters::ParseLumma("User: alice\nUser: bob\n", "System.txt", countries_);
    EXPECT_EQ(Value(info, Field::USERNAME), "alice");
}

TEST_F(FamilyAdapterTest, Lumma_CountryNeverTakesAnIP) {
    auto info = FamilyAdapters::ParseLumma("Country: 1.2.3.4\nCountry: US\n", "System.txt", countries_);
    EXPECT_EQ(Value(info, Field::COUNTRY), "US");
}

TEST_F(FamilyAdapterTest, Lumma_JunkValuesLeaveFieldOpen) {
    auto info = FamilyAdapters::ParseLumma("HWID: Unknown\nHWID: N/A\nHWID: H-42\n", "System.txt", countries_);
    EXPECT_EQ(Value(info, Field::HWID), "H-42");
}

TEST_F(FamilyAdapterTest, CryptBot_SplitsUserAndComputerPair) {
    const std::string content =
        "OS: Windows 10 Pro\n"
        "Local Date and Time: 29.06.2025 21:02:11\n"
        "UserName (ComputerName): john (DESKTOP-1)\n"
        "CPU: Intel i7 [8 cores]\n";

    auto info = FamilyAdapters::ParseCryptBot(content, "DESKTOP-1_Information.txt", countries_);

    EXPECT_EQ(Value(info, Field::USERNAME), "john");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "DESKTOP-1");
    EXPECT_EQ(Value(info, Field::CPU), "Intel i7");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
}

TEST_F(FamilyAdapterTest, Ailurophile_RedactedValuesAreDropped) {
    const std::string content =
        "IP: [REDACTED]\n"
        "Country: [REDACTED]\n"
        "Hostname: [REDACTED]\n"
        "PC Type: Microsoft Windows 10\n"
        "Allowed Extensions: .txt\n";

    auto info = FamilyAdapters::ParseAilurophile(content, "System.txt", countries_);

    EXPECT_FALSE(info.Has(Field::IP_ADDRESS));
    EXPECT_FALSE(info.Has(Field::COUNTRY));
    EXPECT_FALSE(info.Has(Field::COMPUTER_NAME));
    EXPECT_EQ(Value(info, Field::OS), "Microsoft Windows 10");
}

TEST_F(FamilyAdapterTest, RLStealer_PaddedLabels) {
    const std::string content =
        "Operating System : Windows 10\n"
        "PC User : DESKTOP/john\n";

    auto info = FamilyAdapters::ParseRLStealer(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::OS), "Windows 10");
    EXPECT_EQ(Value(info, Field::USERNAME), "john");
}

TEST_F(FamilyAdapterTest, Banshee_StripsUserAnnotationAndCpuClock) {
    const std::string content =
        "HWID: B-1\n"
        "Log Date: 29.06.2025 21:02:11\n"
        "Build Name: main\n"
        "Country Code: DE\n"
        "User Name: john (admin)\n"
        "Computer Name: MAC-1\n"
        "Operation System: macOS 14.2\n"
        "CPU: Apple M1, 3.20 GHz\n"
        "RAM: 16 GB\n"
        "IP: 5.6.7.8\n";

    auto info = FamilyAdapters::ParseBanshee(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::HWID), "B-1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_EQ(Value(info, Field::COUNTRY), "DE");
    EXPECT_EQ(Value(info, Field::USERNAME), "john");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "MAC-1");
    EXPECT_EQ(Value(info, Field::OS), "macOS 14.2");
    EXPECT_EQ(Value(info, Field::CPU), "Apple M1");
    EXPECT_EQ(Value(info, Field::RAM), "16 GB");
    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "5.6.7.8");
}

TEST_F(FamilyAdapterTest, Meduza_CoreSuffixAndExecutePath) {
    const std::string content =
        "HWID: M-1\n"
        "Log Date: 01.07.2025 10:00:00\n"
        "Build Name: x\n"
        "Country Code: US\n"
        "User Name: DESKTOP\\alice\n"
        "Computer Name: DESKTOP\n"
        "Operation System: Windows 10 Pro\n"
        "CPU: Intel Core i5, 6 cores\n"
        "GPU: Intel UHD\n"
        "RAM: 8 GB\n"
        "IP: 1.1.1.1\n"
        "Execute Path: C:\\Temp\\m.exe\n";

    auto info = FamilyAdapters::ParseMeduza(content, "UserInfo.txt", countries_);

    EXPECT_EQ(Value(info, Field::HWID), "M-1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "01.07.2025 10:00:00");
    EXPECT_EQ(Value(info, Field::COUNTRY), "US");
    EXPECT_EQ(Value(info, Field::USERNAME), "alice");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "DESKTOP");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::CPU), "Intel Core i5");
    EXPECT_EQ(Value(info, Field::GPU), "Intel UHD");
    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "1.1.1.1");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\Temp\\m.exe");
}

TEST_F(FamilyAdapterTest, Noxty_StripsClockAndDriverNotes) {
    const std::string content =
        "User: bob\n"
        "Operating System: Windows 11 Home\n"
        "Process Executable Path: C:\\Tools\\agent.exe\n"
        "CPU: AMD Ryzen 5 3600 3.59 GHz\n"
        "RAM: 16 GB\n"
        "GPU: NVIDIA GTX 1660 (driver 531.41)\n"
        "Serial Number: SN-77\n"
        "IP: 2.2.2.2\n"
        "Country: Netherlands\n";

    auto info = FamilyAdapters::ParseNoxty(content, "Identification.txt", countries_);

    EXPECT_EQ(Value(info, Field::USERNAME), "bob");
    EXPECT_EQ(Value(info, Field::OS), "Windows 11 Home");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\Tools\\agent.exe");
    EXPECT_EQ(Value(info, Field::CPU), "AMD Ryzen 5 3600");
    EXPECT_EQ(Value(info, Field::GPU), "NVIDIA GTX 1660");
    EXPECT_EQ(Value(info, Field::HWID), "SN-77");
    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "2.2.2.2");
    EXPECT_EQ(Value(info, Field::COUNTRY), "NL");
}

TEST_F(FamilyAdapterTest, Predator_LaunchTimeAndRamNote) {
    const std::string content =
        "Predator The Thief\n"
        "User Name: carol\n"
        "Machine Name: PC-P\n"
        "OS Version: Windows 7 SP1\n"
        "Launch Time: 29.06.2025 21:02:11\n"
        "CPU Info: Intel Pentium\n"
        "Amount of RAM: 4096 MB (4 GB)\n"
        "GPU Info: AMD Radeon\n"
        "Startup Folder: C:\\Users\\carol\\AppData\n";

    auto info = FamilyAdapters::ParsePredator(content, "Information.txt", countries_);

    EXPECT_EQ(Value(info, Field::USERNAME), "carol");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "PC-P");
    EXPECT_EQ(Value(info, Field::OS), "Windows 7 SP1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_EQ(Value(info, Field::CPU), "Intel Pentium");
    EXPECT_EQ(Value(info, Field::RAM), "4096 MB");
    EXPECT_EQ(Value(info, Field::GPU), "AMD Radeon");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\Users\\carol\\AppData");
}

TEST_F(FamilyAdapterTest, Rhadamanthys_RedactedHwidFallsBackToMachineId) {
    const std::string content =
        "Install Date: 2025-06-29 21:02:11\n"
        "Traffic Name: t1\n"
        "HWID: [REDACTED]\n"
        "MachineID: MID-9\n"
        "IP: [REDACTED]\n"
        "Country: [REDACTED]\n"
        "Processor: Intel i9\n"
        "Installed RAM: 32 GB\n"
        "OS: Windows 10 Enterprise\n"
        "Video Card: NVIDIA RTX 4090\n"
        "Computer Name: RH-1\n"
        "User Name: RH-1\\dan\n";

    auto info = FamilyAdapters::ParseRhadamanthys(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::LOG_DATE), "2025-06-29 21:02:11");
    EXPECT_EQ(Value(info, Field::HWID), "MID-9");
    EXPECT_FALSE(info.Has(Field::IP_ADDRESS));
    EXPECT_FALSE(info.Has(Field::COUNTRY));
    EXPECT_EQ(Value(info, Field::CPU), "Intel i9");
    EXPECT_EQ(Value(info, Field::RAM), "32 GB");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Enterprise");
    EXPECT_EQ(Value(info, Field::GPU), "NVIDIA RTX 4090");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "RH-1");
    EXPECT_EQ(Value(info, Field::USERNAME), "dan");
}

TEST_F(FamilyAdapterTest, Skalka_RewritesWindowsNameAndJarPath) {
    const std::string content =
        "Operation System: win10 amd64\n"
        "Current JarFile Path: /home/u/app.jar\n"
        "Username: erin\n"
        "IP: 3.3.3.3\n"
        "Timezone: 2025-06-29T21:02:11.123+02:00\n"
        "Language & Country: en_US\n";

    auto info = FamilyAdapters::ParseSkalka(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::OS), "Windows 10 amd64");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "\\home\\u\\app.jar");
    EXPECT_EQ(Value(info, Field::USERNAME), "erin");
    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "3.3.3.3");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "2025-06-29T21:02:11.123");
    EXPECT_EQ(Value(info, Field::COUNTRY), "US");
}

TEST_F(FamilyAdapterTest, XFiles_CombinedLabels) {
    const std::string content =
        "Operation ID: 77\n"
        "IP: 4.4.4.4\n"
        "Country: France\n"
        "Operating System: Windows 10 Pro\n"
        "Username: frank\n"
        "Computer Name: XF-1\n"
        "Hardware ID: XH-1\n"
        "CPU Processor: Intel i3\n"
        "GPU Display Devices: Intel HD 620\n"
        "RAM Memory: 8 GB\n";

    auto info = FamilyAdapters::ParseXFiles(content, "Information.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "4.4.4.4");
    EXPECT_EQ(Value(info, Field::COUNTRY), "FR");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::USERNAME), "frank");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "XF-1");
    EXPECT_EQ(Value(info, Field::HWID), "XH-1");
    EXPECT_EQ(Value(info, Field::CPU), "Intel i3");
    EXPECT_EQ(Value(info, Field::GPU), "Intel HD 620");
    EXPECT_EQ(Value(info, Field::RAM), "8 GB");
}

TEST_F(FamilyAdapterTest, DarkCrystal_CountryCodePrefixAndUnknownHardware) {
    const std::string content =
        "PC Name: SRV-01\n"
        "User Name: SRV-01\\admin\n"
        "Windows: Windows Server 2019\n"
        "CPU Name: Unknown\n"
        "GPU Name: Microsoft Basic Display\n"
        "RAM: 4096 MB\n"
        "IP: 6.6.6.6\n"
        "Country: RU [Russia]\n"
        "Save Time: 29.06.2025 21:02:11\n"
        "Path: C:\\ProgramData\\dc.exe\n";

    auto info = FamilyAdapters::ParseDarkCrystal(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "SRV-01");
    EXPECT_EQ(Value(info, Field::USERNAME), "admin");
    EXPECT_EQ(Value(info, Field::OS), "Windows Server 2019");
    EXPECT_FALSE(info.Has(Field::CPU));
    EXPECT_EQ(Value(info, Field::GPU), "Microsoft Basic Display");
    EXPECT_EQ(Value(info, Field::RAM), "4096 MB");
    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "6.6.6.6");
    EXPECT_EQ(Value(info, Field::COUNTRY), "RU");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\ProgramData\\dc.exe");
}

TEST_F(FamilyAdapterTest, DarkCrystal_CountryNameResolved) {
    auto info = FamilyAdapters::ParseDarkCrystal("Country: Germany\n", "System.txt", countries_);
    EXPECT_EQ(Value(info, Field::COUNTRY), "DE");
}

// ============================================================================
// Systeminfo Layouts
// ============================================================================

TEST_F(FamilyAdapterTest, BlankGrabber_NextLineCapturesAndOSCombine) {
    const std::string content =
        "Host Name:                 DESKTOP-1\n"
        "OS Name:                   Microsoft Windows 10 Pro\n"
        "OS Version:                10.0.19045 N/A Build 19045\n"
        "Registered Owner:          john\n"
        "System Manufacturer:       Dell\n"
        "Total Physical Memory:     16,262 MB\n"
        "Processor(s):              1 Processor(s) Installed.\n"
        "                           [01]: Intel64 Family 6 Model 158\n"
        "Network Card(s):           1 NIC(s) Installed.\n"
        "                           [01]: Intel Ethernet\n"
        "                                 IP address(es)\n"
        "                                 [01]: 192.168.1.10\n";

    auto info = FamilyAdapters::ParseBlankGrabber(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "DESKTOP-1");
    EXPECT_EQ(Value(info, Field::OS), "Microsoft Windows 10 Pro 10.0.19045 19045");
    EXPECT_EQ(Value(info, Field::USERNAME), "john");
    EXPECT_EQ(Value(info, Field::RAM), "16,262 MB");
    EXPECT_EQ(Value(info, Field::CPU), "Intel64 Family 6 Model 158");
    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "192.168.1.10");
}

TEST_F(FamilyAdapterTest, Exela_BannerLabelsOverSystemInfo) {
    const std::string content =
        "IP: 7.7.7.7\n"
        "Country: 7.7.7.7\n"
        "Country: Poland\n"
        "User Name: gina\n"
        "HWID: EX-1\n"
        "Log Date: 29.06.2025 21:02:11\n"
        "\n"
        "Host Name:                 EX-PC\n"
        "OS Name:                   Microsoft Windows 11 Pro\n"
        "OS Version:                10.0.22631 N/A Build 22631\n"
        "Total Physical Memory:     32,000 MB\n";

    auto info = FamilyAdapters::ParseExela(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "7.7.7.7");
    EXPECT_EQ(Value(info, Field::COUNTRY), "PL");
    EXPECT_EQ(Value(info, Field::USERNAME), "gina");
    EXPECT_EQ(Value(info, Field::HWID), "EX-1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "EX-PC");
    EXPECT_EQ(Value(info, Field::OS), "Microsoft Windows 11 Pro 10.0.22631 22631");
    EXPECT_EQ(Value(info, Field::RAM), "32,000 MB");
}

// ============================================================================
// Sectioned Layouts
// ============================================================================

TEST_F(FamilyAdapterTest, StealC_SectionScopingAndIndentedGpuList) {
    const std::string content =
        "IP: 9.9.9.9\n"
        "Network Info:\n"
        "\t- IP: 1.2.3.4\n"
        "\t- Country: US\n"
        "\n"
        "System Summary:\n"
        "\t- HWID: H1\n"
        "\t- OS: Windows 10 Pro\n"
        "\t- Username: john\n"
        "\t- Computer Name: PC-1\n"
        "\t- Local Time: 2025/6/29 21:2:11\n"
        "\t- CPU: Intel i5\n"
        "\t- RAM: 8191 MB\n"
        "\t- GPU:\n"
        "\t\t-Intel HD\n"
        "\t\t-NVIDIA\n";

    auto info = FamilyAdapters::ParseStealC(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "1.2.3.4");
    EXPECT_EQ(Value(info, Field::COUNTRY), "US");
    EXPECT_EQ(Value(info, Field::HWID), "H1");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::USERNAME), "john");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "PC-1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "2025/6/29 21:2:11");
    EXPECT_EQ(Value(info, Field::CPU), "Intel i5");
    EXPECT_EQ(Value(info, Field::RAM), "8191 MB");
    EXPECT_EQ(Value(info, Field::GPU), "Intel HD");
}

TEST_F(FamilyAdapterTest, StealC_GpuItemsAtHeaderIndent) {
    const std::string content =
        "System Summary:\n"
        "  OS: Windows 11\n"
        "  GPU:\n"
        "  - NVIDIA RTX 3070\n"
        "  - Intel UHD\n"
        "  CPU: Intel i7\n";

    auto info = FamilyAdapters::ParseStealC(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::OS), "Windows 11");
    EXPECT_EQ(Value(info, Field::GPU), "NVIDIA RTX 3070");
    EXPECT_EQ(Value(info, Field::CPU), "Intel i7");
}

TEST_F(FamilyAdapterTest, StealC_DashedHeaderDoesNotSwallowSiblingLabels) {
    const std::string content =
        "System Summary:\n"
        "\t- GPU:\n"
        "\t- CPU: Intel i5\n";

    auto info = FamilyAdapters::ParseStealC(content, "System.txt", countries_);

    EXPECT_FALSE(info.Has(Field::GPU));
    EXPECT_EQ(Value(info, Field::CPU), "Intel i5");
}

TEST_F(FamilyAdapterTest, Astris_IniSectionScoping) {
    const std::string content =
        "[General]\n"
        "HWID: AS-1\n"
        "Date: 29.06.2025 21:02:11\n"
        "Build: recaptcha-verify\n"
        "[Machine]\n"
        "Computer Name: AST-PC\n"
        "User Name: henry\n"
        "System: Windows 10 Pro\n"
        "Antiviruses: Windows Defender\n"
        "CPU: Decoy CPU\n"
        "[Geolocation]\n"
        "Country: Spain\n"
        "[Network]\n"
        "Public IP Address: 8.8.4.4\n"
        "[Hardware]\n"
        "CPU: AMD Ryzen 7\n"
        "GPU: Radeon RX 6600\n"
        "RAM: 16 GB\n";

    auto info = FamilyAdapters::ParseAstris(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::HWID), "AS-1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "AST-PC");
    EXPECT_EQ(Value(info, Field::USERNAME), "henry");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::ANTIVIRUS), "Windows Defender");
    EXPECT_EQ(Value(info, Field::COUNTRY), "ES");
    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "8.8.4.4");
    EXPECT_EQ(Value(info, Field::CPU), "AMD Ryzen 7");
    EXPECT_EQ(Value(info, Field::GPU), "Radeon RX 6600");
    EXPECT_EQ(Value(info, Field::RAM), "16 GB");
}

TEST_F(FamilyAdapterTest, RisePro_HeaderFieldsAndHardwareSection) {
    const std::string content =
        "Build: 1\n"
        "MachineID: RP-1\n"
        "Date: 29.06.2025 21:02:11\n"
        "Path: C:\\rp.exe\n"
        "IP: 9.8.7.6\n"
        "Location: PL, Warsaw\n"
        "Windows: Windows 10 Pro\n"
        "Computer Name: RP-PC [DESKTOP]\n"
        "User Name: ivan\n"
        "Processor: Decoy CPU\n"
        "\n"
        "[Hardware]\n"
        "Processor: Intel i5-10400\n"
        "RAM: 16384 MB\n"
        "Videocard #0: NVIDIA GTX 1650\n";

    auto info = FamilyAdapters::ParseRisePro(content, "information.txt", countries_);

    EXPECT_EQ(Value(info, Field::HWID), "RP-1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\rp.exe");
    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "9.8.7.6");
    EXPECT_EQ(Value(info, Field::COUNTRY), "PL");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "RP-PC");
    EXPECT_EQ(Value(info, Field::USERNAME), "ivan");
    EXPECT_EQ(Value(info, Field::CPU), "Intel i5-10400");
    EXPECT_EQ(Value(info, Field::RAM), "16384 MB");
    EXPECT_EQ(Value(info, Field::GPU), "NVIDIA GTX 1650");
}

TEST_F(FamilyAdapterTest, Stealerium_IniSectionScoping) {
    const std::string content =
        "[IP]\n"
        "External IP: 10.1.1.1\n"
        "Username: decoy\n"
        "[Machine]\n"
        "Username: jack\n"
        "Compname: ST-PC\n"
        "System: Windows 11\n"
        "CPU: Intel i7\n"
        "GPU: Intel Iris\n"
        "RAM: 16 GB\n"
        "Date: 29.06.2025 21:02:11\n"
        "[Virtualization]\n"
        "Antivirus: Windows Defender\n";

    auto info = FamilyAdapters::ParseStealerium(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "10.1.1.1");
    EXPECT_EQ(Value(info, Field::USERNAME), "jack");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "ST-PC");
    EXPECT_EQ(Value(info, Field::OS), "Windows 11");
    EXPECT_EQ(Value(info, Field::CPU), "Intel i7");
    EXPECT_EQ(Value(info, Field::GPU), "Intel Iris");
    EXPECT_EQ(Value(info, Field::RAM), "16 GB");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_EQ(Value(info, Field::ANTIVIRUS), "Windows Defender");
}

TEST_F(FamilyAdapterTest, Vidar_IniSectionsAndRedaction) {
    const std::string content =
        "Version: 7.2\n"
        "Date: 29.06.2025 21:02:11\n"
        "MachineID: abc\n"
        "HWID: H1\n"
        "Path: C:\\a.exe\n"
        "Windows: Windows 10 Pro\n"
        "Computer Name: PC-1\n"
        "User Name: john\n"
        "IP: [REDACTED]\n"
        "Country: [REDACTED]\n"
        "\n"
        "[Hardware]\n"
        "Processor: Intel i7\n"
        "RAM: 16384 MB\n"
        "Videocard: NVIDIA RTX\n";

    auto info = FamilyAdapters::ParseVidar(content, "information.txt", countries_);

    EXPECT_EQ(Value(info, Field::HWID), "abc");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\a.exe");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "29.06.2025 21:02:11");
    EXPECT_FALSE(info.Has(Field::IP_ADDRESS));
    EXPECT_FALSE(info.Has(Field::COUNTRY));
    EXPECT_EQ(Value(info, Field::CPU), "Intel i7");
    EXPECT_EQ(Value(info, Field::RAM), "16384 MB");
    EXPECT_EQ(Value(info, Field::GPU), "NVIDIA RTX");
}

TEST_F(FamilyAdapterTest, Phemedrone_TitledDividerSections) {
    const std::string content =
        "----- Geolocation Data -----\n"
        "IP: 1.2.3.4\n"
        "Country: Germany\n"
        "----- Hardware Info -----\n"
        "Username: john\n"
        "Windows name: Windows 11 Pro\n"
        "Hardware ID: HW1\n"
        "GPU: RTX 4070\n"
        "----- Miscellaneous -----\n"
        "Antivirus products: Windows Defender\n"
        "File Location: C:\\x.exe\n";

    auto info = FamilyAdapters::ParsePhemedrone(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "1.2.3.4");
    EXPECT_EQ(Value(info, Field::COUNTRY), "DE");
    EXPECT_EQ(Value(info, Field::USERNAME), "john");
    EXPECT_EQ(Value(info, Field::OS), "Windows 11 Pro");
    EXPECT_EQ(Value(info, Field::HWID), "HW1");
    EXPECT_EQ(Value(info, Field::GPU), "RTX 4070");
    EXPECT_EQ(Value(info, Field::ANTIVIRUS), "Windows Defender");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\x.exe");
}

TEST_F(FamilyAdapterTest, Raccoon_SystemBlockAndNumberedDisplayList) {
    const std::string content =
        "System Information:\n"
        "- IP: 1.2.3.4\n"
        "- Location: Berlin, Germany (DE)\n"
        "- ComputerName: PC-1\n"
        "- Username: john\n"
        "- Product Name: Windows 10 Pro\n"
        "- CPU: Intel i7 (8 cores)\n"
        "- RAM: 16384 MB (free)\n"
        "\n"
        "Display Devices:\n"
        "1) NVIDIA RTX\n"
        "2) Intel UHD\n";

    auto info = FamilyAdapters::ParseRaccoon(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "1.2.3.4");
    EXPECT_EQ(Value(info, Field::COUNTRY), "DE");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "PC-1");
    EXPECT_EQ(Value(info, Field::USERNAME), "john");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::CPU), "Intel i7");
    EXPECT_EQ(Value(info, Field::RAM), "16384 MB");
    EXPECT_EQ(Value(info, Field::GPU), "NVIDIA RTX");
}

TEST_F(FamilyAdapterTest, AtomicMac_CombinesProductVersionAndBuild) {
    const std::string content =
        "ProductName: macOS\n"
        "ProductVersion: 14.2.1\n"
        "BuildVersion: 23C71\n"
        "Hardware:\n"
        "\n"
        "    Hardware Overview:\n"
        "\n"
        "      Model Name: MacBook Pro\n"
        "      Chip: Apple M1 Pro\n"
        "      Memory: 16 GB\n"
        "      Serial Number (system): C02XYZ\n"
        "\n"
        "Graphics/Displays:\n"
        "\n"
        "    Apple M1 Pro:\n"
        "\n"
        "      Chipset Model: Apple M1 Pro GPU\n";

    auto info = FamilyAdapters::ParseAtomicMac(content, "System.txt", countries_);

    EXPECT_EQ(Value(info, Field::OS), "macOS 14.2.1 (23C71)");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "MacBook Pro");
    EXPECT_EQ(Value(info, Field::CPU), "Apple M1 Pro");
    EXPECT_EQ(Value(info, Field::RAM), "16 GB");
    EXPECT_EQ(Value(info, Field::HWID), "C02XYZ");
    EXPECT_EQ(Value(info, Field::GPU), "Apple M1 Pro GPU");
}

// ============================================================================
// RedLine-Style Layouts
// ============================================================================

TEST_F(FamilyAdapterTest, RedLine_HardwareBlockAndAntivirusList) {
    const std::string content =
        "Build ID: cloud\n"
        "IP: 1.2.3.4\n"
        "FileLocation: C:\\Users\\john\\a.exe\n"
        "UserName: john\n"
        "Country: US\n"
        "HWID: H1\n"
        "Operation System: Windows 10 Pro x64\n"
        "MachineName: DESKTOP-1\n"
        "Log date: 6/29/2025 9:02:11 PM\n"
        "Hardwares:\n"
        "Name: Intel(R) Core(TM) i7-9700 CPU @ 3.00GHz, 8 Cores\n"
        "Name: NVIDIA GeForce RTX 3060, 4293918720 bytes\n"
        "Name: Total of RAM, 16297.36 MB or 17089310720 bytes\n"
        "Anti-Viruses:\n"
        "Windows Defender\n"
        "Avast\n";

    auto info = FamilyAdapters::ParseRedLine(content, "UserInformation.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "1.2.3.4");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\Users\\john\\a.exe");
    EXPECT_EQ(Value(info, Field::USERNAME), "john");
    EXPECT_EQ(Value(info, Field::COUNTRY), "US");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro x64");
    EXPECT_EQ(Value(info, Field::COMPUTER_NAME), "DESKTOP-1");
    EXPECT_EQ(Value(info, Field::LOG_DATE), "6/29/2025 9:02:11 PM");
    EXPECT_EQ(Value(info, Field::CPU), "Intel(R) Core(TM) i7-9700 CPU @ 3.00GHz");
    EXPECT_EQ(Value(info, Field::GPU), "NVIDIA GeForce RTX 3060");
    EXPECT_EQ(Value(info, Field::RAM), "16297.36 MB");
    EXPECT_EQ(Value(info, Field::ANTIVIRUS), "Windows Defender, Avast");
}

TEST_F(FamilyAdapterTest, ArechClient_HardwareBlockWithoutMachineFields) {
    const std::string content =
        "IP: 11.11.11.11\n"
        "FileLocation: C:\\a\\b.exe\n"
        "UserName: kate\n"
        "Country: GB\n"
        "HWID: AR-1\n"
        "Operation System: Windows 10 Pro\n"
        "Hardwares:\n"
        "Name: AMD Ryzen 5 5600X 6-Core Processor, 12 Cores\n"
        "Name: Total of RAM, 32768.00 MB or 34359738368 bytes\n"
        "MachineName: AR-PC\n";

    auto info = FamilyAdapters::ParseArechClient(content, "UserInformation.txt", countries_);

    EXPECT_EQ(Value(info, Field::IP_ADDRESS), "11.11.11.11");
    EXPECT_EQ(Value(info, Field::FILE_PATH), "C:\\a\\b.exe");
    EXPECT_EQ(Value(info, Field::USERNAME), "kate");
    EXPECT_EQ(Value(info, Field::COUNTRY), "GB");
    EXPECT_EQ(Value(info, Field::HWID), "AR-1");
    EXPECT_EQ(Value(info, Field::OS), "Windows 10 Pro");
    EXPECT_EQ(Value(info, Field::CPU), "AMD Ryzen 5 5600X 6-Core Processor");
    EXPECT_EQ(Value(info, Field::RAM), "32768.00 MB");
    EXPECT_FALSE(info.Has(Field::COMPUTER_NAME));
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(FamilyAdapterTest, Parse_DispatchesToFamilyAdapter) {
    const std::string content = "- User: DESKTOP\\john\n- Computer: DESKTOP-1\n";

    auto direct = FamilyAdapters::ParseLumma(content, "System.txt", countries_);
    auto dispatched = FamilyAdapters::Parse(StealerFamily::LUMMA, content, "System.txt", countries_);

    EXPECT_EQ(direct.fields, dispatched.fields);
    EXPECT_EQ(Value(dispatched, Field::USERNAME), "john");
}

TEST_F(FamilyAdapterTest, Parse_EmptyContentYieldsEmptyRecord) {
    auto info = FamilyAdapters::Parse(StealerFamily::STEALC, "", "System.txt", countries_);
    EXPECT_EQ(info.PopulatedCount(), 0u);
    EXPECT_FALSE(info.Has(Field::LOG_DATE));
}
