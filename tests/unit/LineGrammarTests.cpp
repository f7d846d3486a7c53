/*
 * ============================================================================
 * Stealerlog Line Grammar Unit Tests
 * ============================================================================
 *
 * Separator detection, section headers, label/value splitting and the
 * junk value cleaner shared by every format adapter.
 *
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "stealerlog/parsers/line_grammar.hpp"

#include <string>

using namespace stealerlog::parsers;

// ============================================================================
// Test Fixture
// ============================================================================

class LineGrammarTest : public ::testing::Test {
protected:
    void SetUp() override {
    }

    void TearDown() override {
    }
};

// ============================================================================
// Line Shape
// ============================================================================

TEST_F(LineGrammarTest, NormalizeLine_StripsDashPrefix) {
    EXPECT_EQ(LineGrammar::NormalizeLine("  - IP: 1.2.3.4"), "IP: 1.2.3.4");
    EXPECT_EQ(LineGrammar::NormalizeLine("\t\tGPU: RTX"), "GPU: RTX");
}

TEST_F(LineGrammarTest, NormalizeLine_StripsOnlyOneDash) {
    EXPECT_EQ(LineGrammar::NormalizeLine("-- x"), "- x");
}

// ============================================================================
// Separators
// ============================================================================

TEST_F(LineGrammarTest, IsSeparatorLine_BlankAndPureDividers) {
    EXPECT_TRUE(LineGrammar::IsSeparatorLine(""));
    EXPECT_TRUE(LineGrammar::IsSeparatorLine("   "));
    EXPECT_TRUE(LineGrammar::IsSeparatorLine("========"));
    EXPECT_TRUE(LineGrammar::IsSeparatorLine("--------------------"));
}

TEST_F(LineGrammarTest, IsSeparatorLine_ShortOrMixedRunsAreNotDividers) {
    EXPECT_FALSE(LineGrammar::IsSeparatorLine("======="));
    EXPECT_FALSE(LineGrammar::IsSeparatorLine("====----"));
}

TEST_F(LineGrammarTest, IsSeparatorLine_TitledDivider) {
    EXPECT_TRUE(LineGrammar::IsSeparatorLine("----- Geolocation Data -----"));
    EXPECT_TRUE(LineGrammar::IsSeparatorLine("=== Hardware ==="));
}

TEST_F(LineGrammarTest, IsSeparatorLine_BannerWithFieldLabelIsNotSeparator) {
    EXPECT_FALSE(LineGrammar::IsSeparatorLine("========IP: 1.2.3.4========"));
    EXPECT_TRUE(LineGrammar::IsSeparatorLine("========Daisy========"));
}

TEST_F(LineGrammarTest, IsSeparatorLine_CredentialProfileRejectsTitledDivider) {
    const auto& profile = SeparatorProfile::Credential();
    EXPECT_FALSE(LineGrammar::IsSeparatorLine("--- Chrome ---", profile));
    EXPECT_TRUE(LineGrammar::IsSeparatorLine("========Daisy========", profile));
    EXPECT_FALSE(LineGrammar::IsSeparatorLine("========URL: a.com========", profile));
}

TEST_F(LineGrammarTest, IsSeparatorLine_OrdinaryLinesAreNotSeparators) {
    EXPECT_FALSE(LineGrammar::IsSeparatorLine("OS: Windows 10"));
    EXPECT_FALSE(LineGrammar::IsSeparatorLine("- IP: 1.2.3.4"));
}

// ============================================================================
// Sections
// ============================================================================

TEST_F(LineGrammarTest, ExtractSectionFromSeparator_ReturnsTitle) {
    auto title = LineGrammar::ExtractSectionFromSeparator("----- Hardware Info -----");
    ASSERT_TRUE(title.has_value());
    EXPECT_EQ(*title, "Hardware Info");
    EXPECT_FALSE(LineGrammar::ExtractSectionFromSeparator("----------").has_value());
}

TEST_F(LineGrammarTest, ExtractIniHeader_BracketedName) {
    auto header = LineGrammar::ExtractIniHeader("[Network]");
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(*header, "Network");
    EXPECT_FALSE(LineGrammar::ExtractIniHeader("[]").has_value());
    EXPECT_FALSE(LineGrammar::ExtractIniHeader("Network").has_value());
}

TEST_F(LineGrammarTest, CanonicalSection_MapsKnownTags) {
    EXPECT_EQ(LineGrammar::CanonicalSection("Geolocation Data"), "geolocation");
    EXPECT_EQ(LineGrammar::CanonicalSection("Hardware Info"), "hardware");
    EXPECT_EQ(LineGrammar::CanonicalSection("Machine"), "machine");
    EXPECT_EQ(LineGrammar::CanonicalSection("Browsers"), "browsers");
}

// ============================================================================
// Label / Value
// ============================================================================

TEST_F(LineGrammarTest, ExtractValue_ColonFirst) {
    EXPECT_EQ(LineGrammar::ExtractValue("Path: C:\\Users\\x"), "C:\\Users\\x");
    EXPECT_EQ(LineGrammar::ExtractValue("Time: 12:30:00"), "12:30:00");
}

TEST_F(LineGrammarTest, ExtractValue_DashAndEquals) {
    EXPECT_EQ(LineGrammar::ExtractValue("OS - Windows 10"), "Windows 10");
    EXPECT_EQ(LineGrammar::ExtractValue("HWID = ABC"), "ABC");
    EXPECT_EQ(LineGrammar::ExtractValue("-x"), "-x");
}

TEST_F(LineGrammarTest, ExtractValue_NoSeparatorReturnsLine) {
    EXPECT_EQ(LineGrammar::ExtractValue("  plain text  "), "plain text");
}

// ============================================================================
// Value Cleaner
// ============================================================================

TEST_F(LineGrammarTest, CleanValue_JunkTokensAreNull) {
    EXPECT_FALSE(LineGrammar::CleanValue("Unknown").has_value());
    EXPECT_FALSE(LineGrammar::CleanValue("[REDACTED]").has_value());
    EXPECT_FALSE(LineGrammar::CleanValue("").has_value());
    EXPECT_FALSE(LineGrammar::CleanValue("N/A").has_value());
    EXPECT_FALSE(LineGrammar::CleanValue("none").has_value());
    EXPECT_FALSE(LineGrammar::CleanValue(" null ").has_value());
}

TEST_F(LineGrammarTest, CleanValue_KeepsOriginalCase) {
    auto value = LineGrammar::CleanValue("US");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "US");
    EXPECT_EQ(*LineGrammar::CleanValue("  Windows 10 Pro "), "Windows 10 Pro");
}

// ============================================================================
// Extractors
// ============================================================================

TEST_F(LineGrammarTest, ExtractIP_DropsSuffix) {
    EXPECT_EQ(LineGrammar::ExtractIP("1.2.3.4 / Germany"), "1.2.3.4");
}

TEST_F(LineGrammarTest, ExtractUsername_DropsDomain) {
    EXPECT_EQ(LineGrammar::ExtractUsername("DESKTOP-1\\alice"), "alice");
    EXPECT_EQ(LineGrammar::ExtractUsername("host/bob"), "bob");
    EXPECT_EQ(LineGrammar::ExtractUsername("carol"), "carol");
}

TEST_F(LineGrammarTest, CaptureDateText_CutsSignature) {
    EXPECT_EQ(LineGrammar::CaptureDateText("29.06.2025 21:02:11 (sig:abc)"), "29.06.2025 21:02:11");
    EXPECT_EQ(LineGrammar::CaptureDateText("29 Jun 25 21:02 [UTC+2]"), "29 Jun 25 21:02");
}

TEST_F(LineGrammarTest, CombineOS_JoinsNameAndBuild) {
    auto os = LineGrammar::CombineOS(std::string("Microsoft Windows 10 Pro"),
                                     std::string("10.0.19045 N/A Build 19045"));
    ASSERT_TRUE(os.has_value());
    EXPECT_EQ(*os, "Microsoft Windows 10 Pro 10.0.19045 19045");
}

TEST_F(LineGrammarTest, CombineOS_SinglePart) {
    EXPECT_EQ(*LineGrammar::CombineOS(std::string("macOS"), std::nullopt), "macOS");
    EXPECT_EQ(*LineGrammar::CombineOS(std::nullopt, std::string("14.2")), "14.2");
    EXPECT_FALSE(LineGrammar::CombineOS(std::nullopt, std::nullopt).has_value());
}

TEST_F(LineGrammarTest, NormalizeRAM_ConvertsMegabytes) {
    EXPECT_EQ(LineGrammar::NormalizeRAM("16,384 MB"), "16.00 GB");
    EXPECT_EQ(LineGrammar::NormalizeRAM("8 GB"), "8 GB");
    EXPECT_EQ(LineGrammar::NormalizeRAM("lots"), "lots");
}

// ============================================================================
// Oversized Input
// ============================================================================

TEST_F(LineGrammarTest, IsSeparatorLine_MegabyteLines) {
    const std::string filler(1 << 20, 'x');
    EXPECT_FALSE(LineGrammar::IsSeparatorLine("--------" + filler));
    EXPECT_TRUE(LineGrammar::IsSeparatorLine("========" + filler + "========"));
    EXPECT_TRUE(LineGrammar::IsSeparatorLine(std::string(1 << 20, '=')));
}

TEST_F(LineGrammarTest, ExtractSectionFromSeparator_MegabyteTitle) {
    const std::string filler(1 << 20, 'x');
    auto title = LineGrammar::ExtractSectionFromSeparator("--- " + filler + " ---");
    ASSERT_TRUE(title.has_value());
    EXPECT_EQ(title->size(), filler.size());
    EXPECT_FALSE(LineGrammar::ExtractSectionFromSeparator("---" + filler).has_value());
}

TEST_F(LineGrammarTest, CaptureDateText_MegabyteValueIsClamped) {
    std::string date = LineGrammar::CaptureDateText(std::string(1 << 20, 'a'));
    EXPECT_EQ(date.size(), LineGrammar::kMaxPatternInput);
    
    EXPECT_EQ(LineGrammar::CaptureDateText("29 June 2025 (" + std::string(1 << 20, 'z') + ")"),
              "29 June 2025");
}

TEST_F(LineGrammarTest, NormalizeRAM_MegabyteValueUnchanged) {
    const std::string value = "1024 MB" + std::string(1 << 20, ' ') + "x";
    EXPECT_EQ(LineGrammar::NormalizeRAM(value), value);
}
