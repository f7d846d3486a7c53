/*
 * ============================================================================
 * Stealerlog Credential Extractor Unit Tests
 * ============================================================================
 *
 * Block splitting of browser password dumps, record validity, URL domain
 * derivation and password file pre-analysis.
 *
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "stealerlog/parsers/credential_extractor.hpp"

#include <string>

using namespace stealerlog::parsers;

// ============================================================================
// Test Fixture
// ============================================================================

class CredentialExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
    }

    void TearDown() override {
    }

    CredentialExtractor extractor_;
};

// ============================================================================
// Block Grammar
// ============================================================================

TEST_F(CredentialExtractorTest, Extract_TwoBlocksSecondWithEmptyPassword) {
    const std::string content =
        "URL: https://a.com\nUsername: u\nPassword: p\n--------\n"
        "URL: https://b.com\nUsername: v\nPassword:\n";

    auto records = extractor_.Extract(content);
    ASSERT_EQ(records.size(), 2u);

    EXPECT_EQ(records[0].url, "https://a.com");
    EXPECT_EQ(records[0].username, "u");
    EXPECT_EQ(records[0].password, "p");
    EXPECT_EQ(records[0].domain, std::optional<std::string>("a.com"));
    EXPECT_EQ(records[0].tld, std::optional<std::string>("com"));

    EXPECT_EQ(records[1].url, "https://b.com");
    EXPECT_EQ(records[1].username, "v");
    EXPECT_EQ(records[1].password, "");
}

TEST_F(CredentialExtractorTest, Extract_MissingPasswordLineIsDropped) {
    const std::string content =
        "URL: https://a.com\nUsername: u\n\n"
        "URL: https://b.com\nUsername: v\nPassword:\n";

    auto records = extractor_.Extract(content);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].url, "https://b.com");
}

TEST_F(CredentialExtractorTest, Extract_MissingUrlIsDropped) {
    auto records = extractor_.Extract("Username: u\nPassword: p\n");
    EXPECT_TRUE(records.empty());
}

TEST_F(CredentialExtractorTest, Extract_ImplicitBoundaryOnSecondUrl) {
    const std::string content =
        "URL: https://a.com\nLogin: u1\nPass: p1\n"
        "Host: https://b.org\nUser: u2\nPass: p2\n";

    auto records = extractor_.Extract(content);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].username, "u1");
    EXPECT_EQ(records[1].url, "https://b.org");
    EXPECT_EQ(records[1].password, "p2");
}

TEST_F(CredentialExtractorTest, Extract_BrowserSynonyms) {
    const std::string content =
        "SOFT: Chrome (120.0)\nURL: https://a.com\nUSER: u\nPASS: p\n\n"
        "Application: Firefox\nHostname: https://files.example.net\nLogin: x\nPassword: y\n";

    auto records = extractor_.Extract(content);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].browser, std::optional<std::string>("Chrome (120.0)"));
    EXPECT_EQ(records[1].browser, std::optional<std::string>("Firefox"));
    EXPECT_EQ(records[1].domain, std::optional<std::string>("example.net"));
}

TEST_F(CredentialExtractorTest, Extract_BrandedBannerSeparatesBlocks) {
    const std::string content =
        "===============Daisy===============\n"
        "URL: https://a.com\nUsername: u\nPassword: p\n"
        "===============Daisy===============\n"
        "URL: https://b.com\nUsername: v\nPassword: q\n";

    auto records = extractor_.Extract(content);
    ASSERT_EQ(records.size(), 2u);
}

TEST_F(CredentialExtractorTest, Extract_PasswordContainingColonsAndLabels) {
    const std::string content = "URL: https://a.com\nUsername: u\nPassword: url:pass:word\n";

    auto records = extractor_.Extract(content);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].password, "url:pass:word");
}

TEST_F(CredentialExtractorTest, Extract_EmptyUsernameIsKept) {
    auto records = extractor_.Extract("URL: https://a.com\nUsername:\nPassword: p\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].username, "");
}

TEST_F(CredentialExtractorTest, Extract_RecordsFilePath) {
    auto records = extractor_.Extract("URL: https://a.com\nUsername: u\nPassword: p\n", "logs/Passwords.txt");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].file_path, std::optional<std::string>("logs/Passwords.txt"));
}

TEST_F(CredentialExtractorTest, Extract_MegabyteLinesAreHarmless) {
    const std::string filler(1 << 20, 'x');
    const std::string content =
        "URL: https://a.com\nUsername: u\nPassword: p\n"
        "========" + filler + "========\n"
        "URL: https://b.com/" + filler + "\nUsername: v\nPassword: q\n"
        "--------" + filler;

    auto records = extractor_.Extract(content);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].url, "https://a.com");
    EXPECT_EQ(records[1].username, "v");
    EXPECT_EQ(records[1].domain, std::optional<std::string>("b.com"));
}

TEST_F(CredentialExtractorTest, IsSeparatorLine_CredentialGuard) {
    EXPECT_TRUE(CredentialExtractor::IsSeparatorLine(""));
    EXPECT_TRUE(CredentialExtractor::IsSeparatorLine("========"));
    EXPECT_FALSE(CredentialExtractor::IsSeparatorLine("========Password: x========"));
}

// ============================================================================
// URL Helpers
// ============================================================================

TEST_F(CredentialExtractorTest, ExtractUrlInfo_SubdomainsAndPort) {
    auto info = CredentialExtractor::ExtractUrlInfo("https://v1.api.example.com:8080/path");
    EXPECT_EQ(info.domain, std::optional<std::string>("example.com"));
    EXPECT_EQ(info.tld, std::optional<std::string>("com"));
}

TEST_F(CredentialExtractorTest, ExtractUrlInfo_IpHost) {
    auto info = CredentialExtractor::ExtractUrlInfo("http://10.0.0.5/x");
    EXPECT_EQ(info.domain, std::optional<std::string>("10.0.0.5"));
    EXPECT_FALSE(info.tld.has_value());
}

TEST_F(CredentialExtractorTest, ExtractUrlInfo_WwwAndSingleLabel) {
    auto www = CredentialExtractor::ExtractUrlInfo("https://www.Example.org/login");
    EXPECT_EQ(www.domain, std::optional<std::string>("example.org"));
    EXPECT_EQ(www.tld, std::optional<std::string>("org"));

    auto local = CredentialExtractor::ExtractUrlInfo("http://localhost:3000");
    EXPECT_EQ(local.domain, std::optional<std::string>("localhost"));
    EXPECT_FALSE(local.tld.has_value());

    auto empty = CredentialExtractor::ExtractUrlInfo("  ");
    EXPECT_FALSE(empty.domain.has_value());
}

TEST_F(CredentialExtractorTest, ParseUrl_AllComponents) {
    auto parsed = CredentialExtractor::ParseUrl("https://www.mail.example.co:8443/inbox/view?id=7#top");
    EXPECT_EQ(parsed.protocol, std::optional<std::string>("https"));
    EXPECT_EQ(parsed.full_hostname, "mail.example.co");
    EXPECT_EQ(parsed.subdomain, std::optional<std::string>("mail"));
    EXPECT_EQ(parsed.base_domain, "example.co");
    EXPECT_EQ(parsed.domain, "example.co");
    EXPECT_EQ(parsed.tld, std::optional<std::string>("co"));
    EXPECT_EQ(parsed.port, std::optional<int>(8443));
    EXPECT_EQ(parsed.path, "/inbox/view");
    EXPECT_EQ(parsed.query, std::optional<std::string>("id=7"));
    EXPECT_EQ(parsed.fragment, std::optional<std::string>("top"));
}

TEST_F(CredentialExtractorTest, ParseUrl_BareHostDefaultsPath) {
    auto parsed = CredentialExtractor::ParseUrl("example.com");
    EXPECT_FALSE(parsed.protocol.has_value());
    EXPECT_EQ(parsed.path, "/");
    EXPECT_FALSE(parsed.subdomain.has_value());
    EXPECT_EQ(parsed.base_domain, "example.com");
}

TEST_F(CredentialExtractorTest, ParseUrl_OversizedPortIgnored) {
    auto parsed = CredentialExtractor::ParseUrl("http://example.com:" + std::string(100000, '9') + "/x");
    EXPECT_FALSE(parsed.port.has_value());
    EXPECT_EQ(parsed.full_hostname, "example.com");
}

TEST_F(CredentialExtractorTest, ParseUrl_IpHost) {
    auto parsed = CredentialExtractor::ParseUrl("http://192.168.0.1:8080/admin");
    EXPECT_EQ(parsed.domain, "192.168.0.1");
    EXPECT_FALSE(parsed.tld.has_value());
    EXPECT_EQ(parsed.port, std::optional<int>(8080));
}

TEST_F(CredentialExtractorTest, IsPasswordFileName_KnownNames) {
    EXPECT_TRUE(CredentialExtractor::IsPasswordFileName("All Passwords.txt"));
    EXPECT_TRUE(CredentialExtractor::IsPasswordFileName("logs/device/passwords.txt"));
    EXPECT_TRUE(CredentialExtractor::IsPasswordFileName("AllPasswords_list.txt"));
    EXPECT_FALSE(CredentialExtractor::IsPasswordFileName("Information.txt"));
    EXPECT_FALSE(CredentialExtractor::IsPasswordFileName("old_passwords.txt"));
}

// ============================================================================
// Pre-analysis
// ============================================================================

TEST_F(CredentialExtractorTest, Analyze_CountsPasswordsUrlsAndDomains) {
    const std::string content =
        "URL: https://a.com\nUsername: u\nPassword: shared\n\n"
        "URL: http://10.0.0.1/login\nUsername: v\nPassword: shared\n\n"
        "URL: https://c.net\nUsername: w\nPassword:\n";

    auto summary = extractor_.Analyze(content);
    EXPECT_EQ(summary.credential_count, 2u);
    EXPECT_EQ(summary.url_count, 3u);
    EXPECT_EQ(summary.domain_count, 2u);
    EXPECT_EQ(summary.password_counts.at("shared"), 2u);
    EXPECT_EQ(summary.credentials.size(), 3u);
}

TEST_F(CredentialExtractorTest, Analyze_RepeatedUrlLinesAreEachCounted) {
    const std::string content =
        "URL: https://a.com\nUsername: u\nPassword: p1\n\n"
        "URL: https://a.com\nUsername: v\nPassword: p2\n";

    auto summary = extractor_.Analyze(content);
    EXPECT_EQ(summary.url_count, 2u);
    EXPECT_EQ(summary.domain_count, 2u);
}

TEST_F(CredentialExtractorTest, Analyze_EmptyContent) {
    auto summary = extractor_.Analyze("   \n");
    EXPECT_EQ(summary.credential_count, 0u);
    EXPECT_TRUE(summary.credentials.empty());
}

TEST_F(CredentialExtractorTest, PrepareForStorage_UsesConfiguredLimit) {
    CredentialExtractor::Config config;
    config.max_username_length = 4;
    CredentialExtractor extractor(config);

    auto records = extractor.Extract("URL: https://a.com\nUsername: longname\nPassword: a\"b\n");
    auto stored = extractor.PrepareForStorage(records);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].username, "long");
    EXPECT_TRUE(stored[0].username_truncated);
    EXPECT_EQ(stored[0].password, "a\\\"b");
}
