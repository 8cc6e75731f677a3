/*
 * ============================================================================
 * PromptShield Sanitization Configuration Unit Tests
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Defaults, validation, JSON overlay, environment overlay and the shared
 * enum name tables.
 *
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "../../../src/Sanitization/SanitizationConfig.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

using namespace PromptShield::Sanitization;

// ============================================================================
// Test Fixture
// ============================================================================

class SanitizationConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_env.clear();
    }

    void TearDown() override {
    }

    EnvironmentLookup Lookup() {
        return [this](const char* name) -> std::optional<std::string> {
            const auto it = m_env.find(name);
            if (it == m_env.end()) return std::nullopt;
            return it->second;
        };
    }

    std::map<std::string, std::string> m_env;
};

// ============================================================================
// Defaults and Validation
// ============================================================================

TEST_F(SanitizationConfigTest, Defaults) {
    const SanitizationConfig cfg;

    EXPECT_FALSE(cfg.enabled);
    EXPECT_DOUBLE_EQ(cfg.blockThreshold, 75.0);
    EXPECT_DOUBLE_EQ(cfg.sanitizeThreshold, 50.0);
    EXPECT_DOUBLE_EQ(cfg.warnThreshold, 25.0);
    EXPECT_EQ(cfg.maxInputLength, 100000u);
    EXPECT_EQ(cfg.maxRepeatedChars, 50u);
    EXPECT_TRUE(cfg.cacheEnabled);
    EXPECT_EQ(cfg.cacheTtl, std::chrono::hours(24));
    EXPECT_EQ(cfg.cacheMaxEntries, 1000u);
    EXPECT_FALSE(cfg.logAllAttempts);
    EXPECT_TRUE(cfg.Validate());
}

TEST_F(SanitizationConfigTest, Validate_ThresholdOrdering) {
    SanitizationConfig cfg;
    cfg.sanitizeThreshold = 80.0;
    const auto err = cfg.Validate();
    EXPECT_FALSE(err);
    EXPECT_EQ(err.code, SanitizerErrorCode::InvalidThresholds);

    cfg = SanitizationConfig{};
    cfg.warnThreshold = -1.0;
    EXPECT_EQ(cfg.Validate().code, SanitizerErrorCode::InvalidThresholds);

    cfg = SanitizationConfig{};
    cfg.warnThreshold = 60.0;
    EXPECT_EQ(cfg.Validate().code, SanitizerErrorCode::InvalidThresholds);
}

TEST_F(SanitizationConfigTest, Validate_EqualThresholdsAllowed) {
    SanitizationConfig cfg;
    cfg.blockThreshold = 50.0;
    cfg.sanitizeThreshold = 50.0;
    cfg.warnThreshold = 50.0;
    EXPECT_TRUE(cfg.Validate());
}

TEST_F(SanitizationConfigTest, Validate_Limits) {
    SanitizationConfig cfg;
    cfg.maxRepeatedChars = 0;
    EXPECT_EQ(cfg.Validate().code, SanitizerErrorCode::InvalidConfiguration);

    cfg = SanitizationConfig{};
    cfg.cacheMaxEntries = 0;
    EXPECT_EQ(cfg.Validate().code, SanitizerErrorCode::InvalidConfiguration);

    cfg.cacheEnabled = false;
    EXPECT_TRUE(cfg.Validate());
}

// ============================================================================
// JSON Overlay
// ============================================================================

TEST_F(SanitizationConfigTest, Json_OverlaysPresentKeys) {
    SanitizationConfig cfg;
    const auto err = cfg.LoadFromJSONString(R"({
        "enabled": true,
        "blockThreshold": 90,
        "cacheTtlHours": 2,
        "logAllAttempts": true,
        "unknownKey": "ignored"
    })");

    ASSERT_TRUE(err) << err;
    EXPECT_TRUE(cfg.enabled);
    EXPECT_DOUBLE_EQ(cfg.blockThreshold, 90.0);
    EXPECT_DOUBLE_EQ(cfg.sanitizeThreshold, 50.0);
    EXPECT_EQ(cfg.cacheTtl, std::chrono::hours(2));
    EXPECT_TRUE(cfg.logAllAttempts);
}

TEST_F(SanitizationConfigTest, Json_TypeErrorLeavesConfigUnchanged) {
    SanitizationConfig cfg;
    const auto err = cfg.LoadFromJSONString(R"({"enabled": true, "blockThreshold": "high"})");

    EXPECT_EQ(err.code, SanitizerErrorCode::ParseError);
    EXPECT_FALSE(cfg.enabled);
    EXPECT_DOUBLE_EQ(cfg.blockThreshold, 75.0);
}

TEST_F(SanitizationConfigTest, Json_NegativeCountRejected) {
    SanitizationConfig cfg;
    const auto err = cfg.LoadFromJSONString(R"({"enabled": true, "maxInputLength": -1})");

    EXPECT_EQ(err.code, SanitizerErrorCode::InvalidConfiguration);
    EXPECT_NE(err.message.find("maxInputLength"), std::string::npos);
    EXPECT_FALSE(cfg.enabled);
    EXPECT_EQ(cfg.maxInputLength, 100000u);
}

TEST_F(SanitizationConfigTest, Json_FractionalCountRejected) {
    SanitizationConfig cfg;
    const auto err = cfg.LoadFromJSONString(R"({"maxRepeatedChars": 2.5})");

    EXPECT_EQ(err.code, SanitizerErrorCode::InvalidConfiguration);
    EXPECT_EQ(cfg.maxRepeatedChars, 50u);
}

TEST_F(SanitizationConfigTest, Json_HugeCacheTtlRejected) {
    SanitizationConfig cfg;
    EXPECT_EQ(cfg.LoadFromJSONString(R"({"cacheTtlHours": 100000000000})").code,
              SanitizerErrorCode::InvalidConfiguration);
    EXPECT_EQ(cfg.LoadFromJSONString(R"({"cacheTtlHours": 18446744073709551615})").code,
              SanitizerErrorCode::InvalidConfiguration);
    EXPECT_EQ(cfg.cacheTtl, std::chrono::hours(24));

    ASSERT_TRUE(cfg.LoadFromJSONString(R"({"cacheTtlHours": 87600})"));
    EXPECT_EQ(cfg.cacheTtl, std::chrono::hours(SanitizationConfig::kMaxCacheTtlHours));
}

TEST_F(SanitizationConfigTest, Json_MalformedAndNonObject) {
    SanitizationConfig cfg;
    EXPECT_EQ(cfg.LoadFromJSONString("{not json").code, SanitizerErrorCode::ParseError);
    EXPECT_EQ(cfg.LoadFromJSONString("[1,2,3]").code, SanitizerErrorCode::ParseError);
}

TEST_F(SanitizationConfigTest, Json_FileRoundTrip) {
    const auto path = std::filesystem::temp_directory_path() / "promptshield_config_test.json";

    SanitizationConfig written;
    written.enabled = true;
    written.warnThreshold = 10.0;
    written.cacheMaxEntries = 42;
    {
        std::ofstream out(path);
        out << written.ToJSON().dump();
    }

    SanitizationConfig loaded;
    const auto err = loaded.LoadFromJSONFile(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(err) << err;
    EXPECT_TRUE(loaded.enabled);
    EXPECT_DOUBLE_EQ(loaded.warnThreshold, 10.0);
    EXPECT_EQ(loaded.cacheMaxEntries, 42u);
    EXPECT_EQ(loaded.cacheTtl, std::chrono::hours(24));
}

TEST_F(SanitizationConfigTest, Json_MissingFile) {
    SanitizationConfig cfg;
    const auto err = cfg.LoadFromJSONFile("/nonexistent/promptshield/config.json");
    EXPECT_EQ(err.code, SanitizerErrorCode::FileNotFound);
}

TEST_F(SanitizationConfigTest, ToJson_Keys) {
    const auto j = SanitizationConfig{}.ToJSON();
    EXPECT_EQ(j.at("enabled"), false);
    EXPECT_EQ(j.at("blockThreshold"), 75.0);
    EXPECT_EQ(j.at("cacheTtlHours"), 24);
    EXPECT_EQ(j.at("maxRepeatedChars"), 50);
    EXPECT_TRUE(j.contains("logAllAttempts"));
}

// ============================================================================
// Environment Overlay
// ============================================================================

TEST_F(SanitizationConfigTest, Env_EnableRequiresLiteralTrue) {
    SanitizationConfig cfg;

    m_env["ENABLE_AI_SANITIZATION"] = "TRUE";
    ASSERT_TRUE(cfg.ApplyEnvironment(Lookup()));
    EXPECT_TRUE(cfg.enabled);

    m_env["ENABLE_AI_SANITIZATION"] = "1";
    ASSERT_TRUE(cfg.ApplyEnvironment(Lookup()));
    EXPECT_FALSE(cfg.enabled);
}

TEST_F(SanitizationConfigTest, Env_NumericOverrides) {
    m_env["AI_BLOCK_THRESHOLD"] = "80";
    m_env["AI_SANITIZE_THRESHOLD"] = "60";
    m_env["AI_MAX_REPEATED_CHARS"] = "20";
    m_env["AI_CACHE_TTL_HOURS"] = "1";
    m_env["AI_CACHE_ENABLED"] = "false";
    m_env["AI_LOG_ALL_ATTEMPTS"] = "yes";

    SanitizationConfig cfg;
    ASSERT_TRUE(cfg.ApplyEnvironment(Lookup()));

    EXPECT_DOUBLE_EQ(cfg.blockThreshold, 80.0);
    EXPECT_DOUBLE_EQ(cfg.sanitizeThreshold, 60.0);
    EXPECT_EQ(cfg.maxRepeatedChars, 20u);
    EXPECT_EQ(cfg.cacheTtl, std::chrono::hours(1));
    EXPECT_FALSE(cfg.cacheEnabled);
    EXPECT_TRUE(cfg.logAllAttempts);
}

TEST_F(SanitizationConfigTest, Env_InvalidValueReported) {
    m_env["AI_WARN_THRESHOLD"] = "low";

    SanitizationConfig cfg;
    const auto err = cfg.ApplyEnvironment(Lookup());
    EXPECT_EQ(err.code, SanitizerErrorCode::InvalidConfiguration);
    EXPECT_NE(err.message.find("AI_WARN_THRESHOLD"), std::string::npos);
    EXPECT_DOUBLE_EQ(cfg.warnThreshold, 25.0);
}

TEST_F(SanitizationConfigTest, Env_ZeroTtlRejected) {
    m_env["AI_CACHE_TTL_HOURS"] = "0";
    SanitizationConfig cfg;
    EXPECT_FALSE(cfg.ApplyEnvironment(Lookup()));
}

TEST_F(SanitizationConfigTest, Env_HugeTtlRejected) {
    m_env["AI_CACHE_TTL_HOURS"] = "999999999999";
    SanitizationConfig cfg;
    const auto err = cfg.ApplyEnvironment(Lookup());
    EXPECT_EQ(err.code, SanitizerErrorCode::InvalidConfiguration);
    EXPECT_EQ(cfg.cacheTtl, std::chrono::hours(24));
}

TEST_F(SanitizationConfigTest, Env_EmptyLookupIsNoOp) {
    SanitizationConfig cfg;
    EXPECT_TRUE(cfg.ApplyEnvironment(EnvironmentLookup{}));
    EXPECT_TRUE(cfg.ApplyEnvironment(Lookup()));
    EXPECT_FALSE(cfg.enabled);
}

// ============================================================================
// Shared Types
// ============================================================================

TEST_F(SanitizationConfigTest, Types_SeverityBands) {
    EXPECT_TRUE(BandFor(ThreatSeverity::Critical).Contains(100.0));
    EXPECT_FALSE(BandFor(ThreatSeverity::Critical).Contains(99.0));
    EXPECT_TRUE(BandFor(ThreatSeverity::High).Contains(50.0));
    EXPECT_TRUE(BandFor(ThreatSeverity::High).Contains(75.0));
    EXPECT_FALSE(BandFor(ThreatSeverity::Medium).Contains(45.0));
    EXPECT_TRUE(BandFor(ThreatSeverity::Low).Contains(10.0));
    EXPECT_FALSE(BandFor(ThreatSeverity::Low).Contains(25.0));
}

TEST_F(SanitizationConfigTest, Types_NameTables) {
    EXPECT_STREQ(ToString(ThreatSeverity::High), "HIGH");
    EXPECT_STREQ(ToString(ThreatCategory::PredictionBias), "prediction_bias");
    EXPECT_STREQ(ToString(SanitizationAction::Sanitize), "SANITIZE");
    EXPECT_STREQ(ToString(EncodingVariant::Base64Decoded), "base64");

    EXPECT_EQ(ParseSeverity("critical"), ThreatSeverity::Critical);
    EXPECT_EQ(ParseCategory("DATA_EXFILTRATION"), ThreatCategory::DataExfiltration);
    EXPECT_FALSE(ParseSeverity("severe").has_value());
    EXPECT_FALSE(ParseCategory("").has_value());
}

TEST_F(SanitizationConfigTest, Types_ErrorStreaming) {
    std::ostringstream os;
    os << SanitizerError::WithMessage(SanitizerErrorCode::DuplicatePattern, "dan_mode");
    EXPECT_EQ(os.str(), "DuplicatePattern: dan_mode");

    std::ostringstream ok;
    ok << SanitizerError::Success();
    EXPECT_EQ(ok.str(), "Success");
}
