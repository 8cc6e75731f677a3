/*
 * ============================================================================
 * PromptShield Threat Scorer Unit Tests
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Composite scoring, penalties, whitelist discount, action thresholds and
 * the escalation / event forwarding rules.
 *
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "../../../src/Sanitization/ThreatScorer.hpp"
#include <string>
#include <vector>

using namespace PromptShield::Sanitization;

// ============================================================================
// Test Fixture
// ============================================================================

class ThreatScorerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_config = SanitizationConfig{};
        m_config.enabled = true;
    }

    void TearDown() override {
    }

    static DetectedThreat MakeThreat(double score, ThreatSeverity severity) {
        DetectedThreat t;
        t.patternName = "test";
        t.score = score;
        t.severity = severity;
        return t;
    }

    ThreatScorer m_scorer{ PatternDatabase::Builtin() };
    SanitizationConfig m_config;
};

// ============================================================================
// Composite Score
// ============================================================================

TEST_F(ThreatScorerTest, Score_SumsThreats) {
    const std::vector<DetectedThreat> threats = {
        MakeThreat(75, ThreatSeverity::High),
        MakeThreat(30, ThreatSeverity::Medium),
    };
    EXPECT_DOUBLE_EQ(m_scorer.Score(threats, "plain text", m_config), 105.0);
}

TEST_F(ThreatScorerTest, Score_EmptyIsZero) {
    EXPECT_DOUBLE_EQ(m_scorer.Score({}, "", m_config), 0.0);
    EXPECT_DOUBLE_EQ(m_scorer.Score({}, "nothing to see", m_config), 0.0);
}

TEST_F(ThreatScorerTest, Score_AddingCriticalNeverDecreases) {
    std::vector<DetectedThreat> threats = { MakeThreat(40, ThreatSeverity::Medium) };
    const std::string content = "let me show you how the economic system works";

    const double before = m_scorer.Score(threats, content, m_config);
    threats.push_back(MakeThreat(100, ThreatSeverity::Critical));
    const double after = m_scorer.Score(threats, content, m_config);

    EXPECT_GE(after, before);
    EXPECT_DOUBLE_EQ(before, 30.0);
    EXPECT_DOUBLE_EQ(after, 140.0);
}

TEST_F(ThreatScorerTest, Score_WhitelistDiscount) {
    const std::vector<DetectedThreat> threats = { MakeThreat(60, ThreatSeverity::High) };
    EXPECT_DOUBLE_EQ(m_scorer.Score(threats, "find the root cause", m_config), 50.0);
}

TEST_F(ThreatScorerTest, Score_WhitelistNotAppliedAtCeiling) {
    const std::vector<DetectedThreat> threats = { MakeThreat(100, ThreatSeverity::Critical) };
    EXPECT_DOUBLE_EQ(m_scorer.Score(threats, "find the root cause", m_config), 100.0);
}

TEST_F(ThreatScorerTest, Score_NeverNegative) {
    EXPECT_DOUBLE_EQ(m_scorer.Score({}, "the banking system", m_config), 0.0);
}

TEST_F(ThreatScorerTest, Score_IncludesPenalties) {
    std::string content;
    for (int i = 0; i < 10000; ++i) content += "Bitcoin analysis. ";
    ASSERT_EQ(content.size(), 180000u);

    EXPECT_DOUBLE_EQ(m_scorer.Score({}, content, m_config), 25.0);
}

// ============================================================================
// Penalties
// ============================================================================

TEST_F(ThreatScorerTest, LengthPenalty_Steps) {
    EXPECT_DOUBLE_EQ(ThreatScorer::LengthPenalty(100000, 100000), 0.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::LengthPenalty(109999, 100000), 0.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::LengthPenalty(110000, 100000), 5.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::LengthPenalty(130000, 100000), 15.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::LengthPenalty(180000, 100000), 25.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::LengthPenalty(10000000, 100000), 25.0);
}

TEST_F(ThreatScorerTest, RepetitionPenalty_Steps) {
    EXPECT_DOUBLE_EQ(ThreatScorer::RepetitionPenalty(std::string(99, '!'), 50), 0.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::RepetitionPenalty(std::string(100, '!'), 50), 5.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::RepetitionPenalty(std::string(250, '!'), 50), 10.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::RepetitionPenalty(std::string(5000, '!'), 50), 20.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::RepetitionPenalty(std::string(50, '!'), 50), 0.0);
}

TEST_F(ThreatScorerTest, RepetitionPenalty_SumsSeparateRuns) {
    const std::string content = std::string(60, 'a') + "-" + std::string(60, 'b');
    EXPECT_DOUBLE_EQ(ThreatScorer::RepetitionPenalty(content, 50), 5.0);
}

// ============================================================================
// Actions
// ============================================================================

TEST_F(ThreatScorerTest, DetermineAction_Thresholds) {
    EXPECT_EQ(ThreatScorer::DetermineAction(75.0, m_config), SanitizationAction::Block);
    EXPECT_EQ(ThreatScorer::DetermineAction(74.0, m_config), SanitizationAction::Sanitize);
    EXPECT_EQ(ThreatScorer::DetermineAction(50.0, m_config), SanitizationAction::Sanitize);
    EXPECT_EQ(ThreatScorer::DetermineAction(49.9, m_config), SanitizationAction::Allow);
    EXPECT_EQ(ThreatScorer::DetermineAction(0.0, m_config), SanitizationAction::Allow);
}

TEST_F(ThreatScorerTest, DetermineAction_DisabledAlwaysAllows) {
    m_config.enabled = false;
    EXPECT_EQ(ThreatScorer::DetermineAction(500.0, m_config), SanitizationAction::Allow);
}

TEST_F(ThreatScorerTest, SeverityOf_Bands) {
    EXPECT_EQ(ThreatScorer::SeverityOf(140.0), ThreatSeverity::Critical);
    EXPECT_EQ(ThreatScorer::SeverityOf(100.0), ThreatSeverity::Critical);
    EXPECT_EQ(ThreatScorer::SeverityOf(75.0), ThreatSeverity::High);
    EXPECT_EQ(ThreatScorer::SeverityOf(50.0), ThreatSeverity::Medium);
    EXPECT_EQ(ThreatScorer::SeverityOf(25.0), ThreatSeverity::Low);
    EXPECT_FALSE(ThreatScorer::SeverityOf(24.9).has_value());
}

TEST_F(ThreatScorerTest, Escalation_Rules) {
    const std::vector<DetectedThreat> none;
    EXPECT_FALSE(ThreatScorer::ShouldEscalateToBlock(400, 300, none));
    EXPECT_TRUE(ThreatScorer::ShouldEscalateToBlock(400, 200, none));
    EXPECT_TRUE(ThreatScorer::ShouldEscalateToBlock(120, 99, none));

    const std::vector<DetectedThreat> oneCritical = { MakeThreat(100, ThreatSeverity::Critical) };
    EXPECT_FALSE(ThreatScorer::ShouldEscalateToBlock(400, 300, oneCritical));

    const std::vector<DetectedThreat> twoCritical = {
        MakeThreat(100, ThreatSeverity::Critical),
        MakeThreat(100, ThreatSeverity::Critical),
    };
    EXPECT_TRUE(ThreatScorer::ShouldEscalateToBlock(400, 390, twoCritical));
}

TEST_F(ThreatScorerTest, Escalation_DecodedVariantThreat) {
    auto decoded = MakeThreat(50, ThreatSeverity::High);
    decoded.variant = EncodingVariant::UrlDecoded;
    EXPECT_TRUE(ThreatScorer::ShouldEscalateToBlock(400, 400, { decoded }));

    decoded.variant = EncodingVariant::Base64Decoded;
    EXPECT_TRUE(ThreatScorer::ShouldEscalateToBlock(400, 400, { decoded }));

    EXPECT_FALSE(ThreatScorer::ShouldEscalateToBlock(400, 400, { MakeThreat(50, ThreatSeverity::High) }));
}

TEST_F(ThreatScorerTest, ForwardEvent_Rules) {
    SanitizationResult result;
    result.action = SanitizationAction::Allow;

    result.score = 25.0;
    EXPECT_FALSE(ThreatScorer::ShouldForwardEvent(result, m_config));

    result.score = 26.0;
    EXPECT_TRUE(ThreatScorer::ShouldForwardEvent(result, m_config));

    result.score = 10.0;
    EXPECT_FALSE(ThreatScorer::ShouldForwardEvent(result, m_config));
    m_config.logAllAttempts = true;
    EXPECT_TRUE(ThreatScorer::ShouldForwardEvent(result, m_config));

    result.score = 0.0;
    EXPECT_FALSE(ThreatScorer::ShouldForwardEvent(result, m_config));

    result.action = SanitizationAction::Block;
    EXPECT_TRUE(ThreatScorer::ShouldForwardEvent(result, m_config));
}

// ============================================================================
// Aggregation Helpers
// ============================================================================

TEST_F(ThreatScorerTest, AverageScore) {
    EXPECT_DOUBLE_EQ(ThreatScorer::AverageScore({}), 0.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::AverageScore({ 10.0, 20.0, 60.0 }), 30.0);
}

TEST_F(ThreatScorerTest, WeightedScore) {
    EXPECT_DOUBLE_EQ(ThreatScorer::WeightedScore(100.0, 50.0, 20.0), 70.0 + 10.0 + 2.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::WeightedScore(100.0, std::nullopt, std::nullopt), 70.0);
    EXPECT_DOUBLE_EQ(ThreatScorer::WeightedScore(0.0, 100.0, std::nullopt), 20.0);
}
