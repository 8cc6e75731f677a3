/*
 * ============================================================================
 * PromptShield Threat Scorer
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Composite score and decision rules:
 *
 *   score = sum(threat scores) + length penalty + repetition penalty
 *           - whitelist discount, floored at 0
 *
 *   action = BLOCK    if score >= blockThreshold
 *            SANITIZE if score >= sanitizeThreshold
 *            ALLOW    otherwise (and always when disabled)
 *
 * ============================================================================
 */
#pragma once

#include "PatternDatabase.hpp"
#include "SanitizationConfig.hpp"
#include "SanitizationTypes.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace PromptShield {
    namespace Sanitization {

        struct ScoringPolicy {
            // Over-length penalty: 5 points per full 10000 bytes over, capped.
            static constexpr size_t kLengthPenaltyStep = 10000;
            static constexpr double kLengthPenaltyPerStep = 5.0;
            static constexpr double kMaxLengthPenalty = 25.0;

            // Repetition penalty: 5 points per full 100 repeated characters, capped.
            static constexpr size_t kRepetitionPenaltyStep = 100;
            static constexpr double kRepetitionPenaltyPerStep = 5.0;
            static constexpr double kMaxRepetitionPenalty = 20.0;

            // Flat discount for benign phrases, not applied at or above the ceiling.
            static constexpr double kWhitelistDiscount = 10.0;
            static constexpr double kWhitelistDiscountCeiling = 100.0;

            // SANITIZE is escalated to BLOCK past any of these.
            static constexpr double kEscalationRemovalPercent = 50.0;
            static constexpr size_t kMinSanitizedLength = 100;
            static constexpr size_t kEscalationCriticalCount = 2;

            static constexpr double kBodyWeight = 0.7;
            static constexpr double kTitleWeight = 0.2;
            static constexpr double kDescriptionWeight = 0.1;
        };

        class ThreatScorer {
        public:
            explicit ThreatScorer(std::shared_ptr<const PatternDatabase> patterns);

            [[nodiscard]] double Score(const std::vector<DetectedThreat>& threats,
                                       std::string_view content,
                                       const SanitizationConfig& config) const;

            [[nodiscard]] static SanitizationAction DetermineAction(double score, const SanitizationConfig& config) noexcept;

            /// Severity tier a composite score falls into; nullopt below 25.
            [[nodiscard]] static std::optional<ThreatSeverity> SeverityOf(double score) noexcept;

            /// True when sanitizing cannot make the content safe: too much removed, too little
            /// left, repeated critical hits, or a hit found only in decoded text.
            [[nodiscard]] static bool ShouldEscalateToBlock(size_t originalLength,
                                                            size_t sanitizedLength,
                                                            const std::vector<DetectedThreat>& threats) noexcept;

            /// Whether a result should be reported to the security event sink.
            [[nodiscard]] static bool ShouldForwardEvent(const SanitizationResult& result,
                                                         const SanitizationConfig& config) noexcept;

            [[nodiscard]] static double LengthPenalty(size_t length, size_t maxInputLength) noexcept;
            [[nodiscard]] static double RepetitionPenalty(std::string_view content, size_t maxRepeatedChars);

            [[nodiscard]] static double AverageScore(const std::vector<double>& scores) noexcept;

            /// Absent fields contribute 0.
            [[nodiscard]] static double WeightedScore(double body,
                                                      std::optional<double> title,
                                                      std::optional<double> description) noexcept;

        private:
            std::shared_ptr<const PatternDatabase> m_patterns;
        };

    } // namespace Sanitization
} // namespace PromptShield
