/*
 * ============================================================================
 * PromptShield Threat Scorer Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "ThreatScorer.hpp"

#include "PatternMatcher.hpp"

#include <algorithm>
#include <numeric>

namespace PromptShield {
    namespace Sanitization {

        ThreatScorer::ThreatScorer(std::shared_ptr<const PatternDatabase> patterns)
            : m_patterns(patterns ? std::move(patterns) : PatternDatabase::Builtin()) {
        }

        double ThreatScorer::Score(const std::vector<DetectedThreat>& threats,
                                   std::string_view content,
                                   const SanitizationConfig& config) const {
            double score = 0.0;
            for (const auto& threat : threats) {
                score += threat.score;
            }

            score += LengthPenalty(content.size(), config.maxInputLength);
            score += RepetitionPenalty(content, config.maxRepeatedChars);

            if (score < ScoringPolicy::kWhitelistDiscountCeiling && m_patterns->ContainsWhitelistedPhrase(content)) {
                score -= ScoringPolicy::kWhitelistDiscount;
            }

            return std::max(0.0, score);
        }

        SanitizationAction ThreatScorer::DetermineAction(double score, const SanitizationConfig& config) noexcept {
            if (!config.enabled) return SanitizationAction::Allow;
            if (score >= config.blockThreshold) return SanitizationAction::Block;
            if (score >= config.sanitizeThreshold) return SanitizationAction::Sanitize;
            return SanitizationAction::Allow;
        }

        std::optional<ThreatSeverity> ThreatScorer::SeverityOf(double score) noexcept {
            if (score >= 100.0) return ThreatSeverity::Critical;
            if (score >= 75.0) return ThreatSeverity::High;
            if (score >= 50.0) return ThreatSeverity::Medium;
            if (score >= 25.0) return ThreatSeverity::Low;
            return std::nullopt;
        }

        bool ThreatScorer::ShouldEscalateToBlock(size_t originalLength,
                                                 size_t sanitizedLength,
                                                 const std::vector<DetectedThreat>& threats) noexcept {
            if (originalLength > 0) {
                const size_t removed = originalLength > sanitizedLength ? originalLength - sanitizedLength : 0;
                const double removedPercent = static_cast<double>(removed) * 100.0 / static_cast<double>(originalLength);
                if (removedPercent >= ScoringPolicy::kEscalationRemovalPercent) return true;
            }

            if (sanitizedLength < ScoringPolicy::kMinSanitizedLength) return true;

            // Decoded-variant offsets do not map back onto the raw text, so it cannot be cut.
            const bool decodedHit = std::any_of(threats.begin(), threats.end(), [](const DetectedThreat& t) {
                return t.variant != EncodingVariant::Plain;
            });
            if (decodedHit) return true;

            const auto critical = std::count_if(threats.begin(), threats.end(), [](const DetectedThreat& t) {
                return t.severity == ThreatSeverity::Critical;
            });
            return static_cast<size_t>(critical) >= ScoringPolicy::kEscalationCriticalCount;
        }

        bool ThreatScorer::ShouldForwardEvent(const SanitizationResult& result,
                                              const SanitizationConfig& config) noexcept {
            if (result.action != SanitizationAction::Allow) return true;
            if (result.score > config.warnThreshold) return true;
            return config.logAllAttempts && result.score > 0.0;
        }

        double ThreatScorer::LengthPenalty(size_t length, size_t maxInputLength) noexcept {
            if (length <= maxInputLength) return 0.0;
            const size_t steps = (length - maxInputLength) / ScoringPolicy::kLengthPenaltyStep;
            return std::min(ScoringPolicy::kMaxLengthPenalty,
                            static_cast<double>(steps) * ScoringPolicy::kLengthPenaltyPerStep);
        }

        double ThreatScorer::RepetitionPenalty(std::string_view content, size_t maxRepeatedChars) {
            std::vector<PatternMatch> runs;
            size_t total = 0;
            Scanners::RepeatedCharacterRuns(content, maxRepeatedChars, runs, &total);

            const size_t steps = total / ScoringPolicy::kRepetitionPenaltyStep;
            return std::min(ScoringPolicy::kMaxRepetitionPenalty,
                            static_cast<double>(steps) * ScoringPolicy::kRepetitionPenaltyPerStep);
        }

        double ThreatScorer::AverageScore(const std::vector<double>& scores) noexcept {
            if (scores.empty()) return 0.0;
            return std::accumulate(scores.begin(), scores.end(), 0.0) / static_cast<double>(scores.size());
        }

        double ThreatScorer::WeightedScore(double body,
                                           std::optional<double> title,
                                           std::optional<double> description) noexcept {
            return body * ScoringPolicy::kBodyWeight +
                   title.value_or(0.0) * ScoringPolicy::kTitleWeight +
                   description.value_or(0.0) * ScoringPolicy::kDescriptionWeight;
        }

    } // namespace Sanitization
} // namespace PromptShield
