/*
 * ============================================================================
 * PromptShield Sanitization Types
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Shared value types of the sanitization pipeline: severity tiers, threat
 * categories, detected threats, results, statistics and error reporting.
 *
 * ============================================================================
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace PromptShield {
    namespace Sanitization {

        // ============================================================================
        // ERROR REPORTING
        // ============================================================================

        enum class SanitizerErrorCode : uint32_t {
            Success = 0,

            // Configuration
            InvalidConfiguration = 1,
            InvalidThresholds = 2,

            // Pattern catalogue
            InvalidPattern = 10,
            DuplicatePattern = 11,
            ScoreOutOfBand = 12,
            InvalidPatternPack = 13,

            // I/O and parsing
            FileNotFound = 20,
            FileReadError = 21,
            ParseError = 22,

            Unknown = 0xFFFFFFFF
        };

        [[nodiscard]] const char* ToString(SanitizerErrorCode code) noexcept;

        /// @brief Error value returned by load-time operations
        struct SanitizerError {
            SanitizerErrorCode code{ SanitizerErrorCode::Success };
            std::string message;

            [[nodiscard]] bool IsSuccess() const noexcept {
                return code == SanitizerErrorCode::Success;
            }

            [[nodiscard]] explicit operator bool() const noexcept {
                return IsSuccess();
            }

            [[nodiscard]] static SanitizerError Success() noexcept {
                return SanitizerError{};
            }

            [[nodiscard]] static SanitizerError WithMessage(SanitizerErrorCode code, std::string msg) noexcept {
                SanitizerError err;
                err.code = code;
                err.message = std::move(msg);
                return err;
            }
        };

        std::ostream& operator<<(std::ostream& os, const SanitizerError& error);

        // ============================================================================
        // SEVERITY / CATEGORY / ACTION
        // ============================================================================

        enum class ThreatSeverity : uint8_t {
            Critical = 0,
            High,
            Medium,
            Low
        };

        /// Inclusive score range a pattern of a given tier must carry.
        struct SeverityBand {
            double minScore;
            double maxScore;

            [[nodiscard]] constexpr bool Contains(double score) const noexcept {
                return score >= minScore && score <= maxScore;
            }
        };

        [[nodiscard]] constexpr SeverityBand BandFor(ThreatSeverity severity) noexcept {
            switch (severity) {
            case ThreatSeverity::Critical: return { 100.0, 100.0 };
            case ThreatSeverity::High:     return { 50.0, 75.0 };
            case ThreatSeverity::Medium:   return { 25.0, 40.0 };
            case ThreatSeverity::Low:      return { 10.0, 20.0 };
            }
            return { 0.0, 0.0 };
        }

        enum class ThreatCategory : uint8_t {
            InstructionOverride = 0,
            Jailbreak,
            DataExfiltration,
            OutputManipulation,
            PredictionBias,
            ResourceExhaustion
        };

        enum class SanitizationAction : uint8_t {
            Allow = 0,
            Sanitize,
            Block
        };

        /// Which text a detected threat's offsets refer to.
        enum class EncodingVariant : uint8_t {
            Plain = 0,
            Base64Decoded,
            UrlDecoded
        };

        [[nodiscard]] const char* ToString(ThreatSeverity severity) noexcept;
        [[nodiscard]] const char* ToString(ThreatCategory category) noexcept;
        [[nodiscard]] const char* ToString(SanitizationAction action) noexcept;
        [[nodiscard]] const char* ToString(EncodingVariant variant) noexcept;

        [[nodiscard]] std::optional<ThreatSeverity> ParseSeverity(std::string_view text) noexcept;
        [[nodiscard]] std::optional<ThreatCategory> ParseCategory(std::string_view text) noexcept;

        // ============================================================================
        // DETECTION / RESULT RECORDS
        // ============================================================================

        struct DetectedThreat {
            std::string patternName;
            ThreatCategory category{ ThreatCategory::InstructionOverride };
            ThreatSeverity severity{ ThreatSeverity::Low };
            double score{ 0.0 };
            std::string matchedText;
            size_t position{ 0 };           ///< Byte offset into the variant's text
            std::string contextSnippet;
            EncodingVariant variant{ EncodingVariant::Plain };
        };

        struct ResultMetadata {
            std::chrono::system_clock::time_point processedAt{};
            double processingDurationMs{ 0.0 };
            size_t contentLength{ 0 };
            size_t threatCount{ 0 };
            size_t sectionsRemoved{ 0 };
            bool cacheHit{ false };
            std::string patternGeneration;
        };

        struct SanitizationResult {
            SanitizationAction action{ SanitizationAction::Allow };
            double score{ 0.0 };
            std::vector<DetectedThreat> threats;
            std::string originalContent;
            std::optional<std::string> sanitizedContent;   ///< Present only for Sanitize
            ResultMetadata metadata;
        };

        /// @brief Text submitted for analysis. Only @c body is scored by default.
        struct ContentRecord {
            std::string body;
            std::optional<std::string> title;
            std::optional<std::string> description;
            std::optional<std::string> contentId;
            std::optional<std::string> sourceId;
        };

        /// @brief Caller identity forwarded to the security event sink.
        struct RequestContext {
            std::string requesterIdentity;
            std::optional<std::string> userId;
        };

        /// @brief Per-field scores from AiSanitizer::ScoreFields().
        struct FieldScores {
            double body{ 0.0 };
            std::optional<double> title;
            std::optional<double> description;
            double weighted{ 0.0 };
        };

        struct SanitizerStats {
            uint64_t totalRequests{ 0 };
            uint64_t allowed{ 0 };
            uint64_t sanitized{ 0 };
            uint64_t blocked{ 0 };
            uint64_t cacheHits{ 0 };
            uint64_t cacheMisses{ 0 };
            double averageScore{ 0.0 };
            double averageProcessingTimeMs{ 0.0 };
            double cacheHitRate{ 0.0 };
            std::string patternGeneration;
        };

    } // namespace Sanitization
} // namespace PromptShield
