/*
 * ============================================================================
 * PromptShield AI Sanitizer
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Entry point of the content-safety layer. Analyze() sequences:
 *
 *   cache lookup -> detection (plain + decoded variants) -> scoring ->
 *   action -> sanitization / escalation -> statistics -> cache store ->
 *   security event
 *
 * One instance per configuration; instances are safe to share between
 * threads. The pattern generation is immutable for the lifetime of the
 * instance.
 *
 * ============================================================================
 */
#pragma once

#include "ContentSanitizer.hpp"
#include "PatternDatabase.hpp"
#include "ResultCache.hpp"
#include "SanitizationConfig.hpp"
#include "SanitizationTypes.hpp"
#include "SecurityEventSink.hpp"
#include "ThreatDetector.hpp"
#include "ThreatScorer.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

namespace PromptShield {
    namespace Sanitization {

        class AiSanitizer {
        public:
            /**
             * @param config     thresholds and limits; expected to pass Validate()
             * @param patterns   pattern generation; the built-in one when null
             * @param eventSink  receives suspicious-content events; a
             *                   LoggerEventSink when null
             * @param cacheClock time source for cache TTL checks
             */
            explicit AiSanitizer(SanitizationConfig config,
                                 std::shared_ptr<const PatternDatabase> patterns = nullptr,
                                 std::shared_ptr<ISecurityEventSink> eventSink = nullptr,
                                 ResultCache::ClockFunction cacheClock = {});

            AiSanitizer(const AiSanitizer&) = delete;
            AiSanitizer& operator=(const AiSanitizer&) = delete;

            /**
             * @brief Analyze the record body and decide ALLOW / SANITIZE / BLOCK.
             *
             * Disabled configurations return ALLOW with score 0. An internal
             * failure is logged and reported as BLOCK.
             */
            [[nodiscard]] SanitizationResult Analyze(const ContentRecord& record,
                                                     const RequestContext& context = {}) noexcept;

            /// Per-field scores and their weighted combination; no cache, no statistics.
            [[nodiscard]] FieldScores ScoreFields(const ContentRecord& record) const;

            [[nodiscard]] SanitizerStats GetStats() const;
            void ResetStats();

            [[nodiscard]] const SanitizationConfig& Config() const noexcept { return m_config; }
            [[nodiscard]] const PatternDatabase& Patterns() const noexcept { return *m_patterns; }

            /// nullptr when caching is disabled.
            [[nodiscard]] ResultCache* Cache() noexcept { return m_cache.get(); }

        private:
            enum class CacheOutcome : uint8_t { NotConsulted, Hit, Miss };

            [[nodiscard]] SanitizationResult analyzeContent(const std::string& content) const;
            [[nodiscard]] double scoreText(const std::string& text) const;

            void recordRequest(SanitizationAction action, double score, double elapsedMs, CacheOutcome cache);
            void forwardEvent(const SanitizationResult& result, const RequestContext& context) noexcept;

            SanitizationConfig m_config;
            std::shared_ptr<const PatternDatabase> m_patterns;
            std::shared_ptr<ISecurityEventSink> m_eventSink;
            ThreatDetector m_detector;
            ThreatScorer m_scorer;
            std::unique_ptr<ResultCache> m_cache;

            struct Counters {
                uint64_t totalRequests = 0;
                uint64_t allowed = 0;
                uint64_t sanitized = 0;
                uint64_t blocked = 0;
                uint64_t cacheHits = 0;
                uint64_t cacheMisses = 0;
                double scoreSum = 0.0;
                double processingTimeSumMs = 0.0;
            };

            mutable std::mutex m_statsMutex;
            Counters m_counters;
        };

    } // namespace Sanitization
} // namespace PromptShield
