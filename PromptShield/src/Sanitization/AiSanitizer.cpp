/*
 * ============================================================================
 * PromptShield AI Sanitizer Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "AiSanitizer.hpp"

#include "../Utils/Logger.hpp"

namespace PromptShield {
    namespace Sanitization {

        namespace {

            double ElapsedMs(std::chrono::steady_clock::time_point start) {
                return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            }

        } // namespace

        AiSanitizer::AiSanitizer(SanitizationConfig config,
                                 std::shared_ptr<const PatternDatabase> patterns,
                                 std::shared_ptr<ISecurityEventSink> eventSink,
                                 ResultCache::ClockFunction cacheClock)
            : m_config(std::move(config))
            , m_patterns(patterns ? std::move(patterns) : PatternDatabase::Builtin())
            , m_eventSink(eventSink ? std::move(eventSink) : std::make_shared<LoggerEventSink>())
            , m_detector(m_patterns)
            , m_scorer(m_patterns) {

            if (m_config.cacheEnabled) {
                m_cache = std::make_unique<ResultCache>(m_config.cacheMaxEntries, m_config.cacheTtl,
                                                        m_patterns->Version(), std::move(cacheClock));
            }

            PS_LOG_INFO("AiSanitizer", "initialized: enabled=%d block=%.1f sanitize=%.1f warn=%.1f cache=%d patterns=%s (%zu)",
                m_config.enabled ? 1 : 0, m_config.blockThreshold, m_config.sanitizeThreshold,
                m_config.warnThreshold, m_cache ? 1 : 0, m_patterns->Version().c_str(), m_patterns->Size());
        }

        SanitizationResult AiSanitizer::Analyze(const ContentRecord& record, const RequestContext& context) noexcept {
            const auto start = std::chrono::steady_clock::now();
            const std::string& content = record.body;

            try {
                if (!m_config.enabled) {
                    SanitizationResult result;
                    result.action = SanitizationAction::Allow;
                    result.score = 0.0;
                    result.originalContent = content;
                    result.metadata.processedAt = std::chrono::system_clock::now();
                    result.metadata.contentLength = content.size();
                    result.metadata.patternGeneration = m_patterns->Version();
                    result.metadata.processingDurationMs = ElapsedMs(start);

                    recordRequest(result.action, result.score, result.metadata.processingDurationMs,
                                  CacheOutcome::NotConsulted);
                    return result;
                }

                CacheOutcome cacheOutcome = CacheOutcome::NotConsulted;
                if (m_cache) {
                    if (auto cached = m_cache->Get(content)) {
                        cached->metadata.processedAt = std::chrono::system_clock::now();
                        cached->metadata.processingDurationMs = ElapsedMs(start);
                        recordRequest(cached->action, cached->score, cached->metadata.processingDurationMs,
                                      CacheOutcome::Hit);
                        if (ThreatScorer::ShouldForwardEvent(*cached, m_config)) {
                            forwardEvent(*cached, context);
                        }
                        return std::move(*cached);
                    }
                    cacheOutcome = CacheOutcome::Miss;
                }

                SanitizationResult result = analyzeContent(content);
                result.metadata.processingDurationMs = ElapsedMs(start);

                recordRequest(result.action, result.score, result.metadata.processingDurationMs, cacheOutcome);

                if (m_cache && !m_cache->Set(content, result)) {
                    PS_LOG_DEBUG("AiSanitizer", "result not cached");
                }

                if (ThreatScorer::ShouldForwardEvent(result, m_config)) {
                    forwardEvent(result, context);
                }

                return result;
            }
            catch (const std::exception& e) {
                PS_LOG_ERROR("AiSanitizer", "analysis failed, blocking content (%zu bytes): %s",
                    content.size(), e.what());

                SanitizationResult result;
                result.action = SanitizationAction::Block;
                result.metadata.processedAt = std::chrono::system_clock::now();
                result.metadata.contentLength = content.size();
                result.metadata.patternGeneration = m_patterns->Version();
                try {
                    result.originalContent = content;
                    recordRequest(result.action, result.score, ElapsedMs(start), CacheOutcome::NotConsulted);
                }
                catch (const std::exception& inner) {
                    PS_LOG_ERROR("AiSanitizer", "failed to record blocked request: %s", inner.what());
                }
                return result;
            }
        }

        SanitizationResult AiSanitizer::analyzeContent(const std::string& content) const {
            SanitizationResult result;
            result.originalContent = content;
            result.threats = m_detector.Detect(content);
            result.score = m_scorer.Score(result.threats, content, m_config);
            result.action = ThreatScorer::DetermineAction(result.score, m_config);

            size_t sectionsRemoved = 0;
            if (result.action == SanitizationAction::Sanitize) {
                SanitizedContent sanitized = ContentSanitizer::Sanitize(content, result.threats);
                sectionsRemoved = sanitized.sectionsRemoved;

                if (!ContentSanitizer::IsUsable(sanitized.content, content)) {
                    PS_LOG_DEBUG("AiSanitizer", "sanitized content unusable, escalating to BLOCK");
                    result.action = SanitizationAction::Block;
                }
                else if (ThreatScorer::ShouldEscalateToBlock(content.size(), sanitized.content.size(), result.threats)) {
                    PS_LOG_DEBUG("AiSanitizer", "escalation rule triggered, escalating to BLOCK");
                    result.action = SanitizationAction::Block;
                }

                if (result.action == SanitizationAction::Sanitize) {
                    result.sanitizedContent = std::move(sanitized.content);
                }
            }

            result.metadata.processedAt = std::chrono::system_clock::now();
            result.metadata.contentLength = content.size();
            result.metadata.threatCount = result.threats.size();
            result.metadata.sectionsRemoved = sectionsRemoved;
            result.metadata.cacheHit = false;
            result.metadata.patternGeneration = m_patterns->Version();
            return result;
        }

        double AiSanitizer::scoreText(const std::string& text) const {
            return m_scorer.Score(m_detector.Detect(text), text, m_config);
        }

        FieldScores AiSanitizer::ScoreFields(const ContentRecord& record) const {
            FieldScores scores;
            scores.body = scoreText(record.body);
            if (record.title) scores.title = scoreText(*record.title);
            if (record.description) scores.description = scoreText(*record.description);
            scores.weighted = ThreatScorer::WeightedScore(scores.body, scores.title, scores.description);
            return scores;
        }

        // ============================================================================
        // Statistics
        // ============================================================================

        void AiSanitizer::recordRequest(SanitizationAction action, double score, double elapsedMs, CacheOutcome cache) {
            std::lock_guard<std::mutex> guard(m_statsMutex);

            ++m_counters.totalRequests;
            switch (action) {
            case SanitizationAction::Allow:    ++m_counters.allowed; break;
            case SanitizationAction::Sanitize: ++m_counters.sanitized; break;
            case SanitizationAction::Block:    ++m_counters.blocked; break;
            }

            if (cache == CacheOutcome::Hit) ++m_counters.cacheHits;
            else if (cache == CacheOutcome::Miss) ++m_counters.cacheMisses;

            m_counters.scoreSum += score;
            m_counters.processingTimeSumMs += elapsedMs;
        }

        SanitizerStats AiSanitizer::GetStats() const {
            std::lock_guard<std::mutex> guard(m_statsMutex);

            SanitizerStats stats;
            stats.totalRequests = m_counters.totalRequests;
            stats.allowed = m_counters.allowed;
            stats.sanitized = m_counters.sanitized;
            stats.blocked = m_counters.blocked;
            stats.cacheHits = m_counters.cacheHits;
            stats.cacheMisses = m_counters.cacheMisses;

            if (m_counters.totalRequests > 0) {
                const double total = static_cast<double>(m_counters.totalRequests);
                stats.averageScore = m_counters.scoreSum / total;
                stats.averageProcessingTimeMs = m_counters.processingTimeSumMs / total;
            }

            const uint64_t lookups = m_counters.cacheHits + m_counters.cacheMisses;
            if (lookups > 0) {
                stats.cacheHitRate = static_cast<double>(m_counters.cacheHits) * 100.0 / static_cast<double>(lookups);
            }

            stats.patternGeneration = m_patterns->Version();
            return stats;
        }

        void AiSanitizer::ResetStats() {
            std::lock_guard<std::mutex> guard(m_statsMutex);
            m_counters = Counters{};
        }

        void AiSanitizer::forwardEvent(const SanitizationResult& result, const RequestContext& context) noexcept {
            try {
                m_eventSink->OnSuspiciousContent(SecurityEvent::FromResult(result, context));
            }
            catch (const std::exception& e) {
                PS_LOG_ERROR("AiSanitizer", "security event sink failed: %s", e.what());
            }
        }

    } // namespace Sanitization
} // namespace PromptShield
