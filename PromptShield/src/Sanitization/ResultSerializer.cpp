/*
 * ============================================================================
 * PromptShield Result Serializer Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "ResultSerializer.hpp"

#include "ThreatScorer.hpp"

#include "../Utils/Logger.hpp"

#include <cstdio>
#include <ctime>

namespace PromptShield {
    namespace Sanitization {
        namespace ResultSerializer {

            nlohmann::json ToJSON(const DetectedThreat& threat) {
                nlohmann::json j;
                j["pattern"] = threat.patternName;
                j["category"] = ToString(threat.category);
                j["severity"] = ToString(threat.severity);
                j["score"] = threat.score;
                j["match"] = threat.matchedText;
                j["position"] = threat.position;
                j["context"] = threat.contextSnippet;
                j["variant"] = ToString(threat.variant);
                return j;
            }

            nlohmann::json ToJSON(const SanitizationResult& result, bool includeContent) {
                nlohmann::json j;
                j["action"] = ToString(result.action);
                j["score"] = result.score;

                const auto severity = ThreatScorer::SeverityOf(result.score);
                j["severity"] = severity ? nlohmann::json(ToString(*severity)) : nlohmann::json(nullptr);

                nlohmann::json threats = nlohmann::json::array();
                for (const auto& threat : result.threats) {
                    threats.push_back(ToJSON(threat));
                }
                j["threats"] = std::move(threats);

                if (includeContent) {
                    j["originalContent"] = result.originalContent;
                    j["sanitizedContent"] = result.sanitizedContent
                        ? nlohmann::json(*result.sanitizedContent)
                        : nlohmann::json(nullptr);
                }

                const auto& meta = result.metadata;
                j["metadata"] = {
                    { "processedAt", FormatTimestamp(meta.processedAt) },
                    { "processingTimeMs", meta.processingDurationMs },
                    { "contentLength", meta.contentLength },
                    { "threatCount", meta.threatCount },
                    { "sectionsRemoved", meta.sectionsRemoved },
                    { "cacheHit", meta.cacheHit },
                    { "patternVersion", meta.patternGeneration },
                };
                return j;
            }

            nlohmann::json ToJSON(const SanitizerStats& stats) {
                nlohmann::json j;
                j["totalRequests"] = stats.totalRequests;
                j["allowed"] = stats.allowed;
                j["sanitized"] = stats.sanitized;
                j["blocked"] = stats.blocked;
                j["cacheHits"] = stats.cacheHits;
                j["cacheMisses"] = stats.cacheMisses;
                j["averageScore"] = stats.averageScore;
                j["averageProcessingTimeMs"] = stats.averageProcessingTimeMs;
                j["cacheHitRate"] = stats.cacheHitRate;
                j["patternVersion"] = stats.patternGeneration;
                return j;
            }

            nlohmann::json ToJSON(const ResultCache::Stats& stats) {
                nlohmann::json j;
                j["size"] = stats.entryCount;
                j["maxSize"] = stats.maxEntries;
                j["hits"] = stats.hits;
                j["misses"] = stats.misses;
                j["hitRate"] = stats.hitRate;
                j["patternVersion"] = stats.patternGeneration;
                j["ttlSeconds"] = stats.ttl.count();
                return j;
            }

            nlohmann::json ToJSON(const FieldScores& scores) {
                nlohmann::json j;
                j["body"] = scores.body;
                j["title"] = scores.title ? nlohmann::json(*scores.title) : nlohmann::json(nullptr);
                j["description"] = scores.description ? nlohmann::json(*scores.description) : nlohmann::json(nullptr);
                j["weighted"] = scores.weighted;
                return j;
            }

            std::string Dump(const nlohmann::json& j, int indent) noexcept {
                try {
                    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
                }
                catch (const std::exception& e) {
                    PS_LOG_ERROR("ResultSerializer", "JSON serialization failed: %s", e.what());
                    return "{}";
                }
            }

            std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
                const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
                const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
                const std::time_t t = std::chrono::system_clock::to_time_t(secs);

                std::tm tmUtc{};
                if (!::gmtime_r(&t, &tmUtc)) {
                    return {};
                }

                char buf[40] = { 0 };
                std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                    tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
                    tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, static_cast<int>(ms));
                return std::string(buf);
            }

        } // namespace ResultSerializer
    } // namespace Sanitization
} // namespace PromptShield
