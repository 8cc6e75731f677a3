/*
 * ============================================================================
 * PromptShield Result Serializer
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * JSON rendering of results, statistics and cache state for dashboards and
 * the promptshield_scan CLI.
 *
 * ============================================================================
 */
#pragma once

#include "ResultCache.hpp"
#include "SanitizationTypes.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace PromptShield {
    namespace Sanitization {
        namespace ResultSerializer {

            [[nodiscard]] nlohmann::json ToJSON(const DetectedThreat& threat);

            /// @param includeContent false omits originalContent and sanitizedContent
            [[nodiscard]] nlohmann::json ToJSON(const SanitizationResult& result, bool includeContent = true);

            [[nodiscard]] nlohmann::json ToJSON(const SanitizerStats& stats);
            [[nodiscard]] nlohmann::json ToJSON(const ResultCache::Stats& stats);
            [[nodiscard]] nlohmann::json ToJSON(const FieldScores& scores);

            /**
             * @brief Serialize, replacing invalid UTF-8 instead of throwing.
             *
             * Never throws; returns "{}" if serialization fails.
             */
            [[nodiscard]] std::string Dump(const nlohmann::json& j, int indent = -1) noexcept;

            /// ISO-8601 UTC with milliseconds, e.g. 2026-01-31T12:00:00.123Z
            [[nodiscard]] std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

        } // namespace ResultSerializer
    } // namespace Sanitization
} // namespace PromptShield
