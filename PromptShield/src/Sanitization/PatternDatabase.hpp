/*
 * ============================================================================
 * PromptShield Pattern Database
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Immutable catalogue of threat patterns plus the benign-phrase whitelist.
 *
 * A database instance is one "pattern generation": it is built once,
 * validated, and then shared read-only (std::shared_ptr<const>) between any
 * number of detectors without locking. Hosts that hot-swap rules load a new
 * generation and hand it to a fresh AiSanitizer; cached results of the old
 * generation are invalidated through Version().
 *
 * Pattern pack JSON format:
 *   {
 *     "version": "2024.06-1",
 *     "patterns": [
 *       { "name": "...", "regex": "...", "score": 100,
 *         "severity": "CRITICAL", "category": "instruction_override",
 *         "description": "...", "caseSensitive": false,
 *         "keywords": ["..."] },
 *       { "name": "...", "scanner": "base64_runs", ... }
 *     ],
 *     "whitelist": ["..."]
 *   }
 *
 * ============================================================================
 */
#pragma once

#include "PatternMatcher.hpp"
#include "SanitizationTypes.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace PromptShield {
    namespace Sanitization {

        struct ThreatPattern {
            std::string name;
            PatternMatcher matcher;
            double baseScore;
            ThreatSeverity severity;
            ThreatCategory category;
            std::string description;
        };

        class PatternDatabase {
        public:
            static constexpr const char* kBuiltinVersion = "1.0.0";

            /// @brief Shared built-in generation, constructed on first use.
            [[nodiscard]] static std::shared_ptr<const PatternDatabase> Builtin();

            /**
             * @brief Validate and assemble a generation.
             *
             * Rejects empty versions, empty or duplicate names and scores
             * outside the band of the declared severity. @p out is only
             * assigned on success.
             */
            [[nodiscard]] static SanitizerError Create(
                std::string version,
                std::vector<ThreatPattern> patterns,
                std::vector<std::string> whitelist,
                std::shared_ptr<const PatternDatabase>& out);

            [[nodiscard]] static SanitizerError LoadFromJSONString(
                std::string_view jsonData,
                std::shared_ptr<const PatternDatabase>& out) noexcept;

            [[nodiscard]] static SanitizerError LoadFromJSONFile(
                const std::string& filePath,
                std::shared_ptr<const PatternDatabase>& out) noexcept;

            // ------------------------------------------------------------------
            // Queries
            // ------------------------------------------------------------------

            [[nodiscard]] const std::vector<ThreatPattern>& All() const noexcept { return m_patterns; }
            [[nodiscard]] std::vector<const ThreatPattern*> BySeverity(ThreatSeverity severity) const;
            [[nodiscard]] std::vector<const ThreatPattern*> ByCategory(ThreatCategory category) const;
            [[nodiscard]] const ThreatPattern* Find(std::string_view name) const noexcept;

            /// ASCII case-insensitive substring test against every whitelist phrase.
            [[nodiscard]] bool ContainsWhitelistedPhrase(std::string_view text) const noexcept;

            [[nodiscard]] const std::vector<std::string>& Whitelist() const noexcept { return m_whitelist; }
            [[nodiscard]] const std::string& Version() const noexcept { return m_version; }
            [[nodiscard]] size_t Size() const noexcept { return m_patterns.size(); }

        private:
            PatternDatabase() = default;

            std::string m_version;
            std::vector<ThreatPattern> m_patterns;
            std::vector<std::string> m_whitelist;
        };

    } // namespace Sanitization
} // namespace PromptShield
