/*
 * ============================================================================
 * PromptShield Threat Detector
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Runs every pattern of a generation over the content and over its decoded
 * variants (whole-input Base64, percent-decoding), producing positioned
 * threats with a context window.
 *
 * ============================================================================
 */
#pragma once

#include "PatternDatabase.hpp"
#include "SanitizationTypes.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace PromptShield {
    namespace Sanitization {

        struct ContentVariant {
            EncodingVariant variant;
            std::string text;
        };

        class ThreatDetector {
        public:
            static constexpr size_t kContextRadius = 100;

            explicit ThreatDetector(std::shared_ptr<const PatternDatabase> patterns);

            /**
             * @brief Scan the content and every decoded variant that differs
             *        from it.
             *
             * Plain threats come first, in catalogue order and then position
             * order per pattern; decoded-variant threats follow with offsets
             * into the decoded text.
             */
            [[nodiscard]] std::vector<DetectedThreat> Detect(std::string_view content) const;

            /// Scan a single text without decoding.
            [[nodiscard]] std::vector<DetectedThreat> Scan(std::string_view text, EncodingVariant variant) const;

            /**
             * @brief Decodings of the whole input that succeeded and differ
             *        from it. Base64 output must be valid UTF-8 to count.
             */
            [[nodiscard]] static std::vector<ContentVariant> DecodeVariants(std::string_view content);

            /// Up to @p radius bytes either side of the match, cut on UTF-8
            /// boundaries, with "..." marking each truncated side.
            [[nodiscard]] static std::string ExtractContext(std::string_view text, size_t position,
                                                            size_t length, size_t radius = kContextRadius);

            [[nodiscard]] const PatternDatabase& Patterns() const noexcept { return *m_patterns; }

        private:
            std::shared_ptr<const PatternDatabase> m_patterns;
        };

    } // namespace Sanitization
} // namespace PromptShield
