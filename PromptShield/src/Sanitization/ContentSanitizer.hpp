/*
 * ============================================================================
 * PromptShield Content Sanitizer
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Redaction applied to content scored into the SANITIZE band:
 *   1. delete each sentence containing a plain-text threat
 *   2. strip fenced override blocks ("--- END --- ... --- START ---" etc.)
 *   3. replace long Base64 / \x / \u runs with placeholders
 *   4. normalize whitespace
 *
 * ============================================================================
 */
#pragma once

#include "SanitizationTypes.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace PromptShield {
    namespace Sanitization {

        struct SanitizedContent {
            std::string content;
            size_t sectionsRemoved = 0;
        };

        class ContentSanitizer {
        public:
            static constexpr const char* kEncodedPlaceholder = " [encoded content removed] ";
            static constexpr const char* kHexPlaceholder = " [hex content removed] ";
            static constexpr const char* kUnicodePlaceholder = " [unicode content removed] ";

            static constexpr size_t kMinUsableLength = 100;
            static constexpr double kMaxUsableRemovalPercent = 70.0;

            /**
             * @brief Redact @p content given the threats detected in it.
             *
             * With no threats the content is returned unchanged. Threats from
             * decoded variants carry offsets into the decoded text and are
             * skipped by sentence removal, as are threats whose matched text
             * is no longer at its offset after an earlier removal.
             */
            [[nodiscard]] static SanitizedContent Sanitize(std::string_view content,
                                                           const std::vector<DetectedThreat>& threats);

            /// False when fewer than 100 non-blank bytes remain or more than 70% was removed.
            [[nodiscard]] static bool IsUsable(std::string_view sanitized, std::string_view original) noexcept;

            /// Share of @p original removed, in [0, 100]; 0 for an empty original.
            [[nodiscard]] static double RemovalPercentage(std::string_view original, std::string_view sanitized) noexcept;

            // Individual steps, exposed for testing.
            [[nodiscard]] static bool RemoveSentence(std::string& content, const DetectedThreat& threat);
            [[nodiscard]] static size_t StripFencedBlocks(std::string& content);
            static void RedactEncodedRuns(std::string& content);
            static void NormalizeWhitespace(std::string& content);
        };

    } // namespace Sanitization
} // namespace PromptShield
