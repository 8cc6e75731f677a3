/*
 * ============================================================================
 * PromptShield Security Event Sink
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Boundary to the host's security event log. Implementations must return
 * quickly; AiSanitizer calls them synchronously from Analyze() and logs
 * (never propagates) exceptions they throw.
 *
 * ============================================================================
 */
#pragma once

#include "SanitizationTypes.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace PromptShield {
    namespace Sanitization {

        struct SecurityEvent {
            static constexpr size_t kPreviewBytes = 200;

            std::string contentPreview;         ///< First 200 bytes, UTF-8 safe
            double score = 0.0;
            SanitizationAction action = SanitizationAction::Allow;
            size_t threatCount = 0;
            std::string requesterIdentity;
            std::optional<std::string> userId;

            [[nodiscard]] static SecurityEvent FromResult(const SanitizationResult& result,
                                                          const RequestContext& context);
        };

        class ISecurityEventSink {
        public:
            virtual ~ISecurityEventSink() = default;

            virtual void OnSuspiciousContent(const SecurityEvent& event) = 0;
        };

        /// Default sink: WARN through the Logger, ERROR for blocked content.
        class LoggerEventSink final : public ISecurityEventSink {
        public:
            void OnSuspiciousContent(const SecurityEvent& event) override;
        };

    } // namespace Sanitization
} // namespace PromptShield
