/*
 * ============================================================================
 * PromptShield Security Event Sink Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "SecurityEventSink.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace PromptShield {
    namespace Sanitization {

        SecurityEvent SecurityEvent::FromResult(const SanitizationResult& result,
                                                const RequestContext& context) {
            SecurityEvent event;
            event.contentPreview.assign(Utils::StringUtils::TruncateUtf8(result.originalContent, kPreviewBytes));
            event.score = result.score;
            event.action = result.action;
            event.threatCount = result.threats.size();
            event.requesterIdentity = context.requesterIdentity;
            event.userId = context.userId;
            return event;
        }

        void LoggerEventSink::OnSuspiciousContent(const SecurityEvent& event) {
            [[maybe_unused]] const char* requester = event.requesterIdentity.empty() ? "unknown" : event.requesterIdentity.c_str();
            [[maybe_unused]] const char* user = event.userId ? event.userId->c_str() : "-";

            if (event.action == SanitizationAction::Block) {
                PS_LOG_ERROR("SecurityEvent", "%s content (score %.1f, %zu threats) from %s user=%s: %.200s",
                    ToString(event.action), event.score, event.threatCount, requester, user,
                    event.contentPreview.c_str());
            }
            else {
                PS_LOG_WARN("SecurityEvent", "%s content (score %.1f, %zu threats) from %s user=%s: %.200s",
                    ToString(event.action), event.score, event.threatCount, requester, user,
                    event.contentPreview.c_str());
            }
        }

    } // namespace Sanitization
} // namespace PromptShield
