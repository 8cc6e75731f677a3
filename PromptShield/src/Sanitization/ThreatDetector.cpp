/*
 * ============================================================================
 * PromptShield Threat Detector Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "ThreatDetector.hpp"

#include "../Utils/Base64Utils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>

namespace PromptShield {
    namespace Sanitization {

        namespace StringUtils = Utils::StringUtils;

        namespace {

            bool IsContinuationByte(char c) noexcept {
                return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
            }

        } // namespace

        ThreatDetector::ThreatDetector(std::shared_ptr<const PatternDatabase> patterns)
            : m_patterns(patterns ? std::move(patterns) : PatternDatabase::Builtin()) {
        }

        std::vector<DetectedThreat> ThreatDetector::Detect(std::string_view content) const {
            std::vector<DetectedThreat> threats = Scan(content, EncodingVariant::Plain);

            for (const auto& decoded : DecodeVariants(content)) {
                auto more = Scan(decoded.text, decoded.variant);
                if (!more.empty()) {
                    PS_LOG_DEBUG("ThreatDetector", "%zu threat(s) in %s variant",
                        more.size(), ToString(decoded.variant));
                }
                threats.insert(threats.end(),
                               std::make_move_iterator(more.begin()),
                               std::make_move_iterator(more.end()));
            }

            return threats;
        }

        std::vector<DetectedThreat> ThreatDetector::Scan(std::string_view text, EncodingVariant variant) const {
            std::vector<DetectedThreat> threats;
            if (text.empty()) return threats;

            std::vector<PatternMatch> matches;
            for (const auto& pattern : m_patterns->All()) {
                matches.clear();
                pattern.matcher.FindAll(text, matches);

                for (const auto& m : matches) {
                    DetectedThreat threat;
                    threat.patternName = pattern.name;
                    threat.category = pattern.category;
                    threat.severity = pattern.severity;
                    threat.score = pattern.baseScore;
                    threat.matchedText.assign(text.substr(m.position, m.length));
                    threat.position = m.position;
                    threat.contextSnippet = ExtractContext(text, m.position, m.length);
                    threat.variant = variant;
                    threats.push_back(std::move(threat));
                }
            }

            return threats;
        }

        std::vector<ContentVariant> ThreatDetector::DecodeVariants(std::string_view content) {
            std::vector<ContentVariant> variants;
            if (content.empty()) return variants;

            if (auto decoded = Utils::Base64DecodeText(content)) {
                if (*decoded != content && StringUtils::IsValidUtf8(*decoded)) {
                    variants.push_back(ContentVariant{ EncodingVariant::Base64Decoded, std::move(*decoded) });
                }
            }

            if (content.find('%') != std::string_view::npos) {
                if (auto decoded = StringUtils::PercentDecode(content)) {
                    if (*decoded != content) {
                        variants.push_back(ContentVariant{ EncodingVariant::UrlDecoded, std::move(*decoded) });
                    }
                }
            }

            return variants;
        }

        std::string ThreatDetector::ExtractContext(std::string_view text, size_t position,
                                                   size_t length, size_t radius) {
            if (position > text.size()) position = text.size();
            const size_t matchEnd = std::min(text.size(), position + length);

            size_t start = position > radius ? position - radius : 0;
            while (start < position && IsContinuationByte(text[start])) ++start;

            size_t end = std::min(text.size(), matchEnd + radius);
            while (end > matchEnd && end < text.size() && IsContinuationByte(text[end])) --end;

            std::string snippet;
            snippet.reserve(end - start + 6);
            if (start > 0) snippet += "...";
            snippet.append(text.substr(start, end - start));
            if (end < text.size()) snippet += "...";
            return snippet;
        }

    } // namespace Sanitization
} // namespace PromptShield
