/*
 * ============================================================================
 * PromptShield Content Sanitizer Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "ContentSanitizer.hpp"

#include "PatternMatcher.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <optional>

namespace PromptShield {
    namespace Sanitization {

        namespace StringUtils = Utils::StringUtils;

        namespace {

            constexpr std::string_view kSentenceDelimiters[] = { ". ", "! ", "? ", "\n\n" };
            constexpr size_t kDelimiterLength = 2;

            /// Fence marker: "<rule> <word> <rule>" with optional whitespace, or a
            /// literal tag when @c rule is empty. Always case-insensitive.
            struct FenceMarker {
                std::string_view rule;
                std::string_view word;
            };

            struct FencePair {
                FenceMarker open;
                FenceMarker close;
            };

            constexpr FencePair kFencePairs[] = {
                { { "---", "END" },      { "---", "START" } },
                { { "###", "OVERRIDE" }, { "###", "END" } },
                { { "===", "STOP" },     { "===", "RESUME" } },
                { { "", "[SYSTEM]" },    { "", "[/SYSTEM]" } },
            };

            struct Span {
                size_t begin;
                size_t end;
            };

            size_t SkipSpaces(std::string_view text, size_t pos) noexcept {
                while (pos < text.size() && StringUtils::IsSpace(text[pos])) ++pos;
                return pos;
            }

            /// End offset of @p marker when it starts exactly at @p pos.
            std::optional<size_t> MatchMarkerAt(std::string_view text, size_t pos, const FenceMarker& marker) {
                if (text.compare(pos, marker.rule.size(), marker.rule) != 0) return std::nullopt;
                pos = SkipSpaces(text, pos + marker.rule.size());

                if (pos + marker.word.size() > text.size() ||
                    !StringUtils::IEquals(text.substr(pos, marker.word.size()), marker.word)) {
                    return std::nullopt;
                }
                pos = SkipSpaces(text, pos + marker.word.size());

                if (text.compare(pos, marker.rule.size(), marker.rule) != 0) return std::nullopt;
                return pos + marker.rule.size();
            }

            std::optional<Span> FindMarker(std::string_view text, size_t from, const FenceMarker& marker) {
                if (marker.rule.empty()) {
                    const size_t at = StringUtils::IFind(text, marker.word, from);
                    if (at == std::string_view::npos) return std::nullopt;
                    return Span{ at, at + marker.word.size() };
                }

                size_t at = text.find(marker.rule, from);
                while (at != std::string_view::npos) {
                    if (auto end = MatchMarkerAt(text, at, marker)) {
                        return Span{ at, *end };
                    }
                    at = text.find(marker.rule, at + 1);
                }
                return std::nullopt;
            }

            void ReplaceMatches(std::string& content, const std::vector<PatternMatch>& matches, std::string_view replacement) {
                if (matches.empty()) return;

                std::string out;
                out.reserve(content.size());
                size_t cursor = 0;
                for (const auto& m : matches) {
                    out.append(content, cursor, m.position - cursor);
                    out.append(replacement);
                    cursor = m.position + m.length;
                }
                out.append(content, cursor, std::string::npos);
                content = std::move(out);
            }

        } // namespace

        SanitizedContent ContentSanitizer::Sanitize(std::string_view content,
                                                    const std::vector<DetectedThreat>& threats) {
            SanitizedContent result;
            result.content.assign(content);
            if (threats.empty()) return result;

            // Back to front so earlier offsets stay valid.
            std::vector<const DetectedThreat*> ordered;
            ordered.reserve(threats.size());
            for (const auto& threat : threats) {
                if (threat.variant == EncodingVariant::Plain) ordered.push_back(&threat);
            }
            std::stable_sort(ordered.begin(), ordered.end(), [](const DetectedThreat* a, const DetectedThreat* b) {
                return a->position > b->position;
            });

            for (const DetectedThreat* threat : ordered) {
                if (RemoveSentence(result.content, *threat)) {
                    ++result.sectionsRemoved;
                }
            }

            result.sectionsRemoved += StripFencedBlocks(result.content);
            RedactEncodedRuns(result.content);
            NormalizeWhitespace(result.content);

            PS_LOG_DEBUG("ContentSanitizer", "removed %zu section(s), %zu -> %zu bytes",
                result.sectionsRemoved, content.size(), result.content.size());
            return result;
        }

        bool ContentSanitizer::RemoveSentence(std::string& content, const DetectedThreat& threat) {
            const size_t position = threat.position;
            const size_t length = threat.matchedText.size();
            if (length == 0 || position > content.size() || content.size() - position < length) return false;
            if (content.compare(position, length, threat.matchedText) != 0) return false;

            const std::string_view text(content);
            const std::string_view before = text.substr(0, position);
            const size_t matchEnd = position + length;

            size_t cutBegin = 0;
            bool foundBegin = false;
            for (const auto delim : kSentenceDelimiters) {
                const size_t at = before.rfind(delim);
                if (at != std::string_view::npos && (!foundBegin || at + kDelimiterLength > cutBegin)) {
                    cutBegin = at + kDelimiterLength;
                    foundBegin = true;
                }
            }

            size_t cutEnd = text.size();
            for (const auto delim : kSentenceDelimiters) {
                const size_t at = text.find(delim, matchEnd);
                if (at != std::string_view::npos) {
                    cutEnd = std::min(cutEnd, at + kDelimiterLength);
                }
            }

            content.erase(cutBegin, cutEnd - cutBegin);
            return true;
        }

        size_t ContentSanitizer::StripFencedBlocks(std::string& content) {
            size_t stripped = 0;

            for (const auto& pair : kFencePairs) {
                size_t from = 0;
                for (;;) {
                    const auto open = FindMarker(content, from, pair.open);
                    if (!open) break;
                    const auto close = FindMarker(content, open->end, pair.close);
                    if (!close) break;

                    content.replace(open->begin, close->end - open->begin, " ");
                    ++stripped;
                    from = open->begin + 1;
                }
            }

            return stripped;
        }

        void ContentSanitizer::RedactEncodedRuns(std::string& content) {
            std::vector<PatternMatch> matches;

            Scanners::Base64Runs(content, matches);
            ReplaceMatches(content, matches, kEncodedPlaceholder);

            matches.clear();
            Scanners::HexEscapeRuns(content, matches);
            ReplaceMatches(content, matches, kHexPlaceholder);

            matches.clear();
            Scanners::UnicodeEscapeRuns(content, matches);
            ReplaceMatches(content, matches, kUnicodePlaceholder);
        }

        void ContentSanitizer::NormalizeWhitespace(std::string& content) {
            std::string out;
            out.reserve(content.size());

            size_t i = 0;
            while (i < content.size()) {
                const char c = content[i];

                if (c == ' ' || c == '\t') {
                    size_t j = i;
                    while (j < content.size() && (content[j] == ' ' || content[j] == '\t')) ++j;
                    if (j - i >= 2) {
                        out.push_back(' ');
                    }
                    else {
                        out.push_back(c);
                    }
                    i = j;
                    continue;
                }

                if (c == '\n') {
                    size_t j = i;
                    while (j < content.size() && content[j] == '\n') ++j;
                    out.append(std::min<size_t>(j - i, 2), '\n');
                    i = j;
                    continue;
                }

                out.push_back(c);
                ++i;
            }

            content = StringUtils::TrimCopy(out);
        }

        bool ContentSanitizer::IsUsable(std::string_view sanitized, std::string_view original) noexcept {
            const std::string_view trimmed = StringUtils::TrimView(sanitized);
            if (trimmed.empty()) return false;
            if (trimmed.size() < kMinUsableLength) return false;
            return RemovalPercentage(original, sanitized) <= kMaxUsableRemovalPercent;
        }

        double ContentSanitizer::RemovalPercentage(std::string_view original, std::string_view sanitized) noexcept {
            if (original.empty() || sanitized.size() >= original.size()) return 0.0;
            const double removed = static_cast<double>(original.size() - sanitized.size());
            return removed * 100.0 / static_cast<double>(original.size());
        }

    } // namespace Sanitization
} // namespace PromptShield
