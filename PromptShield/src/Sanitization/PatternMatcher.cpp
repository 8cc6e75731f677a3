/*
 * ============================================================================
 * PromptShield Pattern Matcher Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "PatternMatcher.hpp"

#include "../Utils/Base64Utils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>

namespace PromptShield {
    namespace Sanitization {

        namespace StringUtils = Utils::StringUtils;

        namespace {

            constexpr size_t kMaxWhitespaceRun = 256;

            /// Copy of a text with whitespace runs clamped; origin[i] is the
            /// source offset of text[i]. Empty origin means nothing was clamped.
            struct SqueezedText {
                std::string text;
                std::vector<size_t> origin;
            };

            SqueezedText SqueezeWhitespace(std::string_view text) {
                SqueezedText result;

                bool needed = false;
                size_t run = 0;
                for (char c : text) {
                    run = StringUtils::IsSpace(c) ? run + 1 : 0;
                    if (run > kMaxWhitespaceRun) {
                        needed = true;
                        break;
                    }
                }
                if (!needed) return result;

                result.text.reserve(text.size());
                result.origin.reserve(text.size());
                run = 0;
                for (size_t i = 0; i < text.size(); ++i) {
                    run = StringUtils::IsSpace(text[i]) ? run + 1 : 0;
                    if (run > kMaxWhitespaceRun) continue;
                    result.text.push_back(text[i]);
                    result.origin.push_back(i);
                }
                return result;
            }

            bool IsWordChar(char c) noexcept {
                return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
            }

        } // namespace

        // ============================================================================
        // PatternMatcher
        // ============================================================================

        std::optional<PatternMatcher> PatternMatcher::FromRegex(
            std::string_view expression,
            bool caseSensitive,
            std::vector<std::string> keywords,
            std::string* error) {

            if (expression.empty()) {
                if (error) *error = "empty expression";
                return std::nullopt;
            }

            auto flags = std::regex::ECMAScript | std::regex::optimize;
            if (!caseSensitive) {
                flags |= std::regex::icase;
            }

            PatternMatcher matcher;
            try {
                matcher.m_regex = std::make_shared<const std::regex>(expression.begin(), expression.end(), flags);
            }
            catch (const std::regex_error& e) {
                if (error) *error = e.what();
                return std::nullopt;
            }

            matcher.m_source.assign(expression);
            matcher.m_caseSensitive = caseSensitive;
            matcher.m_keywords = std::move(keywords);
            return matcher;
        }

        PatternMatcher PatternMatcher::FromScanner(std::string description, ScanFunction scanner) {
            PatternMatcher matcher;
            matcher.m_scanner = std::move(scanner);
            matcher.m_source = std::move(description);
            matcher.m_caseSensitive = true;
            return matcher;
        }

        bool PatternMatcher::PassesPrefilter(std::string_view text) const noexcept {
            if (m_keywords.empty()) return true;
            for (const auto& kw : m_keywords) {
                if (StringUtils::IContains(text, kw)) return true;
            }
            return false;
        }

        void PatternMatcher::FindAll(std::string_view text, std::vector<PatternMatch>& out) const {
            if (text.empty()) return;

            if (m_scanner) {
                m_scanner(text, out);
                return;
            }

            if (!m_regex || !PassesPrefilter(text)) return;

            // std::regex recurses once per repetition; long whitespace runs are
            // clamped before matching and offsets are mapped back afterwards.
            const SqueezedText squeezed = SqueezeWhitespace(text);
            const std::string_view subject = squeezed.origin.empty() ? text : std::string_view(squeezed.text);

            using Iterator = std::regex_iterator<std::string_view::const_iterator>;
            try {
                for (Iterator it(subject.begin(), subject.end(), *m_regex), end; it != end; ++it) {
                    const auto& m = *it;
                    if (m.length(0) <= 0) continue;

                    size_t position = static_cast<size_t>(m.position(0));
                    size_t length = static_cast<size_t>(m.length(0));
                    if (!squeezed.origin.empty()) {
                        const size_t first = squeezed.origin[position];
                        const size_t last = squeezed.origin[position + length - 1];
                        position = first;
                        length = last - first + 1;
                    }
                    out.push_back(PatternMatch{ position, length });
                }
            }
            catch (const std::regex_error& e) {
                // Engine gave up (complexity/stack); keep what was found so far.
                PS_LOG_WARN("PatternMatcher", "regex /%s/ aborted after %zu matches: %s",
                    m_source.c_str(), out.size(), e.what());
            }
        }

        // ============================================================================
        // Scanners
        // ============================================================================

        namespace Scanners {

            namespace {

                bool IsHexDigit(char c) noexcept {
                    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
                }

                bool IsUpperOrSpace(char c) noexcept {
                    return (c >= 'A' && c <= 'Z') || StringUtils::IsSpace(c);
                }

                size_t Utf8SequenceLength(unsigned char lead) noexcept {
                    if (lead < 0x80) return 1;
                    if ((lead & 0xE0) == 0xC0) return 2;
                    if ((lead & 0xF0) == 0xE0) return 3;
                    if ((lead & 0xF8) == 0xF0) return 4;
                    return 1;
                }

                /// Escape runs of the form "\<marker><digits hex digits>".
                void EscapeRuns(std::string_view text, char marker, size_t digits, size_t minCount,
                                std::vector<PatternMatch>& out) {
                    const size_t unit = 2 + digits;
                    auto isUnit = [&](size_t at) {
                        if (at + unit > text.size()) return false;
                        if (text[at] != '\\' || text[at + 1] != marker) return false;
                        for (size_t k = 0; k < digits; ++k) {
                            if (!IsHexDigit(text[at + 2 + k])) return false;
                        }
                        return true;
                    };

                    size_t i = 0;
                    while (i < text.size()) {
                        if (!isUnit(i)) {
                            ++i;
                            continue;
                        }
                        size_t count = 0;
                        size_t j = i;
                        while (isUnit(j)) {
                            ++count;
                            j += unit;
                        }
                        if (count >= minCount) {
                            out.push_back(PatternMatch{ i, j - i });
                        }
                        i = j;
                    }
                }

            } // namespace

            bool IsRunDelimiter(char c) noexcept {
                return c == ',' || StringUtils::IsSpace(c);
            }

            void UppercaseRuns(std::string_view text, std::vector<PatternMatch>& out, size_t minLength) {
                size_t i = 0;
                while (i < text.size()) {
                    if (!IsUpperOrSpace(text[i])) {
                        ++i;
                        continue;
                    }
                    size_t j = i;
                    bool hasLetter = false;
                    while (j < text.size() && IsUpperOrSpace(text[j])) {
                        hasLetter = hasLetter || (text[j] >= 'A' && text[j] <= 'Z');
                        ++j;
                    }
                    if (hasLetter && j - i >= minLength) {
                        out.push_back(PatternMatch{ i, j - i });
                    }
                    i = j;
                }
            }

            void Base64Runs(std::string_view text, std::vector<PatternMatch>& out, size_t minLength) {
                size_t i = 0;
                while (i < text.size()) {
                    if (!Utils::IsBase64AlphabetChar(text[i]) || (i > 0 && !IsRunDelimiter(text[i - 1]))) {
                        ++i;
                        continue;
                    }

                    size_t j = i;
                    while (j < text.size() && Utils::IsBase64AlphabetChar(text[j])) ++j;
                    size_t k = j;
                    while (k < text.size() && text[k] == '=') ++k;

                    const bool padOk = (k - j) <= 2;
                    const bool endOk = (k == text.size()) || IsRunDelimiter(text[k]);
                    if (j - i >= minLength && padOk && endOk) {
                        out.push_back(PatternMatch{ i, k - i });
                    }
                    i = (k > i) ? k : i + 1;
                }
            }

            void HexEscapeRuns(std::string_view text, std::vector<PatternMatch>& out, size_t minCount) {
                EscapeRuns(text, 'x', 2, minCount, out);
            }

            void UnicodeEscapeRuns(std::string_view text, std::vector<PatternMatch>& out, size_t minCount) {
                EscapeRuns(text, 'u', 4, minCount, out);
            }

            void RepeatedWordRuns(std::string_view text, std::vector<PatternMatch>& out) {
                struct Word { size_t begin; size_t end; };

                auto nextWord = [&](size_t from, Word& word) {
                    size_t i = from;
                    while (i < text.size() && !IsWordChar(text[i])) ++i;
                    if (i >= text.size()) return false;
                    size_t j = i;
                    while (j < text.size() && IsWordChar(text[j])) ++j;
                    word = Word{ i, j };
                    return true;
                };

                auto onlySpaceBetween = [&](const Word& a, const Word& b) {
                    if (b.begin == a.end) return false;
                    for (size_t k = a.end; k < b.begin; ++k) {
                        if (!StringUtils::IsSpace(text[k])) return false;
                    }
                    return true;
                };

                auto sameWord = [&](const Word& a, const Word& b) {
                    return StringUtils::IEquals(text.substr(a.begin, a.end - a.begin),
                                                text.substr(b.begin, b.end - b.begin));
                };

                Word w0{}, w1{}, w2{};
                if (!nextWord(0, w0) || !nextWord(w0.end, w1)) return;

                while (nextWord(w1.end, w2)) {
                    if (onlySpaceBetween(w0, w1) && onlySpaceBetween(w1, w2) &&
                        sameWord(w0, w1) && sameWord(w1, w2)) {
                        out.push_back(PatternMatch{ w0.begin, w2.end - w0.begin });
                        if (!nextWord(w2.end, w0) || !nextWord(w0.end, w1)) return;
                        continue;
                    }
                    w0 = w1;
                    w1 = w2;
                }
            }

            void RepeatedCharacterRuns(std::string_view text, size_t maxRepeat,
                                       std::vector<PatternMatch>& out, size_t* totalChars) {
                size_t total = 0;
                size_t i = 0;
                while (i < text.size()) {
                    const size_t len = std::min(Utf8SequenceLength(static_cast<unsigned char>(text[i])), text.size() - i);
                    const std::string_view ch = text.substr(i, len);

                    size_t j = i + len;
                    size_t count = 1;
                    while (j + len <= text.size() && text.compare(j, len, ch) == 0) {
                        j += len;
                        ++count;
                    }

                    const bool lineBreak = (ch == "\n" || ch == "\r");
                    if (!lineBreak && count > maxRepeat) {
                        out.push_back(PatternMatch{ i, j - i });
                        total += count;
                    }
                    i = j;
                }

                if (totalChars) *totalChars = total;
            }

        } // namespace Scanners

    } // namespace Sanitization
} // namespace PromptShield
