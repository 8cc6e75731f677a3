/*
 * ============================================================================
 * PromptShield Pattern Matcher
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Uniform "find every match" interface over two matcher kinds:
 *   - compiled ECMAScript regular expressions (phrase patterns)
 *   - linear scanners for run-shaped signals (uppercase runs, Base64 runs,
 *     escape-sequence runs) that a backtracking engine handles badly on
 *     long inputs
 *
 * ============================================================================
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace PromptShield {
    namespace Sanitization {

        struct PatternMatch {
            size_t position = 0;
            size_t length = 0;
        };

        using ScanFunction = std::function<void(std::string_view text, std::vector<PatternMatch>& out)>;

        class PatternMatcher {
        public:
            /**
             * @brief Compile a regular expression matcher.
             *
             * @param expression   ECMAScript syntax
             * @param caseSensitive false compiles with std::regex::icase
             * @param keywords     optional prefilter; when non-empty the regex
             *                     only runs if one keyword occurs in the text
             *                     (ASCII case-insensitive)
             * @param error        receives the compiler message on failure
             */
            [[nodiscard]] static std::optional<PatternMatcher> FromRegex(
                std::string_view expression,
                bool caseSensitive,
                std::vector<std::string> keywords = {},
                std::string* error = nullptr);

            [[nodiscard]] static PatternMatcher FromScanner(std::string description, ScanFunction scanner);

            /// Append every non-overlapping match in @p text, in order.
            void FindAll(std::string_view text, std::vector<PatternMatch>& out) const;

            [[nodiscard]] bool IsRegex() const noexcept { return static_cast<bool>(m_regex); }
            [[nodiscard]] const std::string& Source() const noexcept { return m_source; }
            [[nodiscard]] bool CaseSensitive() const noexcept { return m_caseSensitive; }

        private:
            PatternMatcher() = default;

            [[nodiscard]] bool PassesPrefilter(std::string_view text) const noexcept;

            std::shared_ptr<const std::regex> m_regex;
            ScanFunction m_scanner;
            std::string m_source;
            std::vector<std::string> m_keywords;
            bool m_caseSensitive = false;
        };

        // ============================================================================
        // Run scanners
        // ============================================================================

        namespace Scanners {

            /// Characters separating a Base64 run from its neighbours.
            [[nodiscard]] bool IsRunDelimiter(char c) noexcept;

            /**
             * @brief Maximal runs of A-Z and whitespace, at least @p minLength
             *        bytes long and containing at least one letter.
             */
            void UppercaseRuns(std::string_view text, std::vector<PatternMatch>& out, size_t minLength = 100);

            /**
             * @brief Maximal Base64-alphabet runs of at least @p minLength
             *        characters plus at most two '=' that start at the beginning
             *        of the text or after whitespace/comma and end at the end of
             *        the text or before whitespace/comma.
             */
            void Base64Runs(std::string_view text, std::vector<PatternMatch>& out, size_t minLength = 50);

            /// Runs of at least @p minCount consecutive "\xHH" escapes.
            void HexEscapeRuns(std::string_view text, std::vector<PatternMatch>& out, size_t minCount = 10);

            /// Runs of at least @p minCount consecutive "\uHHHH" escapes.
            void UnicodeEscapeRuns(std::string_view text, std::vector<PatternMatch>& out, size_t minCount = 10);

            /// The same word (ASCII \w+, case-insensitive) three times in a row,
            /// separated only by whitespace.
            void RepeatedWordRuns(std::string_view text, std::vector<PatternMatch>& out);

            /**
             * @brief Runs of one repeated character (UTF-8 aware) longer than
             *        @p maxRepeat. CR and LF never form runs.
             *
             * Match lengths are in bytes; @p totalChars (optional) receives the
             * summed run lengths in characters.
             */
            void RepeatedCharacterRuns(std::string_view text, size_t maxRepeat,
                                       std::vector<PatternMatch>& out, size_t* totalChars = nullptr);

        } // namespace Scanners

    } // namespace Sanitization
} // namespace PromptShield
