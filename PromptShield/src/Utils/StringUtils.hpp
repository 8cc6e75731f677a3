/*
 * ============================================================================
 * PromptShield String Utilities
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Byte-string helpers. Case folding is ASCII-only so that offsets computed
 * on folded text stay valid for the original UTF-8 bytes.
 *
 * ============================================================================
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PromptShield {
    namespace Utils {
        namespace StringUtils {

            // Case transformations
            void ToLower(std::string& str) noexcept;
            [[nodiscard]] std::string ToLowerCopy(std::string_view str);

            // Trimming (space, tab, CR, LF, VT, FF)
            [[nodiscard]] bool IsSpace(char c) noexcept;
            [[nodiscard]] std::string_view TrimView(std::string_view str) noexcept;
            [[nodiscard]] std::string TrimCopy(std::string_view str);

            // Comparison / search
            [[nodiscard]] bool IEquals(std::string_view s1, std::string_view s2) noexcept;
            [[nodiscard]] bool StartsWith(std::string_view str, std::string_view prefix) noexcept;
            [[nodiscard]] bool IContains(std::string_view str, std::string_view substr) noexcept;
            [[nodiscard]] size_t IFind(std::string_view str, std::string_view substr, size_t from = 0) noexcept;

            // Split / join
            [[nodiscard]] std::vector<std::string> Split(std::string_view str, std::string_view delimiter);
            [[nodiscard]] std::string Join(const std::vector<std::string>& elements, std::string_view delimiter);

            // Encoding
            [[nodiscard]] bool IsValidUtf8(std::string_view str) noexcept;

            /**
             * @brief Truncate to at most @p maxBytes without splitting a UTF-8
             *        sequence.
             */
            [[nodiscard]] std::string_view TruncateUtf8(std::string_view str, size_t maxBytes) noexcept;

            /**
             * @brief Strict percent-decoding.
             *
             * Every '%' must introduce two hex digits and the decoded bytes must
             * form valid UTF-8; otherwise std::nullopt. '+' is left as-is.
             */
            [[nodiscard]] std::optional<std::string> PercentDecode(std::string_view str);

            // Parsing
            [[nodiscard]] std::optional<bool> ParseBool(std::string_view str) noexcept;
            [[nodiscard]] std::optional<long long> ParseInt(std::string_view str) noexcept;

        } // namespace StringUtils
    } // namespace Utils
} // namespace PromptShield
