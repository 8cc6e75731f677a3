/*
 * ============================================================================
 * PromptShield Base64 Utilities
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * RFC 4648 Base64 encoding/decoding used to unwrap encoded payloads before
 * they are scanned.
 *
 * ============================================================================
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PromptShield {
    namespace Utils {

        // ============================================================================
        // Alphabet / Options
        // ============================================================================

        /**
         * @brief Base64 alphabet variant.
         *
         * Standard: '+' and '/' (RFC 4648 Section 4)
         * UrlSafe:  '-' and '_' (RFC 4648 Section 5)
         */
        enum class Base64Alphabet : uint8_t {
            Standard = 0,
            UrlSafe  = 1
        };

        struct Base64EncodeOptions final {
            Base64Alphabet alphabet = Base64Alphabet::Standard;
            bool omitPadding = false;   ///< Drop trailing '=' characters
        };

        struct Base64DecodeOptions final {
            Base64Alphabet alphabet = Base64Alphabet::Standard;
            bool ignoreWhitespace = true;       ///< Skip whitespace characters
            bool acceptMissingPadding = true;   ///< Allow input without '=' padding
        };

        enum class Base64DecodeError : uint8_t {
            None = 0,              ///< No error
            InvalidCharacter = 1,  ///< Input contains a non-alphabet character
            InvalidPadding = 2,    ///< Padding characters are malformed
            AllocationFailed = 3,  ///< Memory allocation failed
            InputTooLarge = 4      ///< Input exceeds safe processing limits
        };

        [[nodiscard]] constexpr const char* Base64DecodeErrorToString(Base64DecodeError err) noexcept {
            switch (err) {
                case Base64DecodeError::None:             return "No error";
                case Base64DecodeError::InvalidCharacter: return "Invalid character";
                case Base64DecodeError::InvalidPadding:   return "Invalid padding";
                case Base64DecodeError::AllocationFailed: return "Allocation failed";
                case Base64DecodeError::InputTooLarge:    return "Input too large";
                default:                                  return "Unknown error";
            }
        }

        // ============================================================================
        // Character Classification
        // ============================================================================

        /// True for A-Z, a-z, 0-9, '+' and '/'.
        [[nodiscard]] constexpr bool IsBase64AlphabetChar(char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                   (c >= '0' && c <= '9') || c == '+' || c == '/';
        }

        /**
         * @brief Whole-input shape check: one or more standard alphabet
         *        characters followed only by '=' padding.
         */
        [[nodiscard]] bool LooksLikeBase64(std::string_view text) noexcept;

        // ============================================================================
        // Length Helpers
        // ============================================================================

        [[nodiscard]] size_t Base64EncodedLength(size_t inputLen, const Base64EncodeOptions& opt = {}) noexcept;
        [[nodiscard]] size_t Base64MaxDecodedLength(size_t inputLen) noexcept;

        // ============================================================================
        // Encode / Decode
        // ============================================================================

        bool Base64Encode(const uint8_t* data, size_t len, std::string& out, const Base64EncodeOptions& opt = {});

        inline bool Base64Encode(std::string_view text, std::string& out, const Base64EncodeOptions& opt = {}) {
            return Base64Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size(), out, opt);
        }

        bool Base64Decode(const char* data, size_t len, std::vector<uint8_t>& out,
                          Base64DecodeError& err, const Base64DecodeOptions& opt = {});

        inline bool Base64Decode(std::string_view text, std::vector<uint8_t>& out,
                                 Base64DecodeError& err, const Base64DecodeOptions& opt = {}) {
            return Base64Decode(text.data(), text.size(), out, err, opt);
        }

        /**
         * @brief Decode a whole text payload to a byte string.
         *
         * Surrounding ASCII whitespace is trimmed first. Returns std::nullopt
         * unless the rest passes LooksLikeBase64() and decodes cleanly. Decoded bytes are returned as-is (not UTF-8 checked).
         */
        [[nodiscard]] std::optional<std::string> Base64DecodeText(std::string_view text);

    } // namespace Utils
} // namespace PromptShield
