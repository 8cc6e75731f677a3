/*
 * ============================================================================
 * PromptShield Base64 Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Scalar, table-driven Base64 codec.
 *
 * ============================================================================
 */

#include "Base64Utils.hpp"

#include <cctype>
#include <cstdint>
#include <new>

namespace PromptShield {
    namespace Utils {

        namespace {

            constexpr std::string_view kStdAlphabet =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
            constexpr std::string_view kUrlAlphabet =
                "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

            constexpr uint8_t kInvalid = 0xFF;

            using DecodeTable = std::array<uint8_t, 256>;

            constexpr DecodeTable MakeDecodeTable(std::string_view alphabet) {
                DecodeTable table{};
                for (auto& slot : table) slot = kInvalid;
                for (size_t i = 0; i < alphabet.size(); ++i) {
                    table[static_cast<unsigned char>(alphabet[i])] = static_cast<uint8_t>(i);
                }
                return table;
            }

            constexpr DecodeTable kStdTable = MakeDecodeTable(kStdAlphabet);
            constexpr DecodeTable kUrlTable = MakeDecodeTable(kUrlAlphabet);

            // Overflow guard for the length arithmetic; real inputs are bounded
            // by the configured maximum content length.
            constexpr size_t kMaxInput = (SIZE_MAX / 4) - 1024;

            std::string_view AlphabetFor(Base64Alphabet alphabet) noexcept {
                return alphabet == Base64Alphabet::UrlSafe ? kUrlAlphabet : kStdAlphabet;
            }

            const DecodeTable& TableFor(Base64Alphabet alphabet) noexcept {
                return alphabet == Base64Alphabet::UrlSafe ? kUrlTable : kStdTable;
            }

        } // namespace

        bool LooksLikeBase64(std::string_view text) noexcept {
            const size_t body = text.find_first_not_of(kStdAlphabet);
            if (text.empty() || body == 0) return false;
            if (body == std::string_view::npos) return true;
            return text.find_first_not_of('=', body) == std::string_view::npos;
        }

        size_t Base64EncodedLength(size_t inputLen, const Base64EncodeOptions& opt) noexcept {
            if (inputLen == 0 || inputLen > kMaxInput) return 0;

            const size_t tail = inputLen % 3;
            const size_t full = (inputLen / 3) * 4;
            if (tail == 0) return full;
            return full + (opt.omitPadding ? tail + 1 : 4);
        }

        size_t Base64MaxDecodedLength(size_t inputLen) noexcept {
            if (inputLen == 0 || inputLen > SIZE_MAX - 3) return 0;
            return ((inputLen + 3) / 4) * 3;
        }

        // ============================================================================
        // Encode
        // ============================================================================

        bool Base64Encode(const uint8_t* data, size_t len, std::string& out, const Base64EncodeOptions& opt) {
            out.clear();
            if (len == 0) return true;
            if (!data) return false;

            const size_t needed = Base64EncodedLength(len, opt);
            if (needed == 0) return false;

            try {
                out.reserve(needed);
            }
            catch (const std::bad_alloc&) {
                return false;
            }

            const std::string_view alphabet = AlphabetFor(opt.alphabet);

            // Emits the first @p symbols sextets of a 24-bit quantum.
            auto emit = [&](uint32_t quantum, int symbols) {
                for (int k = 0; k < symbols; ++k) {
                    out.push_back(alphabet[(quantum >> (18 - 6 * k)) & 0x3F]);
                }
            };

            size_t pos = 0;
            for (; len - pos >= 3; pos += 3) {
                emit((uint32_t{ data[pos] } << 16) | (uint32_t{ data[pos + 1] } << 8) | data[pos + 2], 4);
            }

            const size_t tail = len - pos;
            if (tail > 0) {
                uint32_t quantum = uint32_t{ data[pos] } << 16;
                if (tail == 2) quantum |= uint32_t{ data[pos + 1] } << 8;
                emit(quantum, static_cast<int>(tail) + 1);
                if (!opt.omitPadding) out.append(3 - tail, '=');
            }
            return true;
        }

        // ============================================================================
        // Decode
        // ============================================================================

        bool Base64Decode(const char* data, size_t len, std::vector<uint8_t>& out, Base64DecodeError& err, const Base64DecodeOptions& opt) {
            out.clear();
            err = Base64DecodeError::None;

            if (len == 0) return true;
            if (!data) {
                err = Base64DecodeError::InvalidCharacter;
                return false;
            }
            if (len > kMaxInput) {
                err = Base64DecodeError::InputTooLarge;
                return false;
            }

            try {
                out.reserve(Base64MaxDecodedLength(len));
            }
            catch (const std::bad_alloc&) {
                err = Base64DecodeError::AllocationFailed;
                return false;
            }

            auto fail = [&](Base64DecodeError code) {
                err = code;
                return false;
            };

            const DecodeTable& table = TableFor(opt.alphabet);
            uint32_t buffer = 0;
            int pending = 0;        // bits held in buffer
            size_t symbols = 0;     // alphabet characters consumed
            size_t padding = 0;

            for (size_t i = 0; i < len; ++i) {
                const auto ch = static_cast<unsigned char>(data[i]);

                if (opt.ignoreWhitespace && std::isspace(ch)) continue;

                if (ch == '=') {
                    ++padding;
                    if (padding > 2 || symbols % 4 == 0) return fail(Base64DecodeError::InvalidPadding);
                    continue;
                }
                if (padding > 0) return fail(Base64DecodeError::InvalidPadding);

                const uint8_t value = table[ch];
                if (value == kInvalid) return fail(Base64DecodeError::InvalidCharacter);

                buffer = (buffer << 6) | value;
                pending += 6;
                ++symbols;

                if (pending >= 8) {
                    pending -= 8;
                    out.push_back(static_cast<uint8_t>(buffer >> pending));
                }
            }

            const size_t partial = symbols % 4;
            if (partial == 1) return fail(Base64DecodeError::InvalidPadding);

            if (padding > 0) {
                if (pending > 4 || partial + padding != 4) return fail(Base64DecodeError::InvalidPadding);
            }
            else if (partial != 0 && !opt.acceptMissingPadding) {
                return fail(Base64DecodeError::InvalidPadding);
            }
            return true;
        }

        std::optional<std::string> Base64DecodeText(std::string_view text) {
            constexpr std::string_view kSpace = " \t\r\n\f\v";
            const size_t first = text.find_first_not_of(kSpace);
            if (first == std::string_view::npos) return std::nullopt;
            text = text.substr(first, text.find_last_not_of(kSpace) - first + 1);

            if (!LooksLikeBase64(text)) return std::nullopt;

            Base64DecodeOptions opt{};
            opt.ignoreWhitespace = false;

            std::vector<uint8_t> bytes;
            Base64DecodeError err = Base64DecodeError::None;
            if (!Base64Decode(text, bytes, err, opt)) return std::nullopt;

            return std::string(bytes.begin(), bytes.end());
        }

    } // namespace Utils
} // namespace PromptShield
