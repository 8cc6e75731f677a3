/*
 * ============================================================================
 * PromptShield String Utilities Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>

namespace PromptShield {
    namespace Utils {
        namespace StringUtils {

            namespace {

                constexpr char AsciiLower(char c) noexcept {
                    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
                }

                int HexValue(char c) noexcept {
                    if (c >= '0' && c <= '9') return c - '0';
                    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
                    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
                    return -1;
                }

            } // namespace

            // lower case transformations
            void ToLower(std::string& str) noexcept {
                for (char& c : str) c = AsciiLower(c);
            }

            std::string ToLowerCopy(std::string_view str) {
                std::string out(str);
                ToLower(out);
                return out;
            }

            bool IsSpace(char c) noexcept {
                return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
            }

            std::string_view TrimView(std::string_view str) noexcept {
                size_t b = 0;
                size_t e = str.size();
                while (b < e && IsSpace(str[b])) ++b;
                while (e > b && IsSpace(str[e - 1])) --e;
                return str.substr(b, e - b);
            }

            std::string TrimCopy(std::string_view str) {
                return std::string(TrimView(str));
            }

            // comparisons
            bool IEquals(std::string_view s1, std::string_view s2) noexcept {
                if (s1.size() != s2.size()) return false;
                for (size_t i = 0; i < s1.size(); ++i) {
                    if (AsciiLower(s1[i]) != AsciiLower(s2[i])) return false;
                }
                return true;
            }

            bool StartsWith(std::string_view str, std::string_view prefix) noexcept {
                return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
            }

            size_t IFind(std::string_view str, std::string_view substr, size_t from) noexcept {
                if (substr.empty()) return from <= str.size() ? from : std::string_view::npos;
                if (from >= str.size() || substr.size() > str.size() - from) return std::string_view::npos;

                auto it = std::search(str.begin() + static_cast<std::ptrdiff_t>(from), str.end(),
                    substr.begin(), substr.end(),
                    [](char a, char b) { return AsciiLower(a) == AsciiLower(b); });
                if (it == str.end()) return std::string_view::npos;
                return static_cast<size_t>(it - str.begin());
            }

            bool IContains(std::string_view str, std::string_view substr) noexcept {
                return IFind(str, substr) != std::string_view::npos;
            }

            std::vector<std::string> Split(std::string_view str, std::string_view delimiter) {
                std::vector<std::string> result;
                if (delimiter.empty()) {
                    result.emplace_back(str);
                    return result;
                }

                size_t start = 0;
                size_t pos = 0;
                while ((pos = str.find(delimiter, start)) != std::string_view::npos) {
                    result.emplace_back(str.substr(start, pos - start));
                    start = pos + delimiter.size();
                }
                result.emplace_back(str.substr(start));
                return result;
            }

            std::string Join(const std::vector<std::string>& elements, std::string_view delimiter) {
                std::string out;
                for (size_t i = 0; i < elements.size(); ++i) {
                    if (i) out.append(delimiter);
                    out.append(elements[i]);
                }
                return out;
            }

            bool IsValidUtf8(std::string_view str) noexcept {
                size_t i = 0;
                const size_t n = str.size();
                while (i < n) {
                    const unsigned char c = static_cast<unsigned char>(str[i]);
                    if (c < 0x80) { ++i; continue; }

                    size_t len = 0;
                    uint32_t cp = 0;
                    if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; }
                    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
                    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
                    else return false;

                    if (i + len > n) return false;
                    for (size_t k = 1; k < len; ++k) {
                        const unsigned char cc = static_cast<unsigned char>(str[i + k]);
                        if ((cc & 0xC0) != 0x80) return false;
                        cp = (cp << 6) | (cc & 0x3F);
                    }

                    // overlong forms, surrogates, out of range
                    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
                    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
                    i += len;
                }
                return true;
            }

            std::string_view TruncateUtf8(std::string_view str, size_t maxBytes) noexcept {
                if (str.size() <= maxBytes) return str;
                size_t cut = maxBytes;
                // back off continuation bytes so the cut lands on a sequence start
                while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) --cut;
                return str.substr(0, cut);
            }

            std::optional<std::string> PercentDecode(std::string_view str) {
                std::string out;
                out.reserve(str.size());

                for (size_t i = 0; i < str.size(); ++i) {
                    if (str[i] != '%') {
                        out.push_back(str[i]);
                        continue;
                    }
                    if (i + 2 >= str.size()) return std::nullopt;
                    const int hi = HexValue(str[i + 1]);
                    const int lo = HexValue(str[i + 2]);
                    if (hi < 0 || lo < 0) return std::nullopt;
                    out.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                }

                if (!IsValidUtf8(out)) return std::nullopt;
                return out;
            }

            std::optional<bool> ParseBool(std::string_view str) noexcept {
                const std::string_view t = TrimView(str);
                if (IEquals(t, "true") || t == "1" || IEquals(t, "yes") || IEquals(t, "on")) return true;
                if (IEquals(t, "false") || t == "0" || IEquals(t, "no") || IEquals(t, "off")) return false;
                return std::nullopt;
            }

            std::optional<long long> ParseInt(std::string_view str) noexcept {
                const std::string_view t = TrimView(str);
                if (t.empty()) return std::nullopt;
                long long value = 0;
                const auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
                if (ec != std::errc{} || ptr != t.data() + t.size()) return std::nullopt;
                return value;
            }

        } // namespace StringUtils
    } // namespace Utils
} // namespace PromptShield
