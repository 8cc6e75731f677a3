/*
 * ============================================================================
 * PromptShield Hash Utilities
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Streaming cryptographic digests (OpenSSL EVP) and hex helpers.
 *
 * ============================================================================
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations keep OpenSSL headers out of the public interface.
struct evp_md_ctx_st;

namespace PromptShield {
    namespace Utils {
        namespace HashUtils {

            // ============================================================================
            // Types and Enumerations
            // ============================================================================

            enum class Algorithm : uint8_t {
                SHA256,     ///< SHA-256 (256-bit)
                SHA384,     ///< SHA-384 (384-bit)
                SHA512      ///< SHA-512 (512-bit)
            };

            /**
             * @brief Error detail for failed hash operations.
             *
             * @c opensslError holds the first code from ERR_get_error(), 0 when
             * the failure was a usage error (e.g. Update() before Init()).
             */
            struct Error {
                unsigned long opensslError = 0;
                std::string message;

                [[nodiscard]] bool hasError() const noexcept { return !message.empty() || opensslError != 0; }

                void clear() noexcept {
                    opensslError = 0;
                    message.clear();
                }
            };

            // ============================================================================
            // Hex Encoding
            // ============================================================================

            [[nodiscard]] std::string ToHexLower(const uint8_t* data, size_t len);

            [[nodiscard]] inline std::string ToHexLower(const std::vector<uint8_t>& v) {
                return ToHexLower(v.data(), v.size());
            }

            [[nodiscard]] size_t DigestSize(Algorithm alg) noexcept;

            // ============================================================================
            // Streaming Hasher Class
            // ============================================================================

            /**
             * @brief Incremental hasher over OpenSSL's EVP digest API.
             *
             * @code
             *   Hasher h(Algorithm::SHA256);
             *   std::string hex;
             *   if (h.Init() && h.Update(buf, len) && h.FinalHex(hex)) { ... }
             * @endcode
             */
            class Hasher {
            public:
                explicit Hasher(Algorithm alg = Algorithm::SHA256) noexcept;
                ~Hasher();

                Hasher(const Hasher&) = delete;
                Hasher& operator=(const Hasher&) = delete;

                Hasher(Hasher&& other) noexcept;
                Hasher& operator=(Hasher&& other) noexcept;

                [[nodiscard]] bool Init(Error* err = nullptr) noexcept;
                [[nodiscard]] bool Update(const void* data, size_t len, Error* err = nullptr) noexcept;
                [[nodiscard]] bool Final(std::vector<uint8_t>& out, Error* err = nullptr) noexcept;
                [[nodiscard]] bool FinalHex(std::string& outHex, Error* err = nullptr) noexcept;

                [[nodiscard]] size_t GetDigestSize() const noexcept { return DigestSize(m_alg); }
                [[nodiscard]] Algorithm GetAlgorithm() const noexcept { return m_alg; }
                [[nodiscard]] bool IsInitialized() const noexcept { return m_inited; }

            private:
                void resetState() noexcept;

                evp_md_ctx_st* m_ctx = nullptr;
                Algorithm m_alg;
                bool m_inited = false;
            };

            // ============================================================================
            // One-shot helpers
            // ============================================================================

            /// Lower-case hex SHA-256 of @p data, or nullopt if the digest failed.
            [[nodiscard]] std::optional<std::string> Sha256Hex(std::string_view data, Error* err = nullptr);

        } // namespace HashUtils
    } // namespace Utils
} // namespace PromptShield
