/*
 * ============================================================================
 * PromptShield Hash Utilities Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * EVP-backed streaming digests.
 *
 * ============================================================================
 */

#include "HashUtils.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <new>
#include <utility>

namespace PromptShield {
    namespace Utils {
        namespace HashUtils {

            namespace {

                const EVP_MD* MdFor(Algorithm alg) noexcept {
                    switch (alg) {
                    case Algorithm::SHA256: return EVP_sha256();
                    case Algorithm::SHA384: return EVP_sha384();
                    case Algorithm::SHA512: return EVP_sha512();
                    default:                return nullptr;
                    }
                }

                bool Fail(Error* err, const char* what) noexcept {
                    if (err) {
                        err->opensslError = ERR_get_error();
                        try {
                            err->message = what;
                        }
                        catch (const std::bad_alloc&) {
                            // opensslError still carries the detail
                        }
                    }
                    return false;
                }

            } // namespace

            std::string ToHexLower(const uint8_t* data, size_t len) {
                static constexpr char kHex[] = "0123456789abcdef";
                std::string out;
                if (!data || len == 0) return out;
                out.resize(len * 2);
                for (size_t i = 0; i < len; ++i) {
                    out[2 * i] = kHex[(data[i] >> 4) & 0x0F];
                    out[2 * i + 1] = kHex[data[i] & 0x0F];
                }
                return out;
            }

            size_t DigestSize(Algorithm alg) noexcept {
                switch (alg) {
                case Algorithm::SHA256: return 32;
                case Algorithm::SHA384: return 48;
                case Algorithm::SHA512: return 64;
                default:                return 0;
                }
            }

            // ============================================================================
            // Hasher
            // ============================================================================

            Hasher::Hasher(Algorithm alg) noexcept
                : m_alg(alg) {
            }

            Hasher::~Hasher() {
                resetState();
            }

            Hasher::Hasher(Hasher&& other) noexcept
                : m_ctx(std::exchange(other.m_ctx, nullptr))
                , m_alg(other.m_alg)
                , m_inited(std::exchange(other.m_inited, false)) {
            }

            Hasher& Hasher::operator=(Hasher&& other) noexcept {
                if (this != &other) {
                    resetState();
                    m_ctx = std::exchange(other.m_ctx, nullptr);
                    m_alg = other.m_alg;
                    m_inited = std::exchange(other.m_inited, false);
                }
                return *this;
            }

            void Hasher::resetState() noexcept {
                if (m_ctx) {
                    EVP_MD_CTX_free(m_ctx);
                    m_ctx = nullptr;
                }
                m_inited = false;
            }

            bool Hasher::Init(Error* err) noexcept {
                if (err) err->clear();
                resetState();

                const EVP_MD* md = MdFor(m_alg);
                if (!md) {
                    return Fail(err, "unsupported digest algorithm");
                }

                m_ctx = EVP_MD_CTX_new();
                if (!m_ctx) {
                    return Fail(err, "EVP_MD_CTX_new failed");
                }

                if (EVP_DigestInit_ex(m_ctx, md, nullptr) != 1) {
                    resetState();
                    return Fail(err, "EVP_DigestInit_ex failed");
                }

                m_inited = true;
                return true;
            }

            bool Hasher::Update(const void* data, size_t len, Error* err) noexcept {
                if (!m_inited) {
                    return Fail(err, "Update() called before Init()");
                }
                if (len == 0) return true;
                if (!data) {
                    return Fail(err, "null data with non-zero length");
                }
                if (EVP_DigestUpdate(m_ctx, data, len) != 1) {
                    return Fail(err, "EVP_DigestUpdate failed");
                }
                return true;
            }

            bool Hasher::Final(std::vector<uint8_t>& out, Error* err) noexcept {
                out.clear();
                if (!m_inited) {
                    return Fail(err, "Final() called before Init()");
                }

                unsigned char digest[EVP_MAX_MD_SIZE];
                unsigned int digestLen = 0;
                const bool ok = EVP_DigestFinal_ex(m_ctx, digest, &digestLen) == 1;
                resetState();
                if (!ok) {
                    return Fail(err, "EVP_DigestFinal_ex failed");
                }

                try {
                    out.assign(digest, digest + digestLen);
                }
                catch (const std::bad_alloc&) {
                    return Fail(err, "out of memory");
                }
                return true;
            }

            bool Hasher::FinalHex(std::string& outHex, Error* err) noexcept {
                outHex.clear();
                std::vector<uint8_t> bin;
                if (!Final(bin, err)) return false;
                try {
                    outHex = ToHexLower(bin);
                }
                catch (const std::bad_alloc&) {
                    return Fail(err, "out of memory");
                }
                return true;
            }

            std::optional<std::string> Sha256Hex(std::string_view data, Error* err) {
                Hasher h(Algorithm::SHA256);
                std::string hex;
                if (!h.Init(err) || !h.Update(data.data(), data.size(), err) || !h.FinalHex(hex, err)) {
                    return std::nullopt;
                }
                return hex;
            }

        } // namespace HashUtils
    } // namespace Utils
} // namespace PromptShield
