/*
 * ============================================================================
 * PromptShield Sanitization Configuration Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "SanitizationConfig.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <cstdlib>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace PromptShield {
    namespace Sanitization {

        namespace StringUtils = Utils::StringUtils;

        namespace {

            constexpr int64_t kMaxCount = static_cast<int64_t>(
                std::min<uint64_t>(std::numeric_limits<size_t>::max(), std::numeric_limits<int64_t>::max()));

            /// Integer key in [minValue, maxValue]; @p out is left empty when the key is absent.
            SanitizerError ReadInteger(const nlohmann::json& j, const char* key,
                                       int64_t minValue, int64_t maxValue,
                                       std::optional<int64_t>& out) {
                out.reset();
                if (!j.contains(key)) return SanitizerError::Success();

                const auto& value = j.at(key);
                bool inRange = false;
                if (value.is_number_unsigned()) {
                    inRange = value.get<uint64_t>() <= static_cast<uint64_t>(maxValue);
                }
                else if (value.is_number_integer()) {
                    const int64_t v = value.get<int64_t>();
                    inRange = v >= minValue && v <= maxValue;
                }
                else if (!value.is_number()) {
                    // Non-numeric: let the type_error surface as a parse error.
                    (void)value.get<int64_t>();
                }

                if (!inRange) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::InvalidConfiguration,
                        std::string(key) + " must be an integer in [" + std::to_string(minValue) +
                        ", " + std::to_string(maxValue) + "]");
                }

                const int64_t parsed = value.get<int64_t>();
                out = parsed;
                return SanitizerError::Success();
            }

        } // namespace

        std::optional<std::string> SystemEnvironment(const char* name) {
            if (!name) return std::nullopt;
            const char* value = std::getenv(name);
            if (!value) return std::nullopt;
            return std::string(value);
        }

        SanitizerError SanitizationConfig::Validate() const {
            if (warnThreshold < 0.0) {
                return SanitizerError::WithMessage(SanitizerErrorCode::InvalidThresholds,
                    "warnThreshold must be >= 0");
            }
            if (sanitizeThreshold < warnThreshold) {
                return SanitizerError::WithMessage(SanitizerErrorCode::InvalidThresholds,
                    "sanitizeThreshold must be >= warnThreshold");
            }
            if (blockThreshold < sanitizeThreshold) {
                return SanitizerError::WithMessage(SanitizerErrorCode::InvalidThresholds,
                    "blockThreshold must be >= sanitizeThreshold");
            }
            if (maxInputLength == 0) {
                return SanitizerError::WithMessage(SanitizerErrorCode::InvalidConfiguration,
                    "maxInputLength must be positive");
            }
            if (maxRepeatedChars == 0) {
                return SanitizerError::WithMessage(SanitizerErrorCode::InvalidConfiguration,
                    "maxRepeatedChars must be positive");
            }
            if (cacheEnabled && (cacheMaxEntries == 0 || cacheTtl.count() <= 0)) {
                return SanitizerError::WithMessage(SanitizerErrorCode::InvalidConfiguration,
                    "cache requires positive cacheMaxEntries and cacheTtl");
            }
            return SanitizerError::Success();
        }

        SanitizerError SanitizationConfig::LoadFromJSONString(std::string_view jsonData) noexcept {
            try {
                const auto j = nlohmann::json::parse(jsonData);
                if (!j.is_object()) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::ParseError,
                        "configuration root must be a JSON object");
                }

                SanitizationConfig next = *this;

                if (j.contains("enabled"))           next.enabled = j.at("enabled").get<bool>();
                if (j.contains("blockThreshold"))    next.blockThreshold = j.at("blockThreshold").get<double>();
                if (j.contains("sanitizeThreshold")) next.sanitizeThreshold = j.at("sanitizeThreshold").get<double>();
                if (j.contains("warnThreshold"))     next.warnThreshold = j.at("warnThreshold").get<double>();
                if (j.contains("cacheEnabled"))      next.cacheEnabled = j.at("cacheEnabled").get<bool>();
                if (j.contains("logAllAttempts"))    next.logAllAttempts = j.at("logAllAttempts").get<bool>();

                // Zero passes here and is rejected by Validate().
                std::optional<int64_t> value;
                if (auto err = ReadInteger(j, "maxInputLength", 0, kMaxCount, value); !err) return err;
                if (value) next.maxInputLength = static_cast<size_t>(*value);
                if (auto err = ReadInteger(j, "maxRepeatedChars", 0, kMaxCount, value); !err) return err;
                if (value) next.maxRepeatedChars = static_cast<size_t>(*value);
                if (auto err = ReadInteger(j, "cacheMaxEntries", 0, kMaxCount, value); !err) return err;
                if (value) next.cacheMaxEntries = static_cast<size_t>(*value);
                if (auto err = ReadInteger(j, "cacheTtlHours", 0, kMaxCacheTtlHours, value); !err) return err;
                if (value) next.cacheTtl = std::chrono::hours(*value);

                *this = std::move(next);
                return SanitizerError::Success();
            }
            catch (const nlohmann::json::exception& e) {
                return SanitizerError::WithMessage(SanitizerErrorCode::ParseError,
                    std::string("configuration JSON error: ") + e.what());
            }
            catch (const std::exception& e) {
                return SanitizerError::WithMessage(SanitizerErrorCode::Unknown, e.what());
            }
        }

        SanitizerError SanitizationConfig::LoadFromJSONFile(const std::string& filePath) noexcept {
            try {
                std::ifstream file(filePath, std::ios::in | std::ios::binary);
                if (!file.is_open()) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::FileNotFound,
                        "cannot open configuration file: " + filePath);
                }

                std::ostringstream buffer;
                buffer << file.rdbuf();
                if (file.bad()) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::FileReadError,
                        "failed reading configuration file: " + filePath);
                }

                const std::string data = buffer.str();
                return LoadFromJSONString(data);
            }
            catch (const std::exception& e) {
                return SanitizerError::WithMessage(SanitizerErrorCode::FileReadError, e.what());
            }
        }

        SanitizerError SanitizationConfig::ApplyEnvironment(const EnvironmentLookup& lookup) {
            if (!lookup) {
                return SanitizerError::Success();
            }

            auto invalid = [](const char* name, const std::string& value) {
                return SanitizerError::WithMessage(SanitizerErrorCode::InvalidConfiguration,
                    std::string("invalid value for ") + name + ": '" + value + "'");
            };

            auto applyBool = [&](const char* name, bool& target) -> SanitizerError {
                const auto raw = lookup(name);
                if (!raw) return SanitizerError::Success();
                const auto parsed = StringUtils::ParseBool(*raw);
                if (!parsed) return invalid(name, *raw);
                target = *parsed;
                return SanitizerError::Success();
            };

            auto applyNumber = [&](const char* name, auto& target, long long minValue) -> SanitizerError {
                const auto raw = lookup(name);
                if (!raw) return SanitizerError::Success();
                const auto parsed = StringUtils::ParseInt(*raw);
                if (!parsed || *parsed < minValue) return invalid(name, *raw);
                target = static_cast<std::remove_reference_t<decltype(target)>>(*parsed);
                return SanitizerError::Success();
            };

            // The enable switch is opt-in: only an explicit "true" turns the filter on.
            if (const auto raw = lookup("ENABLE_AI_SANITIZATION")) {
                enabled = StringUtils::IEquals(StringUtils::TrimView(*raw), "true");
            }

            if (auto err = applyNumber("AI_BLOCK_THRESHOLD", blockThreshold, 0); !err) return err;
            if (auto err = applyNumber("AI_SANITIZE_THRESHOLD", sanitizeThreshold, 0); !err) return err;
            if (auto err = applyNumber("AI_WARN_THRESHOLD", warnThreshold, 0); !err) return err;
            if (auto err = applyNumber("AI_MAX_INPUT_LENGTH", maxInputLength, 1); !err) return err;
            if (auto err = applyNumber("AI_MAX_REPEATED_CHARS", maxRepeatedChars, 1); !err) return err;
            if (auto err = applyBool("AI_CACHE_ENABLED", cacheEnabled); !err) return err;

            if (const auto raw = lookup("AI_CACHE_TTL_HOURS")) {
                const auto hours = StringUtils::ParseInt(*raw);
                if (!hours || *hours <= 0 || *hours > kMaxCacheTtlHours) return invalid("AI_CACHE_TTL_HOURS", *raw);
                cacheTtl = std::chrono::hours(*hours);
            }

            if (auto err = applyBool("AI_LOG_ALL_ATTEMPTS", logAllAttempts); !err) return err;

            PS_LOG_DEBUG("SanitizationConfig", "environment applied: enabled=%d block=%.1f sanitize=%.1f warn=%.1f",
                enabled ? 1 : 0, blockThreshold, sanitizeThreshold, warnThreshold);
            return SanitizerError::Success();
        }

        nlohmann::json SanitizationConfig::ToJSON() const {
            nlohmann::json j;
            j["enabled"] = enabled;
            j["blockThreshold"] = blockThreshold;
            j["sanitizeThreshold"] = sanitizeThreshold;
            j["warnThreshold"] = warnThreshold;
            j["maxInputLength"] = maxInputLength;
            j["maxRepeatedChars"] = maxRepeatedChars;
            j["cacheEnabled"] = cacheEnabled;
            j["cacheTtlHours"] = std::chrono::duration_cast<std::chrono::hours>(cacheTtl).count();
            j["cacheMaxEntries"] = cacheMaxEntries;
            j["logAllAttempts"] = logAllAttempts;
            return j;
        }

    } // namespace Sanitization
} // namespace PromptShield
