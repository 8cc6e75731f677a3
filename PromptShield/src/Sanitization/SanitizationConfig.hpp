/*
 * ============================================================================
 * PromptShield Sanitization Configuration
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Thresholds, limits and cache policy of the sanitizer. Values are layered:
 * built-in defaults, then an optional JSON document, then environment
 * variables.
 *
 * ============================================================================
 */
#pragma once

#include "SanitizationTypes.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace PromptShield {
    namespace Sanitization {

        /// Returns the value of an environment variable, or nullopt if unset.
        using EnvironmentLookup = std::function<std::optional<std::string>(const char* name)>;

        /// std::getenv-backed lookup.
        [[nodiscard]] std::optional<std::string> SystemEnvironment(const char* name);

        struct SanitizationConfig {
            /// Ten years; larger values overflow the seconds representation of cacheTtl.
            static constexpr int64_t kMaxCacheTtlHours = 24 * 365 * 10;

            bool enabled = false;
            double blockThreshold = 75.0;
            double sanitizeThreshold = 50.0;
            double warnThreshold = 25.0;
            size_t maxInputLength = 100000;
            size_t maxRepeatedChars = 50;
            bool cacheEnabled = true;
            std::chrono::seconds cacheTtl = std::chrono::hours(24);
            size_t cacheMaxEntries = 1000;
            bool logAllAttempts = false;

            /**
             * @brief Check block >= sanitize >= warn >= 0 and positive limits.
             */
            [[nodiscard]] SanitizerError Validate() const;

            /**
             * @brief Overlay keys present in a JSON object onto this config.
             *
             * Unknown keys are ignored. On error the config is left unchanged.
             */
            [[nodiscard]] SanitizerError LoadFromJSONString(std::string_view jsonData) noexcept;
            [[nodiscard]] SanitizerError LoadFromJSONFile(const std::string& filePath) noexcept;

            /**
             * @brief Overlay ENABLE_AI_SANITIZATION / AI_* variables.
             *
             * Stops at the first unparsable value and reports it; variables
             * applied before it stay applied.
             */
            [[nodiscard]] SanitizerError ApplyEnvironment(const EnvironmentLookup& lookup = SystemEnvironment);

            [[nodiscard]] nlohmann::json ToJSON() const;
        };

    } // namespace Sanitization
} // namespace PromptShield
