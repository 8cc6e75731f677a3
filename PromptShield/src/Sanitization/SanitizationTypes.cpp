/*
 * ============================================================================
 * PromptShield Sanitization Types Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "SanitizationTypes.hpp"

#include "../Utils/StringUtils.hpp"

#include <array>
#include <utility>

namespace PromptShield {
    namespace Sanitization {

        namespace {

            constexpr std::array<std::pair<ThreatSeverity, const char*>, 4> kSeverityNames{ {
                { ThreatSeverity::Critical, "CRITICAL" },
                { ThreatSeverity::High,     "HIGH" },
                { ThreatSeverity::Medium,   "MEDIUM" },
                { ThreatSeverity::Low,      "LOW" },
            } };

            constexpr std::array<std::pair<ThreatCategory, const char*>, 6> kCategoryNames{ {
                { ThreatCategory::InstructionOverride, "instruction_override" },
                { ThreatCategory::Jailbreak,           "jailbreak" },
                { ThreatCategory::DataExfiltration,    "data_exfiltration" },
                { ThreatCategory::OutputManipulation,  "output_manipulation" },
                { ThreatCategory::PredictionBias,      "prediction_bias" },
                { ThreatCategory::ResourceExhaustion,  "resource_exhaustion" },
            } };

        } // namespace

        const char* ToString(SanitizerErrorCode code) noexcept {
            switch (code) {
            case SanitizerErrorCode::Success:              return "Success";
            case SanitizerErrorCode::InvalidConfiguration: return "InvalidConfiguration";
            case SanitizerErrorCode::InvalidThresholds:    return "InvalidThresholds";
            case SanitizerErrorCode::InvalidPattern:       return "InvalidPattern";
            case SanitizerErrorCode::DuplicatePattern:     return "DuplicatePattern";
            case SanitizerErrorCode::ScoreOutOfBand:       return "ScoreOutOfBand";
            case SanitizerErrorCode::InvalidPatternPack:   return "InvalidPatternPack";
            case SanitizerErrorCode::FileNotFound:         return "FileNotFound";
            case SanitizerErrorCode::FileReadError:        return "FileReadError";
            case SanitizerErrorCode::ParseError:           return "ParseError";
            case SanitizerErrorCode::Unknown:              return "Unknown";
            }
            return "Unknown";
        }

        std::ostream& operator<<(std::ostream& os, const SanitizerError& error) {
            os << ToString(error.code);
            if (!error.message.empty()) {
                os << ": " << error.message;
            }
            return os;
        }

        const char* ToString(ThreatSeverity severity) noexcept {
            for (const auto& [value, name] : kSeverityNames) {
                if (value == severity) return name;
            }
            return "UNKNOWN";
        }

        const char* ToString(ThreatCategory category) noexcept {
            for (const auto& [value, name] : kCategoryNames) {
                if (value == category) return name;
            }
            return "unknown";
        }

        const char* ToString(SanitizationAction action) noexcept {
            switch (action) {
            case SanitizationAction::Allow:    return "ALLOW";
            case SanitizationAction::Sanitize: return "SANITIZE";
            case SanitizationAction::Block:    return "BLOCK";
            }
            return "UNKNOWN";
        }

        const char* ToString(EncodingVariant variant) noexcept {
            switch (variant) {
            case EncodingVariant::Plain:         return "plain";
            case EncodingVariant::Base64Decoded: return "base64";
            case EncodingVariant::UrlDecoded:    return "url";
            }
            return "unknown";
        }

        std::optional<ThreatSeverity> ParseSeverity(std::string_view text) noexcept {
            for (const auto& [value, name] : kSeverityNames) {
                if (Utils::StringUtils::IEquals(text, name)) return value;
            }
            return std::nullopt;
        }

        std::optional<ThreatCategory> ParseCategory(std::string_view text) noexcept {
            for (const auto& [value, name] : kCategoryNames) {
                if (Utils::StringUtils::IEquals(text, name)) return value;
            }
            return std::nullopt;
        }

    } // namespace Sanitization
} // namespace PromptShield
