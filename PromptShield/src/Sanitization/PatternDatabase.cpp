/*
 * ============================================================================
 * PromptShield Pattern Database Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Built-in catalogue, pattern pack loading and validation.
 *
 * ============================================================================
 */

#include "PatternDatabase.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <unordered_set>

namespace PromptShield {
    namespace Sanitization {

        namespace StringUtils = Utils::StringUtils;

        namespace {

            /// Row of the built-in catalogue.
            struct BuiltinRegex {
                const char* name;
                const char* expression;
                double score;
                ThreatSeverity severity;
                ThreatCategory category;
                const char* description;
                std::vector<std::string> keywords;
            };

            using S = ThreatSeverity;
            using C = ThreatCategory;

            std::vector<BuiltinRegex> BuiltinRegexRows() {
                return {
                    // Critical: direct instruction override
                    { "ignore_previous_instructions", R"(ignore\s+(all\s+)?(previous|prior|earlier)\s+instructions?)",
                      100, S::Critical, C::InstructionOverride, "Attempts to discard the task instructions", { "ignore" } },
                    { "disregard_instructions", R"(disregard\s+(everything|all|previous|prior))",
                      100, S::Critical, C::InstructionOverride, "Attempts to discard the task instructions", { "disregard" } },
                    { "forget_role", R"(forget\s+(your|the)\s+(role|task|instructions?|prompt))",
                      100, S::Critical, C::InstructionOverride, "Attempts to reset the assigned role", { "forget" } },
                    { "new_task", R"((new\s+task|new\s+instructions?)\s*:)",
                      100, S::Critical, C::InstructionOverride, "Injects a replacement task", { "new" } },
                    { "system_prompt", R"((^|\n)\s*(SYSTEM|ADMIN|ROOT|DEVELOPER)\s*:)",
                      100, S::Critical, C::InstructionOverride, "Line-leading privileged role marker",
                      { "system", "admin", "root", "developer" } },
                    { "you_are_now", R"(you\s+are\s+now\s+(a|an|in|the))",
                      100, S::Critical, C::InstructionOverride, "Reassigns the model identity", { "you" } },

                    // Critical: prompt exfiltration
                    { "print_prompt",
                      R"((print|show|display|reveal|output)\s+(your|the|me\s+your|me\s+the)\s+(prompt|instructions?|system\s+message))",
                      100, S::Critical, C::DataExfiltration, "Requests the hidden prompt",
                      { "prompt", "instruction", "system" } },
                    { "repeat_instructions", R"((repeat|show\s+all)\s+(all\s+)?(your|the)\s+(instructions?|prompt|rules))",
                      100, S::Critical, C::DataExfiltration, "Requests the hidden instructions", { "repeat", "show" } },

                    // High: jailbreak
                    { "dan_mode", R"((DAN|STAN)\s+mode)",
                      75, S::High, C::Jailbreak, "Known jailbreak persona", { "mode" } },
                    { "developer_mode", R"(developer\s+mode\s+(activated|enabled|on))",
                      75, S::High, C::Jailbreak, "Fake developer mode switch", { "developer" } },
                    { "unrestricted_mode", R"(unrestricted\s+mode)",
                      75, S::High, C::Jailbreak, "Requests an unrestricted mode", { "unrestricted" } },
                    { "end_marker", R"((---\s*END\s*---|###\s*OVERRIDE\s*###|===\s*STOP\s*===))",
                      60, S::High, C::Jailbreak, "Fake context boundary marker", { "end", "override", "stop" } },
                    { "ignore_safety", R"((ignore|bypass|disable)\s+(safety|ethics|guardrails?))",
                      70, S::High, C::Jailbreak, "Requests disabling safety rules", { "safety", "ethics", "guardrail" } },
                    { "educational_bypass", R"(for\s+(educational|research)\s+purposes?,?\s+(ignore|bypass|disable))",
                      65, S::High, C::Jailbreak, "Pretext framing for a bypass", { "educational", "research" } },
                    { "pretend_mode", R"((pretend|act\s+as|simulate)\s+(you\s+are|being))",
                      50, S::High, C::Jailbreak, "Role-play framing", { "pretend", "act", "simulate" } },
                    { "reveal_data", R"((reveal|expose|leak)\s+(training\s+data|api\s+keys?|credentials?|environment))",
                      75, S::High, C::DataExfiltration, "Requests secrets or training data", { "reveal", "expose", "leak" } },

                    // Medium: output manipulation
                    { "format_override", R"(instead\s+of\s+JSON,?\s+(output|return|provide))",
                      35, S::Medium, C::OutputManipulation, "Overrides the response format", { "json" } },
                    { "no_json", R"((don't|do\s+not)\s+(return|output|use)\s+JSON)",
                      35, S::Medium, C::OutputManipulation, "Suppresses the response format", { "json" } },
                    { "include_in_response", R"((include|add|insert)\s+(in\s+)?(your|the)\s+response)",
                      30, S::Medium, C::OutputManipulation, "Injects response content", { "response" } },
                    { "make_sure_to", R"(make\s+sure\s+to\s+(print|output|include|add))",
                      30, S::Medium, C::OutputManipulation, "Injects response content", { "make" } },
                    { "reasoning_field_manipulation", R"((in\s+the\s+reasoning\s+field|for\s+reasoning),?\s+(include|add|put))",
                      40, S::Medium, C::OutputManipulation, "Targets the reasoning field", { "reasoning" } },

                    // Medium: prediction bias
                    { "all_bullish",
                      R"((all|every|each)\s+(predictions?|forecasts?|assets?)\s+(must\s+be|should\s+be|are)\s+bullish)",
                      40, S::Medium, C::PredictionBias, "Forces a bullish outcome", { "bullish" } },
                    { "all_bearish",
                      R"((all|every|each)\s+(predictions?|forecasts?|assets?)\s+(must\s+be|should\s+be|are)\s+bearish)",
                      40, S::Medium, C::PredictionBias, "Forces a bearish outcome", { "bearish" } },
                    { "confidence_override", R"((always|every|all)\s+(use|set|mark|predictions?\s+set)\s+(\d+%|100%|maximum)\s+confidence)",
                      35, S::Medium, C::PredictionBias, "Forces confidence values", { "confidence" } },
                };
            }

            /// Scanner-backed matchers addressable from pattern packs.
            std::optional<PatternMatcher> ScannerByName(std::string_view name) {
                if (name == "uppercase_runs") {
                    return PatternMatcher::FromScanner("uppercase_runs(100)",
                        [](std::string_view text, std::vector<PatternMatch>& out) { Scanners::UppercaseRuns(text, out); });
                }
                if (name == "base64_runs") {
                    return PatternMatcher::FromScanner("base64_runs(50)",
                        [](std::string_view text, std::vector<PatternMatch>& out) { Scanners::Base64Runs(text, out); });
                }
                if (name == "hex_escapes") {
                    return PatternMatcher::FromScanner("hex_escapes(10)",
                        [](std::string_view text, std::vector<PatternMatch>& out) { Scanners::HexEscapeRuns(text, out); });
                }
                if (name == "unicode_escapes") {
                    return PatternMatcher::FromScanner("unicode_escapes(10)",
                        [](std::string_view text, std::vector<PatternMatch>& out) { Scanners::UnicodeEscapeRuns(text, out); });
                }
                if (name == "repeated_words") {
                    return PatternMatcher::FromScanner("repeated_words",
                        [](std::string_view text, std::vector<PatternMatch>& out) { Scanners::RepeatedWordRuns(text, out); });
                }
                return std::nullopt;
            }

            std::vector<std::string> BuiltinWhitelist() {
                return {
                    "the economic system",
                    "the financial system",
                    "the banking system",
                    "the monetary system",
                    "show the chart",
                    "show the data",
                    "show you how",
                    "let me show",
                    "imagine if",
                    "think about",
                    "root cause",
                    "system works",
                    "system failure",
                    "admin panel",
                    "admin access",
                    "developer tools",
                    "developer experience",
                };
            }

            std::shared_ptr<const PatternDatabase> BuildBuiltin() {
                std::vector<ThreatPattern> patterns;

                for (auto& row : BuiltinRegexRows()) {
                    std::string error;
                    auto matcher = PatternMatcher::FromRegex(row.expression, false, std::move(row.keywords), &error);
                    if (!matcher) {
                        PS_LOG_FATAL("PatternDatabase", "built-in pattern '%s' does not compile: %s",
                            row.name, error.c_str());
                        continue;
                    }
                    patterns.push_back(ThreatPattern{ row.name, std::move(*matcher), row.score,
                                                      row.severity, row.category, row.description });
                }

                struct ScannerRow {
                    const char* name;
                    const char* scanner;
                    double score;
                    ThreatSeverity severity;
                    ThreatCategory category;
                    const char* description;
                };

                static const ScannerRow kScannerRows[] = {
                    { "excessive_caps", "uppercase_runs", 15, S::Low, C::ResourceExhaustion, "Long uppercase run" },
                    { "base64_content", "base64_runs", 20, S::Low, C::Jailbreak, "Embedded Base64 payload" },
                    { "hex_encoding", "hex_escapes", 20, S::Low, C::Jailbreak, "Hex escape sequence run" },
                    { "unicode_escapes", "unicode_escapes", 20, S::Low, C::Jailbreak, "Unicode escape sequence run" },
                    { "repeated_words", "repeated_words", 10, S::Low, C::ResourceExhaustion, "Same word three times in a row" },
                };

                for (const auto& row : kScannerRows) {
                    auto matcher = ScannerByName(row.scanner);
                    if (!matcher) continue;
                    patterns.push_back(ThreatPattern{ row.name, std::move(*matcher), row.score,
                                                      row.severity, row.category, row.description });
                }

                std::shared_ptr<const PatternDatabase> db;
                const auto err = PatternDatabase::Create(PatternDatabase::kBuiltinVersion,
                                                         std::move(patterns), BuiltinWhitelist(), db);
                if (!err) {
                    // Detection degrades to penalties only; callers always get a generation.
                    PS_LOG_FATAL("PatternDatabase", "built-in catalogue rejected: %s", err.message.c_str());
                    (void)PatternDatabase::Create(PatternDatabase::kBuiltinVersion, {}, {}, db);
                    return db;
                }

                PS_LOG_INFO("PatternDatabase", "built-in catalogue %s ready: %zu patterns, %zu whitelist phrases",
                    db->Version().c_str(), db->Size(), db->Whitelist().size());
                return db;
            }

        } // namespace

        // ============================================================================
        // Construction
        // ============================================================================

        std::shared_ptr<const PatternDatabase> PatternDatabase::Builtin() {
            static const std::shared_ptr<const PatternDatabase> instance = BuildBuiltin();
            return instance;
        }

        SanitizerError PatternDatabase::Create(
            std::string version,
            std::vector<ThreatPattern> patterns,
            std::vector<std::string> whitelist,
            std::shared_ptr<const PatternDatabase>& out) {

            if (StringUtils::TrimView(version).empty()) {
                return SanitizerError::WithMessage(SanitizerErrorCode::InvalidPatternPack,
                    "pattern generation version must not be empty");
            }

            std::unordered_set<std::string> names;
            names.reserve(patterns.size());

            for (const auto& pattern : patterns) {
                if (pattern.name.empty()) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::InvalidPattern,
                        "pattern name must not be empty");
                }
                if (!names.insert(pattern.name).second) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::DuplicatePattern,
                        "duplicate pattern name: " + pattern.name);
                }
                const SeverityBand band = BandFor(pattern.severity);
                if (!band.Contains(pattern.baseScore)) {
                    std::ostringstream msg;
                    msg << "pattern '" << pattern.name << "' score " << pattern.baseScore
                        << " outside " << ToString(pattern.severity)
                        << " band [" << band.minScore << ", " << band.maxScore << "]";
                    return SanitizerError::WithMessage(SanitizerErrorCode::ScoreOutOfBand, msg.str());
                }
            }

            // Blank phrases would match every text.
            std::vector<std::string> phrases;
            phrases.reserve(whitelist.size());
            for (auto& phrase : whitelist) {
                if (!StringUtils::TrimView(phrase).empty()) {
                    phrases.push_back(std::move(phrase));
                }
            }

            std::shared_ptr<PatternDatabase> db(new PatternDatabase());
            db->m_version = std::move(version);
            db->m_patterns = std::move(patterns);
            db->m_whitelist = std::move(phrases);
            out = std::move(db);
            return SanitizerError::Success();
        }

        SanitizerError PatternDatabase::LoadFromJSONString(
            std::string_view jsonData,
            std::shared_ptr<const PatternDatabase>& out) noexcept {

            try {
                const auto j = nlohmann::json::parse(jsonData);
                if (!j.is_object() || !j.contains("patterns") || !j.at("patterns").is_array()) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::InvalidPatternPack,
                        "pattern pack must be an object with a 'patterns' array");
                }

                const std::string version = j.value("version", std::string{});

                std::vector<ThreatPattern> patterns;
                patterns.reserve(j.at("patterns").size());

                for (const auto& item : j.at("patterns")) {
                    const std::string name = item.at("name").get<std::string>();

                    const auto severity = ParseSeverity(item.at("severity").get<std::string>());
                    if (!severity) {
                        return SanitizerError::WithMessage(SanitizerErrorCode::InvalidPattern,
                            "pattern '" + name + "': unknown severity");
                    }
                    const auto category = ParseCategory(item.at("category").get<std::string>());
                    if (!category) {
                        return SanitizerError::WithMessage(SanitizerErrorCode::InvalidPattern,
                            "pattern '" + name + "': unknown category");
                    }

                    std::optional<PatternMatcher> matcher;
                    if (item.contains("scanner")) {
                        matcher = ScannerByName(item.at("scanner").get<std::string>());
                        if (!matcher) {
                            return SanitizerError::WithMessage(SanitizerErrorCode::InvalidPattern,
                                "pattern '" + name + "': unknown scanner");
                        }
                    }
                    else {
                        std::vector<std::string> keywords;
                        if (item.contains("keywords")) {
                            keywords = item.at("keywords").get<std::vector<std::string>>();
                        }
                        std::string error;
                        matcher = PatternMatcher::FromRegex(item.at("regex").get<std::string>(),
                                                            item.value("caseSensitive", false),
                                                            std::move(keywords), &error);
                        if (!matcher) {
                            return SanitizerError::WithMessage(SanitizerErrorCode::InvalidPattern,
                                "pattern '" + name + "': " + error);
                        }
                    }

                    patterns.push_back(ThreatPattern{ name, std::move(*matcher), item.at("score").get<double>(),
                                                      *severity, *category, item.value("description", std::string{}) });
                }

                std::vector<std::string> whitelist;
                if (j.contains("whitelist")) {
                    whitelist = j.at("whitelist").get<std::vector<std::string>>();
                }

                auto err = Create(version, std::move(patterns), std::move(whitelist), out);
                if (err) {
                    PS_LOG_INFO("PatternDatabase", "loaded pattern pack %s (%zu patterns)",
                        out->Version().c_str(), out->Size());
                }
                return err;
            }
            catch (const nlohmann::json::exception& e) {
                return SanitizerError::WithMessage(SanitizerErrorCode::ParseError,
                    std::string("pattern pack JSON error: ") + e.what());
            }
            catch (const std::exception& e) {
                return SanitizerError::WithMessage(SanitizerErrorCode::Unknown, e.what());
            }
        }

        SanitizerError PatternDatabase::LoadFromJSONFile(
            const std::string& filePath,
            std::shared_ptr<const PatternDatabase>& out) noexcept {

            try {
                std::ifstream file(filePath, std::ios::in | std::ios::binary);
                if (!file.is_open()) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::FileNotFound,
                        "cannot open pattern pack: " + filePath);
                }

                std::ostringstream buffer;
                buffer << file.rdbuf();
                if (file.bad()) {
                    return SanitizerError::WithMessage(SanitizerErrorCode::FileReadError,
                        "failed reading pattern pack: " + filePath);
                }

                return LoadFromJSONString(buffer.str(), out);
            }
            catch (const std::exception& e) {
                return SanitizerError::WithMessage(SanitizerErrorCode::FileReadError, e.what());
            }
        }

        // ============================================================================
        // Queries
        // ============================================================================

        std::vector<const ThreatPattern*> PatternDatabase::BySeverity(ThreatSeverity severity) const {
            std::vector<const ThreatPattern*> result;
            for (const auto& pattern : m_patterns) {
                if (pattern.severity == severity) result.push_back(&pattern);
            }
            return result;
        }

        std::vector<const ThreatPattern*> PatternDatabase::ByCategory(ThreatCategory category) const {
            std::vector<const ThreatPattern*> result;
            for (const auto& pattern : m_patterns) {
                if (pattern.category == category) result.push_back(&pattern);
            }
            return result;
        }

        const ThreatPattern* PatternDatabase::Find(std::string_view name) const noexcept {
            for (const auto& pattern : m_patterns) {
                if (pattern.name == name) return &pattern;
            }
            return nullptr;
        }

        bool PatternDatabase::ContainsWhitelistedPhrase(std::string_view text) const noexcept {
            for (const auto& phrase : m_whitelist) {
                if (StringUtils::IContains(text, phrase)) return true;
            }
            return false;
        }

    } // namespace Sanitization
} // namespace PromptShield
