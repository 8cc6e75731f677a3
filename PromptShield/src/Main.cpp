/*
 * ============================================================================
 * PromptShield Scanner
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Command line front end: reads untrusted text from a file or stdin, runs
 * AiSanitizer::Analyze() and prints the decision as JSON on stdout.
 *
 * Exit codes:
 *   0  ALLOW
 *   1  SANITIZE
 *   2  BLOCK
 *   3  usage, configuration or input error
 *
 * Configuration layering: scanner defaults (filter enabled), then --config
 * JSON, then ENABLE_AI_SANITIZATION / AI_* environment variables.
 *
 * ============================================================================
 */

#include "Sanitization/AiSanitizer.hpp"
#include "Sanitization/PatternDatabase.hpp"
#include "Sanitization/ResultSerializer.hpp"
#include "Sanitization/SanitizationConfig.hpp"
#include "Utils/Logger.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

    using namespace PromptShield;

    constexpr int kExitAllow = 0;
    constexpr int kExitSanitize = 1;
    constexpr int kExitBlock = 2;
    constexpr int kExitUsage = 3;

    struct Options {
        std::optional<std::string> configPath;
        std::optional<std::string> patternsPath;
        std::optional<std::string> inputPath;
        std::optional<std::string> title;
        std::optional<std::string> description;
        std::string requester = "promptshield_scan";
        bool pretty = false;
        bool includeContent = true;
        bool fieldScores = false;
        bool verbose = false;
    };

    void PrintUsage(std::ostream& os) {
        os << "Usage: promptshield_scan [options] [--file PATH]\n"
              "\n"
              "Reads text from PATH (or stdin) and prints the sanitization decision as JSON.\n"
              "\n"
              "Options:\n"
              "  --file PATH         read the content body from PATH instead of stdin\n"
              "  --config PATH       JSON configuration overlay\n"
              "  --patterns PATH     JSON pattern pack replacing the built-in catalogue\n"
              "  --title TEXT        title field (used with --field-scores)\n"
              "  --description TEXT  description field (used with --field-scores)\n"
              "  --field-scores      also print per-field and weighted scores\n"
              "  --requester NAME    requester identity attached to security events\n"
              "  --no-content        omit original and sanitized content from the output\n"
              "  --pretty            indent JSON output\n"
              "  --verbose           log at DEBUG level to stderr\n"
              "  --help              show this message\n"
              "\n"
              "Exit codes: 0 ALLOW, 1 SANITIZE, 2 BLOCK, 3 usage or input error\n";
    }

    /// Returns false (after printing a message) on malformed arguments.
    bool ParseArguments(int argc, char** argv, Options& opts, bool& helpRequested) {
        helpRequested = false;

        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];

            auto takeValue = [&](std::optional<std::string>& target) {
                if (i + 1 >= argc) {
                    std::cerr << "promptshield_scan: " << arg << " requires a value\n";
                    return false;
                }
                target = argv[++i];
                return true;
            };

            if (arg == "--help" || arg == "-h") {
                helpRequested = true;
                return true;
            }
            else if (arg == "--file") {
                if (!takeValue(opts.inputPath)) return false;
            }
            else if (arg == "--config") {
                if (!takeValue(opts.configPath)) return false;
            }
            else if (arg == "--patterns") {
                if (!takeValue(opts.patternsPath)) return false;
            }
            else if (arg == "--title") {
                if (!takeValue(opts.title)) return false;
            }
            else if (arg == "--description") {
                if (!takeValue(opts.description)) return false;
            }
            else if (arg == "--requester") {
                std::optional<std::string> value;
                if (!takeValue(value)) return false;
                opts.requester = *value;
            }
            else if (arg == "--field-scores") {
                opts.fieldScores = true;
            }
            else if (arg == "--no-content") {
                opts.includeContent = false;
            }
            else if (arg == "--pretty") {
                opts.pretty = true;
            }
            else if (arg == "--verbose") {
                opts.verbose = true;
            }
            else {
                std::cerr << "promptshield_scan: unknown argument '" << arg << "'\n";
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> ReadInput(const std::optional<std::string>& path) {
        if (!path) {
            std::ostringstream buffer;
            buffer << std::cin.rdbuf();
            if (std::cin.bad()) return std::nullopt;
            return buffer.str();
        }

        std::ifstream file(*path, std::ios::in | std::ios::binary);
        if (!file.is_open()) return std::nullopt;

        std::ostringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) return std::nullopt;
        return buffer.str();
    }

    int ExitCodeFor(Sanitization::SanitizationAction action) {
        switch (action) {
        case Sanitization::SanitizationAction::Allow:    return kExitAllow;
        case Sanitization::SanitizationAction::Sanitize: return kExitSanitize;
        case Sanitization::SanitizationAction::Block:    return kExitBlock;
        }
        return kExitUsage;
    }

    int Run(const Options& opts) {
        Sanitization::SanitizationConfig config;
        config.enabled = true;

        if (opts.configPath) {
            if (auto err = config.LoadFromJSONFile(*opts.configPath); !err) {
                std::cerr << "promptshield_scan: " << err << "\n";
                return kExitUsage;
            }
        }
        if (auto err = config.ApplyEnvironment(); !err) {
            std::cerr << "promptshield_scan: " << err << "\n";
            return kExitUsage;
        }
        if (auto err = config.Validate(); !err) {
            std::cerr << "promptshield_scan: " << err << "\n";
            return kExitUsage;
        }

        std::shared_ptr<const Sanitization::PatternDatabase> patterns;
        if (opts.patternsPath) {
            if (auto err = Sanitization::PatternDatabase::LoadFromJSONFile(*opts.patternsPath, patterns); !err) {
                std::cerr << "promptshield_scan: " << err << "\n";
                return kExitUsage;
            }
        }

        const auto body = ReadInput(opts.inputPath);
        if (!body) {
            std::cerr << "promptshield_scan: cannot read input"
                      << (opts.inputPath ? " from " + *opts.inputPath : std::string{}) << "\n";
            return kExitUsage;
        }

        Sanitization::ContentRecord record;
        record.body = *body;
        record.title = opts.title;
        record.description = opts.description;

        Sanitization::RequestContext context;
        context.requesterIdentity = opts.requester;

        Sanitization::AiSanitizer sanitizer(config, patterns);
        const Sanitization::SanitizationResult result = sanitizer.Analyze(record, context);

        nlohmann::json out = Sanitization::ResultSerializer::ToJSON(result, opts.includeContent);
        if (opts.fieldScores) {
            out["fieldScores"] = Sanitization::ResultSerializer::ToJSON(sanitizer.ScoreFields(record));
        }

        std::cout << Sanitization::ResultSerializer::Dump(out, opts.pretty ? 2 : -1) << std::endl;
        return ExitCodeFor(result.action);
    }

} // namespace

int main(int argc, char** argv) {
    Options opts;
    bool helpRequested = false;

    if (!ParseArguments(argc, argv, opts, helpRequested)) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }
    if (helpRequested) {
        PrintUsage(std::cout);
        return kExitAllow;
    }

    PromptShield::Utils::LoggerConfig logCfg;
    logCfg.toConsole = true;
    logCfg.includeSrcLocation = opts.verbose;
    logCfg.minimalLevel = opts.verbose ? PromptShield::Utils::LogLevel::Debug : PromptShield::Utils::LogLevel::Warn;
    PromptShield::Utils::Logger::Instance().Initialize(logCfg);

    int exitCode = kExitUsage;
    try {
        exitCode = Run(opts);
    }
    catch (const std::exception& e) {
        std::cerr << "promptshield_scan: " << e.what() << "\n";
        exitCode = kExitUsage;
    }

    PromptShield::Utils::Logger::Instance().ShutDown();
    return exitCode;
}
