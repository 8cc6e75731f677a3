/*
 * ============================================================================
 * PromptShield Logger
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Thread-safe asynchronous logging system.
 *
 * ============================================================================
 */
#pragma once
/**
 * @file Logger.hpp
 * @brief Thread-safe asynchronous logging system for PromptShield.
 *
 * Provides:
 * - Asynchronous logging with configurable back-pressure policies
 * - Console (stderr) and rotating file output
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 *
 * @note Thread-safe for all public methods.
 * @warning Call Initialize() before logging, or the logger auto-initializes
 *          with console-only defaults.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>

namespace PromptShield {
    namespace Utils {

        // ============================================================================
        // Log Levels
        // ============================================================================

        /**
         * @brief Severity levels for log messages.
         *
         * Ordered from least to most severe. Messages below the configured
         * minimum level are discarded.
         */
        enum class LogLevel : uint8_t {
            Trace = 0,  ///< Verbose debugging information
            Debug,      ///< Debug-level information
            Info,       ///< Informational messages
            Warn,       ///< Warning conditions
            Error,      ///< Error conditions
            Fatal       ///< Fatal/critical errors
        };

        [[nodiscard]] const char* LogLevelToString(LogLevel level) noexcept;

        // ============================================================================
        // Configuration
        // ============================================================================

        /**
         * @brief Configuration options for the Logger.
         */
        struct LoggerConfig {
            /// Maximum queue size for async logging
            size_t maxQueueSize = 1000;

            /// Policy when queue is full
            enum class BackPressurePolicy {
                Block,       ///< Wait until the worker makes room
                DropOldest,  ///< Drop oldest messages
                DropNewest   ///< Drop newest messages
            } bpPolicy = BackPressurePolicy::DropOldest;

            bool async = true;              ///< Enable asynchronous logging
            bool toConsole = true;          ///< Output to stderr
            bool toFile = false;            ///< Output to file
            bool colorConsole = true;       ///< ANSI colours on console output
            bool jsonLines = false;         ///< Use JSON Lines format
            bool includeSrcLocation = true; ///< Include source file/line/function
            bool includeProcThreadId = true;///< Include process/thread IDs

            std::string logDirectory = "logs";            ///< Log file directory
            std::string baseFileName = "PromptShield";    ///< Base log file name
            uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
            size_t maxFileCount = 10;                     ///< Max rotated files to keep

            LogLevel minimalLevel = LogLevel::Info;       ///< Minimum level to log
            LogLevel flushLevel = LogLevel::Error;        ///< Level that triggers flush
        };

        // ============================================================================
        // Logger Class
        // ============================================================================

        /**
         * @brief Thread-safe singleton logger with async support.
         *
         * Usage:
         * @code
         *   LoggerConfig cfg;
         *   cfg.toFile = true;
         *   Logger::Instance().Initialize(cfg);
         *
         *   PS_LOG_INFO("Scanner", "Loaded %zu patterns", count);
         *
         *   Logger::Instance().ShutDown();
         * @endcode
         */
        class Logger {
        public:
            [[nodiscard]] static Logger& Instance();

            /**
             * @brief Initialize the logger with configuration.
             *
             * Calling again on an initialized logger only replaces the
             * configuration.
             */
            void Initialize(const LoggerConfig& cfg);

            /**
             * @brief Stop the worker thread and write remaining messages.
             */
            void ShutDown();

            [[nodiscard]] bool IsInitialized() const noexcept;

            void setMinimalLevel(LogLevel level) noexcept;

            [[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

            /**
             * @brief Log a printf-style formatted message with source location.
             */
            void LogEx(LogLevel level,
                       const char* category,
                       const char* file,
                       int line,
                       const char* function,
                       const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
                __attribute__((format(printf, 7, 8)))
#endif
                ;

            /**
             * @brief Log a pre-formatted message.
             */
            void LogMessage(LogLevel level,
                            const char* category,
                            const std::string& message,
                            const char* file = nullptr,
                            int line = 0,
                            const char* function = nullptr);

            /**
             * @brief Block until queued messages are written (bounded wait).
             */
            void Flush();

            /// Number of messages discarded by the back-pressure policy.
            [[nodiscard]] uint64_t DroppedCount() const noexcept;

            [[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

            /**
             * @brief RAII scope logger for function entry/exit timing.
             */
            class Scope {
            public:
                Scope(const char* category,
                      const char* file,
                      int line,
                      const char* function,
                      const char* messageOnEnter = "Enter",
                      LogLevel level = LogLevel::Debug);
                ~Scope();

                Scope(const Scope&) = delete;
                Scope& operator=(const Scope&) = delete;
                Scope(Scope&&) = delete;
                Scope& operator=(Scope&&) = delete;

            private:
                const char* m_category;
                const char* m_file;
                int m_line;
                const char* m_function;
                LogLevel m_level;
                std::chrono::steady_clock::time_point m_start;
            };

            Logger(const Logger&) = delete;
            Logger& operator=(const Logger&) = delete;

        private:
            Logger();
            ~Logger();

            struct LogItem {
                LogLevel level = LogLevel::Info;
                std::string category;
                std::string message;
                std::string file;
                std::string function;
                int line = 0;
                uint32_t pid = 0;
                uint64_t tid = 0;
                std::chrono::system_clock::time_point ts{};
            };

            void EnsureInitialized();
            void WorkerLoop();
            void Enqueue(LogItem&& item);
            [[nodiscard]] bool Dequeue(LogItem& out);
            void Dispatch(const LogItem& item);

            void WriteConsole(const LogItem& item);
            void WriteFile(const LogItem& item);

            [[nodiscard]] std::string FormatPrefix(const LogItem& item) const;
            [[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
            [[nodiscard]] static std::string EscapeJson(const std::string& s);
            [[nodiscard]] static std::string FormatIso8601UTC(std::chrono::system_clock::time_point tp);

            void OpenLogFileIfNeeded_NoLock();
            void RotateIfNeeded_NoLock(size_t nextWriteBytes);
            void PerformRotation_NoLock();
            [[nodiscard]] std::string BaseLogPath() const;

            std::atomic<bool> m_accepting{ false };
            std::atomic<bool> m_initialized{ false };
            std::atomic<LogLevel> m_minLevel{ LogLevel::Info };
            std::atomic<uint64_t> m_dropped{ 0 };

            /// Guards configuration and both sinks
            LoggerConfig m_cfg{};
            mutable std::mutex m_cfgMutex;

            std::deque<LogItem> m_queue;
            mutable std::mutex m_queueMutex;
            std::condition_variable m_queueCv;
            std::condition_variable m_spaceCv;

            std::thread m_worker;
            std::atomic<bool> m_stop{ false };
            std::once_flag m_autoInit;

            /// Guarded by m_cfgMutex
            std::ofstream m_file;
            uint64_t m_currentSize{ 0 };
        };

    }  // namespace Utils
}  // namespace PromptShield

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   PS_LOG_INFO("Category", "Message with %d format", value);
//   PS_LOG_ERROR("Category", "Error occurred: %s", errorMsg);
//   PS_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// Unit test builds define PROMPTSHIELD_TESTING, which compiles the macros out.
//
// ═══════════════════════════════════════════════════════════════════════════

#ifdef PROMPTSHIELD_TESTING

#define PS_LOG_TRACE(category, fmt, ...) do { } while (0)
#define PS_LOG_DEBUG(category, fmt, ...) do { } while (0)
#define PS_LOG_INFO(category, fmt, ...)  do { } while (0)
#define PS_LOG_WARN(category, fmt, ...)  do { } while (0)
#define PS_LOG_ERROR(category, fmt, ...) do { } while (0)
#define PS_LOG_FATAL(category, fmt, ...) do { } while (0)
#define PS_LOG_SCOPE(category)           do { } while (0)

#else

#define PS_LOG_AT_LEVEL(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::PromptShield::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while (0)

#define PS_LOG_TRACE(category, fmt, ...) \
    PS_LOG_AT_LEVEL(::PromptShield::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)
#define PS_LOG_DEBUG(category, fmt, ...) \
    PS_LOG_AT_LEVEL(::PromptShield::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)
#define PS_LOG_INFO(category, fmt, ...) \
    PS_LOG_AT_LEVEL(::PromptShield::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)
#define PS_LOG_WARN(category, fmt, ...) \
    PS_LOG_AT_LEVEL(::PromptShield::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)
#define PS_LOG_ERROR(category, fmt, ...) \
    PS_LOG_AT_LEVEL(::PromptShield::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)
#define PS_LOG_FATAL(category, fmt, ...) \
    PS_LOG_AT_LEVEL(::PromptShield::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define PS_LOG_CONCAT_INNER(a, b) a##b
#define PS_LOG_CONCAT(a, b) PS_LOG_CONCAT_INNER(a, b)

/// RAII scope logger - logs function entry and exit with timing
#define PS_LOG_SCOPE(category) \
    ::PromptShield::Utils::Logger::Scope PS_LOG_CONCAT(_ps_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)

#endif
