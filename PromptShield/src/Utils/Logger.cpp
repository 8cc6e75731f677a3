/*
 * ============================================================================
 * PromptShield Logger Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Bounded-queue asynchronous logger with console and rotating file sinks.
 *
 * ============================================================================
 */

#include "Logger.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <functional>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace PromptShield {

    namespace Utils {

        namespace fs = std::filesystem;

        const char* LogLevelToString(LogLevel level) noexcept {
            switch (level) {
            case LogLevel::Trace: return "TRACE";
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO";
            case LogLevel::Warn:  return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Fatal: return "FATAL";
            default:              return "UNKNOWN";
            }
        }

        static const char* LevelColor(LogLevel level) noexcept {
            switch (level) {
            case LogLevel::Trace: return "\x1b[36m";
            case LogLevel::Debug: return "\x1b[94m";
            case LogLevel::Info:  return "\x1b[92m";
            case LogLevel::Warn:  return "\x1b[93m";
            case LogLevel::Error: return "\x1b[91m";
            case LogLevel::Fatal: return "\x1b[95m";
            default:              return "";
            }
        }

        Logger& Logger::Instance()
        {
            static Logger g_instance;
            g_instance.EnsureInitialized();
            return g_instance;
        }

        Logger::Logger() = default;

        Logger::~Logger()
        {
            ShutDown();
        }

        bool Logger::IsEnabled(LogLevel level) const noexcept {
            const LogLevel minLevel = m_minLevel.load(std::memory_order_acquire);
            return static_cast<int>(level) >= static_cast<int>(minLevel);
        }

        bool Logger::IsInitialized() const noexcept
        {
            return m_initialized.load(std::memory_order_acquire);
        }

        uint64_t Logger::DroppedCount() const noexcept
        {
            return m_dropped.load(std::memory_order_relaxed);
        }

        void Logger::EnsureInitialized() {
            // Only the first access auto-initializes; after ShutDown() the host
            // has to call Initialize() explicitly.
            std::call_once(m_autoInit, [this]() {
                if (!IsInitialized()) {
                    Initialize(LoggerConfig{});
                }
            });
        }

        void Logger::Initialize(const LoggerConfig& cfg) {
            bool expected = false;

            if (!m_initialized.compare_exchange_strong(expected, true)) {
                // already initialized -> just update the config
                std::lock_guard<std::mutex> lk(m_cfgMutex);
                const bool pathChanged = cfg.logDirectory != m_cfg.logDirectory ||
                                         cfg.baseFileName != m_cfg.baseFileName;
                m_cfg = cfg;
                if (pathChanged && m_file.is_open()) {
                    m_file.close();
                }
                m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
                m_accepting.store(true, std::memory_order_release);
                return;
            }

            {
                std::lock_guard<std::mutex> lk(m_cfgMutex);
                m_cfg = cfg;
                m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
            }

            m_stop.store(false, std::memory_order_release);

            // Worker must exist before messages are accepted.
            if (cfg.async) {
                try {
                    m_worker = std::thread([this]() { WorkerLoop(); });
                }
                catch (const std::system_error& e) {
                    std::fprintf(stderr, "[Logger] worker thread failed (%s), logging synchronously\n", e.what());
                    std::lock_guard<std::mutex> lk(m_cfgMutex);
                    m_cfg.async = false;
                }
            }

            m_accepting.store(true, std::memory_order_release);
        }

        void Logger::ShutDown() {
            bool expected = true;
            if (!m_initialized.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
                return;
            }

            m_accepting.store(false, std::memory_order_release);

            m_stop.store(true, std::memory_order_release);
            m_queueCv.notify_all();
            m_spaceCv.notify_all();

            if (m_worker.joinable()) {
                m_worker.join();
            }

            // Worker has stopped; drain whatever is left on this thread.
            LogItem item;
            while (Dequeue(item)) {
                Dispatch(item);
            }

            std::lock_guard<std::mutex> lk(m_cfgMutex);
            if (m_file.is_open()) {
                m_file.flush();
                m_file.close();
            }
            m_currentSize = 0;
        }

        void Logger::setMinimalLevel(LogLevel level) noexcept {
            m_minLevel.store(level, std::memory_order_release);
        }

        void Logger::Enqueue(LogItem&& item) {
            if (!m_accepting.load(std::memory_order_acquire)) return;
            if (!IsInitialized()) return;
            if (!IsEnabled(item.level)) return;

            bool async = false;
            size_t maxQueue = 0;
            LoggerConfig::BackPressurePolicy policy{};
            {
                std::lock_guard<std::mutex> lk(m_cfgMutex);
                async = m_cfg.async && m_worker.joinable();
                maxQueue = m_cfg.maxQueueSize;
                policy = m_cfg.bpPolicy;
            }

            if (!async) {
                Dispatch(item);
                return;
            }

            std::unique_lock<std::mutex> lk(m_queueMutex);

            if (maxQueue > 0 && m_queue.size() >= maxQueue) {
                switch (policy) {
                case LoggerConfig::BackPressurePolicy::Block:
                    m_spaceCv.wait(lk, [this, maxQueue]() {
                        return m_stop.load(std::memory_order_acquire) || m_queue.size() < maxQueue;
                    });
                    if (m_stop.load(std::memory_order_acquire)) {
                        m_dropped.fetch_add(1, std::memory_order_relaxed);
                        return;
                    }
                    break;
                case LoggerConfig::BackPressurePolicy::DropOldest:
                    m_queue.pop_front();
                    m_dropped.fetch_add(1, std::memory_order_relaxed);
                    break;
                case LoggerConfig::BackPressurePolicy::DropNewest:
                    m_dropped.fetch_add(1, std::memory_order_relaxed);
                    return;
                }
            }

            m_queue.emplace_back(std::move(item));
            lk.unlock();
            m_queueCv.notify_one();
        }

        bool Logger::Dequeue(LogItem& out) {
            {
                std::lock_guard<std::mutex> lk(m_queueMutex);
                if (m_queue.empty()) return false;
                out = std::move(m_queue.front());
                m_queue.pop_front();
            }
            m_spaceCv.notify_one();
            return true;
        }

        void Logger::Dispatch(const LogItem& item) {
            std::lock_guard<std::mutex> lk(m_cfgMutex);
            try {
                if (m_cfg.toConsole) WriteConsole(item);
                if (m_cfg.toFile) WriteFile(item);
            }
            catch (const std::exception& e) {
                std::fprintf(stderr, "[Logger] sink failure: %s\n", e.what());
            }
        }

        void Logger::WorkerLoop() {
            while (true) {
                LogItem item;
                {
                    std::unique_lock<std::mutex> lk(m_queueMutex);
                    m_queueCv.wait_for(lk, std::chrono::seconds(1), [this]() {
                        return m_stop.load(std::memory_order_acquire) || !m_queue.empty();
                    });

                    if (m_queue.empty()) {
                        if (m_stop.load(std::memory_order_acquire)) break;
                        continue;
                    }

                    item = std::move(m_queue.front());
                    m_queue.pop_front();
                }
                m_spaceCv.notify_one();

                // Sinks run outside the queue lock.
                Dispatch(item);
            }
        }

        void Logger::LogEx(LogLevel level,
            const char* category,
            const char* file,
            int line,
            const char* function,
            const char* format, ...) {

            if (!IsEnabled(level)) return;

            va_list args;
            va_start(args, format);
            std::string msg = FormatMessageV(format, args);
            va_end(args);

            LogMessage(level, category, msg, file, line, function);
        }

        void Logger::LogMessage(LogLevel level,
            const char* category,
            const std::string& message,
            const char* file,
            int line,
            const char* function) {

            LogItem item{};
            item.level = level;
            item.category = category ? category : "";
            item.message = message;
            if (file) {
                // Keep the basename; full build paths add nothing to a log line.
                item.file = fs::path(file).filename().string();
            }
            item.function = function ? function : "";
            item.line = line;
            item.pid = static_cast<uint32_t>(::getpid());
            item.tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
            item.ts = std::chrono::system_clock::now();

            Enqueue(std::move(item));
        }

        void Logger::Flush()
        {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);

            while (std::chrono::steady_clock::now() < deadline) {
                {
                    std::lock_guard<std::mutex> lk(m_queueMutex);
                    if (m_queue.empty()) break;
                }
                m_queueCv.notify_all();
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }

            std::lock_guard<std::mutex> lk(m_cfgMutex);
            std::fflush(stderr);
            if (m_file.is_open()) {
                m_file.flush();
            }
        }

        // Helpers

        std::string Logger::FormatMessageV(const char* fmt, va_list args) {
            if (!fmt) return "";

            std::string out;
            out.resize(512);

            va_list args_copy;
            va_copy(args_copy, args);
            const int needed = std::vsnprintf(out.data(), out.size(), fmt, args_copy);
            va_end(args_copy);

            if (needed < 0) {
                return "[Logger] formatting error";
            }

            constexpr size_t kMaxMessage = 1u << 20;
            if (static_cast<size_t>(needed) >= out.size()) {
                if (static_cast<size_t>(needed) >= kMaxMessage) {
                    return "[Logger] Message too large";
                }
                out.resize(static_cast<size_t>(needed) + 1);
                va_copy(args_copy, args);
                std::vsnprintf(out.data(), out.size(), fmt, args_copy);
                va_end(args_copy);
            }

            out.resize(static_cast<size_t>(needed));
            return out;
        }

        std::string Logger::FormatIso8601UTC(std::chrono::system_clock::time_point tp) {
            const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
            const std::time_t t = std::chrono::system_clock::to_time_t(secs);

            std::tm tmUtc{};
            if (!::gmtime_r(&t, &tmUtc)) {
                return "[Invalid timestamp]";
            }

            char buf[40] = { 0 };
            std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
                tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, static_cast<int>(ms));
            return std::string(buf);
        }

        std::string Logger::EscapeJson(const std::string& s) {
            std::string out;
            out.reserve(s.size() + 16);

            for (char c : s)
            {
                switch (c)
                {
                case '\\': out += "\\\\"; break;
                case '"':  out += "\\\""; break;
                case '\b': out += "\\b";  break;
                case '\f': out += "\\f";  break;
                case '\n': out += "\\n";  break;
                case '\r': out += "\\r";  break;
                case '\t': out += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20)
                    {
                        char buf[7];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        out += buf;
                    }
                    else
                    {
                        out += c;
                    }
                }
            }
            return out;
        }

        std::string Logger::FormatPrefix(const LogItem& item) const {
            std::string s;
            s.reserve(128);
            s += FormatIso8601UTC(item.ts);
            s += " [";
            s += LogLevelToString(item.level);
            s += "]";

            if (!item.category.empty())
            {
                s += " [";
                s += item.category;
                s += "]";
            }

            if (m_cfg.includeProcThreadId)
            {
                s += " (";
                s += std::to_string(item.pid);
                s += ":";
                s += std::to_string(item.tid);
                s += ")";
            }

            if (m_cfg.includeSrcLocation && !item.file.empty())
            {
                s += " ";
                s += item.file;
                s += ":";
                s += std::to_string(item.line);

                if (!item.function.empty())
                {
                    s += " ";
                    s += item.function;
                }
            }

            s += " - ";
            return s;
        }

        std::string Logger::FormatAsJson(const LogItem& item) const {
            // JSON Lines format
            std::string s;
            s.reserve(128 + item.message.size());
            s += "{\"ts\":\"";
            s += EscapeJson(FormatIso8601UTC(item.ts));
            s += "\",\"lvl\":\"";
            s += LogLevelToString(item.level);
            s += "\"";

            if (!item.category.empty())
            {
                s += ",\"cat\":\"";
                s += EscapeJson(item.category);
                s += "\"";
            }

            if (m_cfg.includeProcThreadId)
            {
                s += ",\"pid\":";
                s += std::to_string(item.pid);
                s += ",\"tid\":";
                s += std::to_string(item.tid);
            }

            if (m_cfg.includeSrcLocation && !item.file.empty())
            {
                s += ",\"file\":\"";
                s += EscapeJson(item.file);
                s += "\",\"line\":";
                s += std::to_string(item.line);

                if (!item.function.empty())
                {
                    s += ",\"func\":\"";
                    s += EscapeJson(item.function);
                    s += "\"";
                }
            }

            s += ",\"msg\":\"";
            s += EscapeJson(item.message);
            s += "\"}";
            return s;
        }

        // Sinks

        void Logger::WriteConsole(const LogItem& item) {
            std::string line = m_cfg.jsonLines ? FormatAsJson(item) : (FormatPrefix(item) + item.message);

            const bool color = m_cfg.colorConsole && !m_cfg.jsonLines && ::isatty(::fileno(stderr)) == 1;
            if (color) {
                line = std::string(LevelColor(item.level)) + line + "\x1b[0m";
            }
            line += '\n';

            std::fwrite(line.data(), 1, line.size(), stderr);
            if (static_cast<int>(item.level) >= static_cast<int>(m_cfg.flushLevel)) {
                std::fflush(stderr);
            }
        }

        std::string Logger::BaseLogPath() const
        {
            fs::path path = m_cfg.logDirectory.empty() ? fs::path{} : fs::path(m_cfg.logDirectory);
            path /= m_cfg.baseFileName + ".log";
            return path.string();
        }

        void Logger::OpenLogFileIfNeeded_NoLock() {
            if (m_file.is_open()) return;

            std::error_code ec;
            if (!m_cfg.logDirectory.empty()) {
                fs::create_directories(m_cfg.logDirectory, ec);
                if (ec) {
                    std::fprintf(stderr, "[Logger] cannot create %s: %s\n",
                        m_cfg.logDirectory.c_str(), ec.message().c_str());
                    return;
                }
            }

            const std::string path = BaseLogPath();
            m_file.open(path, std::ios::out | std::ios::app | std::ios::binary);
            if (!m_file.is_open()) {
                std::fprintf(stderr, "[Logger] failed to open log file %s\n", path.c_str());
                return;
            }

            const auto size = fs::file_size(path, ec);
            m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
        }

        void Logger::RotateIfNeeded_NoLock(size_t nextWriteBytes) {
            if (m_cfg.maxFileSizeBytes == 0) return;
            if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;

            PerformRotation_NoLock();
            OpenLogFileIfNeeded_NoLock();
        }

        void Logger::PerformRotation_NoLock()
        {
            if (m_file.is_open()) {
                m_file.flush();
                m_file.close();
            }

            const std::string base = BaseLogPath();
            std::error_code ec;

            if (m_cfg.maxFileCount > 1) {
                fs::remove(base + "." + std::to_string(m_cfg.maxFileCount), ec);

                for (size_t idx = m_cfg.maxFileCount - 1; idx >= 1; --idx) {
                    const std::string src = base + "." + std::to_string(idx);
                    const std::string dst = base + "." + std::to_string(idx + 1);
                    if (fs::exists(src, ec)) {
                        fs::rename(src, dst, ec);
                    }
                }

                fs::rename(base, base + ".1", ec);
                if (ec) {
                    std::fprintf(stderr, "[Logger] rotation failed: %s\n", ec.message().c_str());
                }
            }
            else {
                fs::remove(base, ec);
            }

            m_currentSize = 0;
        }

        void Logger::WriteFile(const LogItem& item)
        {
            OpenLogFileIfNeeded_NoLock();
            if (!m_file.is_open()) return;

            std::string line = m_cfg.jsonLines ? FormatAsJson(item) : (FormatPrefix(item) + item.message);
            line += '\n';

            RotateIfNeeded_NoLock(line.size());
            if (!m_file.is_open()) return;

            m_file.write(line.data(), static_cast<std::streamsize>(line.size()));
            m_currentSize += line.size();

            if (static_cast<int>(item.level) >= static_cast<int>(m_cfg.flushLevel))
                m_file.flush();
        }

        Logger::Scope::Scope(const char* category,
            const char* file,
            int line,
            const char* function,
            const char* messageOnEnter,
            LogLevel level)
            : m_category(category ? category : "")
            , m_file(file ? file : "")
            , m_line(line)
            , m_function(function ? function : "")
            , m_level(level)
            , m_start(std::chrono::steady_clock::now())
        {
            Logger& lg = Logger::Instance();
            if (lg.IsEnabled(m_level)) {
                lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter", m_file, m_line, m_function);
            }
        }

        Logger::Scope::~Scope()
        {
            Logger& lg = Logger::Instance();
            if (!lg.IsEnabled(m_level)) return;

            const double ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - m_start).count();

            char buf[64];
            std::snprintf(buf, sizeof(buf), "Leave (%.3f ms)", ms);
            lg.LogMessage(m_level, m_category, buf, m_file, m_line, m_function);
        }

    } // namespace Utils
} // namespace PromptShield
