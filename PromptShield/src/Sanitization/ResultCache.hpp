/*
 * ============================================================================
 * PromptShield Result Cache
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * Thread-safe, capacity-bounded memo of full sanitization decisions keyed by
 * the SHA-256 digest of the exact content bytes.
 *
 * Entries are invalidated lazily on lookup when older than the TTL or when
 * they were produced by a different pattern generation. When full, the
 * oldest inserted entry is evicted; overwriting a key keeps its position.
 *
 * ============================================================================
 */
#pragma once

#include "SanitizationTypes.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace PromptShield {
    namespace Sanitization {

        class ResultCache {
        public:
            using TimePoint = std::chrono::steady_clock::time_point;
            using ClockFunction = std::function<TimePoint()>;

            struct Stats {
                size_t entryCount = 0;
                size_t maxEntries = 0;
                uint64_t hits = 0;
                uint64_t misses = 0;
                double hitRate = 0.0;              ///< Percent of lookups that hit
                std::string patternGeneration;
                std::chrono::seconds ttl{ 0 };
            };

            /**
             * @param maxEntries capacity, at least 1
             * @param ttl        maximum entry age
             * @param generation pattern generation stored with new entries and
             *                   required of entries served
             * @param clock      time source; steady_clock::now when empty
             */
            ResultCache(size_t maxEntries,
                        std::chrono::seconds ttl,
                        std::string generation,
                        ClockFunction clock = {});

            ResultCache(const ResultCache&) = delete;
            ResultCache& operator=(const ResultCache&) = delete;

            /// Copy of the stored result with metadata.cacheHit set, or nullopt.
            [[nodiscard]] std::optional<SanitizationResult> Get(std::string_view content);

            /// Returns false when the content could not be digested.
            bool Set(std::string_view content, const SanitizationResult& result);

            /// Drop all entries and reset hit/miss counters.
            void Clear();

            /// Remove expired and stale-generation entries; returns how many.
            size_t PurgeExpired();

            [[nodiscard]] Stats GetStats() const;
            [[nodiscard]] size_t ApproximateMemoryUsage() const;

            /// Switch the current generation; older entries become misses.
            void SetGeneration(std::string generation);
            [[nodiscard]] std::string Generation() const;

            [[nodiscard]] static std::optional<std::string> KeyFor(std::string_view content);

        private:
            struct Entry {
                SanitizationResult result;
                TimePoint storedAt;
                std::string generation;
                std::list<std::string>::iterator orderIt;
                size_t sizeBytes = 0;
            };

            [[nodiscard]] TimePoint now() const;
            [[nodiscard]] bool isStale_NoLock(const Entry& entry, TimePoint at) const noexcept;
            void erase_NoLock(std::unordered_map<std::string, Entry>::iterator it) noexcept;
            void evictIfNeeded_NoLock() noexcept;

            static size_t estimateSize(const std::string& key, const SanitizationResult& result) noexcept;

            mutable std::shared_mutex m_lock;
            std::unordered_map<std::string, Entry> m_map;
            std::list<std::string> m_order;       ///< Front = oldest insertion
            size_t m_totalBytes = 0;

            const size_t m_maxEntries;
            const std::chrono::seconds m_ttl;
            std::string m_generation;
            ClockFunction m_clock;

            std::atomic<uint64_t> m_hits{ 0 };
            std::atomic<uint64_t> m_misses{ 0 };
        };

    } // namespace Sanitization
} // namespace PromptShield
