/*
 * ============================================================================
 * PromptShield Result Cache Implementation
 * ============================================================================
 *
 * Copyright (c) 2026 PromptShield Security Suite
 * All rights reserved.
 *
 * PROPRIETARY AND CONFIDENTIAL
 *
 * ============================================================================
 */

#include "ResultCache.hpp"

#include "../Utils/HashUtils.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <mutex>

namespace PromptShield {
    namespace Sanitization {

        ResultCache::ResultCache(size_t maxEntries,
                                 std::chrono::seconds ttl,
                                 std::string generation,
                                 ClockFunction clock)
            : m_maxEntries(std::max<size_t>(1, maxEntries))
            , m_ttl(ttl)
            , m_generation(std::move(generation))
            , m_clock(std::move(clock)) {
        }

        std::optional<std::string> ResultCache::KeyFor(std::string_view content) {
            Utils::HashUtils::Error err;
            auto key = Utils::HashUtils::Sha256Hex(content, &err);
            if (!key) {
                PS_LOG_WARN("ResultCache", "content digest failed (openssl=%lu): %s",
                    err.opensslError, err.message.c_str());
            }
            return key;
        }

        std::optional<SanitizationResult> ResultCache::Get(std::string_view content) {
            const auto key = KeyFor(content);
            if (!key) {
                m_misses.fetch_add(1, std::memory_order_relaxed);
                return std::nullopt;
            }

            const TimePoint at = now();

            {
                std::shared_lock<std::shared_mutex> guard(m_lock);
                auto it = m_map.find(*key);
                if (it == m_map.end()) {
                    m_misses.fetch_add(1, std::memory_order_relaxed);
                    return std::nullopt;
                }
                if (!isStale_NoLock(it->second, at)) {
                    SanitizationResult copy = it->second.result;
                    copy.metadata.cacheHit = true;
                    m_hits.fetch_add(1, std::memory_order_relaxed);
                    return copy;
                }
            }

            // Stale: drop it under the exclusive lock (it may have been replaced meanwhile).
            {
                std::unique_lock<std::shared_mutex> guard(m_lock);
                auto it = m_map.find(*key);
                if (it != m_map.end() && isStale_NoLock(it->second, at)) {
                    erase_NoLock(it);
                }
            }

            m_misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        bool ResultCache::Set(std::string_view content, const SanitizationResult& result) {
            auto key = KeyFor(content);
            if (!key) return false;

            Entry entry;
            entry.result = result;
            entry.result.metadata.cacheHit = false;
            entry.storedAt = now();
            entry.sizeBytes = estimateSize(*key, entry.result);

            std::unique_lock<std::shared_mutex> guard(m_lock);
            entry.generation = m_generation;

            auto existing = m_map.find(*key);
            if (existing != m_map.end()) {
                m_totalBytes -= std::min(m_totalBytes, existing->second.sizeBytes);
                entry.orderIt = existing->second.orderIt;
                existing->second = std::move(entry);
                m_totalBytes += existing->second.sizeBytes;
                return true;
            }

            while (m_map.size() >= m_maxEntries && !m_order.empty()) {
                evictIfNeeded_NoLock();
            }

            m_order.push_back(*key);
            entry.orderIt = std::prev(m_order.end());
            m_totalBytes += entry.sizeBytes;
            m_map.emplace(std::move(*key), std::move(entry));
            return true;
        }

        void ResultCache::Clear() {
            std::unique_lock<std::shared_mutex> guard(m_lock);
            m_map.clear();
            m_order.clear();
            m_totalBytes = 0;
            m_hits.store(0, std::memory_order_relaxed);
            m_misses.store(0, std::memory_order_relaxed);
        }

        size_t ResultCache::PurgeExpired() {
            const TimePoint at = now();
            size_t removed = 0;

            std::unique_lock<std::shared_mutex> guard(m_lock);
            for (auto it = m_map.begin(); it != m_map.end(); ) {
                if (isStale_NoLock(it->second, at)) {
                    auto victim = it++;
                    erase_NoLock(victim);
                    ++removed;
                }
                else {
                    ++it;
                }
            }

            if (removed > 0) {
                PS_LOG_DEBUG("ResultCache", "purged %zu expired entries", removed);
            }
            return removed;
        }

        ResultCache::Stats ResultCache::GetStats() const {
            std::shared_lock<std::shared_mutex> guard(m_lock);

            Stats stats{};
            stats.entryCount = m_map.size();
            stats.maxEntries = m_maxEntries;
            stats.hits = m_hits.load(std::memory_order_relaxed);
            stats.misses = m_misses.load(std::memory_order_relaxed);
            const uint64_t lookups = stats.hits + stats.misses;
            stats.hitRate = lookups > 0 ? static_cast<double>(stats.hits) * 100.0 / static_cast<double>(lookups) : 0.0;
            stats.patternGeneration = m_generation;
            stats.ttl = m_ttl;
            return stats;
        }

        size_t ResultCache::ApproximateMemoryUsage() const {
            std::shared_lock<std::shared_mutex> guard(m_lock);
            return m_totalBytes;
        }

        void ResultCache::SetGeneration(std::string generation) {
            std::unique_lock<std::shared_mutex> guard(m_lock);
            if (generation != m_generation) {
                PS_LOG_INFO("ResultCache", "pattern generation %s -> %s", m_generation.c_str(), generation.c_str());
                m_generation = std::move(generation);
            }
        }

        std::string ResultCache::Generation() const {
            std::shared_lock<std::shared_mutex> guard(m_lock);
            return m_generation;
        }

        // ============================================================================
        // Internals
        // ============================================================================

        ResultCache::TimePoint ResultCache::now() const {
            return m_clock ? m_clock() : std::chrono::steady_clock::now();
        }

        bool ResultCache::isStale_NoLock(const Entry& entry, TimePoint at) const noexcept {
            if (entry.generation != m_generation) return true;
            return (at - entry.storedAt) > m_ttl;
        }

        void ResultCache::erase_NoLock(std::unordered_map<std::string, Entry>::iterator it) noexcept {
            m_totalBytes -= std::min(m_totalBytes, it->second.sizeBytes);
            m_order.erase(it->second.orderIt);
            m_map.erase(it);
        }

        void ResultCache::evictIfNeeded_NoLock() noexcept {
            if (m_order.empty()) return;

            auto it = m_map.find(m_order.front());
            if (it == m_map.end()) {
                // Orphaned order entry
                m_order.pop_front();
                return;
            }
            erase_NoLock(it);
        }

        size_t ResultCache::estimateSize(const std::string& key, const SanitizationResult& result) noexcept {
            size_t bytes = sizeof(Entry) + key.size() + result.originalContent.size();
            if (result.sanitizedContent) bytes += result.sanitizedContent->size();
            bytes += result.metadata.patternGeneration.size();
            for (const auto& threat : result.threats) {
                bytes += sizeof(DetectedThreat) + threat.patternName.size() +
                         threat.matchedText.size() + threat.contextSnippet.size();
            }
            return bytes;
        }

    } // namespace Sanitization
} // namespace PromptShield
