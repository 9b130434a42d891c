/**
 * @file EmbeddingCache.hpp
 * @brief Process-wide memoization of text embeddings.
 */

#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <memory>
#include <shared_mutex>
#include "domain/EmbeddingProvider.hpp"

namespace agentrouter::infrastructure {

struct EmbeddingCacheOptions {
    std::size_t maxChars = 5000;  ///< Texts longer than this are shortened before embedding.
    std::size_t headChars = 2000;
    std::size_t tailChars = 2000;
};

/**
 * @class EmbeddingCache
 * @brief Memoizes embeddings per normalized text so repeated texts cost one provider call.
 *
 * Entries are keyed by a hash of the exact normalized text and are never
 * invalidated during the process lifetime; the cache grows without bound.
 * Safe for concurrent readers and writers.
 */
class EmbeddingCache {
public:
    EmbeddingCache(std::shared_ptr<domain::EmbeddingProvider> provider, EmbeddingCacheOptions options = {});

    /**
     * @brief Returns the cached embedding or asks the provider once.
     * @throws domain::EmbeddingProviderError if the provider fails. Failures are not cached.
     */
    std::vector<float> getOrCompute(const std::string& text);

    /** @brief Cache lookup without calling the provider. */
    std::optional<std::vector<float>> get(const std::string& text) const;

    /** @brief Head + marker + tail shortening applied to long inputs. */
    std::string normalizeInput(const std::string& text) const;

    std::size_t size() const;

    /** @brief Writes all entries as JSON through a temp file and an atomic rename. */
    bool persist(const std::string& path) const;

    /** @brief Merges entries from a file written by persist(). Existing entries win. */
    bool load(const std::string& path);

    static constexpr const char* kTruncationMarker = "\n[...]\n";

private:
    static std::string keyFor(const std::string& normalized);

    std::shared_ptr<domain::EmbeddingProvider> m_provider;
    EmbeddingCacheOptions m_options;
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::vector<float>> m_entries; ///< textHash -> vector
};

} // namespace agentrouter::infrastructure
