/**
 * @file DocumentCorpus.hpp
 * @brief TTL-bounded snapshot of the document store.
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/Document.hpp"
#include "domain/DocumentStore.hpp"

namespace agentrouter::infrastructure {

struct DocumentCorpusOptions {
    std::chrono::seconds ttl{3600};
    std::string prefix;
};

/**
 * @class DocumentCorpus
 * @brief Serves an immutable snapshot of the corpus, refetched when older than the TTL.
 *
 * Readers hold a shared_ptr to a complete snapshot; a refresh builds a new
 * vector and swaps the pointer, so nobody sees a half-replaced corpus.
 * Refreshes are serialized so two callers never fetch concurrently.
 */
class DocumentCorpus {
public:
    using Snapshot = std::shared_ptr<const std::vector<domain::Document>>;
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    DocumentCorpus(std::shared_ptr<domain::DocumentStore> store,
                   DocumentCorpusOptions options = {},
                   ClockFn clock = [] { return Clock::now(); });

    /**
     * @brief Returns the cached snapshot, refetching first if it expired.
     *
     * On refetch failure the stale snapshot is served; with no snapshot at all
     * an empty corpus is returned. Never throws for store failures.
     */
    Snapshot load();

    /** @brief Forces a refetch. @return false if the store failed (current snapshot kept). */
    bool refresh();

    /** @brief Current snapshot without any refetch (empty if never loaded). */
    Snapshot current() const;

private:
    bool isFresh(Clock::time_point now) const;
    bool refetchLocked();

    std::shared_ptr<domain::DocumentStore> m_store;
    DocumentCorpusOptions m_options;
    ClockFn m_clock;

    mutable std::mutex m_snapshotMutex; ///< Guards m_snapshot and m_lastLoad.
    std::mutex m_refreshMutex;          ///< Single writer role.
    Snapshot m_snapshot;
    std::optional<Clock::time_point> m_lastLoad;
};

} // namespace agentrouter::infrastructure
