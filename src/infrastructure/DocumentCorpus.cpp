/**
 * @file DocumentCorpus.cpp
 * @brief Implementation of DocumentCorpus.
 */

#include "infrastructure/DocumentCorpus.hpp"
#include "infrastructure/DocumentParser.hpp"
#include "domain/Errors.hpp"
#include <iostream>
#include <unordered_set>

namespace agentrouter::infrastructure {

DocumentCorpus::DocumentCorpus(std::shared_ptr<domain::DocumentStore> store,
                               DocumentCorpusOptions options,
                               ClockFn clock)
    : m_store(std::move(store)), m_options(std::move(options)), m_clock(std::move(clock)) {}

bool DocumentCorpus::isFresh(Clock::time_point now) const {
    return m_snapshot && m_lastLoad && (now - *m_lastLoad) < m_options.ttl;
}

DocumentCorpus::Snapshot DocumentCorpus::load() {
    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        if (isFresh(m_clock())) return m_snapshot;
    }

    std::lock_guard<std::mutex> refreshLock(m_refreshMutex);
    {
        // Another caller may have refreshed while we waited.
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        if (isFresh(m_clock())) return m_snapshot;
    }

    refetchLocked();
    return current();
}

bool DocumentCorpus::refresh() {
    std::lock_guard<std::mutex> refreshLock(m_refreshMutex);
    return refetchLocked();
}

DocumentCorpus::Snapshot DocumentCorpus::current() const {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    if (m_snapshot) return m_snapshot;
    return std::make_shared<const std::vector<domain::Document>>();
}

bool DocumentCorpus::refetchLocked() {
    std::vector<domain::StoredObject> objects;
    try {
        if (!m_store) throw domain::CorpusUnavailableError("No document store configured");
        objects = m_store->listDocuments(m_options.prefix);
    } catch (const domain::CorpusUnavailableError& e) {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        std::cerr << "[DocumentCorpus] Refetch failed: " << e.what()
                  << (m_snapshot ? " Serving stale snapshot." : " No snapshot, serving empty corpus.") << std::endl;
        return false;
    }

    auto docs = std::make_shared<std::vector<domain::Document>>();
    docs->reserve(objects.size());
    std::unordered_set<std::string> seen;
    for (const auto& object : objects) {
        auto doc = DocumentParser::Parse(object);
        if (!doc) continue;
        if (!seen.insert(doc->id).second) {
            std::cerr << "[DocumentCorpus] Duplicate document id " << doc->id << " in " << object.id << ", dropped." << std::endl;
            continue;
        }
        docs->push_back(std::move(*doc));
    }

    std::cerr << "[DocumentCorpus] Loaded " << docs->size() << " documents (" << objects.size() << " objects)." << std::endl;

    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    m_snapshot = std::move(docs);
    m_lastLoad = m_clock();
    return true;
}

} // namespace agentrouter::infrastructure
