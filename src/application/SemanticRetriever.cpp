/**
 * @file SemanticRetriever.cpp
 * @brief Implementation of SemanticRetriever.
 */

#include "application/SemanticRetriever.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace agentrouter::application {

float CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;

    double dot = 0.0, normA = 0.0, normB = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }

    if (normA == 0.0 || normB == 0.0) return 0.0f;
    double sim = dot / (std::sqrt(normA) * std::sqrt(normB));
    return static_cast<float>(std::clamp(sim, 0.0, 1.0));
}

SemanticRetriever::SemanticRetriever(std::shared_ptr<infrastructure::EmbeddingCache> cache, RetrievalOptions options)
    : m_cache(std::move(cache)), m_options(options) {}

std::string SemanticRetriever::weightedRepresentation(const domain::Document& doc) const {
    std::string rep;
    for (int i = 0; i < m_options.titleRepeat; ++i) {
        if (!rep.empty()) rep += ' ';
        rep += doc.title;
    }
    std::string body = domain::TextUtils::Utf8Prefix(doc.bodyText, m_options.bodyPrefixChars);
    if (!body.empty()) {
        if (!rep.empty()) rep += ' ';
        rep += body;
    }
    return rep;
}

std::optional<std::vector<float>> SemanticRetriever::embedDocument(const domain::Document& doc, std::size_t queryDims) const {
    if (doc.embedding && doc.embedding->size() == queryDims) {
        return doc.embedding;
    }
    try {
        return m_cache->getOrCompute(weightedRepresentation(doc));
    } catch (const domain::EmbeddingProviderError& e) {
        std::cerr << "[SemanticRetriever] Skipping document '" << doc.id << "': " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<std::vector<domain::ScoredDocument>> SemanticRetriever::tryRetrieve(
    const std::string& query, const std::vector<domain::Document>& corpus, std::size_t k, float minScore) const {
    std::vector<float> queryVec;
    try {
        queryVec = m_cache->getOrCompute(query);
    } catch (const domain::EmbeddingProviderError& e) {
        std::cerr << "[SemanticRetriever] Query embedding failed: " << e.what() << std::endl;
        return std::nullopt;
    }

    std::vector<domain::ScoredDocument> scored;
    if (k == 0) return scored;

    for (const auto& doc : corpus) {
        auto docVec = embedDocument(doc, queryVec.size());
        if (!docVec) continue;

        float score = CosineSimilarity(queryVec, *docVec);
        if (score >= minScore) {
            scored.push_back({doc, score});
        }
    }

    std::stable_sort(scored.begin(), scored.end(), [](const domain::ScoredDocument& a, const domain::ScoredDocument& b) {
        return a.score > b.score;
    });
    if (scored.size() > k) scored.resize(k);
    return scored;
}

std::vector<domain::ScoredDocument> SemanticRetriever::retrieve(
    const std::string& query, const std::vector<domain::Document>& corpus, std::size_t k, float minScore) const {
    return tryRetrieve(query, corpus, k, minScore).value_or(std::vector<domain::ScoredDocument>{});
}

} // namespace agentrouter::application
