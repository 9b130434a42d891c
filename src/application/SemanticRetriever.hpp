/**
 * @file SemanticRetriever.hpp
 * @brief Embedding-based ranking of corpus documents against a query.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Document.hpp"
#include "infrastructure/EmbeddingCache.hpp"

namespace agentrouter::application {

struct RetrievalOptions {
    std::size_t topK = 3;
    float minScore = 0.3f;
    int titleRepeat = 3;                ///< Title weight in the document representation.
    std::size_t bodyPrefixChars = 1000; ///< Body bytes included in the representation.
};

/**
 * @brief Cosine similarity clamped to [0, 1].
 * Returns 0 for mismatched dimensions or a zero-norm vector.
 */
float CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * @class SemanticRetriever
 * @brief Ranks documents by similarity between the query embedding and a
 * title-weighted representation of each document.
 *
 * Stateless apart from the shared embedding cache.
 */
class SemanticRetriever {
public:
    explicit SemanticRetriever(std::shared_ptr<infrastructure::EmbeddingCache> cache, RetrievalOptions options = {});

    /**
     * @brief Top-k documents with score >= minScore, best first.
     *
     * Equal scores keep corpus order. Documents whose embedding fails are
     * skipped. Returns nullopt when the query itself cannot be embedded.
     */
    std::optional<std::vector<domain::ScoredDocument>> tryRetrieve(const std::string& query,
                                                                   const std::vector<domain::Document>& corpus,
                                                                   std::size_t k,
                                                                   float minScore) const;

    /** @brief Same as tryRetrieve(), with an empty result when the query embedding fails. */
    std::vector<domain::ScoredDocument> retrieve(const std::string& query,
                                                 const std::vector<domain::Document>& corpus,
                                                 std::size_t k,
                                                 float minScore) const;

    std::vector<domain::ScoredDocument> retrieve(const std::string& query,
                                                 const std::vector<domain::Document>& corpus) const {
        return retrieve(query, corpus, m_options.topK, m_options.minScore);
    }

    /** @brief Title repeated `titleRepeat` times, then the body prefix. */
    std::string weightedRepresentation(const domain::Document& doc) const;

    const RetrievalOptions& options() const { return m_options; }

private:
    std::optional<std::vector<float>> embedDocument(const domain::Document& doc, std::size_t queryDims) const;

    std::shared_ptr<infrastructure::EmbeddingCache> m_cache;
    RetrievalOptions m_options;
};

} // namespace agentrouter::application
