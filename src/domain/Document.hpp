/**
 * @file Document.hpp
 * @brief Domain entities for the retrieval corpus.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace agentrouter::domain {

/**
 * @struct Document
 * @brief A corpus entry produced by the ingestion pipeline.
 *
 * Identity is `id`, derived from `sourceUrl`. Documents are read-only for the
 * retrieval core; a corpus refresh replaces them wholesale.
 */
struct Document {
    std::string id;
    std::string title;
    std::string bodyText;
    std::string sourceUrl;
    std::size_t sizeChars = 0;                   ///< Byte length of bodyText.
    std::optional<std::vector<float>> embedding; ///< Precomputed by ingestion, if any.
};

/**
 * @struct ScoredDocument
 * @brief A document ranked against one query. Score is always in [0, 1].
 */
struct ScoredDocument {
    Document document;
    float score = 0.0f;
};

/**
 * @struct StoredObject
 * @brief Raw object as listed by a DocumentStore, before parsing.
 */
struct StoredObject {
    std::string id;
    std::string rawBytes;
};

/** @brief Derives a stable document id from its source URL. */
std::string DeriveDocumentId(const std::string& sourceUrl);

} // namespace agentrouter::domain
