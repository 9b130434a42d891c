/**
 * @file LexicalRetriever.hpp
 * @brief Keyword-overlap ranking, used when the query cannot be embedded.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Document.hpp"

namespace agentrouter::application {

struct LexicalOptions {
    double titleBonus = 3.0;            ///< Added once per keyword found in the title.
    std::size_t minKeywordLength = 3;
};

class LexicalRetriever {
public:
    explicit LexicalRetriever(LexicalOptions options = {});

    /** @brief Lower-cased query words minus French stopwords and short tokens, deduplicated. */
    std::vector<std::string> extractKeywords(const std::string& query) const;

    /**
     * @brief Scores each keyword by a title bonus plus its body occurrences,
     * normalized by the best score so results stay in [0, 1].
     */
    std::vector<domain::ScoredDocument> retrieve(const std::string& query,
                                                 const std::vector<domain::Document>& corpus,
                                                 std::size_t k,
                                                 float minScore) const;

private:
    LexicalOptions m_options;
};

} // namespace agentrouter::application
