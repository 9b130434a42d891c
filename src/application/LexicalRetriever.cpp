/**
 * @file LexicalRetriever.cpp
 * @brief Keyword scoring used when the query cannot be embedded.
 */

#include "application/LexicalRetriever.hpp"
#include "domain/TextUtils.hpp"
#include <algorithm>
#include <set>

namespace agentrouter::application {

namespace {

const std::set<std::string>& Stopwords() {
    static const std::set<std::string> words = {
        "le", "la", "les", "un", "une", "des", "de", "du", "et", "ou", "est", "sont",
        "pour", "dans", "sur", "avec", "par", "que", "qui", "quoi", "comment", "quel",
        "quelle", "quels", "quelles", "mon", "ma", "mes", "ton", "ta", "tes", "son",
        "sa", "ses", "notre", "nos", "votre", "vos", "leur", "leurs", "ce", "cette",
        "ces", "il", "elle", "ils", "elles", "nous", "vous", "je", "tu", "on", "au",
        "aux", "pas", "plus", "moins", "tout", "tous", "toute", "toutes", "faire",
        "fait", "peut", "doit", "dois", "avoir", "être", "etre", "quand", "combien",
        "pourquoi", "entre", "sans", "sous", "chez", "mais", "donc", "car"};
    return words;
}

} // namespace

LexicalRetriever::LexicalRetriever(LexicalOptions options) : m_options(options) {}

std::vector<std::string> LexicalRetriever::extractKeywords(const std::string& query) const {
    std::vector<std::string> keywords;
    std::set<std::string> seen;
    for (const auto& word : domain::TextUtils::Words(domain::TextUtils::ToLowerAscii(query))) {
        if (word.size() < m_options.minKeywordLength) continue;
        if (Stopwords().count(word)) continue;
        if (seen.insert(word).second) keywords.push_back(word);
    }
    return keywords;
}

std::vector<domain::ScoredDocument> LexicalRetriever::retrieve(const std::string& query,
                                                               const std::vector<domain::Document>& corpus,
                                                               std::size_t k,
                                                               float minScore) const {
    std::vector<domain::ScoredDocument> result;
    auto keywords = extractKeywords(query);
    if (keywords.empty() || k == 0) return result;

    std::vector<std::pair<std::size_t, double>> raw;
    double best = 0.0;
    for (std::size_t i = 0; i < corpus.size(); ++i) {
        std::string title = domain::TextUtils::ToLowerAscii(corpus[i].title);
        std::string body = domain::TextUtils::ToLowerAscii(corpus[i].bodyText);

        double score = 0.0;
        for (const auto& kw : keywords) {
            if (title.find(kw) != std::string::npos) score += m_options.titleBonus;
            score += static_cast<double>(domain::TextUtils::CountOccurrences(body, kw));
        }
        if (score > 0.0) {
            raw.emplace_back(i, score);
            best = std::max(best, score);
        }
    }

    for (const auto& [index, score] : raw) {
        float normalized = static_cast<float>(score / best);
        if (normalized >= minScore) {
            result.push_back({corpus[index], normalized});
        }
    }

    std::stable_sort(result.begin(), result.end(), [](const domain::ScoredDocument& a, const domain::ScoredDocument& b) {
        return a.score > b.score;
    });
    if (result.size() > k) result.resize(k);
    return result;
}

} // namespace agentrouter::application
