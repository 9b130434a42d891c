/**
 * @file ResponderService.hpp
 * @brief Local responder pipeline: corpus -> retrieval -> context -> generation.
 */

#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "application/ContextAssembler.hpp"
#include "application/LexicalRetriever.hpp"
#include "application/SemanticRetriever.hpp"
#include "domain/TextGenerator.hpp"
#include "infrastructure/DocumentCorpus.hpp"

namespace agentrouter::application {

struct ResponderOptions {
    double answerTemperature = 0.3;
    int answerMaxTokens = 1024;
    std::size_t maxSources = 3;
};

/**
 * @class ResponderService
 * @brief Answers a question from the document corpus, the way a downstream agent does.
 *
 * Falls back to keyword search when the query cannot be embedded, and skips
 * generation entirely when no document qualifies.
 */
class ResponderService {
public:
    ResponderService(std::shared_ptr<infrastructure::DocumentCorpus> corpus,
                     std::shared_ptr<SemanticRetriever> retriever,
                     LexicalRetriever lexical,
                     ContextAssembler assembler,
                     std::shared_ptr<domain::TextGenerator> generator,
                     std::string answerTemplate,
                     ResponderOptions options = {});

    /** @return `{question, reponse, documents_trouves, sources[{titre,url}]}`, plus `erreur` on generation failure. */
    nlohmann::json answer(const std::string& question) const;

    /** @brief Ranked documents for the question (semantic, else lexical). */
    std::vector<domain::ScoredDocument> rank(const std::string& question) const;

    static constexpr const char* kNoInformation =
        "Je n'ai pas trouvé d'information pertinente dans ma base documentaire pour répondre à cette question.";

private:
    std::shared_ptr<infrastructure::DocumentCorpus> m_corpus;
    std::shared_ptr<SemanticRetriever> m_retriever;
    LexicalRetriever m_lexical;
    ContextAssembler m_assembler;
    std::shared_ptr<domain::TextGenerator> m_generator;
    std::string m_template;
    ResponderOptions m_options;
};

} // namespace agentrouter::application
