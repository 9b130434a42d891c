/**
 * @file ResponderService.cpp
 * @brief Implementation of ResponderService.
 */

#include "application/ResponderService.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <iostream>

using json = nlohmann::json;

namespace agentrouter::application {

ResponderService::ResponderService(std::shared_ptr<infrastructure::DocumentCorpus> corpus,
                                   std::shared_ptr<SemanticRetriever> retriever,
                                   LexicalRetriever lexical,
                                   ContextAssembler assembler,
                                   std::shared_ptr<domain::TextGenerator> generator,
                                   std::string answerTemplate,
                                   ResponderOptions options)
    : m_corpus(std::move(corpus)),
      m_retriever(std::move(retriever)),
      m_lexical(std::move(lexical)),
      m_assembler(std::move(assembler)),
      m_generator(std::move(generator)),
      m_template(std::move(answerTemplate)),
      m_options(options) {}

std::vector<domain::ScoredDocument> ResponderService::rank(const std::string& question) const {
    auto snapshot = m_corpus->load();
    const auto& docs = *snapshot;
    if (docs.empty()) {
        std::cerr << "[ResponderService] Corpus is empty." << std::endl;
        return {};
    }

    const auto& opts = m_retriever->options();
    auto ranked = m_retriever->tryRetrieve(question, docs, opts.topK, opts.minScore);
    if (ranked) return *ranked;

    std::cerr << "[ResponderService] Falling back to keyword search." << std::endl;
    return m_lexical.retrieve(question, docs, opts.topK, opts.minScore);
}

json ResponderService::answer(const std::string& question) const {
    json out = {
        {"question", question},
        {"documents_trouves", 0},
        {"sources", json::array()}
    };

    auto ranked = rank(question);
    out["documents_trouves"] = ranked.size();

    std::string context = m_assembler.assemble(ranked);
    if (context == ContextAssembler::kNoDocuments) {
        out["reponse"] = kNoInformation;
        return out;
    }

    for (std::size_t i = 0; i < ranked.size() && i < m_options.maxSources; ++i) {
        out["sources"].push_back({{"titre", ranked[i].document.title}, {"url", ranked[i].document.sourceUrl}});
    }

    std::string prompt = infrastructure::PromptCatalog::Fill(m_template, {
        {"contexte", context},
        {"question", question}
    });

    std::optional<std::string> generated;
    if (m_generator) {
        generated = m_generator->generate(prompt, m_options.answerTemperature, m_options.answerMaxTokens);
    }
    if (!generated) {
        std::cerr << "[ResponderService] Generation failed." << std::endl;
        out["reponse"] = "Erreur lors de la génération de la réponse.";
        out["erreur"] = {{"kind", "generation"}, {"message", "text generation provider returned no output"}};
        return out;
    }

    out["reponse"] = domain::TextUtils::Trim(*generated);
    return out;
}

} // namespace agentrouter::application
