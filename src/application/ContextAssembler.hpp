/**
 * @file ContextAssembler.hpp
 * @brief Application service that renders retrieved documents into a bounded prompt context.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Document.hpp"

namespace agentrouter::application {

struct ContextOptions {
    std::size_t maxTotalChars = 3000;
    std::size_t docBodyChars = 800;        ///< Preferred body length per document.
    std::size_t docBodyFallbackChars = 400; ///< Used when the preferred length does not fit.
    double sentenceCutRatio = 0.7;          ///< A '.' must sit past this share of the limit to cut there.
};

/**
 * @class ContextAssembler
 * @brief Concatenates ranked documents as labelled blocks within a character budget.
 *
 * Each block carries the title, source URL and a cleaned, truncated body.
 * Rank order is preserved; documents that no longer fit are dropped.
 */
class ContextAssembler {
public:
    explicit ContextAssembler(ContextOptions options = {});

    /**
     * @brief Builds the context text.
     * @return kNoDocuments when `documents` is empty; otherwise at most
     *         `maxTotalChars` bytes.
     */
    std::string assemble(const std::vector<domain::ScoredDocument>& documents, std::size_t maxTotalChars) const;

    std::string assemble(const std::vector<domain::ScoredDocument>& documents) const {
        return assemble(documents, m_options.maxTotalChars);
    }

    /** @brief Cuts at the last sentence end past the ratio, else hard-cuts and appends "...". */
    std::string truncateBody(const std::string& body, std::size_t limit) const;

    /** @brief Drops markdown links, tags and raw URLs in one linear pass, then collapses whitespace. */
    static std::string CleanBody(const std::string& body);

    static constexpr const char* kNoDocuments = "no documents";

    /** Only this many times the body budget is cleaned; markup rarely shrinks text more. */
    static constexpr std::size_t kCleanWindowFactor = 4;

private:
    static std::string renderBlock(std::size_t index, const domain::Document& doc, const std::string& body);

    ContextOptions m_options;
};

} // namespace agentrouter::application
