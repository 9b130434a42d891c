/**
 * @file PromptCatalog.hpp
 * @brief Opaque prompt templates with `{name}` placeholders.
 */

#pragma once

#include <map>
#include <string>

namespace agentrouter::infrastructure {

class PromptCatalog {
public:
    /** @param promptsDir Optional directory with `classification.txt` / `answer.txt` overrides. */
    explicit PromptCatalog(const std::string& promptsDir = "");

    /** @brief Placeholders: {agents}, {question}. */
    const std::string& classificationTemplate() const { return m_classification; }

    /** @brief Placeholders: {contexte}, {question}. */
    const std::string& answerTemplate() const { return m_answer; }

    /** @brief Replaces each `{name}` with vars[name]; substituted text is not rescanned. */
    static std::string Fill(const std::string& tmpl, const std::map<std::string, std::string>& vars);

    static std::string DefaultClassificationTemplate();
    static std::string DefaultAnswerTemplate();

private:
    std::string m_classification;
    std::string m_answer;
};

} // namespace agentrouter::infrastructure
