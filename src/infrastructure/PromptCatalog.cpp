#include "infrastructure/PromptCatalog.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace agentrouter::infrastructure {

namespace {

std::string ReadOverride(const std::string& dir, const char* name, std::string fallback) {
    if (dir.empty()) return fallback;
    std::filesystem::path p = std::filesystem::path(dir) / name;
    if (!std::filesystem::exists(p)) return fallback;

    std::ifstream f(p);
    if (!f.is_open()) {
        std::cerr << "[PromptCatalog] Cannot read " << p << ", using built-in template." << std::endl;
        return fallback;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

PromptCatalog::PromptCatalog(const std::string& promptsDir)
    : m_classification(ReadOverride(promptsDir, "classification.txt", DefaultClassificationTemplate())),
      m_answer(ReadOverride(promptsDir, "answer.txt", DefaultAnswerTemplate())) {}

std::string PromptCatalog::Fill(const std::string& tmpl, const std::map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(tmpl.size());
    std::size_t pos = 0;
    while (pos < tmpl.size()) {
        auto open = tmpl.find('{', pos);
        if (open == std::string::npos) break;
        auto close = tmpl.find('}', open + 1);
        if (close == std::string::npos) break;

        out.append(tmpl, pos, open - pos);
        auto it = vars.find(tmpl.substr(open + 1, close - open - 1));
        if (it != vars.end()) {
            out += it->second;
        } else {
            out.append(tmpl, open, close - open + 1);
        }
        pos = close + 1;
    }
    out.append(tmpl, pos, std::string::npos);
    return out;
}

std::string PromptCatalog::DefaultClassificationTemplate() {
    return
        "Tu es un classificateur de questions pour un système multi-agents.\n"
        "AGENTS DISPONIBLES :\n{agents}\n"
        "Réponds UNIQUEMENT avec un JSON : {\"agent\": \"<id ou none>\", \"confidence\": <0..1>, \"reason\": \"...\"}\n"
        "QUESTION : {question}\n";
}

std::string PromptCatalog::DefaultAnswerTemplate() {
    return
        "Réponds EXCLUSIVEMENT à partir du contexte documentaire ci-dessous et cite les sources.\n\n"
        "CONTEXTE DOCUMENTAIRE :\n{contexte}\n\n"
        "QUESTION DE L'UTILISATEUR :\n{question}\n\n"
        "RÉPONSE :";
}

} // namespace agentrouter::infrastructure
