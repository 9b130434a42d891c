/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include "domain/Errors.hpp"
#include <iostream>

namespace agentrouter::infrastructure {

OllamaAdapter::OllamaAdapter(const OllamaSettings& settings)
    : m_settings(settings),
      m_client(settings.host, settings.port, settings.readTimeoutSeconds) {}

std::vector<float> OllamaAdapter::embed(const std::string& text) {
    auto vec = m_client.getEmbedding(m_settings.embeddingModel, text);
    if (vec.empty()) {
        throw domain::EmbeddingProviderError("Ollama returned no embedding (model " + m_settings.embeddingModel + ")");
    }
    return vec;
}

std::optional<std::string> OllamaAdapter::generate(const std::string& prompt,
                                                   double temperature,
                                                   int maxTokens,
                                                   bool forceJson) {
    std::cerr << "[OllamaAdapter] Sending request to " << m_settings.generationModel << " (JSON=" << forceJson << ")"
              << " PromptSize=" << prompt.size() << " bytes" << std::endl;
    return m_client.generate(m_settings.generationModel, prompt, temperature, maxTokens, forceJson);
}

} // namespace agentrouter::infrastructure
