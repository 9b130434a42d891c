/**
 * @file OllamaAdapter.hpp
 * @brief Adapter exposing a local Ollama server as the engine's AI providers.
 */

#pragma once
#include <string>
#include "domain/EmbeddingProvider.hpp"
#include "domain/TextGenerator.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace agentrouter::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string embeddingModel = "nomic-embed-text";
    std::string generationModel = "qwen2.5:7b";
    int readTimeoutSeconds = 120;
};

/**
 * @class OllamaAdapter
 * @brief Implements EmbeddingProvider and TextGenerator with the Ollama REST API.
 */
class OllamaAdapter : public domain::EmbeddingProvider, public domain::TextGenerator {
public:
    explicit OllamaAdapter(const OllamaSettings& settings);

    /** @see domain::EmbeddingProvider::embed */
    std::vector<float> embed(const std::string& text) override;

    /** @see domain::TextGenerator::generate */
    std::optional<std::string> generate(const std::string& prompt,
                                        double temperature,
                                        int maxTokens,
                                        bool forceJson = false) override;

private:
    OllamaSettings m_settings;
    OllamaClient m_client;
};

} // namespace agentrouter::infrastructure
