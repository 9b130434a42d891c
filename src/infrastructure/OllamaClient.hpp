/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace agentrouter::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434, int readTimeoutSeconds = 120);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& prompt,
                                        double temperature,
                                        int maxTokens,
                                        bool forceJson = false);

    /** @brief Sends a POST request to /api/embeddings. Empty on failure. */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text);

private:
    std::string m_host;
    int m_port;
    int m_readTimeoutSeconds;
};

} // namespace agentrouter::infrastructure
