/**
 * @file EmbeddingProvider.hpp
 * @brief Interface for the external embedding capability.
 */

#pragma once
#include <string>
#include <vector>

namespace agentrouter::domain {

/**
 * @class EmbeddingProvider
 * @brief Turns text into a dense vector.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Embeds the given text.
     * @throws EmbeddingProviderError when the provider fails or returns nothing.
     */
    virtual std::vector<float> embed(const std::string& text) = 0;
};

} // namespace agentrouter::domain
