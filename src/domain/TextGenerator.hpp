/**
 * @file TextGenerator.hpp
 * @brief Interface for the external text-generation capability.
 */

#pragma once
#include <string>
#include <optional>

namespace agentrouter::domain {

/**
 * @class TextGenerator
 * @brief Used for both classification (low temperature, JSON) and answer synthesis.
 */
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    /**
     * @brief Generates a completion for the prompt.
     * @param prompt Fully rendered prompt.
     * @param temperature Sampling temperature.
     * @param maxTokens Upper bound on generated tokens.
     * @param forceJson Ask the provider to constrain output to JSON.
     * @return The generated text, or nullopt if generation failed.
     */
    virtual std::optional<std::string> generate(const std::string& prompt,
                                                double temperature,
                                                int maxTokens,
                                                bool forceJson = false) = 0;
};

} // namespace agentrouter::domain
