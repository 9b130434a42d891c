/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the engine configuration (settings.json).
 *
 * Provides a unified way to access tunables like thresholds, timeouts and
 * provider endpoints without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "application/ContextAssembler.hpp"
#include "application/IntentRouter.hpp"
#include "application/LexicalRetriever.hpp"
#include "application/ResponderService.hpp"
#include "application/SemanticRetriever.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/OutboundInvoker.hpp"
#include "infrastructure/PathUtils.hpp"

namespace agentrouter::infrastructure {

/**
 * @struct EngineConfig
 * @brief Every tunable of the engine, with built-in defaults.
 */
struct EngineConfig {
    application::RetrievalOptions retrieval;
    application::LexicalOptions lexical;
    application::ContextOptions context;
    std::chrono::seconds corpusTtl{3600};
    std::string corpusPrefix;

    EmbeddingCacheOptions embedding;
    std::string embeddingCacheFile = PathUtils::GetEmbeddingCachePath().string(); ///< Empty: no persistence.

    application::RouterOptions router;
    InvokerOptions invoker;

    OllamaSettings provider;
    application::ResponderOptions responder;

    std::chrono::milliseconds requestBudget{120000};

    std::string corpusDir = "corpus";
    std::string agentsFile;
    std::string promptsDir;
    std::string identityToken;
};

class ConfigLoader {
public:
    /**
     * @brief Loads settings from `path`, then applies environment overrides.
     * A missing file yields the defaults.
     * @throws domain::ConfigurationError on unreadable JSON or wrongly-typed keys.
     */
    static EngineConfig Load(const std::string& path);

    /** @brief Builds a config from a parsed settings document. Unknown keys are ignored. */
    static EngineConfig FromJson(const nlohmann::json& settings);

    /** @brief AGENTROUTER_OLLAMA_HOST/PORT, AGENTROUTER_CORPUS_DIR, AGENTROUTER_AGENTS_FILE, AGENTROUTER_IDENTITY_TOKEN. */
    static void ApplyEnvironment(EngineConfig& config);

    /** @brief $XDG_CONFIG_HOME/AgentRouter/settings.json */
    static std::string DefaultSettingsPath();
};

} // namespace agentrouter::infrastructure
