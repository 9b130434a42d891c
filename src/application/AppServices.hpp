/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/IntentRouter.hpp"
#include "application/OrchestrationController.hpp"
#include "application/ResponderService.hpp"
#include "application/SemanticRetriever.hpp"
#include "infrastructure/AgentRegistry.hpp"
#include "infrastructure/DocumentCorpus.hpp"
#include "infrastructure/EmbeddingCache.hpp"

namespace agentrouter::application {

struct AppServices {
    std::shared_ptr<infrastructure::EmbeddingCache> embeddingCache;
    std::shared_ptr<infrastructure::DocumentCorpus> corpus;
    std::shared_ptr<const infrastructure::AgentRegistry> registry;
    std::shared_ptr<SemanticRetriever> retriever;
    std::shared_ptr<IntentRouter> router;
    std::unique_ptr<ResponderService> responder;
    std::unique_ptr<OrchestrationController> controller;
};

} // namespace agentrouter::application
