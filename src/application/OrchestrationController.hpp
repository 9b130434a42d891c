/**
 * @file OrchestrationController.hpp
 * @brief Sequences routing, the outbound call and normalization into an answer envelope.
 */

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "application/IntentRouter.hpp"
#include "application/ResponseNormalizer.hpp"
#include "domain/Deadline.hpp"
#include "infrastructure/AgentRegistry.hpp"
#include "infrastructure/OutboundInvoker.hpp"

namespace agentrouter::application {

struct ControllerOptions {
    std::chrono::milliseconds requestBudget{120000};
};

/**
 * @class OrchestrationController
 * @brief Entry point for one inbound question.
 *
 * Always returns an envelope; user-visible errors carry
 * `erreur: {kind, message}` with a friendly `reponse`.
 */
class OrchestrationController {
public:
    OrchestrationController(std::shared_ptr<const infrastructure::AgentRegistry> registry,
                            std::shared_ptr<const IntentRouter> router,
                            std::shared_ptr<infrastructure::OutboundInvoker> invoker,
                            ControllerOptions options = {});

    /** @brief Handles the question within the configured request budget. */
    nlohmann::json handle(const std::string& question,
                          const std::optional<nlohmann::json>& context = std::nullopt) const;

    nlohmann::json handle(const std::string& question,
                          const std::optional<nlohmann::json>& context,
                          const domain::Deadline& deadline) const;

private:
    nlohmann::json invokeAgent(nlohmann::json envelope,
                               const domain::AgentDescriptor& agent,
                               const std::string& question,
                               const std::optional<nlohmann::json>& context,
                               const domain::Deadline& deadline) const;

    std::shared_ptr<const infrastructure::AgentRegistry> m_registry;
    std::shared_ptr<const IntentRouter> m_router;
    std::shared_ptr<infrastructure::OutboundInvoker> m_invoker;
    ResponseNormalizer m_normalizer;
    ControllerOptions m_options;
};

} // namespace agentrouter::application
