/**
 * @file OrchestrationController.cpp
 * @brief Implementation of OrchestrationController.
 */

#include "application/OrchestrationController.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <iostream>

using json = nlohmann::json;

namespace agentrouter::application {

namespace {

json BaseEnvelope(const std::string& question) {
    return {
        {"question", question},
        {"agent_utilise", "aucun"},
        {"reponse", ""},
        {"sources", json::array()},
        {"documents_trouves", 0},
        {"confiance", 0.0},
        {"methode", "none"},
        {"agent_disponible", true}
    };
}

json WithError(json envelope, const std::string& kind, const std::string& message, const std::string& friendly) {
    envelope["reponse"] = friendly;
    envelope["erreur"] = {{"kind", kind}, {"message", message}};
    return envelope;
}

json TimeoutEnvelope(json envelope, const std::string& message) {
    return WithError(std::move(envelope), domain::ErrorKindName(domain::ErrorKind::DeadlineExceeded), message,
                     "Le délai de traitement de votre question a été dépassé. Veuillez réessayer.");
}

} // namespace

OrchestrationController::OrchestrationController(std::shared_ptr<const infrastructure::AgentRegistry> registry,
                                                 std::shared_ptr<const IntentRouter> router,
                                                 std::shared_ptr<infrastructure::OutboundInvoker> invoker,
                                                 ControllerOptions options)
    : m_registry(std::move(registry)),
      m_router(std::move(router)),
      m_invoker(std::move(invoker)),
      m_options(options) {}

json OrchestrationController::handle(const std::string& question, const std::optional<json>& context) const {
    return handle(question, context, domain::Deadline::After(m_options.requestBudget));
}

json OrchestrationController::handle(const std::string& question,
                                     const std::optional<json>& context,
                                     const domain::Deadline& deadline) const {
    json envelope = BaseEnvelope(question);
    if (domain::TextUtils::Trim(question).empty()) {
        return WithError(std::move(envelope), "invalid_request", "question is empty",
                         "Veuillez poser une question.");
    }

    domain::RoutingDecision decision = m_router->route(question);
    envelope["methode"] = domain::RoutingMethodName(decision.method);
    envelope["confiance"] = decision.confidence;
    std::cerr << "[OrchestrationController] Routing: " << decision.targetAgent.value_or("none")
              << " (" << domain::RoutingMethodName(decision.method) << ", " << decision.confidence << ")" << std::endl;

    if (deadline.expired()) {
        return TimeoutEnvelope(std::move(envelope), "deadline expired during routing");
    }

    if (!decision.targetAgent) {
        envelope["reponse"] = "Je n'ai pas compris votre question. Pouvez-vous la reformuler en précisant le domaine "
                              "(fiscalité, comptabilité, RH, juridique, aides) ?";
        return envelope;
    }

    const std::string& agentId = *decision.targetAgent;
    envelope["agent_utilise"] = agentId;
    const domain::AgentDescriptor* agent = m_registry->find(agentId);
    if (!agent || !agent->isAvailable()) {
        envelope["agent_disponible"] = false;
        envelope["reponse"] = "Votre question relève du domaine '" + agentId +
                              "', mais l'agent correspondant n'est pas encore disponible.";
        return envelope;
    }

    return invokeAgent(std::move(envelope), *agent, question, context, deadline);
}

json OrchestrationController::invokeAgent(json envelope,
                                          const domain::AgentDescriptor& agent,
                                          const std::string& question,
                                          const std::optional<json>& context,
                                          const domain::Deadline& deadline) const {
    infrastructure::InvokeResult result;
    try {
        result = m_invoker->invoke(agent, infrastructure::OutboundInvoker::BuildPayload(agent, question, context), deadline);
    } catch (const domain::AgentAuthError& e) {
        std::cerr << "[OrchestrationController] Auth failure for " << agent.id << ": " << e.what() << std::endl;
        return WithError(std::move(envelope), e.kindName(), e.what(),
                         "L'agent spécialisé a refusé la requête (autorisation). L'équipe technique a été notifiée.");
    } catch (const domain::AgentUnreachableError& e) {
        std::cerr << "[OrchestrationController] " << agent.id << " unreachable: " << e.what() << std::endl;
        return WithError(std::move(envelope), e.kindName(), e.what(),
                         "L'agent spécialisé est momentanément injoignable. Veuillez réessayer plus tard.");
    } catch (const domain::DeadlineExceededError& e) {
        std::cerr << "[OrchestrationController] " << agent.id << ": " << e.what() << std::endl;
        return TimeoutEnvelope(std::move(envelope), e.what());
    } catch (const domain::AgentRouterError& e) {
        std::cerr << "[OrchestrationController] " << agent.id << " failed (" << e.kindName() << "): " << e.what() << std::endl;
        return WithError(std::move(envelope), e.kindName(), e.what(),
                         "Une erreur est survenue lors de l'appel à l'agent spécialisé.");
    }

    if (result.statusCode < 200 || result.statusCode >= 300) {
        std::cerr << "[OrchestrationController] " << agent.id << " returned HTTP " << result.statusCode << std::endl;
        return WithError(std::move(envelope), "agent_error",
                         "agent returned HTTP " + std::to_string(result.statusCode),
                         "L'agent spécialisé a rencontré une erreur. Veuillez réessayer plus tard.");
    }

    domain::NormalizedResponse normalized = m_normalizer.normalize(result.body);
    envelope["reponse"] = normalized.answerText.empty() ? "Aucune réponse générée" : normalized.answerText;

    json sources = json::array();
    for (const auto& src : normalized.sources) {
        sources.push_back({{"titre", src.title}, {"url", src.url}});
    }
    envelope["sources"] = std::move(sources);

    json extras = normalized.extraFields;
    envelope["documents_trouves"] = normalized.sources.size();
    for (const char* key : {"documents_trouves", "chunks_trouves"}) {
        auto it = extras.find(key);
        if (it != extras.end() && it->is_number()) {
            envelope["documents_trouves"] = *it;
            extras.erase(it);
            break;
        }
    }
    extras.erase("question");
    if (!extras.empty()) {
        envelope["details"] = std::move(extras);
    }
    return envelope;
}

} // namespace agentrouter::application
