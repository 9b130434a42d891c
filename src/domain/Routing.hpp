/**
 * @file Routing.hpp
 * @brief Domain types for intent routing: agent registry entries and decisions.
 */

#pragma once
#include <string>
#include <map>
#include <optional>

namespace agentrouter::domain {

/**
 * @struct AgentDescriptor
 * @brief Registry entry for a downstream responder. Never mutated by the engine.
 */
struct AgentDescriptor {
    std::string id;
    std::string endpointUrl;          ///< Empty when the agent is not deployed yet.
    bool requiresAuth = false;
    bool needsExtraContext = false;
    bool enabled = true;
    std::string description;          ///< Shown to the classifier.
    std::string payloadKey = "question"; ///< "question" or "user_query" depending on the agent family.
    std::map<std::string, double> keywords; ///< Lower-cased keyword -> weight.

    bool isAvailable() const { return enabled && !endpointUrl.empty(); }
};

/**
 * @enum RoutingMethod
 * @brief Provenance of a routing decision.
 */
enum class RoutingMethod {
    Rules, ///< Keyword evidence alone.
    Llm,   ///< Classifier alone.
    Fused, ///< Both signals agreed.
    None   ///< Nobody produced a candidate.
};

inline const char* RoutingMethodName(RoutingMethod method) {
    switch (method) {
        case RoutingMethod::Rules: return "rules";
        case RoutingMethod::Llm: return "llm";
        case RoutingMethod::Fused: return "fused";
        case RoutingMethod::None: return "none";
    }
    return "none";
}

/**
 * @struct RoutingDecision
 * @brief Outcome of routing one query.
 *
 * `targetAgent` is empty if and only if `method == RoutingMethod::None`.
 * `confidence` is in [0, 1].
 */
struct RoutingDecision {
    std::optional<std::string> targetAgent;
    float confidence = 0.0f;
    RoutingMethod method = RoutingMethod::None;
    std::string rationale;
    float rulesConfidence = 0.0f;
    float llmConfidence = 0.0f;

    static RoutingDecision NoneDecision(const std::string& rationale) {
        RoutingDecision d;
        d.rationale = rationale;
        return d;
    }
};

} // namespace agentrouter::domain
