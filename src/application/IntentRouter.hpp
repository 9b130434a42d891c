/**
 * @file IntentRouter.hpp
 * @brief Two-signal query routing: keyword rules fused with an LLM classifier.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Routing.hpp"
#include "domain/TextGenerator.hpp"
#include "infrastructure/AgentRegistry.hpp"

namespace agentrouter::application {

struct RouterOptions {
    float goodThreshold = 0.8f;      ///< Rules at or above this skip the classifier.
    float perHitConfidence = 0.8f;   ///< Confidence contributed by one full-weight keyword.
    float ambiguityPenalty = 0.5f;   ///< Multiplier when two agents tie on keyword weight.
    double classifierTemperature = 0.0;
    int classifierMaxTokens = 128;
    float llmDefaultConfidence = 0.5f; ///< When the classifier omits a confidence.
    float bareLabelConfidence = 0.9f;  ///< When the classifier answers with a bare agent id.
};

/** @brief Keyword evidence for one agent. */
struct RuleScore {
    std::string agentId;
    double weight = 0.0;
    float confidence = 0.0f;
    std::vector<std::string> hits;
};

/**
 * @struct Classification
 * @brief Parsed classifier answer. An empty agentId means "no pertinent agent".
 */
struct Classification {
    std::optional<std::string> agentId;
    float confidence = 0.0f;
    std::string reason;
};

/**
 * @class IntentRouter
 * @brief Decides which agent should answer a query.
 *
 * Keyword rules run first. The classifier is consulted only when the best
 * rule confidence is below `goodThreshold`, and it can only name agents
 * present in the registry. Never throws for classifier failures.
 */
class IntentRouter {
public:
    IntentRouter(std::shared_ptr<const infrastructure::AgentRegistry> registry,
                 std::shared_ptr<domain::TextGenerator> classifier,
                 std::string classificationTemplate,
                 RouterOptions options = {});

    domain::RoutingDecision route(const std::string& query) const;

    /** @brief Agents with at least one keyword hit, best first (ties keep registry order). */
    std::vector<RuleScore> scoreRules(const std::string& query) const;

    /** @brief Asks the classifier. nullopt when it is absent, failed or answered out of schema. */
    std::optional<Classification> classify(const std::string& query) const;

    /** @brief Lenient parsing of the classifier output. */
    std::optional<Classification> parseClassification(const std::string& raw) const;

    /** @brief First balanced `{...}` span, honoring JSON strings. */
    static std::optional<std::string> ExtractFirstJsonObject(const std::string& text);

    const RouterOptions& options() const { return m_options; }

private:
    std::string renderAgentList() const;
    /** @brief Registered and enabled; other labels are never routed to. */
    bool isRoutableLabel(const std::string& label) const;

    std::shared_ptr<const infrastructure::AgentRegistry> m_registry;
    std::shared_ptr<domain::TextGenerator> m_classifier;
    std::string m_template;
    RouterOptions m_options;
};

} // namespace agentrouter::application
