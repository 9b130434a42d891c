/**
 * @file IntentRouter.cpp
 * @brief Implementation of IntentRouter.
 */

#include "application/IntentRouter.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace agentrouter::application {

namespace {

// Lower-cased words joined by single spaces and padded, so that a padded
// keyword phrase only matches on whole words.
std::string PaddedWords(const std::string& text) {
    std::string out = " ";
    for (const auto& word : domain::TextUtils::Words(domain::TextUtils::ToLowerAscii(text))) {
        out += word;
        out += ' ';
    }
    return out;
}

bool IsNoneLabel(const std::string& label) {
    return label == "none" || label == "non_pertinent" || label == "aucun";
}

float Clamp01(double v) {
    return static_cast<float>(std::clamp(v, 0.0, 1.0));
}

void LogParseFailure(const std::string& message) {
    std::cerr << "[IntentRouter] " << domain::ErrorKindName(domain::ErrorKind::ClassificationParse)
              << ": " << message << std::endl;
}

} // namespace

IntentRouter::IntentRouter(std::shared_ptr<const infrastructure::AgentRegistry> registry,
                           std::shared_ptr<domain::TextGenerator> classifier,
                           std::string classificationTemplate,
                           RouterOptions options)
    : m_registry(std::move(registry)),
      m_classifier(std::move(classifier)),
      m_template(std::move(classificationTemplate)),
      m_options(options) {}

std::vector<RuleScore> IntentRouter::scoreRules(const std::string& query) const {
    std::vector<RuleScore> scores;
    const std::string padded = PaddedWords(query);

    for (const auto& agent : m_registry->agents()) {
        if (!agent.enabled) continue;

        RuleScore score;
        score.agentId = agent.id;
        for (const auto& [keyword, weight] : agent.keywords) {
            std::string needle = PaddedWords(keyword);
            if (needle.size() <= 1 || weight <= 0.0) continue;
            if (padded.find(needle) != std::string::npos) {
                score.weight += weight;
                score.hits.push_back(keyword);
            }
        }
        if (score.weight > 0.0) {
            score.confidence = Clamp01(1.0 - std::pow(1.0 - m_options.perHitConfidence, score.weight));
            scores.push_back(std::move(score));
        }
    }

    std::stable_sort(scores.begin(), scores.end(), [](const RuleScore& a, const RuleScore& b) {
        return a.weight > b.weight;
    });

    if (scores.size() > 1 && scores[0].weight == scores[1].weight) {
        scores[0].confidence = Clamp01(scores[0].confidence * m_options.ambiguityPenalty);
    }
    return scores;
}

std::string IntentRouter::renderAgentList() const {
    std::stringstream ss;
    for (const auto& agent : m_registry->agents()) {
        if (!agent.enabled) continue;
        ss << "- " << agent.id << " : " << agent.description << "\n";
    }
    return ss.str();
}

std::optional<std::string> IntentRouter::ExtractFirstJsonObject(const std::string& text) {
    auto start = text.find('{');
    if (start == std::string::npos) return std::nullopt;

    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (std::size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (inString) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') inString = false;
            continue;
        }
        if (c == '"') inString = true;
        else if (c == '{') ++depth;
        else if (c == '}' && --depth == 0) return text.substr(start, i - start + 1);
    }
    return std::nullopt;
}

std::optional<Classification> IntentRouter::parseClassification(const std::string& raw) const {
    std::string text = domain::TextUtils::StripCodeFence(domain::TextUtils::Trim(raw));
    if (text.empty()) {
        LogParseFailure("empty classifier output");
        return std::nullopt;
    }

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        auto span = ExtractFirstJsonObject(text);
        j = span ? json::parse(*span, nullptr, false) : json();
    }

    if (!j.is_object()) {
        // Bare label, e.g. `fiscalite` or `"none".`
        std::string label = domain::TextUtils::ToLowerAscii(domain::TextUtils::Trim(text));
        while (!label.empty() && std::string("\"'.`").find(label.back()) != std::string::npos) label.pop_back();
        while (!label.empty() && std::string("\"'`").find(label.front()) != std::string::npos) label.erase(0, 1);

        if (IsNoneLabel(label)) {
            return Classification{std::nullopt, m_options.bareLabelConfidence, "bare label"};
        }
        if (isRoutableLabel(label)) {
            return Classification{label, m_options.bareLabelConfidence, "bare label"};
        }
        LogParseFailure("no JSON object or known label in '" + domain::TextUtils::Utf8Prefix(text, 80) + "'");
        return std::nullopt;
    }

    auto agentIt = j.find("agent");
    if (agentIt == j.end() || !agentIt->is_string()) {
        LogParseFailure("missing string field 'agent'");
        return std::nullopt;
    }

    Classification result;
    result.confidence = m_options.llmDefaultConfidence;
    auto confIt = j.find("confidence");
    if (confIt != j.end() && confIt->is_number()) {
        result.confidence = Clamp01(confIt->get<double>());
    }
    auto reasonIt = j.find("reason");
    if (reasonIt != j.end() && reasonIt->is_string()) {
        result.reason = reasonIt->get<std::string>();
    }

    std::string label = domain::TextUtils::ToLowerAscii(domain::TextUtils::Trim(agentIt->get<std::string>()));
    if (IsNoneLabel(label)) {
        return result;
    }
    if (!isRoutableLabel(label)) {
        LogParseFailure("label '" + label + "' is not an enabled agent");
        return std::nullopt;
    }
    result.agentId = label;
    return result;
}

bool IntentRouter::isRoutableLabel(const std::string& label) const {
    const domain::AgentDescriptor* agent = m_registry->find(label);
    return agent && agent->enabled;
}

std::optional<Classification> IntentRouter::classify(const std::string& query) const {
    if (!m_classifier) return std::nullopt;

    std::string prompt = infrastructure::PromptCatalog::Fill(m_template, {
        {"agents", renderAgentList()},
        {"question", query}
    });

    auto raw = m_classifier->generate(prompt, m_options.classifierTemperature, m_options.classifierMaxTokens, true);
    if (!raw) {
        std::cerr << "[IntentRouter] Classifier unavailable, relying on rules." << std::endl;
        return std::nullopt;
    }
    return parseClassification(*raw);
}

domain::RoutingDecision IntentRouter::route(const std::string& query) const {
    auto rules = scoreRules(query);
    const RuleScore* bestRule = rules.empty() ? nullptr : &rules.front();

    domain::RoutingDecision decision;
    if (bestRule) {
        decision.rulesConfidence = bestRule->confidence;
        if (bestRule->confidence >= m_options.goodThreshold) {
            decision.targetAgent = bestRule->agentId;
            decision.confidence = bestRule->confidence;
            decision.method = domain::RoutingMethod::Rules;
            decision.rationale = "keywords: " + bestRule->hits.front();
            for (std::size_t i = 1; i < bestRule->hits.size(); ++i) decision.rationale += ", " + bestRule->hits[i];
            return decision;
        }
    }

    auto llm = classify(query);
    const bool llmHasAgent = llm && llm->agentId;
    if (llm) decision.llmConfidence = llm->confidence;

    if (!bestRule && !llmHasAgent) {
        auto none = domain::RoutingDecision::NoneDecision(llm ? "classifier: no pertinent agent" : "no keyword or classifier match");
        none.llmConfidence = decision.llmConfidence;
        return none;
    }

    if (bestRule && llmHasAgent && bestRule->agentId == *llm->agentId) {
        decision.targetAgent = bestRule->agentId;
        decision.confidence = std::max(bestRule->confidence, llm->confidence);
        decision.method = domain::RoutingMethod::Fused;
        decision.rationale = "rules and classifier agree";
        return decision;
    }

    const bool useRules = bestRule && (!llmHasAgent || bestRule->confidence >= llm->confidence);
    if (useRules) {
        decision.targetAgent = bestRule->agentId;
        decision.confidence = bestRule->confidence;
        decision.method = domain::RoutingMethod::Rules;
        decision.rationale = "keywords: " + bestRule->hits.front();
    } else {
        decision.targetAgent = *llm->agentId;
        decision.confidence = llm->confidence;
        decision.method = domain::RoutingMethod::Llm;
        decision.rationale = llm->reason.empty() ? "classifier" : llm->reason;
    }
    return decision;
}

} // namespace agentrouter::application
