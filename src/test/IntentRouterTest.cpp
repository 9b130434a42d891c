#include <cassert>
#include <iostream>
#include <memory>
#include "application/IntentRouter.hpp"
#include "infrastructure/AgentRegistry.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "TestDoubles.hpp"

using namespace agentrouter;

namespace {

std::shared_ptr<const infrastructure::AgentRegistry> Registry() {
    return std::make_shared<infrastructure::AgentRegistry>(infrastructure::AgentRegistry::WithDefaults());
}

application::IntentRouter MakeRouter(std::shared_ptr<test::ScriptedGenerator> classifier,
                                     application::RouterOptions options = {}) {
    return application::IntentRouter(Registry(), classifier,
                                     infrastructure::PromptCatalog::DefaultClassificationTemplate(), options);
}

void TestStrongRulesSkipClassifier() {
    std::cout << "[Test] Unambiguous keywords never call the classifier..." << std::endl;
    auto classifier = std::make_shared<test::ScriptedGenerator>();
    auto router = MakeRouter(classifier);

    auto decision = router.route("C'est quoi la TVA ?");
    assert(decision.targetAgent && *decision.targetAgent == "fiscalite");
    assert(decision.method == domain::RoutingMethod::Rules);
    assert(decision.confidence >= router.options().goodThreshold);
    assert(decision.confidence <= 1.0f);
    assert(classifier->calls == 0);

    decision = router.route("Quel est le montant de la CFE et de la CVAE ?");
    assert(*decision.targetAgent == "fiscalite");
    assert(classifier->calls == 0);
    std::cout << "[PASS] Rules short-circuit" << std::endl;
}

void TestWholeWordMatching() {
    std::cout << "[Test] Keywords match whole words only..." << std::endl;
    auto router = MakeRouter(nullptr);
    // "rh" must not match inside "rhum", nor "tva" inside "tvaxx".
    assert(router.scoreRules("Une question sur le rhum et tvaxx").empty());
    auto scores = router.scoreRules("Mon bulletin de paie");
    assert(!scores.empty());
    assert(scores[0].agentId == "ressources_humaines");
    std::cout << "[PASS] Whole words" << std::endl;
}

void TestClassifierFusion() {
    std::cout << "[Test] Weak rules consult the classifier and fuse..." << std::endl;
    auto classifier = std::make_shared<test::ScriptedGenerator>(std::vector<std::optional<std::string>>{
        std::string(R"({"agent": "aides", "confidence": 0.95, "reason": "subventions"})"),
        std::string(R"({"agent": "juridique", "confidence": 0.4})")
    });
    auto router = MakeRouter(classifier);

    // "aide" alone is a weak keyword for "aides".
    auto decision = router.route("Quelle aide pour mon projet ?");
    assert(classifier->calls == 1);
    assert(classifier->lastForceJson);
    assert(classifier->lastPrompt.find("Quelle aide pour mon projet ?") != std::string::npos);
    assert(classifier->lastPrompt.find("- fiscalite : ") != std::string::npos);
    assert(decision.method == domain::RoutingMethod::Fused);
    assert(*decision.targetAgent == "aides");
    assert(decision.confidence == 0.95f);

    // Disagreement: the higher confidence wins, here the rules.
    decision = router.route("Quelle aide pour mon projet ?");
    assert(decision.method == domain::RoutingMethod::Rules);
    assert(*decision.targetAgent == "aides");
    assert(decision.llmConfidence == 0.4f);
    std::cout << "[PASS] Fusion" << std::endl;
}

void TestUnknownLabelIsDiscarded() {
    std::cout << "[Test] Unrecognized classifier labels fall back to none..." << std::endl;
    auto classifier = std::make_shared<test::ScriptedGenerator>(std::vector<std::optional<std::string>>{
        std::string(R"({"agent": "meteo", "confidence": 0.99})")
    });
    auto router = MakeRouter(classifier);

    auto decision = router.route("Quel temps fera-t-il demain ?");
    assert(classifier->calls == 1);
    assert(decision.method == domain::RoutingMethod::None);
    assert(!decision.targetAgent.has_value());
    assert(decision.confidence == 0.0f);
    std::cout << "[PASS] Unknown label" << std::endl;
}

void TestDisabledAgentLabelIsDiscarded() {
    std::cout << "[Test] Classifier labels naming a disabled agent are discarded..." << std::endl;
    auto registry = std::make_shared<infrastructure::AgentRegistry>(infrastructure::AgentRegistry::WithDefaults());
    registry->applyCollection(nlohmann::json::parse(R"({"comptabilite": {"enabled": false}})"));
    auto classifier = std::make_shared<test::ScriptedGenerator>(std::vector<std::optional<std::string>>{
        std::string(R"({"agent": "comptabilite", "confidence": 0.95})"),
        std::string("comptabilite")
    });
    application::IntentRouter router(registry, classifier,
                                     infrastructure::PromptCatalog::DefaultClassificationTemplate());

    auto decision = router.route("Comment clôturer mon exercice ?");
    assert(classifier->calls == 1);
    assert(decision.method == domain::RoutingMethod::None);
    assert(!decision.targetAgent.has_value());

    assert(!router.parseClassification("comptabilite").has_value());
    std::cout << "[PASS] Disabled label" << std::endl;
}

void TestClassifierOnlyRouting() {
    std::cout << "[Test] Classifier alone can route when no keyword matches..." << std::endl;
    auto classifier = std::make_shared<test::ScriptedGenerator>(std::vector<std::optional<std::string>>{
        std::string("Voici ma réponse : {\"agent\": \"comptabilite\", \"confidence\": 1.7, \"reason\": \"a {b}\"} merci"),
        std::nullopt
    });
    auto router = MakeRouter(classifier);

    auto decision = router.route("Comment clôturer mon exercice ?");
    assert(decision.method == domain::RoutingMethod::Llm);
    assert(*decision.targetAgent == "comptabilite");
    assert(decision.confidence == 1.0f); // clamped

    // Classifier unavailable and no keyword: none.
    decision = router.route("Comment clôturer mon exercice ?");
    assert(decision.method == domain::RoutingMethod::None);
    std::cout << "[PASS] Classifier routing" << std::endl;
}

void TestLenientParsing() {
    std::cout << "[Test] Classifier output parsing..." << std::endl;
    auto router = MakeRouter(nullptr);

    auto fenced = router.parseClassification("```json\n{\"agent\": \"juridique\", \"confidence\": 0.7}\n```");
    assert(fenced && fenced->agentId && *fenced->agentId == "juridique");
    assert(fenced->confidence == 0.7f);

    auto bare = router.parseClassification("fiscalite");
    assert(bare && *bare->agentId == "fiscalite");
    assert(bare->confidence == router.options().bareLabelConfidence);

    auto none = router.parseClassification(R"({"agent": "none", "confidence": 0.8})");
    assert(none && !none->agentId);

    auto noConfidence = router.parseClassification(R"({"agent": "FISCALITE"})");
    assert(noConfidence && *noConfidence->agentId == "fiscalite");
    assert(noConfidence->confidence == router.options().llmDefaultConfidence);

    auto negative = router.parseClassification(R"({"agent": "aides", "confidence": -3})");
    assert(negative && negative->confidence == 0.0f);

    assert(!router.parseClassification("").has_value());
    assert(!router.parseClassification("je ne sais pas").has_value());
    assert(!router.parseClassification(R"({"agent": 3})").has_value());
    assert(!router.parseClassification(R"({"label": "fiscalite"})").has_value());

    auto span = application::IntentRouter::ExtractFirstJsonObject("x {\"a\": \"}\", \"b\": {\"c\": 1}} y {}");
    assert(span && *span == "{\"a\": \"}\", \"b\": {\"c\": 1}}");
    assert(!application::IntentRouter::ExtractFirstJsonObject("{ unterminated").has_value());
    std::cout << "[PASS] Parsing" << std::endl;
}

void TestAmbiguityPenalty() {
    std::cout << "[Test] Tied keyword evidence is penalized..." << std::endl;
    auto classifier = std::make_shared<test::ScriptedGenerator>();
    auto router = MakeRouter(classifier);

    // One strong keyword for fiscalite (tva) and one for ressources_humaines (paie).
    auto scores = router.scoreRules("TVA sur la paie");
    assert(scores.size() == 2);
    assert(scores[0].agentId == "fiscalite"); // registry order on ties
    assert(scores[0].confidence < router.options().goodThreshold);

    auto decision = router.route("TVA sur la paie");
    assert(classifier->calls == 1);
    assert(decision.method == domain::RoutingMethod::Rules);
    assert(*decision.targetAgent == "fiscalite");
    std::cout << "[PASS] Ambiguity" << std::endl;
}

void TestConfigurableThreshold() {
    std::cout << "[Test] Thresholds are parameters..." << std::endl;
    auto classifier = std::make_shared<test::ScriptedGenerator>();
    application::RouterOptions strict;
    strict.goodThreshold = 0.99f;
    auto router = MakeRouter(classifier, strict);
    auto decision = router.route("C'est quoi la TVA ?");
    assert(classifier->calls == 1);
    assert(decision.method == domain::RoutingMethod::Rules);
    std::cout << "[PASS] Threshold" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting IntentRouter tests..." << std::endl;
    TestStrongRulesSkipClassifier();
    TestWholeWordMatching();
    TestClassifierFusion();
    TestUnknownLabelIsDiscarded();
    TestDisabledAgentLabelIsDiscarded();
    TestClassifierOnlyRouting();
    TestLenientParsing();
    TestAmbiguityPenalty();
    TestConfigurableThreshold();
    std::cout << "[PASS] IntentRouter tests completed." << std::endl;
    return 0;
}
