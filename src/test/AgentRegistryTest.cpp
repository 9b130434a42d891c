#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/AgentRegistry.hpp"
#include "infrastructure/PromptCatalog.hpp"

using namespace agentrouter;
using json = nlohmann::json;

namespace {

void TestDefaults() {
    std::cout << "[Test] Built-in registry..." << std::endl;
    auto registry = infrastructure::AgentRegistry::WithDefaults();
    auto ids = registry.ids();
    assert(ids.size() == 5);
    assert(ids[0] == "fiscalite");
    assert(ids[4] == "aides");

    const auto* fiscal = registry.find("fiscalite");
    assert(fiscal && fiscal->isAvailable());
    assert(fiscal->keywords.count("tva"));
    assert(fiscal->payloadKey == "question");

    const auto* legal = registry.find("juridique");
    assert(legal && !legal->isAvailable());
    assert(legal->payloadKey == "user_query");
    assert(!registry.contains("meteo"));
    std::cout << "[PASS] Defaults" << std::endl;
}

void TestCollectionOverrides() {
    std::cout << "[Test] Collection entries override defaults field by field..." << std::endl;
    auto registry = infrastructure::AgentRegistry::WithDefaults();
    registry.applyCollection(json::parse(R"({
        "juridique": {"endpoint": "https://agents.example.org/juridique", "requires_auth": true},
        "fiscalite": {"enabled": false},
        "douane": {"url": "https://agents.example.org/douane", "keywords": ["douane", "Incoterm"]},
        "fantome": {"description": "sans endpoint"},
        "casse": "pas un objet"
    })"));

    const auto* legal = registry.find("juridique");
    assert(legal->isAvailable());
    assert(legal->requiresAuth);
    assert(legal->payloadKey == "user_query");     // kept from defaults
    assert(legal->keywords.count("rgpd"));

    assert(!registry.find("fiscalite")->isAvailable());
    assert(!registry.find("fiscalite")->endpointUrl.empty());

    const auto* customs = registry.find("douane");
    assert(customs && customs->isAvailable());
    assert(customs->keywords.at("incoterm") == 1.0);
    assert(!registry.contains("fantome"));
    assert(!registry.contains("casse"));
    assert(registry.ids().back() == "douane");

    registry.applyCollection(json::parse(R"([{"id": "aides", "endpointUrl": "https://agents.example.org/aides", "keywords": {"bpi": 2.0}}])"));
    assert(registry.find("aides")->isAvailable());
    assert(registry.find("aides")->keywords.size() == 1);
    std::cout << "[PASS] Overrides" << std::endl;
}

void TestCollectionFile() {
    std::cout << "[Test] Collection files: missing or corrupt keep defaults..." << std::endl;
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "agentrouter_registry_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    auto registry = infrastructure::AgentRegistry::WithDefaults();
    assert(!registry.loadCollectionFile((dir / "absent.json").string()));

    std::ofstream(dir / "broken.json") << "{ pas du json";
    assert(!registry.loadCollectionFile((dir / "broken.json").string()));
    assert(registry.ids().size() == 5);

    std::ofstream(dir / "agents.json") << R"({"comptabilite": {"endpoint": "http://localhost:9000/compta"}})";
    assert(registry.loadCollectionFile((dir / "agents.json").string()));
    assert(registry.find("comptabilite")->isAvailable());
    fs::remove_all(dir);
    std::cout << "[PASS] Collection file" << std::endl;
}

void TestPromptFill() {
    std::cout << "[Test] Prompt placeholders are filled once..." << std::endl;
    std::string out = infrastructure::PromptCatalog::Fill("Q: {question} / C: {contexte} / {inconnu}",
        {{"question", "Que vaut {contexte} ?"}, {"contexte", "CTX"}});
    assert(out == "Q: Que vaut {contexte} ? / C: CTX / {inconnu}");

    infrastructure::PromptCatalog defaults;
    assert(defaults.classificationTemplate().find("{question}") != std::string::npos);
    assert(defaults.classificationTemplate().find("{agents}") != std::string::npos);
    assert(defaults.answerTemplate().find("{contexte}") != std::string::npos);

    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "agentrouter_prompts_test";
    fs::create_directories(dir);
    std::ofstream(dir / "answer.txt") << "Contexte: {contexte}\nQuestion: {question}";
    infrastructure::PromptCatalog custom(dir.string());
    assert(custom.answerTemplate() == "Contexte: {contexte}\nQuestion: {question}");
    assert(custom.classificationTemplate() == infrastructure::PromptCatalog::DefaultClassificationTemplate());
    fs::remove_all(dir);
    std::cout << "[PASS] Prompts" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AgentRegistry tests..." << std::endl;
    TestDefaults();
    TestCollectionOverrides();
    TestCollectionFile();
    TestPromptFill();
    std::cout << "[PASS] AgentRegistry tests completed." << std::endl;
    return 0;
}
