#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace agentrouter;
using json = nlohmann::json;

namespace {

void TestDefaults() {
    std::cout << "[Test] Empty settings give the documented defaults..." << std::endl;
    auto cfg = infrastructure::ConfigLoader::FromJson(json::object());
    assert(cfg.retrieval.topK == 3);
    assert(cfg.retrieval.minScore == 0.3f);
    assert(cfg.context.maxTotalChars == 3000);
    assert(cfg.corpusTtl == std::chrono::seconds(3600));
    assert(cfg.embedding.maxChars == 5000);
    assert(cfg.router.goodThreshold == 0.8f);
    assert(cfg.invoker.maxRetries == 3);
    assert(cfg.invoker.backoffBase == std::chrono::milliseconds(750));
    assert(cfg.invoker.timeout == std::chrono::milliseconds(45000));
    assert(cfg.requestBudget == std::chrono::milliseconds(120000));
    std::cout << "[PASS] Defaults" << std::endl;
}

void TestOverrides() {
    std::cout << "[Test] Sections override defaults, unknown keys are ignored..." << std::endl;
    auto cfg = infrastructure::ConfigLoader::FromJson(json::parse(R"({
        "retrieval": {"topK": 5, "minScore": 0.25, "corpusTtlSeconds": 60, "lexicalTitleBonus": 2},
        "router": {"goodThreshold": 0.9, "perHitConfidence": 0.6},
        "invoker": {"timeoutSeconds": 30, "backoffBaseSeconds": 0.5, "maxRetries": 1},
        "provider": {"host": "ollama.internal", "port": 8080, "answerTemperature": 0.2},
        "paths": {"corpusDir": "/srv/corpus", "agentsFile": "/etc/agents.json"},
        "futur": {"x": 1}
    })"));
    assert(cfg.retrieval.topK == 5);
    assert(cfg.retrieval.minScore == 0.25f);
    assert(cfg.corpusTtl == std::chrono::seconds(60));
    assert(cfg.lexical.titleBonus == 2.0);
    assert(cfg.router.goodThreshold == 0.9f);
    assert(cfg.router.perHitConfidence == 0.6f);
    assert(cfg.invoker.timeout == std::chrono::milliseconds(30000));
    assert(cfg.invoker.backoffBase == std::chrono::milliseconds(500));
    assert(cfg.invoker.maxRetries == 1);
    assert(cfg.provider.host == "ollama.internal");
    assert(cfg.provider.port == 8080);
    assert(cfg.responder.answerTemperature == 0.2);
    assert(cfg.corpusDir == "/srv/corpus");
    assert(cfg.agentsFile == "/etc/agents.json");
    std::cout << "[PASS] Overrides" << std::endl;
}

void TestTypeErrors() {
    std::cout << "[Test] Wrongly-typed keys raise ConfigurationError..." << std::endl;
    const char* bad[] = {
        R"({"retrieval": {"topK": "trois"}})",
        R"({"router": "pas une section"})",
        R"({"invoker": {"maxRetries": -1}})",
        R"({"retrieval": {"minScore": 1.5}})",
        R"({"invoker": {"maxRetries": 70}})",
        R"({"invoker": {"timeoutSeconds": 0}})",
        R"({"invoker": {"backoffBaseSeconds": 1e12}})",
        R"({"router": {"goodThreshold": 1.2}})",
        R"({"router": {"perHitConfidence": -0.1}})",
        R"({"router": {"ambiguityPenalty": 3}})",
        R"({"retrieval": {"topK": -1}})",
        R"({"retrieval": {"maxContextChars": -3000}})",
        R"({"retrieval": {"sentenceCutRatio": 2}})",
        R"({"provider": {"port": 70000}})",
        R"([1, 2])"
    };
    for (const char* text : bad) {
        bool threw = false;
        try {
            infrastructure::ConfigLoader::FromJson(json::parse(text));
        } catch (const domain::ConfigurationError& e) {
            threw = true;
            assert(std::string(e.kindName()) == "configuration");
        }
        assert(threw);
    }
    std::cout << "[PASS] Type errors" << std::endl;
}

void TestLoadAndEnvironment() {
    std::cout << "[Test] Load reads the file then applies environment overrides..." << std::endl;
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "agentrouter_config_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "settings.json") << R"({"provider": {"host": "from-file"}, "paths": {"corpusDir": "file-corpus"}})";

    setenv("AGENTROUTER_OLLAMA_HOST", "from-env", 1);
    setenv("AGENTROUTER_IDENTITY_TOKEN", "tok", 1);
    auto cfg = infrastructure::ConfigLoader::Load((dir / "settings.json").string());
    assert(cfg.provider.host == "from-env");
    assert(cfg.corpusDir == "file-corpus");
    assert(cfg.identityToken == "tok");

    auto missing = infrastructure::ConfigLoader::Load((dir / "absent.json").string());
    assert(missing.retrieval.topK == 3);
    assert(missing.provider.host == "from-env");

    setenv("AGENTROUTER_OLLAMA_PORT", "onze", 1);
    bool threw = false;
    try {
        infrastructure::ConfigLoader::Load((dir / "absent.json").string());
    } catch (const domain::ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    unsetenv("AGENTROUTER_OLLAMA_HOST");
    unsetenv("AGENTROUTER_IDENTITY_TOKEN");
    unsetenv("AGENTROUTER_OLLAMA_PORT");

    std::ofstream(dir / "broken.json") << "{";
    threw = false;
    try {
        infrastructure::ConfigLoader::Load((dir / "broken.json").string());
    } catch (const domain::ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    fs::remove_all(dir);
    std::cout << "[PASS] Load and environment" << std::endl;
}

void TestRetryLimitIsAccepted() {
    std::cout << "[Test] The largest allowed retry count is accepted..." << std::endl;
    auto cfg = infrastructure::ConfigLoader::FromJson(
        json{{"invoker", {{"maxRetries", infrastructure::InvokerOptions::kMaxRetriesLimit}}}});
    assert(cfg.invoker.maxRetries == infrastructure::InvokerOptions::kMaxRetriesLimit);
    std::cout << "[PASS] Retry limit" << std::endl;
}

void TestEmbeddingCacheFileDefault() {
    std::cout << "[Test] Embeddings persist under the cache home unless disabled..." << std::endl;
    setenv("XDG_CACHE_HOME", "/tmp/agentrouter-cache-home", 1);
    auto cfg = infrastructure::ConfigLoader::FromJson(json::object());
    assert(cfg.embeddingCacheFile == "/tmp/agentrouter-cache-home/AgentRouter/embeddings.json");

    auto disabled = infrastructure::ConfigLoader::FromJson(json::parse(R"({"embedding": {"cacheFile": ""}})"));
    assert(disabled.embeddingCacheFile.empty());
    unsetenv("XDG_CACHE_HOME");
    std::cout << "[PASS] Cache file default" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader tests..." << std::endl;
    TestDefaults();
    TestOverrides();
    TestTypeErrors();
    TestLoadAndEnvironment();
    TestRetryLimitIsAccepted();
    TestEmbeddingCacheFileDefault();
    std::cout << "[PASS] ConfigLoader tests completed." << std::endl;
    return 0;
}
