/**
 * @file AgentRouterApp.cpp
 * @brief Implementation of the AgentRouterApp class.
 */
#include "app/AgentRouterApp.hpp"

#include <fstream>
#include <iostream>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/FileSystemDocumentStore.hpp"
#include "infrastructure/HttplibTransport.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include "infrastructure/RequestSigner.hpp"

using json = nlohmann::json;

namespace agentrouter::app {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitError = 2;

std::optional<json> ReadJsonFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[AgentRouterApp] Cannot open " << path << std::endl;
        return std::nullopt;
    }
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[AgentRouterApp] " << path << " is not valid JSON" << std::endl;
        return std::nullopt;
    }
    return j;
}

} // namespace

void AgentRouterApp::PrintUsage() {
    std::cerr << "Usage: agentrouter <ask|answer|route|retrieve> \"<question>\" "
                 "[--context file.json] [--config settings.json]" << std::endl;
}

std::optional<AgentRouterApp::CliOptions> AgentRouterApp::ParseArgs(int argc, char** argv) {
    CliOptions options;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--context" || arg == "--config") {
            if (i + 1 >= argc) return std::nullopt;
            (arg == "--context" ? options.contextFile : options.configPath) = argv[++i];
        } else if (arg.rfind("--", 0) == 0) {
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) return std::nullopt;
    options.command = positional[0];
    options.question = positional[1];
    if (options.command != "ask" && options.command != "answer" &&
        options.command != "route" && options.command != "retrieve") {
        return std::nullopt;
    }
    return options;
}

bool AgentRouterApp::Init(const std::string& configPath) {
    try {
        m_config = infrastructure::ConfigLoader::Load(
            configPath.empty() ? infrastructure::ConfigLoader::DefaultSettingsPath() : configPath);
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[AgentRouterApp] Invalid configuration: " << e.what() << std::endl;
        return false;
    }

    // Dependency Injection / Composition Root
    auto ollama = std::make_shared<infrastructure::OllamaAdapter>(m_config.provider);

    m_services.embeddingCache = std::make_shared<infrastructure::EmbeddingCache>(ollama, m_config.embedding);
    if (!m_config.embeddingCacheFile.empty() && !m_services.embeddingCache->load(m_config.embeddingCacheFile)) {
        std::cerr << "[AgentRouterApp] Starting with a cold embedding cache." << std::endl;
    }

    auto store = std::make_shared<infrastructure::FileSystemDocumentStore>(m_config.corpusDir);
    infrastructure::DocumentCorpusOptions corpusOptions;
    corpusOptions.ttl = m_config.corpusTtl;
    corpusOptions.prefix = m_config.corpusPrefix;
    m_services.corpus = std::make_shared<infrastructure::DocumentCorpus>(store, corpusOptions);

    auto registry = std::make_shared<infrastructure::AgentRegistry>(infrastructure::AgentRegistry::WithDefaults());
    if (!m_config.agentsFile.empty() && !registry->loadCollectionFile(m_config.agentsFile)) {
        std::cerr << "[AgentRouterApp] Agent collection " << m_config.agentsFile << " not applied, using defaults." << std::endl;
    }
    m_services.registry = registry;

    infrastructure::PromptCatalog prompts(m_config.promptsDir);

    m_services.retriever = std::make_shared<application::SemanticRetriever>(m_services.embeddingCache, m_config.retrieval);
    m_services.router = std::make_shared<application::IntentRouter>(
        m_services.registry, ollama, prompts.classificationTemplate(), m_config.router);

    m_services.responder = std::make_unique<application::ResponderService>(
        m_services.corpus,
        m_services.retriever,
        application::LexicalRetriever(m_config.lexical),
        application::ContextAssembler(m_config.context),
        ollama,
        prompts.answerTemplate(),
        m_config.responder);

    std::shared_ptr<infrastructure::RequestSigner> signer;
    if (!m_config.identityToken.empty()) {
        signer = std::make_shared<infrastructure::BearerTokenSigner>(m_config.identityToken);
    }
    auto invoker = std::make_shared<infrastructure::OutboundInvoker>(
        std::make_shared<infrastructure::HttplibTransport>(), signer, m_config.invoker);

    application::ControllerOptions controllerOptions;
    controllerOptions.requestBudget = m_config.requestBudget;
    m_services.controller = std::make_unique<application::OrchestrationController>(
        m_services.registry, m_services.router, invoker, controllerOptions);

    return true;
}

void AgentRouterApp::Shutdown() {
    if (m_services.embeddingCache && !m_config.embeddingCacheFile.empty() &&
        !m_services.embeddingCache->persist(m_config.embeddingCacheFile)) {
        std::cerr << "[AgentRouterApp] Could not save embedding cache to " << m_config.embeddingCacheFile << std::endl;
    }
}

int AgentRouterApp::RunAsk(const CliOptions& options) {
    std::optional<json> context;
    if (!options.contextFile.empty()) {
        context = ReadJsonFile(options.contextFile);
        if (!context) return kExitUsage;
    }

    json envelope = m_services.controller->handle(options.question, context);
    std::cout << envelope.dump(2) << std::endl;
    return envelope.contains("erreur") ? kExitError : kExitOk;
}

int AgentRouterApp::RunAnswer(const CliOptions& options) {
    json result = m_services.responder->answer(options.question);
    std::cout << result.dump(2) << std::endl;
    return result.contains("erreur") ? kExitError : kExitOk;
}

int AgentRouterApp::RunRoute(const CliOptions& options) {
    domain::RoutingDecision decision = m_services.router->route(options.question);
    json out = {
        {"agent", decision.targetAgent ? json(*decision.targetAgent) : json(nullptr)},
        {"confidence", decision.confidence},
        {"method", domain::RoutingMethodName(decision.method)},
        {"rationale", decision.rationale},
        {"rulesConfidence", decision.rulesConfidence},
        {"llmConfidence", decision.llmConfidence}
    };
    std::cout << out.dump(2) << std::endl;
    return kExitOk;
}

int AgentRouterApp::RunRetrieve(const CliOptions& options) {
    json out = json::array();
    for (const auto& scored : m_services.responder->rank(options.question)) {
        out.push_back({
            {"id", scored.document.id},
            {"title", scored.document.title},
            {"url", scored.document.sourceUrl},
            {"score", scored.score}
        });
    }
    std::cout << out.dump(2) << std::endl;
    return kExitOk;
}

int AgentRouterApp::Run(int argc, char** argv) {
    auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return kExitUsage;
    }
    if (!Init(options->configPath)) {
        return kExitUsage;
    }

    int code = kExitOk;
    if (options->command == "ask") code = RunAsk(*options);
    else if (options->command == "answer") code = RunAnswer(*options);
    else if (options->command == "route") code = RunRoute(*options);
    else code = RunRetrieve(*options);

    Shutdown();
    return code;
}

} // namespace agentrouter::app
