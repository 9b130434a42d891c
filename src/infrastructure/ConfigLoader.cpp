/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <type_traits>

using json = nlohmann::json;

namespace agentrouter::infrastructure {

namespace {

template <typename T>
void Read(const json& section, const char* sectionName, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    if constexpr (std::is_unsigned_v<T>) {
        if (it->is_number() && it->get<double>() < 0.0) {
            throw domain::ConfigurationError(std::string("settings.") + sectionName + "." + key + " must not be negative");
        }
    }
    try {
        out = it->get<T>();
    } catch (const json::type_error& e) {
        throw domain::ConfigurationError(std::string("settings.") + sectionName + "." + key + ": " + e.what());
    }
}

const json& Section(const json& settings, const char* name) {
    static const json empty = json::object();
    auto it = settings.find(name);
    if (it == settings.end()) return empty;
    if (!it->is_object()) {
        throw domain::ConfigurationError(std::string("settings.") + name + " must be an object");
    }
    return *it;
}

template <typename T>
void RequireRange(T value, double low, double high, const char* name) {
    if (!(static_cast<double>(value) >= low && static_cast<double>(value) <= high)) {
        throw domain::ConfigurationError(std::string("settings.") + name + " must be within [" +
                                         std::to_string(low) + ", " + std::to_string(high) + "]");
    }
}

std::chrono::milliseconds SecondsToMs(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

} // namespace

EngineConfig ConfigLoader::FromJson(const json& settings) {
    EngineConfig cfg;
    if (settings.is_null()) return cfg;
    if (!settings.is_object()) {
        throw domain::ConfigurationError("settings must be a JSON object");
    }

    const json& retrieval = Section(settings, "retrieval");
    Read(retrieval, "retrieval", "topK", cfg.retrieval.topK);
    Read(retrieval, "retrieval", "minScore", cfg.retrieval.minScore);
    Read(retrieval, "retrieval", "titleRepeat", cfg.retrieval.titleRepeat);
    Read(retrieval, "retrieval", "bodyPrefixChars", cfg.retrieval.bodyPrefixChars);
    Read(retrieval, "retrieval", "lexicalTitleBonus", cfg.lexical.titleBonus);
    Read(retrieval, "retrieval", "maxContextChars", cfg.context.maxTotalChars);
    Read(retrieval, "retrieval", "docBodyChars", cfg.context.docBodyChars);
    Read(retrieval, "retrieval", "docBodyFallbackChars", cfg.context.docBodyFallbackChars);
    Read(retrieval, "retrieval", "sentenceCutRatio", cfg.context.sentenceCutRatio);
    Read(retrieval, "retrieval", "corpusPrefix", cfg.corpusPrefix);
    long long ttl = cfg.corpusTtl.count();
    Read(retrieval, "retrieval", "corpusTtlSeconds", ttl);
    RequireRange(ttl, 0.0, 31536000.0, "retrieval.corpusTtlSeconds");
    cfg.corpusTtl = std::chrono::seconds(ttl);

    const json& embedding = Section(settings, "embedding");
    Read(embedding, "embedding", "maxChars", cfg.embedding.maxChars);
    Read(embedding, "embedding", "headChars", cfg.embedding.headChars);
    Read(embedding, "embedding", "tailChars", cfg.embedding.tailChars);
    Read(embedding, "embedding", "cacheFile", cfg.embeddingCacheFile);

    const json& router = Section(settings, "router");
    Read(router, "router", "goodThreshold", cfg.router.goodThreshold);
    Read(router, "router", "perHitConfidence", cfg.router.perHitConfidence);
    Read(router, "router", "ambiguityPenalty", cfg.router.ambiguityPenalty);
    Read(router, "router", "classifierTemperature", cfg.router.classifierTemperature);
    Read(router, "router", "classifierMaxTokens", cfg.router.classifierMaxTokens);
    Read(router, "router", "bareLabelConfidence", cfg.router.bareLabelConfidence);
    Read(router, "router", "llmDefaultConfidence", cfg.router.llmDefaultConfidence);

    const json& invoker = Section(settings, "invoker");
    double timeoutSeconds = cfg.invoker.timeout.count() / 1000.0;
    double backoffSeconds = cfg.invoker.backoffBase.count() / 1000.0;
    Read(invoker, "invoker", "timeoutSeconds", timeoutSeconds);
    Read(invoker, "invoker", "backoffBaseSeconds", backoffSeconds);
    Read(invoker, "invoker", "maxRetries", cfg.invoker.maxRetries);
    RequireRange(timeoutSeconds, 0.001, 3600.0, "invoker.timeoutSeconds");
    RequireRange(backoffSeconds, 0.0, 60.0, "invoker.backoffBaseSeconds");
    cfg.invoker.timeout = SecondsToMs(timeoutSeconds);
    cfg.invoker.backoffBase = SecondsToMs(backoffSeconds);

    const json& provider = Section(settings, "provider");
    Read(provider, "provider", "host", cfg.provider.host);
    Read(provider, "provider", "port", cfg.provider.port);
    Read(provider, "provider", "embeddingModel", cfg.provider.embeddingModel);
    Read(provider, "provider", "generationModel", cfg.provider.generationModel);
    Read(provider, "provider", "readTimeoutSeconds", cfg.provider.readTimeoutSeconds);
    Read(provider, "provider", "answerTemperature", cfg.responder.answerTemperature);
    Read(provider, "provider", "answerMaxTokens", cfg.responder.answerMaxTokens);

    const json& request = Section(settings, "request");
    double deadlineSeconds = cfg.requestBudget.count() / 1000.0;
    Read(request, "request", "deadlineSeconds", deadlineSeconds);
    RequireRange(deadlineSeconds, 0.001, 3600.0, "request.deadlineSeconds");
    cfg.requestBudget = SecondsToMs(deadlineSeconds);

    const json& paths = Section(settings, "paths");
    Read(paths, "paths", "corpusDir", cfg.corpusDir);
    Read(paths, "paths", "agentsFile", cfg.agentsFile);
    Read(paths, "paths", "promptsDir", cfg.promptsDir);

    RequireRange(cfg.retrieval.minScore, 0.0, 1.0, "retrieval.minScore");
    RequireRange(cfg.retrieval.topK, 1.0, 100.0, "retrieval.topK");
    RequireRange(cfg.context.sentenceCutRatio, 0.0, 1.0, "retrieval.sentenceCutRatio");
    RequireRange(cfg.router.goodThreshold, 0.0, 1.0, "router.goodThreshold");
    RequireRange(cfg.router.perHitConfidence, 0.0, 1.0, "router.perHitConfidence");
    RequireRange(cfg.router.ambiguityPenalty, 0.0, 1.0, "router.ambiguityPenalty");
    RequireRange(cfg.router.bareLabelConfidence, 0.0, 1.0, "router.bareLabelConfidence");
    RequireRange(cfg.router.llmDefaultConfidence, 0.0, 1.0, "router.llmDefaultConfidence");
    RequireRange(cfg.invoker.maxRetries, 0.0, InvokerOptions::kMaxRetriesLimit, "invoker.maxRetries");
    RequireRange(cfg.provider.port, 1.0, 65535.0, "provider.port");
    return cfg;
}

void ConfigLoader::ApplyEnvironment(EngineConfig& config) {
    if (const char* host = std::getenv("AGENTROUTER_OLLAMA_HOST"); host && *host) {
        config.provider.host = host;
    }
    if (const char* port = std::getenv("AGENTROUTER_OLLAMA_PORT"); port && *port) {
        try {
            config.provider.port = std::stoi(port);
        } catch (const std::exception&) {
            throw domain::ConfigurationError(std::string("AGENTROUTER_OLLAMA_PORT is not a number: ") + port);
        }
        RequireRange(config.provider.port, 1.0, 65535.0, "provider.port (AGENTROUTER_OLLAMA_PORT)");
    }
    if (const char* dir = std::getenv("AGENTROUTER_CORPUS_DIR"); dir && *dir) {
        config.corpusDir = dir;
    }
    if (const char* agents = std::getenv("AGENTROUTER_AGENTS_FILE"); agents && *agents) {
        config.agentsFile = agents;
    }
    if (const char* token = std::getenv("AGENTROUTER_IDENTITY_TOKEN"); token && *token) {
        config.identityToken = token;
    }
}

EngineConfig ConfigLoader::Load(const std::string& path) {
    EngineConfig cfg;
    if (!path.empty() && std::filesystem::exists(path)) {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw domain::ConfigurationError("Cannot open settings file " + path);
        }
        json j = json::parse(f, nullptr, false);
        if (j.is_discarded()) {
            throw domain::ConfigurationError("Settings file " + path + " is not valid JSON");
        }
        cfg = FromJson(j);
        std::cerr << "[ConfigLoader] Loaded " << path << std::endl;
    } else {
        std::cerr << "[ConfigLoader] No settings file, using defaults." << std::endl;
    }
    ApplyEnvironment(cfg);
    return cfg;
}

std::string ConfigLoader::DefaultSettingsPath() {
    return PathUtils::GetSettingsPath().string();
}

} // namespace agentrouter::infrastructure
