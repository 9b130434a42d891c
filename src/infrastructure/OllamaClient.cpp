#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace agentrouter::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kTopP = 1.0;
constexpr int kSeed = 42;
}

OllamaClient::OllamaClient(const std::string& host, int port, int readTimeoutSeconds)
    : m_host(host), m_port(port), m_readTimeoutSeconds(readTimeoutSeconds) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& prompt,
                                                  double temperature,
                                                  int maxTokens,
                                                  bool forceJson) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSeconds);

    json requestData = {
        {"model", model},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", temperature},
            {"top_p", kTopP},
            {"seed", kSeed},
            {"num_predict", maxTokens}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        json body = json::parse(res->body, nullptr, false);
        if (body.is_object() && body.contains("response") && body["response"].is_string()) {
            return body["response"].get<std::string>();
        }
        std::cerr << "[OllamaClient] Unexpected generate payload: " << res->body.substr(0, 200) << std::endl;
    } else if (res) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body.substr(0, 200) << std::endl;
    } else {
        std::cerr << "[OllamaClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(m_readTimeoutSeconds);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        json body = json::parse(res->body, nullptr, false);
        if (body.is_object() && body.contains("embedding") && body["embedding"].is_array()) {
            try {
                return body["embedding"].get<std::vector<float>>();
            } catch (const json::exception& e) {
                std::cerr << "[OllamaClient] Bad embedding array: " << e.what() << std::endl;
            }
        }
    } else if (res) {
        std::cerr << "[OllamaClient] Embedding HTTP Error " << res->status << std::endl;
    } else {
        std::cerr << "[OllamaClient] Embedding connection failed: " << httplib::to_string(res.error()) << std::endl;
    }
    return {};
}

} // namespace agentrouter::infrastructure
