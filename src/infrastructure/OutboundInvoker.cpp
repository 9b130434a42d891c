/**
 * @file OutboundInvoker.cpp
 * @brief Implementation of OutboundInvoker.
 */

#include "infrastructure/OutboundInvoker.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace agentrouter::infrastructure {

OutboundInvoker::OutboundInvoker(std::shared_ptr<HttpTransport> transport,
                                 std::shared_ptr<RequestSigner> signer,
                                 InvokerOptions options,
                                 SleepFn sleep)
    : m_transport(std::move(transport)),
      m_signer(std::move(signer)),
      m_options(options),
      m_sleep(std::move(sleep)) {
    m_options.maxRetries = std::clamp(m_options.maxRetries, 0, InvokerOptions::kMaxRetriesLimit);
    if (!m_sleep) {
        m_sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

nlohmann::json OutboundInvoker::BuildPayload(const domain::AgentDescriptor& agent,
                                             const std::string& question,
                                             const std::optional<nlohmann::json>& context) {
    nlohmann::json payload = {{agent.payloadKey.empty() ? "question" : agent.payloadKey, question}};
    if (agent.needsExtraContext && context && !context->is_null()) {
        payload["context"] = *context;
    }
    return payload;
}

std::chrono::milliseconds OutboundInvoker::backoffDelay(int retry) const {
    retry = std::clamp(retry, 1, InvokerOptions::kMaxRetriesLimit);
    return m_options.backoffBase * (1LL << (retry - 1));
}

HttpHeaders OutboundInvoker::buildHeaders(const domain::AgentDescriptor& agent) {
    HttpHeaders headers = {{"Content-Type", "application/json"}};
    if (!agent.requiresAuth) return headers;

    if (!m_signer) {
        throw domain::AgentAuthError("Agent '" + agent.id + "' requires authentication but no signer is configured", 0);
    }
    for (auto& [name, value] : m_signer->sign(agent.endpointUrl)) {
        headers[name] = value;
    }
    return headers;
}

InvokeResult OutboundInvoker::invoke(const domain::AgentDescriptor& agent,
                                     const nlohmann::json& payload,
                                     const domain::Deadline& deadline) {
    if (agent.endpointUrl.empty()) {
        throw domain::AgentUnreachableError("Agent '" + agent.id + "' has no endpoint");
    }
    if (!m_transport) {
        throw domain::AgentUnreachableError("No HTTP transport configured");
    }

    const HttpHeaders headers = buildHeaders(agent);
    const std::string body = payload.dump();

    for (int attempt = 0; attempt <= m_options.maxRetries; ++attempt) {
        if (deadline.expired()) {
            throw domain::DeadlineExceededError("Request deadline exceeded before calling '" + agent.id + "'");
        }

        try {
            auto response = m_transport->post(agent.endpointUrl, body, headers, deadline.cap(m_options.timeout));
            if (response.status == 401 || response.status == 403) {
                std::cerr << "[OutboundInvoker] Agent '" << agent.id << "' refused our identity (HTTP "
                          << response.status << ")" << std::endl;
                throw domain::AgentAuthError("Agent '" + agent.id + "' answered HTTP " + std::to_string(response.status),
                                             response.status);
            }
            if (response.status < 200 || response.status >= 300) {
                std::cerr << "[OutboundInvoker] Agent '" << agent.id << "' answered HTTP " << response.status << std::endl;
            }
            return InvokeResult{response.status, std::move(response.body), attempt + 1};
        } catch (const domain::TransportError& e) {
            std::cerr << "[OutboundInvoker] Attempt " << (attempt + 1) << " to '" << agent.id << "' failed"
                      << (e.timedOut() ? " (timeout)" : "") << ": " << e.what() << std::endl;

            if (deadline.expired()) {
                throw domain::DeadlineExceededError("Request deadline exceeded while calling '" + agent.id + "'");
            }
            if (attempt == m_options.maxRetries) {
                throw domain::AgentUnreachableError("Agent '" + agent.id + "' unreachable after " +
                                                    std::to_string(attempt + 1) + " attempts: " + e.what());
            }

            auto delay = backoffDelay(attempt + 1);
            if (deadline.isSet() && deadline.remaining() <= delay) {
                throw domain::DeadlineExceededError("Request deadline leaves no room to retry '" + agent.id + "'");
            }
            m_sleep(delay);
        }
    }
    // Unreachable: the loop either returns or throws on its last iteration.
    throw domain::AgentUnreachableError("Agent '" + agent.id + "' unreachable");
}

} // namespace agentrouter::infrastructure
