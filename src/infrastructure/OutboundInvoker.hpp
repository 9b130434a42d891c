/**
 * @file OutboundInvoker.hpp
 * @brief Calls a downstream agent with timeout, backoff retries and auth selection.
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/Deadline.hpp"
#include "domain/Routing.hpp"
#include "infrastructure/HttpTransport.hpp"
#include "infrastructure/RequestSigner.hpp"

namespace agentrouter::infrastructure {

struct InvokerOptions {
    std::chrono::milliseconds timeout{45000};
    std::chrono::milliseconds backoffBase{750};
    int maxRetries = 3;

    static constexpr int kMaxRetriesLimit = 10;
};

struct InvokeResult {
    int statusCode = 0;
    std::string body;
    int attempts = 0;
};

/**
 * @class OutboundInvoker
 * @brief Sends the query to the selected agent.
 *
 * Only transport-level failures are retried: one initial attempt plus up to
 * `maxRetries` retries, waiting `backoffBase * 2^(r-1)` before retry r.
 * HTTP responses are never retried; 401/403 become AgentAuthError.
 */
class OutboundInvoker {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    OutboundInvoker(std::shared_ptr<HttpTransport> transport,
                    std::shared_ptr<RequestSigner> signer,
                    InvokerOptions options = {},
                    SleepFn sleep = nullptr);

    /**
     * @brief Posts the payload to the agent's endpoint.
     * @throws domain::AgentAuthError on 401/403 or when signing fails.
     * @throws domain::AgentUnreachableError once the retry budget is spent.
     * @throws domain::DeadlineExceededError if the request deadline runs out.
     * @throws domain::ConfigurationError for an unusable endpoint URL, without retrying.
     */
    InvokeResult invoke(const domain::AgentDescriptor& agent,
                        const nlohmann::json& payload,
                        const domain::Deadline& deadline = domain::Deadline::Never());

    /** @brief `{payloadKey: question}`, plus `context` for agents that need it. */
    static nlohmann::json BuildPayload(const domain::AgentDescriptor& agent,
                                       const std::string& question,
                                       const std::optional<nlohmann::json>& context);

    /** @brief Wait before retry number `retry` (1-based). */
    std::chrono::milliseconds backoffDelay(int retry) const;

private:
    HttpHeaders buildHeaders(const domain::AgentDescriptor& agent);

    std::shared_ptr<HttpTransport> m_transport;
    std::shared_ptr<RequestSigner> m_signer;
    InvokerOptions m_options;
    SleepFn m_sleep;
};

} // namespace agentrouter::infrastructure
