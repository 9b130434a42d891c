/**
 * @file RequestSigner.hpp
 * @brief Capability to attach a service identity to an outbound request.
 */

#pragma once
#include <string>
#include "infrastructure/HttpTransport.hpp"

namespace agentrouter::infrastructure {

/**
 * @class RequestSigner
 * @brief Produces the headers that authenticate a call to `url`.
 *
 * The identity mechanism itself is external; the invoker only needs headers.
 */
class RequestSigner {
public:
    virtual ~RequestSigner() = default;

    /** @throws domain::AgentAuthError when no identity can be produced. */
    virtual HttpHeaders sign(const std::string& url) = 0;
};

/**
 * @class BearerTokenSigner
 * @brief Sends a pre-issued identity token as `Authorization: Bearer`.
 */
class BearerTokenSigner : public RequestSigner {
public:
    explicit BearerTokenSigner(std::string token);

    HttpHeaders sign(const std::string& url) override;

private:
    std::string m_token;
};

} // namespace agentrouter::infrastructure
