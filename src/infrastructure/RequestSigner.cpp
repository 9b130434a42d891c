/**
 * @file RequestSigner.cpp
 * @brief Implementation of BearerTokenSigner.
 */

#include "infrastructure/RequestSigner.hpp"
#include "domain/Errors.hpp"

namespace agentrouter::infrastructure {

BearerTokenSigner::BearerTokenSigner(std::string token) : m_token(std::move(token)) {}

HttpHeaders BearerTokenSigner::sign(const std::string& url) {
    if (m_token.empty()) {
        throw domain::AgentAuthError("No identity token available to call " + url, 0);
    }
    return {{"Authorization", "Bearer " + m_token}};
}

} // namespace agentrouter::infrastructure
