/**
 * @file HttpTransport.hpp
 * @brief Minimal HTTP POST seam used for calls to downstream agents.
 */

#pragma once
#include <chrono>
#include <map>
#include <string>

namespace agentrouter::infrastructure {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status = 0;
    std::string body;
};

/**
 * @class HttpTransport
 * @brief Sends one POST and reports the application-level response.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief Posts `body` to `url`.
     * @return Any HTTP response, whatever its status.
     * @throws domain::TransportError on timeout or connection-level failure.
     * @throws domain::ConfigurationError if `url` cannot be parsed.
     */
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const HttpHeaders& headers,
                              std::chrono::milliseconds timeout) = 0;
};

} // namespace agentrouter::infrastructure
