/**
 * @file HttplibTransport.hpp
 * @brief HttpTransport implemented with cpp-httplib.
 */

#pragma once
#include "infrastructure/HttpTransport.hpp"

namespace agentrouter::infrastructure {

class HttplibTransport : public HttpTransport {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const HttpHeaders& headers,
                      std::chrono::milliseconds timeout) override;

    /**
     * @brief Splits "scheme://host[:port]/path?query" into origin and path.
     * @return false if the URL has no scheme or host.
     */
    static bool SplitUrl(const std::string& url, std::string& origin, std::string& path);
};

} // namespace agentrouter::infrastructure
