/**
 * @file HttplibTransport.cpp
 * @brief Implementation of HttplibTransport.
 */

#include "infrastructure/HttplibTransport.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>

namespace agentrouter::infrastructure {

bool HttplibTransport::SplitUrl(const std::string& url, std::string& origin, std::string& path) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) return false;

    auto pathStart = url.find('/', schemeEnd + 3);
    if (pathStart == std::string::npos) {
        origin = url;
        path = "/";
    } else {
        origin = url.substr(0, pathStart);
        path = url.substr(pathStart);
    }
    return origin.size() > schemeEnd + 3;
}

HttpResponse HttplibTransport::post(const std::string& url,
                                    const std::string& body,
                                    const HttpHeaders& headers,
                                    std::chrono::milliseconds timeout) {
    std::string origin;
    std::string path;
    if (!SplitUrl(url, origin, path)) {
        throw domain::ConfigurationError("Invalid endpoint URL: " + url);
    }

    httplib::Client cli(origin);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Headers httpHeaders;
    std::string contentType = "application/json";
    for (const auto& [name, value] : headers) {
        if (name == "Content-Type") {
            contentType = value;
            continue;
        }
        httpHeaders.emplace(name, value);
    }

    auto started = std::chrono::steady_clock::now();
    auto res = cli.Post(path, httpHeaders, body, contentType);
    if (!res) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        bool timedOut = res.error() == httplib::Error::Read || elapsed >= timeout;
        throw domain::TransportError(origin + ": " + httplib::to_string(res.error()), timedOut);
    }
    return HttpResponse{res->status, res->body};
}

} // namespace agentrouter::infrastructure
