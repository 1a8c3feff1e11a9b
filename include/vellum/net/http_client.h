#pragma once

#include <vellum/core/types.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace vellum::net {

struct HttpRequest {
    std::string url;
    std::string body; // sent as application/json
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connectTimeout{10000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Blocking JSON POST over libcurl.
 *
 * Transport failures map to Timeout or NetworkError. HTTP 429 maps to
 * RateLimited, 408 to Timeout, other 5xx to NetworkError (all transient); any
 * other non-2xx status is InvalidArgument.
 */
class HttpClient {
public:
    HttpClient();

    Result<HttpResponse> postJson(const HttpRequest& request) const;

    /// Error classification of a completed exchange; success for 2xx.
    static Result<void> classifyStatus(long status, const std::string& body);
};

} // namespace vellum::net
