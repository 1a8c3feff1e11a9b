#include <vellum/net/http_client.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace vellum::net {

namespace {

std::once_flag gCurlInit;

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

Error makeCurlError(CURLcode code, const std::string& url) {
    Error err;
    err.message = url + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

} // namespace

HttpClient::HttpClient() {
    std::call_once(gCurlInit, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<void> HttpClient::classifyStatus(long status, const std::string& body) {
    if (status >= 200 && status < 300) {
        return {};
    }
    std::string snippet = body.substr(0, std::min<size_t>(body.size(), 200));
    std::string message = "HTTP " + std::to_string(status) + ": " + snippet;
    if (status == 429) {
        return Error{ErrorCode::RateLimited, message};
    }
    if (status == 408) {
        return Error{ErrorCode::Timeout, message};
    }
    if (status >= 500) {
        return Error{ErrorCode::NetworkError, message};
    }
    return Error{ErrorCode::InvalidArgument, message};
}

Result<HttpResponse> HttpClient::postJson(const HttpRequest& request) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    curl_slist* list = curl_slist_append(nullptr, "Content-Type: application/json");
    for (const auto& [name, value] : request.headers) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(list);

    HttpResponse response;
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min(request.connectTimeout, request.timeout).count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        spdlog::debug("[Http] POST {} failed: {}", request.url, curl_easy_strerror(rc));
        return makeCurlError(rc, request.url);
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace vellum::net
