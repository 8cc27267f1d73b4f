#include "HttpTransport.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace mcp_host {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    ~CurlHandle() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return curl_; }
    explicit operator bool() const { return curl_ != nullptr; }

private:
    CURL* curl_;
};

class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() { curl_slist_free_all(list_); }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& header) { list_ = curl_slist_append(list_, header.c_str()); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

HttpTransport::HttpTransport(HttpOptions options)
    : options_(std::move(options)) {
    ensure_curl_initialized();
}

Result<HttpTransport::Response> HttpTransport::post(const RemoteTarget& target, const std::string& body) {
    CurlHandle curl;
    if (!curl) {
        return Error{ErrorCode::TransportError, "Failed to initialize cURL"};
    }

    HeaderList headers;
    headers.append("Content-Type: application/json");
    headers.append("Accept: application/json");
    // Suppress "Expect: 100-continue" round trips
    headers.append("Expect:");
    if (!target.api_key.empty()) {
        headers.append("Authorization: " + options_.auth_scheme + " " + target.api_key);
    }

    Response response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, target.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        ErrorCode code = res == CURLE_OPERATION_TIMEDOUT ? ErrorCode::TransportTimeout : ErrorCode::TransportError;
        return Error{code, std::string("HTTP request to ") + target.url + " failed: " + curl_easy_strerror(res)};
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

Result<json> HttpTransport::send(const RemoteTarget& target, const json& message) {
    spdlog::debug("POST {} {}", target.url, message.value("method", "unknown"));

    auto posted = post(target, message.dump());
    if (!posted) {
        spdlog::error("{}", posted.error().message);
        return posted.error();
    }
    const auto& response = posted.value();

    if (response.status < 200 || response.status >= 300) {
        spdlog::error("HTTP error {} from {}", response.status, target.url);
        return Error{ErrorCode::TransportError,
            "HTTP error " + std::to_string(response.status) + " from " + target.url};
    }

    if (response.body.empty()) {
        return Error{ErrorCode::TransportError, "Empty response body from " + target.url};
    }

    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        spdlog::error("Invalid JSON from {}: {}", target.url, e.what());
        return Error{ErrorCode::TransportError, std::string("Invalid JSON response: ") + e.what()};
    }
}

Result<void> HttpTransport::notify(const RemoteTarget& target, const json& message) {
    auto posted = post(target, message.dump());
    if (!posted) {
        return posted.error();
    }
    if (posted.value().status >= 400) {
        return Error{ErrorCode::TransportError,
            "Notification returned HTTP " + std::to_string(posted.value().status)};
    }
    return {};
}

} // namespace mcp_host
