#include "http_client.h"
#include <stdexcept>
#include <curl/curl.h>

namespace {

TransportError classifyCurlError(CURLcode rc) {
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::Timeout;
        case CURLE_COULDNT_CONNECT:
            return TransportError::ConnectionRefused;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportError::DnsFailure;
        default:
            return TransportError::Unknown;
    }
}

} // namespace

std::string toString(TransportError error) {
    switch (error) {
        case TransportError::None:              return "none";
        case TransportError::Timeout:           return "timeout";
        case TransportError::ConnectionRefused: return "connection-refused";
        case TransportError::DnsFailure:        return "dns-failure";
        case TransportError::HttpStatus:        return "http-status";
        case TransportError::ParseError:        return "parse-error";
        case TransportError::Unknown:           return "unknown";
    }
    return "unknown";
}

HttpResponse HttpClient::postJson(const std::string& url, const nlohmann::json& body,
                                  const HttpHeaders& headers) {
    HttpHeaders json_headers = headers;
    json_headers.emplace_back("Content-Type", "application/json");
    // Paths and session ids come from file names, which need not be UTF-8
    return post(url, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), json_headers);
}

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

CurlHttpClient::CurlHttpClient(long connect_timeout_ms, long timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms)
    , timeout_ms_(timeout_ms) {}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body,
                                  const HttpHeaders& headers) {
    return performRequest("POST", url, body, headers);
}

HttpResponse CurlHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    return performRequest("GET", url, "", headers);
}

size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse CurlHttpClient::performRequest(const std::string& method, const std::string& url,
                                            const std::string& body, const HttpHeaders& headers) {
    HttpResponse response;

    CURL* c = curl_easy_init();
    if (!c) {
        response.error = TransportError::Unknown;
        response.errorMessage = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.first + ": " + h.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_USERAGENT, "usage-daemon/1.0");
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, 2L);
    if (header_list) {
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, header_list);
    }

    if (method == "POST") {
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    }

    CURLcode rc = curl_easy_perform(c);
    long code = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(c);

    response.status = code;
    if (rc != CURLE_OK) {
        response.error = classifyCurlError(rc);
        response.errorMessage = curl_easy_strerror(rc);
        return response;
    }
    if (code < 200 || code >= 300) {
        response.error = TransportError::HttpStatus;
        response.errorMessage = "HTTP " + std::to_string(code);
    }
    return response;
}
