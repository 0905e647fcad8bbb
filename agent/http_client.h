#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// What went wrong with a request, decided by the transport itself
enum class TransportError {
    None,
    Timeout,
    ConnectionRefused,
    DnsFailure,
    HttpStatus,     // a response arrived but was not 2xx
    ParseError,     // a 2xx response body could not be understood
    Unknown
};

std::string toString(TransportError error);

struct HttpResponse {
    long status = 0;
    std::string body;
    TransportError error = TransportError::None;
    std::string errorMessage;

    bool ok() const { return error == TransportError::None && status >= 200 && status < 300; }
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HttpHeaders& headers = {}) = 0;
    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers = {}) = 0;

    // Adds Content-Type: application/json
    HttpResponse postJson(const std::string& url, const nlohmann::json& body,
                          const HttpHeaders& headers = {});
};

// Keeps libcurl's global state alive for the lifetime of the process
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long connect_timeout_ms = 10000, long timeout_ms = 30000);

    HttpResponse post(const std::string& url, const std::string& body,
                      const HttpHeaders& headers = {}) override;
    HttpResponse get(const std::string& url, const HttpHeaders& headers = {}) override;

private:
    long connect_timeout_ms_;
    long timeout_ms_;

    HttpResponse performRequest(const std::string& method, const std::string& url,
                                const std::string& body, const HttpHeaders& headers);

    // Callbacks for CURL
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
};
