#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace autotrade {
namespace exchange {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    double timeout_s = 30.0;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers; // names lowercased

    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string() : it->second;
    }
};

/**
 * HttpTransport - one blocking HTTP round trip.
 *
 * Implementations throw NetworkError for timeouts and connection failures;
 * any HTTP status (including 4xx/5xx) is returned, not thrown.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * libcurl-backed transport. Holds one easy handle; calls are serialized.
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse send(const HttpRequest& request) override;

private:
    struct Handle; // owns the CURL easy handle
    std::unique_ptr<Handle> handle_;
    std::mutex mutex_;
};

}  // namespace exchange
}  // namespace autotrade
