#include "../../include/autotrade/exchange/http_transport.hpp"
#include "../../include/autotrade/errors.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>

namespace autotrade::exchange {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Collects "Name: value" header lines, lowercasing names
size_t header_callback(char* buffer, size_t size, size_t nitems, std::map<std::string, std::string>* headers) {
    size_t total = size * nitems;
    std::string line(buffer, total);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        (*headers)[name] = value;
    }
    return total;
}

} // namespace

struct CurlTransport::Handle {
    CURL* curl = nullptr;
};

CurlTransport::CurlTransport()
    : handle_(std::make_unique<Handle>()) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    handle_->curl = curl_easy_init();
    if (!handle_->curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlTransport::~CurlTransport() {
    if (handle_->curl) {
        curl_easy_cleanup(handle_->curl);
    }
    curl_global_cleanup();
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    CURL* curl = handle_->curl;
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_s * 1000));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        header_list = curl_slist_append(header_list, (name + ": " + value).c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);
    if (header_list) {
        curl_slist_free_all(header_list);
    }

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw NetworkError(NetworkError::Kind::Timeout, std::string("CURL timeout: ") + curl_easy_strerror(res));
    }
    if (res != CURLE_OK) {
        throw NetworkError(NetworkError::Kind::Connection, std::string("CURL error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace autotrade::exchange
