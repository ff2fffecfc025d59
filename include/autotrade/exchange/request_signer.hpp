#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace autotrade {
namespace exchange {

using json = nlohmann::json;

/**
 * Output of signing one request.
 *
 * GET:          url = base + path + "?" + query
 *               sign_str = "GET" + path + "?" + query
 * POST/DELETE:  url = base + path + "?timestamp=" + ts, body = compact JSON
 *               sign_str = METHOD + path + "?timestamp=" + ts + body
 */
struct SignedRequest {
    std::string path_url;  // path plus query, as sent
    std::string query;     // sorted "k=v&..." including timestamp
    std::string body;      // compact JSON for POST/DELETE, empty for GET
    std::string timestamp; // milliseconds, decimal
    std::string signature; // lowercase hex HMAC-SHA256
};

/**
 * RequestSigner - HMAC-SHA256 request signing.
 *
 * Deterministic: the same method, path, params, secret and timestamp
 * always produce the same signature.
 */
class RequestSigner {
public:
    RequestSigner(std::string api_key, std::string secret_key)
        : api_key_(std::move(api_key))
        , secret_key_(std::move(secret_key)) {}

    /**
     * Sign a request.
     *
     * @param method       "GET", "POST" or "DELETE"
     * @param path         Endpoint path, e.g. "/api/v1/trade/order"
     * @param params       JSON object of request parameters (timestamp is added)
     * @param timestamp_ms Exchange clock in milliseconds
     */
    SignedRequest sign(const std::string& method, const std::string& path, json params,
                       uint64_t timestamp_ms) const;

    const std::string& api_key() const { return api_key_; }
    bool has_credentials() const { return !api_key_.empty() && !secret_key_.empty(); }

    // Sorted "k=v&k=v" of a JSON object; strings unquoted
    static std::string build_query(const json& params);

    static std::string hmac_sha256_hex(const std::string& key, const std::string& data);

private:
    std::string api_key_;
    std::string secret_key_;
};

}  // namespace exchange
}  // namespace autotrade
