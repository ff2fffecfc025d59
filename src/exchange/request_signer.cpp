#include "../../include/autotrade/exchange/request_signer.hpp"

#include <iomanip>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>

namespace autotrade::exchange {

namespace {

std::string param_value(const json& v) {
    if (v.is_string())
        return v.get<std::string>();
    return v.dump();
}

} // namespace

std::string RequestSigner::build_query(const json& params) {
    // nlohmann objects iterate in key order
    std::string query;
    for (auto it = params.begin(); it != params.end(); ++it) {
        if (!query.empty())
            query += '&';
        query += it.key();
        query += '=';
        query += param_value(it.value());
    }
    return query;
}

std::string RequestSigner::hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &digest_len);

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return out.str();
}

SignedRequest RequestSigner::sign(const std::string& method, const std::string& path, json params,
                                  uint64_t timestamp_ms) const {
    if (params.is_null())
        params = json::object();

    SignedRequest out;
    out.timestamp = std::to_string(timestamp_ms);
    params["timestamp"] = out.timestamp;
    out.query = build_query(params);

    std::string sign_str;
    if (method == "POST" || method == "DELETE") {
        out.body = params.dump();
        out.path_url = path + "?timestamp=" + out.timestamp;
        sign_str = method + out.path_url + out.body;
    } else {
        out.path_url = path + "?" + out.query;
        sign_str = method + out.path_url;
    }

    out.signature = hmac_sha256_hex(secret_key_, sign_str);
    return out;
}

} // namespace autotrade::exchange
