#include "../include/autotrade/exchange/request_signer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace autotrade::exchange;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_NE(a, b) assert((a) != (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

constexpr uint64_t TS = 1700000000000ULL;

// =============================================================================
// Query building
// =============================================================================

TEST(query_keys_are_sorted) {
    json params = {{"symbol", "BTC_USDT"}, {"limit", 100}, {"interval", "5M"}};
    ASSERT_EQ(RequestSigner::build_query(params), "interval=5M&limit=100&symbol=BTC_USDT");
}

TEST(query_of_empty_object_is_empty) {
    ASSERT_EQ(RequestSigner::build_query(json::object()), "");
}

// =============================================================================
// HMAC
// =============================================================================

TEST(hmac_matches_rfc4231_vector) {
    // RFC 4231 test case 2
    ASSERT_EQ(RequestSigner::hmac_sha256_hex("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

// =============================================================================
// Signing
// =============================================================================

TEST(get_signature_covers_sorted_query_with_timestamp) {
    RequestSigner signer("key", "secret");
    json params = {{"symbol", "BTC_USDT"}, {"limit", 100}};
    SignedRequest s = signer.sign("GET", "/api/v1/market/klines", params, TS);

    ASSERT_EQ(s.timestamp, "1700000000000");
    ASSERT_EQ(s.path_url, "/api/v1/market/klines?limit=100&symbol=BTC_USDT&timestamp=1700000000000");
    ASSERT_TRUE(s.body.empty());
    ASSERT_EQ(s.signature, RequestSigner::hmac_sha256_hex("secret", "GET" + s.path_url));
    ASSERT_EQ(s.signature.size(), 64u);
}

TEST(post_signature_covers_body) {
    RequestSigner signer("key", "secret");
    json params = {{"symbol", "BTC_USDT"}, {"side", "BUY"}, {"type", "MARKET"}, {"size", "0.01"}};
    SignedRequest s = signer.sign("POST", "/api/v1/trade/order", params, TS);

    ASSERT_EQ(s.path_url, "/api/v1/trade/order?timestamp=1700000000000");
    json body = json::parse(s.body);
    ASSERT_EQ(body["symbol"], "BTC_USDT");
    ASSERT_EQ(body["timestamp"], "1700000000000");
    ASSERT_EQ(s.signature, RequestSigner::hmac_sha256_hex("secret", "POST" + s.path_url + s.body));
}

TEST(signing_is_deterministic) {
    RequestSigner signer("key", "secret");
    json params = {{"symbol", "ETH_USDT"}};
    auto a = signer.sign("GET", "/api/v1/trade/openOrders", params, TS);
    auto b = signer.sign("GET", "/api/v1/trade/openOrders", params, TS);
    ASSERT_EQ(a.signature, b.signature);
    ASSERT_EQ(a.path_url, b.path_url);
}

TEST(signature_changes_with_secret_and_timestamp) {
    RequestSigner signer("key", "secret");
    RequestSigner other("key", "other-secret");
    json params = {{"symbol", "ETH_USDT"}};
    auto base = signer.sign("GET", "/api/v1/trade/openOrders", params, TS);
    ASSERT_NE(base.signature, other.sign("GET", "/api/v1/trade/openOrders", params, TS).signature);
    ASSERT_NE(base.signature, signer.sign("GET", "/api/v1/trade/openOrders", params, TS + 1).signature);
}

TEST(credentials_required) {
    ASSERT_TRUE(RequestSigner("key", "secret").has_credentials());
    ASSERT_FALSE(RequestSigner("", "secret").has_credentials());
    ASSERT_FALSE(RequestSigner("key", "").has_credentials());
}

int main() {
    std::cout << "\n=== Request Signer Tests ===\n\n";

    std::cout << "Query Tests:\n";
    RUN_TEST(query_keys_are_sorted);
    RUN_TEST(query_of_empty_object_is_empty);

    std::cout << "\nHMAC Tests:\n";
    RUN_TEST(hmac_matches_rfc4231_vector);

    std::cout << "\nSigning Tests:\n";
    RUN_TEST(get_signature_covers_sorted_query_with_timestamp);
    RUN_TEST(post_signature_covers_body);
    RUN_TEST(signing_is_deterministic);
    RUN_TEST(signature_changes_with_secret_and_timestamp);
    RUN_TEST(credentials_required);

    std::cout << "\n=== All Request Signer Tests Passed! ===\n";
    return 0;
}
