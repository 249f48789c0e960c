#include <catch2/catch_all.hpp>

#include "reqsign/signable-payload.hpp"
#include "reqsign/error.hpp"

using nlohmann::json;
using namespace reqsign;

TEST_CASE("Signable payload construction", "[payload]") {

    SECTION("Canonical bytes of a transaction request") {
        auto payload = SignablePayload::make(
            "post",
            "https://api.example/v1/wallets/w1/transactions",
            json::parse(R"({"value":"1000","to":"0xAAA"})"),
            "app_1");

        REQUIRE(payload.method == "POST");
        REQUIRE(payload.canonicalize() ==
            R"({"body":{"to":"0xAAA","value":"1000"},)"
            R"("headers":{"privy-app-id":"app_1"},)"
            R"("method":"POST",)"
            R"("url":"https://api.example/v1/wallets/w1/transactions",)"
            R"("version":1})");
    }

    SECTION("Missing body becomes an empty object") {
        auto payload = SignablePayload::make("DELETE", "https://api.example/v1/policies/p1", json(), "app_1");
        REQUIRE(payload.body == json::object());
        REQUIRE(payload.canonicalize().find(R"("body":{})") != std::string::npos);
    }

    SECTION("Matches the reference canonicalization") {
        auto payload = SignablePayload::make(
            "POST", "https://api.privy.io/v1/wallets", {{"chain_type", "ethereum"}}, "test-app-id");
        REQUIRE(payload.canonicalize() ==
            R"({"body":{"chain_type":"ethereum"},"headers":{"privy-app-id":"test-app-id"},)"
            R"("method":"POST","url":"https://api.privy.io/v1/wallets","version":1})");
    }

    SECTION("App id always wins over a passed header") {
        auto payload = SignablePayload::make("POST", "https://x", json::object(), "app_1",
                                             {{"privy-app-id", "other"}, {"privy-idempotency-key", "k1"}});
        REQUIRE(payload.headers.at("privy-app-id") == "app_1");
        REQUIRE(payload.headers.at("privy-idempotency-key") == "k1");
    }

    SECTION("Url is kept untruncated") {
        std::string url = "https://api.example/v1/wallets?cursor=abc%20def&limit=10#frag";
        auto payload = SignablePayload::make("POST", url, json::object(), "app_1");
        REQUIRE(payload.url == url);
    }
}

TEST_CASE("Authorization header selection", "[payload][headers]") {
    signhttp::Headers headers{
        {"Privy-Idempotency-Key", "abc"},
        {"PRIVY-REQUEST-EXPIRY", "123"},
        {"privy-authorization-signature", "old"},
        {"Content-Type", "application/json"},
        {"Authorization", "Basic xyz"},
        {"x-privy-custom", "no"},
    };

    auto selected = selectAuthorizationHeaders(headers, "app_1");

    REQUIRE(selected.size() == 3);
    REQUIRE(selected.at("privy-idempotency-key") == "abc");
    REQUIRE(selected.at("privy-request-expiry") == "123");
    REQUIRE(selected.at("privy-app-id") == "app_1");
    REQUIRE(selected.count("privy-authorization-signature") == 0);
}

TEST_CASE("Request body parsing", "[payload][body]") {

    SECTION("Empty body") {
        REQUIRE(parseBody("") == json::object());
    }

    SECTION("JSON body") {
        REQUIRE(parseBody(R"({"to":"0xabc","value":"1"})") == json{{"to", "0xabc"}, {"value", "1"}});
    }

    SECTION("Non-JSON body is a canonicalization error") {
        try {
            parseBody("to=0xabc&value=1");
            FAIL("Expected CanonicalizationError");
        }
        catch (Error const& e) {
            REQUIRE(e.kind == Error::Kind::CanonicalizationError);
            REQUIRE_FALSE(e.strategyIndex.has_value());
        }
    }
}
