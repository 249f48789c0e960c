#include <catch2/catch_all.hpp>

#include "reqsign/signing-http-client.hpp"
#include "reqsign/error.hpp"
#include "test-keys.hpp"

#include "spdlog/sinks/ostream_sink.h"

#include <algorithm>
#include <sstream>

using nlohmann::json;
using namespace reqsign;

namespace
{

auto const url = std::string("https://api.example/v1/wallets/w1/rpc");
auto const body = std::string(R"({"method":"eth_signTransaction","params":{"to":"0xabc"}})");

struct Sent
{
    std::string method;
    std::string body;
    signhttp::Headers headers;
};

std::unique_ptr<signhttp::MockHttpClient> recordingClient(Sent& sent, int status = 200)
{
    auto mock = std::make_unique<signhttp::MockHttpClient>();
    mock->sendFun = [&sent, status](signhttp::IRequest& request, signhttp::Config const&) {
        sent.method = request.method();
        sent.body = request.readBody();
        sent.headers = request.headers();
        return signhttp::IHttpClient::Result{status, status == 401 ? R"({"error":"Invalid signature"})" : "{}"};
    };
    return mock;
}

std::optional<std::string> headerOf(Sent const& sent, std::string const& name)
{
    for (auto const& [key, value] : sent.headers)
        if (signhttp::headerNameEquals(key, name))
            return value;
    return {};
}

// Copies everything the shared logger writes while in scope.
class LogCapture
{
public:
    LogCapture()
        : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(out_))
    {
        signhttp::log().sinks().push_back(sink_);
    }

    ~LogCapture()
    {
        auto& sinks = signhttp::log().sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
    }

    std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

}

TEST_CASE("Signing HTTP client", "[signing-client]") {
    Sent sent;
    auto key = test::generateKey();
    auto context = std::make_shared<const AuthorizationContext>(
        AuthorizationContext::builder().addAuthorizationPrivateKey(test::pkcs8Base64(key)).build());

    SECTION("Transport receives the signed request with its full body") {
        SigningHttpClient client(recordingClient(sent), "app_1", context);

        auto result = client.post(url, signhttp::BodyAndContentType{body, "application/json"}, {});

        REQUIRE(result.status == 200);
        REQUIRE(sent.method == "POST");
        REQUIRE(sent.body == body);
        REQUIRE(headerOf(sent, APP_ID_HEADER) == std::optional<std::string>("app_1"));
        auto signature = headerOf(sent, SIGNATURE_HEADER);
        REQUIRE(signature);
        REQUIRE(test::verify(key, SignablePayload::make("POST", url, json::parse(body), "app_1").canonicalize(), *signature));
    }

    SECTION("Per-call context overrides the default") {
        SigningHttpClient client(recordingClient(sent), "app_1", context);
        auto custom = AuthorizationContext::builder().addSignature("manual-sig").build();
        signhttp::Request request("PUT", url, {}, body);

        client.send(request, {}, custom);

        REQUIRE(headerOf(sent, SIGNATURE_HEADER) == std::optional<std::string>("manual-sig"));
        REQUIRE(sent.body == body);
    }

    SECTION("Without context only the app id is sent") {
        SigningHttpClient client(recordingClient(sent), "app_1");

        client.post(url, signhttp::BodyAndContentType{body, "application/json"}, {});

        REQUIRE_FALSE(headerOf(sent, SIGNATURE_HEADER));
        REQUIRE(headerOf(sent, APP_ID_HEADER) == std::optional<std::string>("app_1"));
        REQUIRE(sent.body == body);
    }

    SECTION("Caller app id is overwritten without a context") {
        SigningHttpClient client(recordingClient(sent), "app_1");
        signhttp::Request request("POST", url, {{"Privy-App-Id", "other"}}, body);

        client.send(request, {});

        REQUIRE(headerOf(sent, APP_ID_HEADER) == std::optional<std::string>("app_1"));
    }

    SECTION("Read-only requests are sent unsigned") {
        SigningHttpClient client(recordingClient(sent), "app_1", context);

        client.get(url, {});

        REQUIRE(sent.method == "GET");
        REQUIRE_FALSE(headerOf(sent, SIGNATURE_HEADER));
        REQUIRE(headerOf(sent, APP_ID_HEADER) == std::optional<std::string>("app_1"));
    }

    SECTION("Signing failure prevents sending") {
        bool called = false;
        auto mock = std::make_unique<signhttp::MockHttpClient>();
        mock->sendFun = [&called](signhttp::IRequest&, signhttp::Config const&) {
            called = true;
            return signhttp::IHttpClient::Result{200, ""};
        };
        auto failing = std::make_shared<const AuthorizationContext>(
            AuthorizationContext::builder().addSignature("ok").addUserJwt("jwt").build());
        SigningHttpClient client(std::move(mock), "app_1", failing);

        try {
            client.post(url, signhttp::BodyAndContentType{body, "application/json"}, {});
            FAIL("Expected NotImplemented");
        }
        catch (Error const& e) {
            REQUIRE(e.kind == Error::Kind::NotImplemented);
            REQUIRE(e.strategyIndex == std::optional<std::size_t>(1));
        }
        REQUIRE_FALSE(called);
    }

    SECTION("Unauthorized responses are logged without secrets") {
        auto custom = AuthorizationContext::builder().addSignature("c2VjcmV0LXNpZ25hdHVyZQ==").build();
        SigningHttpClient client(recordingClient(sent, 401), "app_1");
        signhttp::Request request("POST", url, {{"Authorization", "Basic YXBwXzE6c2VjcmV0"}}, body);

        LogCapture capture;
        auto result = client.send(request, {}, custom);

        REQUIRE(result.status == 401);
        auto log = capture.str();
        REQUIRE(log.find("HTTP 401") != std::string::npos);
        REQUIRE(log.find(url) != std::string::npos);
        REQUIRE(log.find("eth_signTransaction") != std::string::npos);
        REQUIRE(log.find("Invalid signature") != std::string::npos);
        REQUIRE(log.find("[PRESENT]") != std::string::npos);
        REQUIRE(log.find("c2VjcmV0LXNpZ25hdHVyZQ==") == std::string::npos);
        REQUIRE(log.find("YXBwXzE6c2VjcmV0") == std::string::npos);
    }

    SECTION("Transport is required") {
        REQUIRE_THROWS_AS(SigningHttpClient(nullptr, "app_1"), std::invalid_argument);
    }
}
