#include <catch2/catch_all.hpp>

#include "signhttp/http-client.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>

using namespace signhttp;

inline void test_setenv(const char* name, const char* value) {
    setenv(name, value, 1);
}
inline void test_unsetenv(const char* name) {
    unsetenv(name);
}

// Helper to capture stderr
class StderrCapture {
public:
    StderrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~StderrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }
private:
    std::stringstream buffer_;
    std::streambuf* old_;
};

TEST_CASE("HttpLibHttpClient constructor with environment variables", "[http-client][constructor]") {
    SECTION("Invalid REQSIGN_HTTP_TIMEOUT is reported") {
        test_setenv("REQSIGN_HTTP_TIMEOUT", "not-a-number");

        StderrCapture capture;
        HttpLibHttpClient client;
        test_unsetenv("REQSIGN_HTTP_TIMEOUT");

        REQUIRE(capture.str().find("Could not parse value of REQSIGN_HTTP_TIMEOUT") != std::string::npos);
    }

    SECTION("Valid REQSIGN_HTTP_TIMEOUT is accepted silently") {
        test_setenv("REQSIGN_HTTP_TIMEOUT", "5");

        StderrCapture capture;
        HttpLibHttpClient client;
        test_unsetenv("REQSIGN_HTTP_TIMEOUT");

        REQUIRE(capture.str().empty());
    }

    SECTION("Invalid URLs are rejected before connecting") {
        HttpLibHttpClient client;
        Request request("POST", "ftp://files.example/x");
        REQUIRE_THROWS_AS(client.send(request, Config{}), URLError);
    }

    SECTION("Unreachable hosts raise a transport error") {
        test_setenv("REQSIGN_HTTP_TIMEOUT", "2");
        HttpLibHttpClient client;
        test_unsetenv("REQSIGN_HTTP_TIMEOUT");

        Request request("POST", "http://127.0.0.1:1/v1", {}, std::string("{}"));
        try {
            client.send(request, Config{});
            FAIL("Expected IHttpClient::Error");
        }
        catch (IHttpClient::Error const& e) {
            REQUIRE(e.result.status == 0);
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("http://127.0.0.1:1/v1"));
        }
    }
}

TEST_CASE("MockHttpClient", "[http-client][mock]") {
    MockHttpClient client;
    Config config;
    OptionalBodyAndContentType body = BodyAndContentType{
        R"({"to":"0xabc"})",
        "application/json"
    };

    SECTION("Default response without send function") {
        auto result = client.put("http://example.com/resource", body, config);

        REQUIRE(result.status == 0);
        REQUIRE(result.content == "");
    }

    SECTION("Verb helpers build the request") {
        std::string method, url, sentBody, contentType;
        client.sendFun = [&](IRequest& request, Config const&) {
            method = request.method();
            url = request.url();
            sentBody = request.readBody();
            contentType = request.header("content-type").value_or("");
            return IHttpClient::Result{200, "ok"};
        };

        auto result = client.post("http://example.com/resource", body, config);
        REQUIRE(result.status == 200);
        REQUIRE(result.content == "ok");
        REQUIRE(method == "POST");
        REQUIRE(url == "http://example.com/resource");
        REQUIRE(sentBody == R"({"to":"0xabc"})");
        REQUIRE(contentType == "application/json");

        client.patch("http://example.com/resource", body, config);
        REQUIRE(method == "PATCH");
        client.del("http://example.com/resource", {}, config);
        REQUIRE(method == "DELETE");
        REQUIRE(sentBody.empty());
        client.get("http://example.com/resource", config);
        REQUIRE(method == "GET");
        REQUIRE(contentType.empty());
    }

    SECTION("Config headers are sent") {
        config.headers.insert({"X-Custom-Header", "value1"});
        std::optional<std::string> header;
        client.sendFun = [&](IRequest& request, Config const&) {
            header = request.header("x-custom-header");
            return IHttpClient::Result{204, ""};
        };

        client.get("http://example.com/resource", config);
        REQUIRE(header == std::optional<std::string>("value1"));
    }
}
