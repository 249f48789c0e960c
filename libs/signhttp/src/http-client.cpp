#include "http-client.hpp"
#include "url.hpp"

#include <httplib.h>
#include <iostream>

namespace
{

signhttp::IHttpClient::Result makeResult(httplib::Result&& result, std::string const& url)
{
    if (result)
        return {result->status, std::move(result->body)};
    auto message = fmt::format("[HttpLibHttpClient] Request to '{}' failed: {}",
                               url, httplib::to_string(result.error()));
    signhttp::log().error(message);
    throw signhttp::IHttpClient::Error({0, {}}, message);
}

}

namespace signhttp
{

using Result = IHttpClient::Result;

Result IHttpClient::sendNew(std::string method,
                            std::string const& url,
                            const OptionalBodyAndContentType& body,
                            const Config& config)
{
    Request request(std::move(method),
                    url,
                    config.headers,
                    body ? std::optional<std::string>(body->body) : std::nullopt,
                    body ? body->contentType : std::string());
    if (body && !body->contentType.empty())
        request.setHeader("Content-Type", body->contentType);
    return send(request, config);
}

Result IHttpClient::get(const std::string& url, const Config& config)
{
    return sendNew("GET", url, {}, config);
}

Result IHttpClient::post(const std::string& url,
                         const OptionalBodyAndContentType& body,
                         const Config& config)
{
    return sendNew("POST", url, body, config);
}

Result IHttpClient::put(const std::string& url,
                        const OptionalBodyAndContentType& body,
                        const Config& config)
{
    return sendNew("PUT", url, body, config);
}

Result IHttpClient::del(const std::string& url,
                        const OptionalBodyAndContentType& body,
                        const Config& config)
{
    return sendNew("DELETE", url, body, config);
}

Result IHttpClient::patch(const std::string& url,
                          const OptionalBodyAndContentType& body,
                          const Config& config)
{
    return sendNew("PATCH", url, body, config);
}

HttpLibHttpClient::HttpLibHttpClient() {
    if (auto timeoutStr = std::getenv("REQSIGN_HTTP_TIMEOUT")) {
        try {
            timeoutSecs_ = std::stoll(timeoutStr);
        }
        catch (std::exception& e) {
            std::cerr << "Could not parse value of REQSIGN_HTTP_TIMEOUT." << std::endl;
        }
    }
    if (auto sslStrictFlagStr = std::getenv("REQSIGN_HTTP_SSL_STRICT"))
        sslCertStrict_ = !std::string(sslStrictFlagStr).empty();
}

Result HttpLibHttpClient::send(IRequest& request, const Config& config)
{
    auto url = URLParts::fromString(request.url());

    httplib::Client client(url.buildHost());
    client.enable_server_certificate_verification(sslCertStrict_);
    client.set_connection_timeout(timeoutSecs_);
    client.set_read_timeout(timeoutSecs_);
    client.set_follow_location(true);

    httplib::Request req;
    req.method = request.method();
    req.path = url.pathAndQuery;
    for (auto const& [name, value] : request.headers())
        req.headers.emplace(name, value);
    // Configured headers fill in what the request does not set itself.
    for (auto const& [name, value] : config.headers) {
        if (!request.header(name))
            req.headers.emplace(name, value);
    }
    req.body = request.readBody();

    log().debug("{} {} ({} body bytes)", req.method, url.build(), req.body.size());
    return makeResult(client.send(req), url.build());
}

Result MockHttpClient::send(IRequest& request, const Config& config)
{
    if (sendFun)
        return sendFun(request, config);
    return {0, ""};
}

}
