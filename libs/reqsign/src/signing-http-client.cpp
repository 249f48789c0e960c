#include "signing-http-client.hpp"

#include "signhttp/log.hpp"

#include <stdexcept>

namespace reqsign
{

using signhttp::log;

namespace
{

bool isMaskedHeader(std::string const& name)
{
    return signhttp::headerNameEquals(name, "Authorization") ||
           signhttp::headerNameEquals(name, SIGNATURE_HEADER);
}

void logUnauthorized(signhttp::IRequest const& request,
                     std::string const& body,
                     signhttp::IHttpClient::Result const& result)
{
    log().error("Request authorization failed (HTTP 401):");
    log().error("  Method: {}", request.method());
    log().error("  URL: {}", request.url());
    log().error("  Headers:");
    for (auto const& [name, value] : request.headers()) {
        if (isMaskedHeader(name))
            log().error("    {}: {} (length: {})", name, value.empty() ? "[MISSING]" : "[PRESENT]", value.size());
        else
            log().error("    {}: {}", name, value);
    }
    log().error("  Body: {}", body.empty() ? "[EMPTY]" : body);
    log().error("  Response Body: {}", result.content);
}

}

SigningHttpClient::SigningHttpClient(std::unique_ptr<signhttp::IHttpClient> client,
                                     std::string appId,
                                     std::shared_ptr<const AuthorizationContext> context)
    : client_(std::move(client))
    , interceptor_(std::move(appId))
    , context_(std::move(context))
{
    if (!client_)
        throw std::invalid_argument("SigningHttpClient requires a transport client");
}

SigningHttpClient::Result SigningHttpClient::send(signhttp::IRequest& request,
                                                  const signhttp::Config& config)
{
    return dispatch(request, config, context_.get());
}

SigningHttpClient::Result SigningHttpClient::send(signhttp::IRequest& request,
                                                  const signhttp::Config& config,
                                                  AuthorizationContext const& context)
{
    return dispatch(request, config, &context);
}

SigningHttpClient::Result SigningHttpClient::dispatch(signhttp::IRequest& request,
                                                      const signhttp::Config& config,
                                                      AuthorizationContext const* context)
{
    if (context)
        interceptor_.authorize(request, *context);
    else {
        request.setHeader(APP_ID_HEADER, interceptor_.appId());
        if (RequestInterceptor::requiresSignature(request.method()))
            log().debug("Skipping authorization signature for {} {} - no authorization context configured",
                        request.method(), request.url());
    }

    // Keep a copy of the body for diagnostics; the transport consumes it.
    std::string body;
    {
        BodyRestorer restorer(request);
        body = restorer.body();
    }

    auto result = client_->send(request, config);
    if (result.status == 401)
        logUnauthorized(request, body, result);
    return result;
}

}
