#include "request-interceptor.hpp"
#include "error.hpp"

#include "signhttp/log.hpp"

#include <array>
#include <stdexcept>

namespace reqsign
{

using signhttp::log;

BodyRestorer::BodyRestorer(signhttp::IRequest& request)
    : request_(request)
    , body_(request.readBody())
{}

BodyRestorer::~BodyRestorer()
{
    request_.replaceBody(body_);
}

std::string const& BodyRestorer::body() const
{
    return body_;
}

RequestInterceptor::RequestInterceptor(std::string appId)
    : appId_(std::move(appId))
{
    if (appId_.empty())
        throw std::invalid_argument("App id must not be empty");
}

std::string const& RequestInterceptor::appId() const
{
    return appId_;
}

bool RequestInterceptor::requiresSignature(std::string const& method)
{
    static const std::array<char const*, 4> signedMethods = {"POST", "PUT", "PATCH", "DELETE"};
    for (auto const* m : signedMethods) {
        if (signhttp::headerNameEquals(method, m))
            return true;
    }
    return false;
}

SignablePayload RequestInterceptor::payloadFor(signhttp::IRequest& request) const
{
    nlohmann::json body;
    {
        BodyRestorer restorer(request);
        body = parseBody(restorer.body());
    }

    auto headers = selectAuthorizationHeaders(request.headers(), appId_);
    if (log().should_log(spdlog::level::debug)) {
        std::string headerNames;
        for (auto const& [name, value] : headers)
            headerNames += (headerNames.empty() ? "" : ", ") + name;
        std::string bodyKeys;
        if (body.is_object())
            for (auto it = body.begin(); it != body.end(); ++it)
                bodyKeys += (bodyKeys.empty() ? "" : ", ") + it.key();
        log().debug("Generating signature for {} {}", request.method(), request.url());
        log().debug("  Headers: {}", headerNames);
        log().debug("  Body keys: {}", bodyKeys.empty() ? "(empty)" : bodyKeys);
    }

    return SignablePayload::make(request.method(), request.url(), std::move(body), appId_, std::move(headers));
}

bool RequestInterceptor::authorize(signhttp::IRequest& request, AuthorizationContext const& context) const
{
    // The signed payload always carries appId_, so the wire header must match it.
    request.setHeader(APP_ID_HEADER, appId_);

    if (!requiresSignature(request.method()))
        return false;

    if (!context.hasSigningMethods()) {
        log().debug("Skipping authorization signature for {} {} - no signing methods configured",
                    request.method(), request.url());
        return false;
    }

    auto signatures = context.generateSignatures(payloadFor(request));
    auto value = joinSignatures(signatures);
    request.setHeader(SIGNATURE_HEADER, value);
    log().debug("Added authorization signature header ({} signature(s), length: {})",
                signatures.size(), value.size());
    return true;
}

std::optional<std::string> RequestInterceptor::signatureHeaderValue(
    AuthorizationContext const* context,
    SignablePayload const& payload,
    std::optional<std::string> const& manualSignature)
{
    if (context) {
        auto signatures = context->generateSignatures(payload);
        if (signatures.empty())
            return {};
        return joinSignatures(signatures);
    }
    if (manualSignature && !manualSignature->empty())
        return manualSignature;
    return {};
}

}
