#pragma once

#include <optional>
#include <string>

#include "signhttp/request.hpp"
#include "authorization-context.hpp"

namespace reqsign
{

/**
 * Reads an outgoing request's body and puts the same bytes back when
 * it goes out of scope, on every exit path.
 */
class BodyRestorer
{
public:
    explicit BodyRestorer(signhttp::IRequest& request);
    ~BodyRestorer();

    BodyRestorer(BodyRestorer const&) = delete;
    BodyRestorer& operator=(BodyRestorer const&) = delete;

    std::string const& body() const;

private:
    signhttp::IRequest& request_;
    std::string body_;
};

/**
 * Attaches the signature header to outgoing requests. Only mutating
 * verbs (POST, PUT, PATCH, DELETE) are signed.
 */
class RequestInterceptor
{
public:
    explicit RequestInterceptor(std::string appId);

    /**
     * Sign the request with the given context and set SIGNATURE_HEADER.
     * APP_ID_HEADER is set on the request if missing. The request body
     * is left byte-for-byte as it was, also when signing throws.
     *
     * Returns false if the request was not signed: a non-mutating verb,
     * or a context without signing methods.
     */
    bool authorize(signhttp::IRequest& request, AuthorizationContext const& context) const;

    /**
     * Build the signable payload of a request without signing it.
     * The body is restored before returning.
     */
    SignablePayload payloadFor(signhttp::IRequest& request) const;

    std::string const& appId() const;

    static bool requiresSignature(std::string const& method);

    /**
     * Resolve the signature header value for a resource call which may
     * carry a context and/or a manually computed, comma-separated
     * signature. The context wins. Returns nullopt if neither yields a
     * signature.
     */
    static std::optional<std::string> signatureHeaderValue(
        AuthorizationContext const* context,
        SignablePayload const& payload,
        std::optional<std::string> const& manualSignature);

private:
    std::string appId_;
};

}
