#pragma once

#include <optional>
#include <string>
#include <vector>

#include "signing-strategy.hpp"

namespace reqsign
{

/**
 * Immutable, ordered collection of signing strategies. Built once via
 * AuthorizationContext::Builder and then shared read-only between any
 * number of concurrent requests.
 */
class AuthorizationContext
{
public:
    class Builder;

    static Builder builder();

    /**
     * Sign a request with every strategy, in the order they were added.
     *
     * All-or-nothing: if any strategy fails, the reqsign::Error of that
     * strategy is thrown, tagged with its zero-based index, and no
     * signature is returned. An empty context returns an empty list.
     */
    std::vector<std::string> generateSignatures(
        std::string const& method,
        std::string const& url,
        nlohmann::json const& body,
        std::string const& appId) const;

    /**
     * Same as above for a payload that already carries additional
     * authorization headers.
     */
    std::vector<std::string> generateSignatures(SignablePayload const& payload) const;

    /**
     * False for a context without strategies, in which case signing
     * is not required.
     */
    bool hasSigningMethods() const;

    std::size_t size() const;
    std::vector<SigningStrategy> const& strategies() const;

private:
    explicit AuthorizationContext(std::vector<SigningStrategy> strategies);

    std::vector<SigningStrategy> strategies_;
};

/**
 * Accumulates signing strategies for an AuthorizationContext. Every
 * strategy is validated when added. Not thread-safe.
 */
class AuthorizationContext::Builder
{
public:
    /**
     * Add a P-256 authorization key (optionally "wallet-auth:"-prefixed
     * base64 DER). Throws reqsign::Error (InvalidKeyMaterial).
     */
    Builder& addAuthorizationPrivateKey(std::string const& keyMaterial);

    /**
     * Add a user JWT. Signing with a context that contains one fails
     * with NotImplemented.
     */
    Builder& addUserJwt(std::string jwt);

    Builder& addCustomSignFunction(CustomSignFunction fun);

    Builder& addSignature(std::string signature,
                          std::optional<std::string> signerPublicKey = {});

    Builder& add(SigningStrategy strategy);

    /**
     * Freeze the strategies added so far into a context. The builder
     * stays usable afterwards.
     */
    AuthorizationContext build() const;

private:
    std::vector<SigningStrategy> pending_;
};

/**
 * Join signatures into the signature header value.
 */
std::string joinSignatures(std::vector<std::string> const& signatures);

}
