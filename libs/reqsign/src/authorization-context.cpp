#include "authorization-context.hpp"
#include "error.hpp"

#include "signhttp/log.hpp"

namespace reqsign
{

using signhttp::log;

AuthorizationContext::AuthorizationContext(std::vector<SigningStrategy> strategies)
    : strategies_(std::move(strategies))
{}

AuthorizationContext::Builder AuthorizationContext::builder()
{
    return {};
}

std::vector<std::string> AuthorizationContext::generateSignatures(
    std::string const& method,
    std::string const& url,
    nlohmann::json const& body,
    std::string const& appId) const
{
    return generateSignatures(SignablePayload::make(method, url, body, appId));
}

std::vector<std::string> AuthorizationContext::generateSignatures(SignablePayload const& payload) const
{
    std::vector<std::string> signatures;
    if (strategies_.empty())
        return signatures;

    auto canonical = payload.canonicalize();
    signatures.reserve(strategies_.size());

    for (std::size_t i = 0; i < strategies_.size(); ++i) {
        auto const& strategy = strategies_[i];
        try {
            signatures.push_back(sign(strategy, payload, canonical).signature);
        }
        catch (Error const& e) {
            log().debug("Signing strategy {} ({}) failed: {}", i, strategyName(strategy), e.what());
            throw e.withStrategyIndex(i);
        }
    }

    log().debug("Generated {} signature(s) for {} {}", signatures.size(), payload.method, payload.url);
    return signatures;
}

bool AuthorizationContext::hasSigningMethods() const
{
    return !strategies_.empty();
}

std::size_t AuthorizationContext::size() const
{
    return strategies_.size();
}

std::vector<SigningStrategy> const& AuthorizationContext::strategies() const
{
    return strategies_;
}

AuthorizationContext::Builder& AuthorizationContext::Builder::addAuthorizationPrivateKey(std::string const& keyMaterial)
{
    if (keyMaterial.empty())
        throw Error(Error::Kind::InvalidKeyMaterial, "Authorization key must not be empty");
    pending_.emplace_back(PrivateKeySigner(keyMaterial));
    return *this;
}

AuthorizationContext::Builder& AuthorizationContext::Builder::addUserJwt(std::string jwt)
{
    pending_.emplace_back(DeferredCredentialSigner(std::move(jwt)));
    return *this;
}

AuthorizationContext::Builder& AuthorizationContext::Builder::addCustomSignFunction(CustomSignFunction fun)
{
    pending_.emplace_back(CustomFunctionSigner(std::move(fun)));
    return *this;
}

AuthorizationContext::Builder& AuthorizationContext::Builder::addSignature(
    std::string signature,
    std::optional<std::string> signerPublicKey)
{
    pending_.emplace_back(PrecomputedSignature(std::move(signature), std::move(signerPublicKey)));
    return *this;
}

AuthorizationContext::Builder& AuthorizationContext::Builder::add(SigningStrategy strategy)
{
    pending_.push_back(std::move(strategy));
    return *this;
}

AuthorizationContext AuthorizationContext::Builder::build() const
{
    return AuthorizationContext(pending_);
}

std::string joinSignatures(std::vector<std::string> const& signatures)
{
    std::string result;
    for (auto const& signature : signatures) {
        if (!result.empty())
            result += ",";
        result += signature;
    }
    return result;
}

}
