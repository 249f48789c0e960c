#include "signing-strategy.hpp"
#include "error.hpp"

#include <stdexcept>

namespace reqsign
{

namespace
{

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

CustomFunctionSigner::CustomFunctionSigner(CustomSignFunction fun)
    : fun_(std::move(fun))
{
    if (!fun_)
        throw std::invalid_argument("Custom sign function must not be empty");
}

SignatureResult CustomFunctionSigner::sign(SignablePayload const& payload, std::string const&) const
{
    SignatureResult result;
    try {
        result = fun_(payload.method, payload.url, payload.body, payload.headers.at(APP_ID_HEADER));
    }
    catch (std::exception const& e) {
        throw Error(Error::Kind::SigningFailed, std::string("Custom sign function failed: ") + e.what());
    }
    catch (...) {
        throw Error(Error::Kind::SigningFailed, "Custom sign function failed with a non-standard exception");
    }

    if (result.signature.empty())
        throw Error(Error::Kind::InvalidSignerResult, "Custom sign function returned an empty signature");
    return result;
}

PrecomputedSignature::PrecomputedSignature(std::string signature,
                                           std::optional<std::string> signerPublicKey)
    : result_{std::move(signature), std::move(signerPublicKey)}
{
    if (result_.signature.empty())
        throw std::invalid_argument("Precomputed signature must not be empty");
}

SignatureResult PrecomputedSignature::sign(SignablePayload const&, std::string const&) const
{
    return result_;
}

DeferredCredentialSigner::DeferredCredentialSigner(std::string token)
    : token_(std::move(token))
{
    if (token_.empty())
        throw std::invalid_argument("User credential token must not be empty");
}

SignatureResult DeferredCredentialSigner::sign(SignablePayload const&, std::string const&) const
{
    throw Error(
        Error::Kind::NotImplemented,
        "User JWT-based signing is not yet implemented. "
        "Please use authorization private keys or a custom sign function instead.");
}

SignatureResult sign(SigningStrategy const& strategy,
                     SignablePayload const& payload,
                     std::string const& canonical)
{
    return std::visit([&](auto const& signer) { return signer.sign(payload, canonical); }, strategy);
}

char const* strategyName(SigningStrategy const& strategy)
{
    return std::visit(overloaded{
        [](PrivateKeySigner const&) { return "private-key"; },
        [](CustomFunctionSigner const&) { return "custom-function"; },
        [](PrecomputedSignature const&) { return "precomputed"; },
        [](DeferredCredentialSigner const&) { return "user-jwt"; },
    }, strategy);
}

}
