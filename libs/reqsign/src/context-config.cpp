#include "context-config.hpp"
#include "error.hpp"

#include "signhttp/log.hpp"

#include <stdexcept>

namespace reqsign
{

using signhttp::log;

AuthorizationContext contextFromConfig(signhttp::Config const& config)
{
    auto builder = AuthorizationContext::builder();
    if (!config.signing)
        return builder.build();

    auto const& signing = *config.signing;

    for (auto const& key : signing.authorizationKeys) {
        if (!key.keychain.empty()) {
            auto material = signhttp::secret::load(key.keychain, key.user);
            if (material.empty())
                throw Error(Error::Kind::InvalidKeyMaterial,
                            fmt::format("No key material found in keychain '{}' for user '{}'", key.keychain, key.user));
            builder.addAuthorizationPrivateKey(material);
        }
        else
            builder.addAuthorizationPrivateKey(key.key);
    }

    for (auto const& jwt : signing.userJwts)
        builder.addUserJwt(jwt);

    for (auto const& signature : signing.signatures)
        builder.addSignature(signature.signature, signature.publicKey);

    auto context = builder.build();
    log().debug("Built authorization context with {} signing method(s) from {}",
                context.size(), config.toSafeString());
    return context;
}

AuthorizationContext contextForUrl(signhttp::Settings const& settings, std::string const& url)
{
    return contextFromConfig(settings[url]);
}

std::unique_ptr<SigningHttpClient> signingClientFromConfig(
    std::unique_ptr<signhttp::IHttpClient> client,
    signhttp::Config const& config)
{
    if (!config.appId || config.appId->empty())
        throw signhttp::logRuntimeError<std::invalid_argument>(
            fmt::format("[signingClientFromConfig] No app-id configured in {}", config.toSafeString()));

    auto context = std::make_shared<const AuthorizationContext>(contextFromConfig(config));
    return std::make_unique<SigningHttpClient>(std::move(client), *config.appId, std::move(context));
}

}
