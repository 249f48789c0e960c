#pragma once

#include <memory>

#include "signhttp/http-settings.hpp"
#include "authorization-context.hpp"
#include "signing-http-client.hpp"

namespace reqsign
{

/**
 * Build an authorization context from the signing section of a config:
 * authorization keys first, then user JWTs, then precomputed
 * signatures, each in configuration order. Keys stored in the system
 * keychain are loaded via signhttp::secret::load. A config without a
 * signing section yields an empty context.
 *
 * Throws reqsign::Error (InvalidKeyMaterial) for unusable keys.
 */
AuthorizationContext contextFromConfig(signhttp::Config const& config);

/**
 * Look up the aggregated config for a URL and build its context.
 */
AuthorizationContext contextForUrl(signhttp::Settings const& settings, std::string const& url);

/**
 * Wrap a transport into a SigningHttpClient for the app id and signing
 * material of a config. Throws std::invalid_argument if the config has
 * no app-id, and reqsign::Error for unusable keys.
 */
std::unique_ptr<SigningHttpClient> signingClientFromConfig(
    std::unique_ptr<signhttp::IHttpClient> client,
    signhttp::Config const& config);

}
