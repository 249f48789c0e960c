#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "signhttp/request.hpp"

namespace reqsign
{

/** Header prefix reserved for the authorization system. */
constexpr char const* AUTHORIZATION_HEADER_PREFIX = "privy-";

/** Header carrying the comma-separated signature list. */
constexpr char const* SIGNATURE_HEADER = "privy-authorization-signature";

/** Mandatory application identifier header. */
constexpr char const* APP_ID_HEADER = "privy-app-id";

/** Version of the signable payload format. */
constexpr int PAYLOAD_VERSION = 1;

/**
 * The minimal structured subset of a request which signatures are
 * computed over. A pure function of method, url, body and the
 * authorization-relevant headers.
 */
struct SignablePayload
{
    int version = PAYLOAD_VERSION;
    std::string method;
    std::string url;
    nlohmann::json body = nlohmann::json::object();
    std::map<std::string, std::string> headers;

    /**
     * Build a payload. The method is upper-cased, a null body becomes
     * the empty-object sentinel and the app id is always present under
     * APP_ID_HEADER.
     */
    static SignablePayload make(std::string method,
                                std::string url,
                                nlohmann::json body,
                                std::string const& appId,
                                std::map<std::string, std::string> headers = {});

    nlohmann::json toJson() const;

    /**
     * RFC 8785 canonical bytes of toJson().
     * Throws reqsign::Error (CanonicalizationError).
     */
    std::string canonicalize() const;
};

/**
 * Select the headers which take part in the signature: names starting
 * (case-insensitively) with AUTHORIZATION_HEADER_PREFIX, lower-cased,
 * without SIGNATURE_HEADER. APP_ID_HEADER is set to appId.
 */
std::map<std::string, std::string> selectAuthorizationHeaders(
    signhttp::Headers const& headers,
    std::string const& appId);

/**
 * Parse a request body into the JSON value that is signed. An empty
 * body yields the empty-object sentinel.
 * Throws reqsign::Error (CanonicalizationError) if the body is not JSON.
 */
nlohmann::json parseBody(std::string const& body);

}
