#include "signable-payload.hpp"
#include "canonical-json.hpp"
#include "error.hpp"

#include <algorithm>
#include <cctype>

namespace reqsign
{

namespace
{

std::string toLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

std::string toUpper(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return str;
}

}

SignablePayload SignablePayload::make(std::string method,
                                      std::string url,
                                      nlohmann::json body,
                                      std::string const& appId,
                                      std::map<std::string, std::string> headers)
{
    SignablePayload payload;
    payload.method = toUpper(std::move(method));
    payload.url = std::move(url);
    if (!body.is_null())
        payload.body = std::move(body);
    payload.headers = std::move(headers);
    payload.headers[APP_ID_HEADER] = appId;
    return payload;
}

nlohmann::json SignablePayload::toJson() const
{
    return {
        {"version", version},
        {"method", method},
        {"url", url},
        {"body", body},
        {"headers", headers},
    };
}

std::string SignablePayload::canonicalize() const
{
    return reqsign::canonicalize(toJson());
}

std::map<std::string, std::string> selectAuthorizationHeaders(
    signhttp::Headers const& headers,
    std::string const& appId)
{
    static const std::string prefix = AUTHORIZATION_HEADER_PREFIX;

    std::map<std::string, std::string> result;
    for (auto const& [name, value] : headers) {
        auto lowerName = toLower(name);
        if (lowerName.compare(0, prefix.size(), prefix) != 0)
            continue;
        if (lowerName == SIGNATURE_HEADER)
            continue;
        result[lowerName] = value;
    }
    result[APP_ID_HEADER] = appId;
    return result;
}

nlohmann::json parseBody(std::string const& body)
{
    if (body.empty())
        return nlohmann::json::object();

    try {
        return nlohmann::json::parse(body);
    }
    catch (nlohmann::json::parse_error const& e) {
        throw Error(Error::Kind::CanonicalizationError,
                    std::string("Request body is not valid JSON: ") + e.what());
    }
}

}
