#include "url.hpp"
#include "log.hpp"

#include <cctype>

namespace signhttp
{

/**
 * Parse scheme
 *
 * https://tools.ietf.org/html/rfc3986#section-3.1
 */
static bool parseScheme(const char*& str, std::string& out)
{
    if (!std::isalpha(static_cast<unsigned char>(*str)))
        return false;

    while (std::isalnum(static_cast<unsigned char>(*str)) ||
           *str == '-' ||
           *str == '+' ||
           *str == '.') {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*str))));
        ++str;
    }

    return *str++ == ':';
}

/**
 * Parse authority + port. User information is skipped.
 *
 * https://tools.ietf.org/html/rfc3986#section-3.2
 */
static bool parseAuthority(const char*& str, std::string& host, uint16_t& port)
{
    if (str[0] != '/' || str[1] != '/')
        return false;
    str += 2;

    auto authorityEnd = str;
    while (*authorityEnd && *authorityEnd != '/' && *authorityEnd != '?' && *authorityEnd != '#')
        ++authorityEnd;

    for (auto at = authorityEnd; at > str; --at) {
        if (at[-1] == '@') {
            str = at;
            break;
        }
    }

    /* IP-Literal */
    if (*str == '[') {
        while (str < authorityEnd && *str != ']')
            host.push_back(*str++);
        if (*str != ']')
            return false;
        host.push_back(*str++);
    }
    else {
        while (std::isalnum(static_cast<unsigned char>(*str)) ||
               *str == '-' || *str == '.' || *str == '_' || *str == '~')
            host.push_back(*str++);
    }

    if (host.empty())
        return false;

    if (*str == ':') {
        ++str;
        uint32_t value = 0u;
        while (std::isdigit(static_cast<unsigned char>(*str))) {
            value = value * 10u + static_cast<uint32_t>(*str - '0');
            if (value > 0xffffu)
                return false;
            ++str;
        }
        port = static_cast<uint16_t>(value);
    }

    return str == authorityEnd;
}

URLParts URLParts::fromString(std::string const& url)
{
    URLParts result;
    const auto* c = url.c_str();
    std::string error;

    if (!parseScheme(c, result.scheme))
        error = "Error parsing scheme";
    else if (result.scheme != "http" && result.scheme != "https")
        error = "Unsupported scheme";
    else if (!parseAuthority(c, result.host, result.port))
        error = "Error parsing authority";

    if (!error.empty())
        throw logRuntimeError<URLError>(fmt::format("[URLParts::fromString] {} of URL '{}'", error, url));

    std::string rest(c);
    if (auto fragment = rest.find('#'); fragment != std::string::npos)
        rest.erase(fragment);
    if (rest.empty() || rest.front() != '/')
        rest.insert(rest.begin(), '/');
    result.pathAndQuery = std::move(rest);

    return result;
}

std::string URLParts::buildHost() const
{
    if (scheme.empty())
        throw logRuntimeError<URLError>("[URLParts::buildHost] Missing scheme");
    if (host.empty())
        throw logRuntimeError<URLError>("[URLParts::buildHost] Missing host");

    return scheme + "://" +
           host +
           (port > 0 ? std::string(":") + std::to_string(port) : "");
}

std::string URLParts::build() const
{
    return buildHost() + pathAndQuery;
}

}
