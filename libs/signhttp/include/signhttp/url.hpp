#pragma once

#include <string>
#include <stdexcept>
#include <cstdint>

namespace signhttp
{

struct URLError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Absolute http(s) URL split into the parts a transport needs to
 * open a connection. The path and query are kept verbatim (no
 * percent-decoding), so the request line carries exactly the bytes
 * that were signed.
 */
struct URLParts
{
    std::string scheme;
    std::string host;
    std::uint16_t port = 0u;
    std::string pathAndQuery;

    /**
     * Split an absolute RFC3986 URL. Fragments are dropped.
     *
     * Throws URLError if the scheme is not http/https, the authority
     * is missing, or the port is out of range.
     */
    static URLParts fromString(std::string const& url);

    std::string buildHost() const; /* Scheme + host + optional port */
    std::string build() const;     /* Full URL */
};

}
