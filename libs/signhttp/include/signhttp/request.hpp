#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <memory>
#include <sstream>
#include <map>

namespace signhttp
{

using Headers = std::multimap<std::string, std::string>;

/**
 * Case-insensitive ASCII comparison of two header names.
 */
bool headerNameEquals(std::string_view a, std::string_view b);

/**
 * The narrow view of an outgoing HTTP request which request
 * authorization depends on. Implementations wrap whatever request
 * object a concrete transport uses.
 */
class IRequest
{
public:
    virtual ~IRequest() = default;

    virtual std::string const& method() const = 0;
    virtual std::string const& url() const = 0;

    /**
     * Read the full remaining body. The body is a stream: once read,
     * it is gone until replaceBody() reinstates it.
     */
    virtual std::string readBody() = 0;

    /**
     * Replace the transmittable body with the given bytes.
     */
    virtual void replaceBody(std::string bytes) = 0;

    /**
     * Get a header value by case-insensitive name.
     */
    virtual std::optional<std::string> header(std::string_view name) const = 0;

    /**
     * Set a header, replacing all values stored under any
     * capitalization of the same name.
     */
    virtual void setHeader(std::string const& name, std::string const& value) = 0;

    virtual Headers const& headers() const = 0;
};

/**
 * Default request implementation, backed by a one-shot body stream.
 */
class Request : public IRequest
{
public:
    Request(std::string method,
            std::string url,
            Headers headers = {},
            std::optional<std::string> body = {},
            std::string contentType = {});

    std::string const& method() const override;
    std::string const& url() const override;
    std::string readBody() override;
    void replaceBody(std::string bytes) override;
    std::optional<std::string> header(std::string_view name) const override;
    void setHeader(std::string const& name, std::string const& value) override;
    Headers const& headers() const override;

    std::string const& contentType() const;
    bool hasBody() const;

private:
    std::string method_;
    std::string url_;
    Headers headers_;
    std::string contentType_;
    std::unique_ptr<std::istringstream> body_;
};

}
