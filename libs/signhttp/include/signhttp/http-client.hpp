#pragma once

#include <string>
#include <memory>
#include <functional>
#include <optional>
#include <stdexcept>
#include <ctime>

#include "http-settings.hpp"
#include "request.hpp"
#include "url.hpp"
#include "log.hpp"

namespace signhttp
{

struct BodyAndContentType {
    std::string body;
    std::string contentType;
};

using OptionalBodyAndContentType = std::optional<BodyAndContentType>;

class IHttpClient
{
public:

    struct Result {
        int status;
        std::string content;
    };

    struct Error : std::runtime_error {
        Result result;

        Error(Result result, std::string const& message)
            : std::runtime_error(message)
            , result(std::move(result))
        {}
    };

    virtual ~IHttpClient() = default;

    /**
     * Transmit the request. The request body is consumed.
     */
    virtual Result send(IRequest& request,
                        const Config& config) = 0;

    Result get(const std::string& url,
               const Config& config);
    Result post(const std::string& url,
                const OptionalBodyAndContentType& body,
                const Config& config);
    Result put(const std::string& url,
               const OptionalBodyAndContentType& body,
               const Config& config);
    Result del(const std::string& url,
               const OptionalBodyAndContentType& body,
               const Config& config);
    Result patch(const std::string& url,
                 const OptionalBodyAndContentType& body,
                 const Config& config);

protected:
    Result sendNew(std::string method,
                   std::string const& url,
                   const OptionalBodyAndContentType& body,
                   const Config& config);
};

class HttpLibHttpClient : public IHttpClient
{
public:
    HttpLibHttpClient();

    Result send(IRequest& request,
                const Config& config) override;

private:
    time_t timeoutSecs_ = 60;
    bool sslCertStrict_ = false;
};

class MockHttpClient : public IHttpClient
{
public:
    std::function<
        IHttpClient::Result(IRequest& /* request */, Config const& /* config */)
    > sendFun;

    Result send(IRequest& request,
                const Config& config) override;
};

}
