#pragma once

#include <memory>

#include "signhttp/http-client.hpp"
#include "request-interceptor.hpp"

namespace reqsign
{

/**
 * Transport decorator which authorizes every outgoing request before
 * handing it to the wrapped client. Requests answered with HTTP 401
 * are logged in detail, with signature and authorization headers
 * masked.
 */
class SigningHttpClient : public signhttp::IHttpClient
{
public:
    /**
     * @param client Transport to send signed requests with.
     * @param appId Application id, signed and sent with every request.
     * @param context Default context. May be null, in which case
     *   requests are only signed when a context is passed to send().
     */
    SigningHttpClient(std::unique_ptr<signhttp::IHttpClient> client,
                      std::string appId,
                      std::shared_ptr<const AuthorizationContext> context = {});

    Result send(signhttp::IRequest& request,
                const signhttp::Config& config) override;

    /**
     * Send with an explicit context instead of the default one.
     */
    Result send(signhttp::IRequest& request,
                const signhttp::Config& config,
                AuthorizationContext const& context);

private:
    Result dispatch(signhttp::IRequest& request,
                    const signhttp::Config& config,
                    AuthorizationContext const* context);

    std::unique_ptr<signhttp::IHttpClient> client_;
    RequestInterceptor interceptor_;
    std::shared_ptr<const AuthorizationContext> context_;
};

}
