#include "request.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace signhttp
{

bool headerNameEquals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
            return std::tolower(static_cast<unsigned char>(l)) ==
                   std::tolower(static_cast<unsigned char>(r));
        });
}

Request::Request(std::string method,
                 std::string url,
                 Headers headers,
                 std::optional<std::string> body,
                 std::string contentType)
    : method_(std::move(method))
    , url_(std::move(url))
    , headers_(std::move(headers))
    , contentType_(std::move(contentType))
{
    std::transform(method_.begin(), method_.end(), method_.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (body)
        body_ = std::make_unique<std::istringstream>(std::move(*body));
}

std::string const& Request::method() const
{
    return method_;
}

std::string const& Request::url() const
{
    return url_;
}

std::string Request::readBody()
{
    if (!body_)
        return {};
    return std::string(std::istreambuf_iterator<char>(*body_), std::istreambuf_iterator<char>());
}

void Request::replaceBody(std::string bytes)
{
    body_ = std::make_unique<std::istringstream>(std::move(bytes));
}

std::optional<std::string> Request::header(std::string_view name) const
{
    for (auto const& [key, value] : headers_) {
        if (headerNameEquals(key, name))
            return value;
    }
    return {};
}

void Request::setHeader(std::string const& name, std::string const& value)
{
    for (auto it = headers_.begin(); it != headers_.end();) {
        if (headerNameEquals(it->first, name))
            it = headers_.erase(it);
        else
            ++it;
    }
    headers_.insert({name, value});
}

Headers const& Request::headers() const
{
    return headers_;
}

std::string const& Request::contentType() const
{
    return contentType_;
}

bool Request::hasBody() const
{
    return static_cast<bool>(body_);
}

}
