#pragma once

#include <string>
#include <string_view>

#include "conduit/context/extensions.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/http/requestBuilder.hpp"

namespace conduit::middlewares
{
// Initializer adding headers the request does not already carry.
class DefaultHeaders
{
public:
    DefaultHeaders() = default;
    explicit DefaultHeaders(http::HeaderMap t_headers);

    static auto bearer(std::string_view t_token) -> DefaultHeaders;

    auto add(std::string t_name, std::string t_value) && -> DefaultHeaders;

    auto init(http::RequestBuilder t_builder, context::Extensions& t_extensions) const -> http::RequestBuilder;

private:
    http::HeaderMap m_headers;
};
}  // namespace conduit::middlewares
