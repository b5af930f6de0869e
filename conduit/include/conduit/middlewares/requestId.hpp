#pragma once

#include <string>

#include "conduit/context/extensions.hpp"
#include "conduit/http/requestBuilder.hpp"

namespace conduit::middlewares
{
struct RequestId
{
    std::string value;
};

// Tags each request with an X-Request-Id header and stores the same id in
// the extensions so later stages can correlate logs with it.
class RequestIdInitializer
{
public:
    RequestIdInitializer();

    auto init(http::RequestBuilder t_builder, context::Extensions& t_extensions) const -> http::RequestBuilder;

private:
    std::string m_prefix;
};
}  // namespace conduit::middlewares
