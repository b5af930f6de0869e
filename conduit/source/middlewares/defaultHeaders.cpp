#include "conduit/middlewares/defaultHeaders.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace conduit::middlewares
{
DefaultHeaders::DefaultHeaders(http::HeaderMap t_headers) : m_headers(std::move(t_headers)) {}

auto DefaultHeaders::bearer(std::string_view t_token) -> DefaultHeaders
{
    return DefaultHeaders{}.add("Authorization", "Bearer " + std::string{t_token});
}

auto DefaultHeaders::add(std::string t_name, std::string t_value) && -> DefaultHeaders
{
    m_headers.set(std::move(t_name), std::move(t_value));
    return std::move(*this);
}

auto DefaultHeaders::init(http::RequestBuilder t_builder, context::Extensions& /*t_extensions*/) const
    -> http::RequestBuilder
{
    for (const auto& [name, value] : m_headers) {
        if (!t_builder.peek().headers.contains(name)) {
            t_builder = std::move(t_builder).header(name, value);
        }
    }

    return t_builder;
}
}  // namespace conduit::middlewares
