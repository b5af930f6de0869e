#pragma once

#include <utility>

#include "conduit/context/extensions.hpp"
#include "conduit/http/requestBuilder.hpp"
#include "conduit/middleware/serviceConcept.hpp"

namespace conduit::middleware
{
// Registering L1, L2, ..., Ln produces Stack<Ln, Stack<..., Stack<L1, Identity>>>.
// Since outer wraps whatever inner produced, L1 ends up outermost and Ln sits
// right next to the service being wrapped.
template <class Inner, class Outer>
struct Stack
{
    Inner inner;
    Outer outer;

    template <ServiceConcept S>
    auto layer(S t_service) const
    {
        return outer.layer(inner.layer(std::move(t_service)));
    }
};

// Same law for initializers: outer (registered earlier) runs first.
template <class Inner, class Outer>
struct RequestStack
{
    Inner inner;
    Outer outer;

    auto init(http::RequestBuilder t_builder, context::Extensions& t_extensions) const -> http::RequestBuilder
    {
        return inner.init(outer.init(std::move(t_builder), t_extensions), t_extensions);
    }
};
}  // namespace conduit::middleware
