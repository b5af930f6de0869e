#pragma once

#include <utility>

#include "conduit/context/extensions.hpp"
#include "conduit/http/requestBuilder.hpp"
#include "conduit/middleware/serviceConcept.hpp"

namespace conduit::middleware
{
// Neutral element of both chains.
struct Identity
{
    template <ServiceConcept S>
    auto layer(S t_service) const -> S
    {
        return t_service;
    }

    auto init(http::RequestBuilder t_builder, context::Extensions& /*t_extensions*/) const -> http::RequestBuilder
    {
        return t_builder;
    }
};
}  // namespace conduit::middleware
