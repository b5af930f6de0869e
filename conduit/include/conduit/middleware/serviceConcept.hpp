#pragma once

#include <concepts>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/context/extensions.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/http/requestBuilder.hpp"

namespace conduit::middleware
{
// A unit of work. call() returns a sender of http::Response that reports
// failures as std::exception_ptr to error::Error. The service must outlive
// the sender it returned; the extensions are only borrowed for that long.
template <class S>
concept ServiceConcept = std::move_constructible<S> && requires(S& t_service,
                                                                http::Request t_request,
                                                                context::Extensions& t_extensions) {
    { t_service.call(std::move(t_request), t_extensions) } -> stdexec::sender;
};

// Wraps one service into another. Applying a layer must not perform I/O.
template <class L, class S>
concept LayerFor = ServiceConcept<S> && requires(const L& t_layer, S t_service) {
    { t_layer.layer(std::move(t_service)) } -> ServiceConcept;
};

// Runs before the request exists and may adjust the builder and seed the
// extensions the rest of the pipeline will see.
template <class I>
concept InitializerConcept = requires(const I& t_initializer,
                                      http::RequestBuilder t_builder,
                                      context::Extensions& t_extensions) {
    { t_initializer.init(std::move(t_builder), t_extensions) } -> std::same_as<http::RequestBuilder>;
};
}  // namespace conduit::middleware
