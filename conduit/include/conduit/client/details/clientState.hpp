#pragma once

#include <memory>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/context/extensions.hpp"
#include "conduit/core/logger.hpp"
#include "conduit/error/error.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/transport/transportService.hpp"

namespace conduit::client::details
{
// Everything a client shares between requests. Immutable once built.
template <class Engine, class Middlewares, class Initializers>
struct ClientState
{
    std::shared_ptr<Engine> engine;
    Middlewares middlewareStack;
    Initializers initializerStack;
    core::Logger::LoggerPtr logger;

    auto service() const
    {
        return middlewareStack.layer(transport::TransportService<Engine>{engine});
    }

    // The freshly composed chain is stored in the returned sender's operation
    // state, so it lives exactly as long as this one request. Whatever a
    // middleware throws reaches the caller as an error::Error.
    auto dispatch(http::Request t_request, context::Extensions& t_extensions) const
    {
        return stdexec::just(service(), std::move(t_request))
               | stdexec::let_value([&t_extensions](auto& t_service, http::Request& t_pending) {
                     return t_service.call(std::move(t_pending), t_extensions);
                 })
               | stdexec::let_error([](std::exception_ptr t_error) {
                     return stdexec::just_error(error::toMiddlewareError(std::move(t_error)));
                 });
    }
};
}  // namespace conduit::client::details
