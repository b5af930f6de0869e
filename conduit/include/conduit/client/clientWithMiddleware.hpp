#pragma once

#include <concepts>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/client/details/clientState.hpp"
#include "conduit/client/requestBuilder.hpp"
#include "conduit/context/extensions.hpp"
#include "conduit/core/logger.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/http/requestBuilder.hpp"
#include "conduit/middleware/identity.hpp"
#include "conduit/middleware/serviceConcept.hpp"
#include "conduit/transport/transportConcept.hpp"
#include "conduit/transport/transportService.hpp"

namespace conduit::client
{
// Runs the registered middleware on every request. Copies are cheap and
// share the same read-only configuration and engine.
template <transport::TransportEngineConcept Engine,
          class Middlewares = middleware::Identity,
          class Initializers = middleware::Identity>
class ClientWithMiddleware
{
    static_assert(middleware::LayerFor<Middlewares, transport::TransportService<Engine>>,
                  "middleware stack does not produce a service");
    static_assert(middleware::InitializerConcept<Initializers>, "initializer stack is not an initializer");

public:
    using State = details::ClientState<Engine, Middlewares, Initializers>;
    using RequestBuilderType = RequestBuilder<Engine, Middlewares, Initializers>;

    explicit ClientWithMiddleware(std::shared_ptr<Engine> t_engine)
        requires(std::same_as<Middlewares, middleware::Identity> && std::same_as<Initializers, middleware::Identity>)
        : ClientWithMiddleware(std::move(t_engine), middleware::Identity{}, middleware::Identity{})
    {}

    ClientWithMiddleware(std::shared_ptr<Engine> t_engine, Middlewares t_middlewares, Initializers t_initializers)
    {
        if (!t_engine) {
            throw std::invalid_argument("ClientWithMiddleware: transport engine not set");
        }

        m_state = std::make_shared<const State>(State{std::move(t_engine),
                                                      std::move(t_middlewares),
                                                      std::move(t_initializers),
                                                      core::Logger::createLogger("CLIENT")});
    }

    auto get(std::string_view t_url) const -> RequestBuilderType
    {
        return request(http::method::get, t_url);
    }

    auto post(std::string_view t_url) const -> RequestBuilderType
    {
        return request(http::method::post, t_url);
    }

    auto put(std::string_view t_url) const -> RequestBuilderType
    {
        return request(http::method::put, t_url);
    }

    auto patch(std::string_view t_url) const -> RequestBuilderType
    {
        return request(http::method::patch, t_url);
    }

    auto del(std::string_view t_url) const -> RequestBuilderType
    {
        return request(http::method::del, t_url);
    }

    auto head(std::string_view t_url) const -> RequestBuilderType
    {
        return request(http::method::head, t_url);
    }

    // The initializer chain runs here, on a fresh bag, before the caller
    // gets the builder.
    auto request(std::string_view t_method, std::string_view t_url) const -> RequestBuilderType
    {
        CONDUIT_LOG_TRACE(m_state->logger, "new request {} {}", t_method, t_url);

        context::Extensions extensions;
        auto inner = m_state->initializerStack.init(http::RequestBuilder{t_method, t_url}, extensions);

        return RequestBuilderType{m_state, std::move(inner), std::move(extensions)};
    }

    // Runs the middleware chain for an already built request.
    [[nodiscard]] auto execute(http::Request t_request) const
    {
        return executeWithExtensions(std::move(t_request), context::Extensions{});
    }

    [[nodiscard]] auto executeWithExtensions(http::Request t_request, context::Extensions t_extensions) const
    {
        return stdexec::just(m_state, std::move(t_request), std::move(t_extensions))
               | stdexec::let_value([](const std::shared_ptr<const State>& t_state,
                                       http::Request& t_pending,
                                       context::Extensions& t_bag) {
                     return t_state->dispatch(std::move(t_pending), t_bag);
                 });
    }

    [[nodiscard]] auto engine() const noexcept -> const std::shared_ptr<Engine>&
    {
        return m_state->engine;
    }

private:
    std::shared_ptr<const State> m_state;
};

template <class Engine>
ClientWithMiddleware(std::shared_ptr<Engine>) -> ClientWithMiddleware<Engine>;
}  // namespace conduit::client
