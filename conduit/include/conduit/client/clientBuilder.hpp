#pragma once

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

#include "conduit/client/clientWithMiddleware.hpp"
#include "conduit/middleware/identity.hpp"
#include "conduit/middleware/serviceConcept.hpp"
#include "conduit/middleware/stack.hpp"
#include "conduit/transport/transportConcept.hpp"

namespace conduit::client
{
// Every with()/withInit() returns a builder of a new type; the final chain is
// a nested Stack resolved at compile time. First registered runs outermost.
template <transport::TransportEngineConcept Engine,
          class Middlewares = middleware::Identity,
          class Initializers = middleware::Identity>
class ClientBuilder
{
public:
    explicit ClientBuilder(std::shared_ptr<Engine> t_engine)
        requires(std::same_as<Middlewares, middleware::Identity> && std::same_as<Initializers, middleware::Identity>)
        : m_engine(std::move(t_engine))
    {}

    ClientBuilder(std::shared_ptr<Engine> t_engine, Middlewares t_middlewares, Initializers t_initializers)
        : m_engine(std::move(t_engine)),
          m_middlewares(std::move(t_middlewares)),
          m_initializers(std::move(t_initializers))
    {}

    template <typename Layer>
    auto with(Layer&& t_layer) const
    {
        using Stacked = middleware::Stack<std::decay_t<Layer>, Middlewares>;

        return ClientBuilder<Engine, Stacked, Initializers>(
            m_engine, Stacked{std::forward<Layer>(t_layer), m_middlewares}, m_initializers);
    }

    template <typename Initializer>
        requires middleware::InitializerConcept<std::decay_t<Initializer>>
    auto withInit(Initializer&& t_initializer) const
    {
        using Stacked = middleware::RequestStack<std::decay_t<Initializer>, Initializers>;

        return ClientBuilder<Engine, Middlewares, Stacked>(
            m_engine, m_middlewares, Stacked{std::forward<Initializer>(t_initializer), m_initializers});
    }

    auto build() const -> ClientWithMiddleware<Engine, Middlewares, Initializers>
    {
        return ClientWithMiddleware<Engine, Middlewares, Initializers>(m_engine, m_middlewares, m_initializers);
    }

private:
    std::shared_ptr<Engine> m_engine;
    Middlewares m_middlewares;
    Initializers m_initializers;
};

template <class Engine>
ClientBuilder(std::shared_ptr<Engine>) -> ClientBuilder<Engine>;
}  // namespace conduit::client
