#pragma once

#include <functional>
#include <type_traits>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/common/resultSender.hpp"
#include "conduit/context/extensions.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/http/requestBuilder.hpp"
#include "conduit/middleware/serviceConcept.hpp"

namespace conduit::middleware
{
// Handle to the remainder of the chain, handed to function middleware.
// run() may be called any number of times, including zero.
class Next
{
public:
    using Handler = std::function<common::ResultSender<http::Response>(http::Request, context::Extensions&)>;

    explicit Next(Handler t_handler) : m_handler(std::move(t_handler)) {}

    auto run(http::Request t_request, context::Extensions& t_extensions) const
        -> common::ResultSender<http::Response>
    {
        return m_handler(std::move(t_request), t_extensions);
    }

private:
    Handler m_handler;
};

template <class F, ServiceConcept S>
class FnService
{
public:
    FnService(F t_fn, S t_inner) : m_fn(std::move(t_fn)), m_inner(std::move(t_inner)) {}

    // f only runs once the returned sender is started.
    auto call(http::Request t_request, context::Extensions& t_extensions)
    {
        return stdexec::just(std::move(t_request))
               | stdexec::let_value([this, &t_extensions](http::Request& t_pending) {
                     Next next{[this](http::Request t_forwarded, context::Extensions& t_bag) {
                         return common::ResultSender<http::Response>{m_inner.call(std::move(t_forwarded), t_bag)};
                     }};

                     return std::invoke(m_fn, std::move(t_pending), t_extensions, std::move(next));
                 });
    }

private:
    F m_fn;
    S m_inner;
};

template <class F>
class FnLayer
{
public:
    explicit FnLayer(F t_fn) : m_fn(std::move(t_fn)) {}

    template <ServiceConcept S>
    auto layer(S t_service) const
    {
        return FnService<F, S>{m_fn, std::move(t_service)};
    }

private:
    F m_fn;
};

// f(http::Request, context::Extensions&, Next) -> sender of http::Response
template <class F>
auto fromFn(F&& t_fn)
{
    return FnLayer<std::decay_t<F>>{std::forward<F>(t_fn)};
}

template <class F>
class InitFn
{
public:
    explicit InitFn(F t_fn) : m_fn(std::move(t_fn)) {}

    auto init(http::RequestBuilder t_builder, context::Extensions& t_extensions) const -> http::RequestBuilder
    {
        return std::invoke(m_fn, std::move(t_builder), t_extensions);
    }

private:
    F m_fn;
};

// f(http::RequestBuilder, context::Extensions&) -> http::RequestBuilder
template <class F>
auto initFn(F&& t_fn)
{
    return InitFn<std::decay_t<F>>{std::forward<F>(t_fn)};
}
}  // namespace conduit::middleware
