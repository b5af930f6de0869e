#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/client/details/clientState.hpp"
#include "conduit/context/extensions.hpp"
#include "conduit/core/logger.hpp"
#include "conduit/error/error.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/http/multipartForm.hpp"
#include "conduit/http/requestBuilder.hpp"

namespace conduit::client
{
// http::RequestBuilder plus the request's extensions and the client it
// will be sent through. Nothing happens until send() is awaited.
template <class Engine, class Middlewares, class Initializers>
class [[nodiscard]] RequestBuilder
{
public:
    using State = details::ClientState<Engine, Middlewares, Initializers>;

    RequestBuilder(std::shared_ptr<const State> t_state, http::RequestBuilder t_inner, context::Extensions t_extensions)
        : m_state(std::move(t_state)), m_inner(std::move(t_inner)), m_extensions(std::move(t_extensions))
    {}

    auto header(std::string_view t_name, std::string_view t_value) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).header(t_name, t_value);
        return std::move(*this);
    }

    auto headers(const http::HeaderMap& t_headers) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).headers(t_headers);
        return std::move(*this);
    }

    auto basicAuth(std::string_view t_user, std::optional<std::string_view> t_password) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).basicAuth(t_user, t_password);
        return std::move(*this);
    }

    auto bearerAuth(std::string_view t_token) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).bearerAuth(t_token);
        return std::move(*this);
    }

    auto body(http::Body t_body) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).body(std::move(t_body));
        return std::move(*this);
    }

    auto query(const http::RequestBuilder::Pairs& t_pairs) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).query(t_pairs);
        return std::move(*this);
    }

    auto form(const http::RequestBuilder::Pairs& t_pairs) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).form(t_pairs);
        return std::move(*this);
    }

    auto json(std::string t_json_text) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).json(std::move(t_json_text));
        return std::move(*this);
    }

    auto multipart(const http::MultipartForm& t_form) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).multipart(t_form);
        return std::move(*this);
    }

    auto timeout(std::chrono::milliseconds t_timeout) && -> RequestBuilder
    {
        m_inner = std::move(m_inner).timeout(t_timeout);
        return std::move(*this);
    }

    template <context::ExtensionConcept T>
    auto withExtension(T t_value) && -> RequestBuilder
    {
        m_extensions.insert(std::move(t_value));
        return std::move(*this);
    }

    [[nodiscard]] auto extensions() & noexcept -> context::Extensions&
    {
        return m_extensions;
    }

    [[nodiscard]] auto build() && -> std::expected<http::Request, error::Error>
    {
        return std::move(m_inner).build();
    }

    // Extensions are never carried over to the clone.
    [[nodiscard]] auto tryClone() const -> std::optional<RequestBuilder>
    {
        auto inner = m_inner.tryClone();
        if (!inner) {
            return std::nullopt;
        }

        return RequestBuilder{m_state, std::move(*inner), context::Extensions{}};
    }

    // Sender of http::Response. A request that fails to build completes with
    // a build error before any middleware runs.
    [[nodiscard]] auto send() &&
    {
        return stdexec::just(std::move(*this))
               | stdexec::let_value([](RequestBuilder& t_self) { return t_self.dispatch(); });
    }

private:
    auto dispatch()
    {
        auto request = std::move(m_inner).build();
        if (!request) {
            CONDUIT_LOG_DEBUG(m_state->logger, "request not sent: {}", request.error().what());
            throw std::move(request.error());
        }

        return m_state->dispatch(std::move(*request), m_extensions);
    }

    std::shared_ptr<const State> m_state;
    http::RequestBuilder m_inner;
    context::Extensions m_extensions;
};
}  // namespace conduit::client
