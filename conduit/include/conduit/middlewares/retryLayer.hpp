#pragma once

#include <cstddef>
#include <exception>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/common/resultSender.hpp"
#include "conduit/context/extensions.hpp"
#include "conduit/core/logger.hpp"
#include "conduit/error/error.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/middleware/serviceConcept.hpp"

namespace conduit::middlewares
{
// Number of attempts made for the current request, visible to outer stages.
struct RetryAttempts
{
    std::size_t count = 0;
};

template <middleware::ServiceConcept S>
class RetryService
{
public:
    RetryService(std::size_t t_max_retries, core::Logger::LoggerPtr t_logger, S t_inner)
        : m_maxRetries(t_max_retries), m_logger(std::move(t_logger)), m_inner(std::move(t_inner))
    {}

    auto call(http::Request t_request, context::Extensions& t_extensions) -> common::ResultSender<http::Response>
    {
        return attempt(std::move(t_request), t_extensions, 0);
    }

private:
    auto attempt(http::Request t_request, context::Extensions& t_extensions, std::size_t t_retry)
        -> common::ResultSender<http::Response>
    {
        t_extensions.insert(RetryAttempts{t_retry + 1});

        // Streaming bodies cannot be replayed, so they get a single attempt.
        auto replay = t_request.tryClone();

        return common::ResultSender<http::Response>{
            m_inner.call(std::move(t_request), t_extensions)
            | stdexec::let_error([this, &t_extensions, replay = std::move(replay), t_retry](
                                     std::exception_ptr t_error) mutable -> common::ResultSender<http::Response> {
                  if (!replay || t_retry >= m_maxRetries || !error::toError(t_error).isTransport()) {
                      return common::ResultSender<http::Response>{stdexec::just_error(std::move(t_error))};
                  }

                  CONDUIT_LOG_DEBUG(m_logger, "retrying {} {} ({}/{}): {}", replay->method, replay->url.toString(),
                                    t_retry + 1, m_maxRetries, error::toError(t_error).what());

                  return attempt(std::move(*replay), t_extensions, t_retry + 1);
              })};
    }

    std::size_t m_maxRetries;
    core::Logger::LoggerPtr m_logger;
    S m_inner;
};

// Replays requests that failed in the transport. Middleware and build errors
// are returned as is.
class RetryLayer
{
public:
    explicit RetryLayer(std::size_t t_max_retries = 2,
                        core::Logger::LoggerPtr t_logger = core::Logger::createLogger("RETRY"))
        : m_maxRetries(t_max_retries), m_logger(std::move(t_logger))
    {}

    template <middleware::ServiceConcept S>
    auto layer(S t_service) const
    {
        return RetryService<S>{m_maxRetries, m_logger, std::move(t_service)};
    }

private:
    std::size_t m_maxRetries;
    core::Logger::LoggerPtr m_logger;
};
}  // namespace conduit::middlewares
