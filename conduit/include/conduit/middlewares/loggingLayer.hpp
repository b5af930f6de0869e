#pragma once

#include <chrono>
#include <exception>
#include <format>
#include <string>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/context/extensions.hpp"
#include "conduit/core/logger.hpp"
#include "conduit/error/error.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/middleware/serviceConcept.hpp"

namespace conduit::middlewares
{
template <middleware::ServiceConcept S>
class LoggingService
{
public:
    LoggingService(core::Logger::LoggerPtr t_logger, S t_inner) : m_logger(std::move(t_logger)), m_inner(std::move(t_inner))
    {}

    auto call(http::Request t_request, context::Extensions& t_extensions)
    {
        auto summary = std::format("{} {}", t_request.method, t_request.url.toString());
        const auto start = std::chrono::steady_clock::now();

        CONDUIT_LOG_INFO(m_logger, "--> {}", summary);

        return m_inner.call(std::move(t_request), t_extensions)
               | stdexec::then([logger = m_logger, summary, start](http::Response t_response) {
                     CONDUIT_LOG_INFO(logger, "<-- {} {} {} ({} ms)", summary, t_response.status_code,
                                      t_response.status_text, elapsedMs(start));
                     return t_response;
                 })
               | stdexec::let_error([logger = m_logger, summary, start](std::exception_ptr t_error) {
                     CONDUIT_LOG_WARN(logger, "<-- {} failed after {} ms: {}", summary, elapsedMs(start),
                                      error::toError(t_error).what());
                     return stdexec::just_error(std::move(t_error));
                 });
    }

private:
    static auto elapsedMs(std::chrono::steady_clock::time_point t_start) -> long long
    {
        const auto elapsed = std::chrono::steady_clock::now() - t_start;
        return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    }

    core::Logger::LoggerPtr m_logger;
    S m_inner;
};

// Logs every request and its outcome. Errors pass through unchanged.
class LoggingLayer
{
public:
    explicit LoggingLayer(core::Logger::LoggerPtr t_logger = core::Logger::createLogger("HTTP"))
        : m_logger(std::move(t_logger))
    {}

    template <middleware::ServiceConcept S>
    auto layer(S t_service) const
    {
        return LoggingService<S>{m_logger, std::move(t_service)};
    }

private:
    core::Logger::LoggerPtr m_logger;
};
}  // namespace conduit::middlewares
