#pragma once

#include <memory>
#include <utility>

#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include "conduit/core/config.hpp"
#include "conduit/core/logger.hpp"
#include "conduit/http/httpMessages.hpp"

namespace conduit::transport
{
// Plain HTTP/1.1 over TCP, one connection per request. Each exchange runs
// on a worker of the engine's own thread pool.
class TcpTransport
{
public:
    explicit TcpTransport(core::TransportConfig t_config = core::TransportConfig::fromEnvironment());

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    auto execute(http::Request t_request) -> stdexec::sender auto
    {
        stdexec::scheduler auto scheduler = m_pool->get_scheduler();

        auto work = stdexec::just(std::move(t_request))
                    | stdexec::then([this](http::Request t_pending) { return exchange(std::move(t_pending)); });

        return stdexec::starts_on(scheduler, std::move(work));
    }

    [[nodiscard]] auto config() const noexcept -> const core::TransportConfig&;

private:
    auto exchange(http::Request t_request) const -> http::Response;

    core::TransportConfig m_config;
    core::Logger::LoggerPtr m_logger;
    std::unique_ptr<exec::static_thread_pool> m_pool;
};
}  // namespace conduit::transport
