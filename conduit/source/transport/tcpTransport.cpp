#include "conduit/transport/tcpTransport.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include "conduit/error/error.hpp"
#include "conduit/http/httpParser.hpp"
#include "conduit/http/httpSerializer.hpp"
#include "conduit/network/socket.hpp"

namespace conduit::transport
{
TcpTransport::TcpTransport(core::TransportConfig t_config)
    : m_config{std::move(t_config)},
      m_logger{core::Logger::createLogger("TRANSPORT")}
{
    m_config.validate();
    m_pool = std::make_unique<exec::static_thread_pool>(static_cast<uint32_t>(m_config.workerThreads));
}

auto TcpTransport::config() const noexcept -> const core::TransportConfig&
{
    return m_config;
}

auto TcpTransport::exchange(http::Request t_request) const -> http::Response
{
    const auto timeout = t_request.timeout.value_or(m_config.requestTimeout);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto expectBody = t_request.method != "HEAD";

    if (!t_request.headers.contains("User-Agent")) {
        t_request.headers.set("User-Agent", m_config.userAgent);
    }

    CONDUIT_LOG_DEBUG(m_logger, "{} {}", t_request.method, t_request.url.toString());

    auto socket = network::Socket::connect(t_request.url.host, t_request.url.port,
                                           std::min(m_config.connectTimeout, timeout));
    socket.setTimeouts(timeout);

    const auto head = http::HttpSerializer::serializeHead(t_request);
    socket.sendAll(std::as_bytes(std::span{head}));

    if (t_request.body.isStream()) {
        while (auto chunk = t_request.body.nextChunk()) {
            const auto framed = http::HttpSerializer::serializeChunk(*chunk);
            socket.sendAll(std::as_bytes(std::span{framed}));
        }
        socket.sendAll(std::as_bytes(std::span{http::HttpSerializer::lastChunk()}));
    } else if (const auto* bytes = t_request.body.bytes(); !bytes->empty()) {
        socket.sendAll(std::as_bytes(std::span{*bytes}));
    }

    std::string raw;
    std::array<std::byte, 16 * 1024> buffer{};
    http::ResponseFramer framer{expectBody};

    while (!framer.update(raw)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw error::Error::transport("request to " + t_request.url.hostHeader() + " timed out",
                                          std::make_error_code(std::errc::timed_out));
        }

        const auto received = socket.receiveSome(buffer);
        if (received == 0) {
            break;
        }

        raw.append(reinterpret_cast<const char*>(buffer.data()), received);

        if (raw.size() > m_config.maxResponseBytes) {
            throw error::Error::transport("response exceeds " + std::to_string(m_config.maxResponseBytes) + " bytes",
                                          std::make_error_code(std::errc::message_size));
        }
    }

    auto response = http::HttpParser::parse(raw, expectBody);
    if (!response) {
        CONDUIT_LOG_WARN(m_logger, "malformed response from {} ({} bytes)", t_request.url.hostHeader(), raw.size());
        throw error::Error::transport("malformed response from " + t_request.url.hostHeader(),
                                      std::make_error_code(std::errc::protocol_error));
    }

    CONDUIT_LOG_DEBUG(m_logger, "{} {} -> {}", t_request.method, t_request.url.toString(), response->status_code);

    return std::move(*response);
}
}  // namespace conduit::transport
