#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include <sys/types.h>

namespace conduit::network
{
class Socket
{
public:
    Socket() = default;
    explicit Socket(int32_t t_fd);

    Socket(Socket&& t_other) noexcept;

    Socket& operator=(Socket&& t_other) noexcept;

    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    // Resolves t_host and tries every address in turn. Throws
    // error::Error (transport) carrying the last errno seen.
    static auto connect(const std::string& t_host, uint16_t t_port, std::chrono::milliseconds t_timeout) -> Socket;

    auto setTimeouts(std::chrono::milliseconds t_timeout) const -> void;

    [[nodiscard]] auto recv(std::span<std::byte> t_buffer) const noexcept -> ssize_t;

    [[nodiscard]] auto send(std::span<const std::byte> t_buffer) const noexcept -> ssize_t;

    // Loops until everything is written; throws error::Error (transport).
    auto sendAll(std::span<const std::byte> t_buffer) const -> void;

    // 0 means the peer closed; throws error::Error (transport) on failure.
    [[nodiscard]] auto receiveSome(std::span<std::byte> t_buffer) const -> std::size_t;

    auto close() -> void;

    [[nodiscard]] auto fd() const noexcept -> int;

    [[nodiscard]] auto isValid() const noexcept -> bool;

private:
    int32_t m_fd{-1};
};
}  // namespace conduit::network
