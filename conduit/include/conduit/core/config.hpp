#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace conduit::core
{
using namespace std::chrono_literals;

struct TransportConfig
{
    std::size_t workerThreads{4};
    std::chrono::milliseconds connectTimeout{10s};
    // Applied when a request carries no timeout of its own.
    std::chrono::milliseconds requestTimeout{30s};
    std::size_t maxResponseBytes{16 * 1024 * 1024};
    std::string userAgent{"conduit/0.1"};

    // Defaults overridden by CONDUIT_WORKER_THREADS, CONDUIT_CONNECT_TIMEOUT_MS,
    // CONDUIT_REQUEST_TIMEOUT_MS, CONDUIT_MAX_RESPONSE_BYTES and
    // CONDUIT_USER_AGENT. Throws std::invalid_argument on malformed values.
    static auto fromEnvironment() -> TransportConfig;

    // Throws std::invalid_argument when a value is out of range.
    auto validate() const -> void;
};
}  // namespace conduit::core
