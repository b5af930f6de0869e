#include "conduit/middlewares/requestId.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <random>
#include <string>
#include <utility>

namespace
{
std::atomic<uint64_t> g_sequence{0};
}  // namespace

namespace conduit::middlewares
{
RequestIdInitializer::RequestIdInitializer()
{
    std::random_device device;
    m_prefix = std::format("{:08x}", device());
}

auto RequestIdInitializer::init(http::RequestBuilder t_builder, context::Extensions& t_extensions) const
    -> http::RequestBuilder
{
    auto id = std::format("{}-{}", m_prefix, g_sequence.fetch_add(1, std::memory_order_relaxed) + 1);

    t_extensions.insert(RequestId{id});

    return std::move(t_builder).header("X-Request-Id", id);
}
}  // namespace conduit::middlewares
