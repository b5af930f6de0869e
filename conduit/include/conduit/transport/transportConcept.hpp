#pragma once

#include <concepts>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/http/httpMessages.hpp"

namespace conduit::transport
{
// An engine performs the actual exchange. Its sender completes with the
// response, or with an error the transport service maps to error::Error.
template <class E>
concept TransportEngineConcept = requires(E& t_engine, http::Request t_request) {
    { t_engine.execute(std::move(t_request)) } -> stdexec::sender;
};
}  // namespace conduit::transport
