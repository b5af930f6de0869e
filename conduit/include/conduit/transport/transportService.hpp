#pragma once

#include <exception>
#include <memory>
#include <utility>

#include <stdexec/execution.hpp>

#include "conduit/context/extensions.hpp"
#include "conduit/error/error.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/transport/transportConcept.hpp"

namespace conduit::transport
{
// Terminal unit of work: hands the request to the engine and maps whatever
// the engine fails with onto error::Error of kind transport.
template <TransportEngineConcept Engine>
class TransportService
{
public:
    explicit TransportService(std::shared_ptr<Engine> t_engine) : m_engine(std::move(t_engine)) {}

    auto call(http::Request t_request, context::Extensions& /*t_extensions*/)
    {
        return m_engine->execute(std::move(t_request)) | stdexec::let_error([](std::exception_ptr t_error) {
                   return stdexec::just_error(error::toTransportError(std::move(t_error)));
               });
    }

private:
    std::shared_ptr<Engine> m_engine;
};
}  // namespace conduit::transport
