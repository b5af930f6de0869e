#pragma once

#include "conduit/common/anySender.hpp"

#include <exception>

#include <stdexec/execution.hpp>

namespace conduit::common
{
// Type-erased sender of a T. Used where a chain needs a single sender type
// across branches (short-circuits, retries, Next); allocates on construction.
template <typename T>
using ResultSender = any_sender_of<
    stdexec::set_value_t(T),
    stdexec::set_error_t(std::exception_ptr),
    stdexec::set_stopped_t()
>;
}  // namespace conduit::common
