#pragma once

#include "conduit/client/clientBuilder.hpp"
#include "conduit/client/clientWithMiddleware.hpp"
#include "conduit/client/requestBuilder.hpp"
#include "conduit/context/extensions.hpp"
#include "conduit/core/config.hpp"
#include "conduit/core/logger.hpp"
#include "conduit/error/error.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/middleware/fnMiddleware.hpp"
#include "conduit/middleware/identity.hpp"
#include "conduit/middleware/stack.hpp"
#include "conduit/middlewares/defaultHeaders.hpp"
#include "conduit/middlewares/loggingLayer.hpp"
#include "conduit/middlewares/requestId.hpp"
#include "conduit/middlewares/retryLayer.hpp"
#include "conduit/transport/tcpTransport.hpp"
