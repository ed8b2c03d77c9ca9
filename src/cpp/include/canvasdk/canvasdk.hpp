/**
 * @file canvasdk.hpp
 * @brief Main include file for CanvaSDK C++
 *
 * CanvaSDK - C++ client for the Canva Connect API: OAuth 2.0 with PKCE,
 * token refresh, a retrying request gateway and asynchronous jobs.
 */

#ifndef CANVASDK_HPP
#define CANVASDK_HPP

#include "types.hpp"
#include "errors.hpp"
#include "cancellation.hpp"
#include "logging.hpp"
#include "transport.hpp"
#include "credential_store.hpp"
#include "auth.hpp"
#include "token_manager.hpp"
#include "gateway.hpp"
#include "jobs.hpp"
#include "config.hpp"
#include "tools.hpp"
#include "client.hpp"

namespace canvasdk {

/// Library version
constexpr const char* VERSION = "0.1.0";

} // namespace canvasdk

#endif // CANVASDK_HPP
