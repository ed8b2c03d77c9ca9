/**
 * @file transport.hpp
 * @brief HTTP transport abstraction for CanvaSDK C++
 */

#ifndef CANVASDK_TRANSPORT_HPP
#define CANVASDK_TRANSPORT_HPP

#include "types.hpp"

namespace canvasdk {

/**
 * Sends a single HTTP request with no retry or auth policy.
 *
 * Implementations return any HTTP status as a response and throw
 * ConnectionError only when no response was received.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Send a request
     * @param request Request to send
     * @return Response with status, headers and body
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * libcurl easy-handle transport, one handle per request
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    HttpResponse send(const HttpRequest& request) override;
};

} // namespace canvasdk

#endif // CANVASDK_TRANSPORT_HPP
