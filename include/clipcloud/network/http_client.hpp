#pragma once

#include "clipcloud/core/result.hpp"
#include "clipcloud/network/http_types.hpp"

namespace clipcloud {
namespace network {

/**
 * @brief Blocking HTTP transport
 *
 * Any HTTP status, including 4xx/5xx, is a successful Result: interpreting
 * the status is the caller's job. An error Result means no usable response
 * was received (DNS, TLS, connection reset, aborted sink, unreadable body
 * file) and always has kind Transfer and status 0.
 *
 * Implementations must stream `FileBody` payloads and `body_sink` output
 * rather than buffering them.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> perform(const HttpRequest& request,
                                         const TransferHooks& hooks) = 0;

    Result<HttpResponse> perform(const HttpRequest& request) {
        return perform(request, TransferHooks{});
    }
};

} // namespace network
} // namespace clipcloud
