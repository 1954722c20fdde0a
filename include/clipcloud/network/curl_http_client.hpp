#pragma once

#include "clipcloud/network/http_client.hpp"

#include <chrono>

namespace clipcloud {
namespace network {

struct CurlOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds request_timeout{0};  ///< 0 disables the overall limit
    bool verify_tls = true;
};

/**
 * @brief libcurl easy-interface transport
 *
 * One easy handle per request; no connection reuse across calls. Redirects
 * are not followed: signed URLs must be hit directly or the upload body
 * would need to be replayed.
 *
 * Thread safety: distinct requests may run on distinct threads.
 */
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(CurlOptions options = {});

    using HttpClient::perform;
    Result<HttpResponse> perform(const HttpRequest& request,
                                 const TransferHooks& hooks) override;

private:
    CurlOptions options_;
};

} // namespace network
} // namespace clipcloud
