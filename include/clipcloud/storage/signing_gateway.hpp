/**
 * @file signing_gateway.hpp
 * @brief Client for the bucket's signing and metadata authority
 *
 * WHY THIS FILE EXISTS:
 * The client never holds object-store credentials. Every upload, session,
 * clock read and size lookup goes through this authority, which signs URLs
 * and enforces quota.
 *
 * WHAT IT DOES:
 * - Builds `<endpoint>/<bucket>/<route>` requests with Basic auth
 * - Maps status codes to ErrorKind (401/403 Authorization, 404 NotFound)
 * - Parses the authority's small JSON replies
 *
 * EXAMPLE:
 * SigningGateway gateway(http, config);
 * auto url = gateway.sign_put("match.mp4", 1048576);
 */

#pragma once

#include "clipcloud/core/config.hpp"
#include "clipcloud/core/result.hpp"
#include "clipcloud/network/http_client.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace clipcloud::storage {

/**
 * @brief Multi-part upload session as handed out by the authority
 *
 * The number of URLs is the number of parts; the client never picks it.
 */
struct MultipartSession {
    std::vector<std::string> part_urls;
};

/**
 * @brief Client for the bucket-scoped signing/metadata authority
 *
 * Every request carries the static Basic credential. Signing requests are
 * where the authority enforces bucket quota, so a refusal there is a
 * Transfer error carrying the authority's explanation in `body`.
 *
 * Stateless apart from configuration; no call is retried.
 */
class SigningGateway {
public:
    SigningGateway(network::HttpClient& http,
                   std::string api_endpoint,
                   std::string bucket,
                   const std::string& user,
                   const std::string& password);

    SigningGateway(network::HttpClient& http, const core::ClientConfig& config);

    Result<std::string> sign_put(const std::string& key, std::uint64_t length);

    Result<MultipartSession> create_multipart_session(const std::string& key, std::uint64_t length);

    Result<void> complete_multipart_session(const std::string& key,
                                            const std::vector<std::string>& ordered_tokens);

    /**
     * @brief Read the bucket's logical clock
     *
     * Fails with NotFound when the clock object has never been written.
     */
    Result<std::string> get_clock();

    Result<void> set_clock(const std::string& value);

    Result<std::uint64_t> object_size(const std::string& key);

    Result<void> delete_object(const std::string& key);

    Result<std::uint64_t> usage();

    Result<double> max_storage_gb();

    Result<void> authenticate();

    Result<nlohmann::json> run_housekeeping();

    const std::string& bucket() const noexcept { return bucket_; }

    // ── Shared with sibling clients on the same authority ──

    /**
     * @brief Authenticated request for `{endpoint}/{bucket}/{path}`
     *
     * `path` must already be percent-encoded per component.
     */
    network::HttpRequest make_request(network::HttpMethod method, const std::string& path) const;

    /**
     * @brief Perform a request and map the status to the error taxonomy
     *
     * 401/403 become Authorization, other non-2xx become Transfer with the
     * status and body attached. `action` names the step in messages.
     */
    Result<network::HttpResponse> execute(const network::HttpRequest& request, const std::string& action);

    static Result<nlohmann::json> parse_json(const std::string& body, const std::string& action);

private:
    Result<network::HttpResponse> send(const network::HttpRequest& request, const std::string& action);

    network::HttpClient& http_;
    std::string api_endpoint_;
    std::string bucket_;
    std::string auth_header_;
};

} // namespace clipcloud::storage
