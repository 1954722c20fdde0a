#pragma once

#include "clipcloud/core/result.hpp"

#include <chrono>
#include <string>

namespace clipcloud::core {

inline constexpr const char* kProductionEndpoint = "https://warcraft-recorder-api-v2.alex-kershaw4.workers.dev";
inline constexpr const char* kDevelopmentEndpoint = "https://warcraft-recorder-dev.alex-kershaw4.workers.dev";

/**
 * @brief Settings needed to reach one bucket on the signing/metadata authority
 */
struct ClientConfig {
    std::string api_endpoint = kProductionEndpoint;
    std::string user;
    std::string password;
    std::string bucket;                                    ///< Guild name, one bucket per guild
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds request_timeout{0};               ///< 0 = no limit, uploads can take hours
    std::chrono::seconds poll_interval{30};
};

/**
 * @brief Read CLIPCLOUD_* environment variables without requiring any
 *
 * Fails only on values that cannot be parsed. Callers that layer other
 * sources on top must call validate() themselves.
 */
Result<ClientConfig> read_config_from_env();

/**
 * @brief Build a validated config from CLIPCLOUD_* environment variables
 *
 * CLIPCLOUD_USER, CLIPCLOUD_PASSWORD and CLIPCLOUD_BUCKET are required.
 * CLIPCLOUD_API_ENDPOINT overrides the endpoint; otherwise CLIPCLOUD_DEV=1
 * selects the development endpoint. CLIPCLOUD_POLL_SECONDS sets the poll
 * interval.
 */
Result<ClientConfig> load_config_from_env();

/**
 * @brief Check a config assembled from any source
 */
Result<void> validate(const ClientConfig& config);

} // namespace clipcloud::core
