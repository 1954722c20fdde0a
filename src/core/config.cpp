#include "clipcloud/core/config.hpp"

#include <cstdlib>
#include <string>

namespace clipcloud::core {
namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool is_truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes";
}

} // namespace

Result<ClientConfig> read_config_from_env() {
    ClientConfig config;
    config.user = env_or_empty("CLIPCLOUD_USER");
    config.password = env_or_empty("CLIPCLOUD_PASSWORD");
    config.bucket = env_or_empty("CLIPCLOUD_BUCKET");

    const auto endpoint = env_or_empty("CLIPCLOUD_API_ENDPOINT");
    if (!endpoint.empty()) {
        config.api_endpoint = endpoint;
    } else if (is_truthy(env_or_empty("CLIPCLOUD_DEV"))) {
        config.api_endpoint = kDevelopmentEndpoint;
    }

    const auto poll = env_or_empty("CLIPCLOUD_POLL_SECONDS");
    if (!poll.empty()) {
        char* end = nullptr;
        const long seconds = std::strtol(poll.c_str(), &end, 10);
        if (end == poll.c_str() || *end != '\0' || seconds <= 0) {
            return Fail<ClientConfig>(ErrorKind::Configuration,
                                      "CLIPCLOUD_POLL_SECONDS must be a positive integer, got '" + poll + "'");
        }
        config.poll_interval = std::chrono::seconds(seconds);
    }

    return Ok(std::move(config));
}

Result<ClientConfig> load_config_from_env() {
    auto config = read_config_from_env();
    if (config.is_error()) {
        return config;
    }
    if (auto res = validate(config.value()); res.is_error()) {
        return Err<ClientConfig>(res.error());
    }
    return config;
}

Result<void> validate(const ClientConfig& config) {
    if (config.user.empty() || config.password.empty()) {
        return Fail<void>(ErrorKind::Configuration, "Cloud user and password are required");
    }
    if (config.bucket.empty()) {
        return Fail<void>(ErrorKind::Configuration, "Cloud bucket is required");
    }
    if (config.api_endpoint.empty()) {
        return Fail<void>(ErrorKind::Configuration, "API endpoint is empty");
    }
    if (config.poll_interval.count() <= 0) {
        return Fail<void>(ErrorKind::Configuration, "Poll interval must be positive");
    }
    return Ok();
}

} // namespace clipcloud::core
