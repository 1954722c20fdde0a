#include "clipcloud/storage/video_catalog.hpp"

#include "clipcloud/network/encoding.hpp"

#include <spdlog/spdlog.h>

namespace clipcloud::storage {

using json = nlohmann::json;
using network::HttpMethod;
using network::url_encode_component;

VideoCatalog::VideoCatalog(SigningGateway& gateway, sync::ChangeDetector& detector)
    : gateway_(gateway), detector_(detector) {}

Result<void> VideoCatalog::mutate(network::HttpRequest request, const std::string& action) {
    auto response = gateway_.execute(request, action);
    if (response.is_error()) {
        return Err<void>(response.error());
    }

    auto advanced = detector_.advance_clock();
    if (advanced.is_error()) {
        return Err<void>(advanced.error());
    }
    return Ok();
}

Result<json> VideoCatalog::list() {
    const std::string action = "get videos";
    auto response = gateway_.execute(gateway_.make_request(HttpMethod::GET, "videos"), action);
    if (response.is_error()) {
        return Err<json>(response.error());
    }

    auto parsed = SigningGateway::parse_json(response.value().body, action);
    if (parsed.is_error()) {
        return parsed;
    }
    if (!parsed.value().is_array()) {
        return Fail<json>(ErrorKind::Transfer, "Video list is not an array", 0, response.value().body);
    }
    spdlog::debug("[VideoCatalog] {} videos", parsed.value().size());
    return parsed;
}

Result<void> VideoCatalog::add(const json& record) {
    if (!record.is_object()) {
        return Fail<void>(ErrorKind::Transfer, "Video record must be a JSON object");
    }
    spdlog::info("[VideoCatalog] Adding video {}", record.value("name", std::string("<unnamed>")));

    auto request = gateway_.make_request(HttpMethod::POST, "videos");
    request.set_header("Content-Type", "application/json");
    request.body = record.dump();
    return mutate(std::move(request), "add video");
}

Result<void> VideoCatalog::remove(const std::string& name) {
    spdlog::info("[VideoCatalog] Deleting video {}", name);
    return mutate(gateway_.make_request(HttpMethod::DELETE_METHOD, "videos/" + url_encode_component(name)),
                  "delete video");
}

Result<void> VideoCatalog::protect(const std::string& name, bool is_protected) {
    spdlog::info("[VideoCatalog] Setting protected={} on {}", is_protected, name);

    auto request = gateway_.make_request(HttpMethod::POST, "videos/" + url_encode_component(name) + "/protected");
    request.set_header("Content-Type", "application/json");
    request.body = is_protected ? "true" : "false";
    return mutate(std::move(request), "protect video");
}

Result<void> VideoCatalog::tag(const std::string& name, const std::string& tag) {
    spdlog::info("[VideoCatalog] Tagging {} with {}", name, tag);

    auto request = gateway_.make_request(HttpMethod::POST, "videos/" + url_encode_component(name) + "/tag");
    request.set_header("Content-Type", "text/plain");
    request.body = tag;
    return mutate(std::move(request), "tag video");
}

} // namespace clipcloud::storage
