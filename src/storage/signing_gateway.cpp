#include "clipcloud/storage/signing_gateway.hpp"

#include "clipcloud/network/encoding.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <optional>

namespace clipcloud::storage {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::url_encode_component;

namespace {

constexpr const char* kCredentialsRejected = "Login to cloud store failed, check your credentials";

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<std::uint64_t> as_unsigned(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer()) {
        const auto signed_value = value.get<std::int64_t>();
        if (signed_value < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(signed_value);
    }
    if (value.is_number_float()) {
        const auto real = value.get<double>();
        if (real < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(real);
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        char* end = nullptr;
        const auto parsed = std::strtoull(text.c_str(), &end, 10);
        if (text.empty() || end == text.c_str()) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(parsed);
    }
    return std::nullopt;
}

Result<HttpResponse> check_status(HttpResponse response, const std::string& action) {
    if (response.status_code == 401 || response.status_code == 403) {
        spdlog::error("[SigningGateway] {}: credentials rejected ({}) {}", action, response.status_code, response.body);
        return Fail<HttpResponse>(ErrorKind::Authorization, kCredentialsRejected,
                                  response.status_code, response.body);
    }
    if (!response.is_success()) {
        spdlog::error("[SigningGateway] {} failed ({}) {}", action, response.status_code, response.body);
        return Fail<HttpResponse>(ErrorKind::Transfer, "Failed to " + action,
                                  response.status_code, response.body);
    }
    return Ok(std::move(response));
}

} // namespace

SigningGateway::SigningGateway(network::HttpClient& http,
                               std::string api_endpoint,
                               std::string bucket,
                               const std::string& user,
                               const std::string& password)
    : http_(http),
      api_endpoint_(std::move(api_endpoint)),
      bucket_(std::move(bucket)),
      auth_header_(network::basic_auth_header(user, password)) {

    while (!api_endpoint_.empty() && api_endpoint_.back() == '/') {
        api_endpoint_.pop_back();
    }
    spdlog::info("[SigningGateway] Creating client for bucket {} as {}", bucket_, user);
}

SigningGateway::SigningGateway(network::HttpClient& http, const core::ClientConfig& config)
    : SigningGateway(http, config.api_endpoint, config.bucket, config.user, config.password) {}

HttpRequest SigningGateway::make_request(HttpMethod method, const std::string& path) const {
    HttpRequest request;
    request.method = method;
    request.url = api_endpoint_ + "/" + url_encode_component(bucket_) + "/" + path;
    request.set_header("Authorization", auth_header_);
    return request;
}

Result<HttpResponse> SigningGateway::send(const HttpRequest& request, const std::string& action) {
    auto result = http_.perform(request);
    if (result.is_error()) {
        spdlog::error("[SigningGateway] {}: {}", action, result.error().message);
        return Fail<HttpResponse>(ErrorKind::Transfer, "Failed to " + action + ": " + result.error().message);
    }
    return result;
}

Result<HttpResponse> SigningGateway::execute(const HttpRequest& request, const std::string& action) {
    auto result = send(request, action);
    if (result.is_error()) {
        return result;
    }
    return check_status(std::move(result.value()), action);
}

Result<json> SigningGateway::parse_json(const std::string& body, const std::string& action) {
    auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return Fail<json>(ErrorKind::Transfer, "Malformed response to " + action, 0, body);
    }
    return Ok(std::move(parsed));
}

Result<std::string> SigningGateway::sign_put(const std::string& key, std::uint64_t length) {
    spdlog::info("[SigningGateway] Getting signed PUT URL {} {}", key, length);
    const std::string action = "get signed upload request";

    auto request = make_request(HttpMethod::GET,
                                "upload/" + url_encode_component(key) + "/" + std::to_string(length));
    auto response = execute(request, action);
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }

    auto body = parse_json(response.value().body, action);
    if (body.is_error()) {
        return Err<std::string>(body.error());
    }
    const auto& data = body.value();
    if (!data.is_object() || !data.contains("signed") || !data["signed"].is_string()) {
        return Fail<std::string>(ErrorKind::Transfer, "Signed upload response has no URL", 0,
                                 response.value().body);
    }
    return Ok(data["signed"].get<std::string>());
}

Result<MultipartSession> SigningGateway::create_multipart_session(const std::string& key, std::uint64_t length) {
    spdlog::info("[SigningGateway] Create signed multipart upload {} {}", key, length);
    const std::string action = "get signed multipart upload request";

    auto request = make_request(HttpMethod::GET,
                                "create-multipart-upload/" + url_encode_component(key) + "/" +
                                std::to_string(length));
    auto response = execute(request, action);
    if (response.is_error()) {
        return Err<MultipartSession>(response.error());
    }

    auto body = parse_json(response.value().body, action);
    if (body.is_error()) {
        return Err<MultipartSession>(body.error());
    }
    const auto& data = body.value();
    if (!data.is_object() || !data.contains("urls") || !data["urls"].is_array() || data["urls"].empty()) {
        return Fail<MultipartSession>(ErrorKind::Transfer, "Multipart upload response has no part URLs", 0,
                                      response.value().body);
    }

    MultipartSession session;
    for (const auto& url : data["urls"]) {
        if (!url.is_string()) {
            return Fail<MultipartSession>(ErrorKind::Transfer, "Multipart upload response has a non-string URL",
                                          0, response.value().body);
        }
        session.part_urls.push_back(url.get<std::string>());
    }
    return Ok(std::move(session));
}

Result<void> SigningGateway::complete_multipart_session(const std::string& key,
                                                        const std::vector<std::string>& ordered_tokens) {
    spdlog::info("[SigningGateway] Complete signed multipart upload {} ({} parts)", key, ordered_tokens.size());

    auto request = make_request(HttpMethod::POST, "complete-multipart-upload/" + url_encode_component(key));
    request.set_header("Content-Type", "application/json");
    request.body = json{{"etags", ordered_tokens}}.dump();

    auto response = execute(request, "complete multipart upload");
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<std::string> SigningGateway::get_clock() {
    const std::string action = "get logical clock";
    auto result = send(make_request(HttpMethod::GET, "mtime"), action);
    if (result.is_error()) {
        return Err<std::string>(result.error());
    }

    const auto& response = result.value();
    if (response.status_code == 404 || response.body.find("NoSuchKey") != std::string::npos) {
        return Fail<std::string>(ErrorKind::NotFound, "Logical clock does not exist yet",
                                 response.status_code, response.body);
    }

    auto checked = check_status(response, action);
    if (checked.is_error()) {
        return Err<std::string>(checked.error());
    }

    std::string value = trim(response.body);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    if (value.empty()) {
        return Fail<std::string>(ErrorKind::Transfer, "Logical clock response was empty", response.status_code);
    }
    return Ok(std::move(value));
}

Result<void> SigningGateway::set_clock(const std::string& value) {
    auto response = execute(make_request(HttpMethod::POST, "mtime/" + url_encode_component(value)),
                            "update logical clock");
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    return Ok();
}

Result<std::uint64_t> SigningGateway::object_size(const std::string& key) {
    const std::string action = "get object size";
    auto response = execute(make_request(HttpMethod::GET, "size/" + url_encode_component(key)), action);
    if (response.is_error()) {
        return Err<std::uint64_t>(response.error());
    }

    auto body = parse_json(response.value().body, action);
    if (body.is_error()) {
        return Err<std::uint64_t>(body.error());
    }
    const auto& data = body.value();
    if (!data.is_object() || !data.contains("size")) {
        return Fail<std::uint64_t>(ErrorKind::Transfer, "Object size response has no size", 0,
                                   response.value().body);
    }
    auto size = as_unsigned(data["size"]);
    if (!size) {
        return Fail<std::uint64_t>(ErrorKind::Transfer, "Object size is not a number", 0, response.value().body);
    }
    spdlog::info("[SigningGateway] Object {} is {} bytes", key, *size);
    return Ok(*size);
}

Result<void> SigningGateway::delete_object(const std::string& key) {
    spdlog::info("[SigningGateway] Deleting {}", key);
    auto response = execute(make_request(HttpMethod::DELETE_METHOD, url_encode_component(key)), "delete object");
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    spdlog::info("[SigningGateway] Deleted {}", key);
    return Ok();
}

Result<std::uint64_t> SigningGateway::usage() {
    const std::string action = "get bucket usage";
    auto response = execute(make_request(HttpMethod::GET, "usage"), action);
    if (response.is_error()) {
        return Err<std::uint64_t>(response.error());
    }

    auto body = parse_json(response.value().body, action);
    if (body.is_error()) {
        return Err<std::uint64_t>(body.error());
    }
    const auto& data = body.value();
    std::optional<std::uint64_t> used;
    if (data.is_object() && data.contains("usage")) {
        used = as_unsigned(data["usage"]);
    }
    if (!used) {
        return Fail<std::uint64_t>(ErrorKind::Transfer, "Usage response has no usage", 0, response.value().body);
    }
    return Ok(*used);
}

Result<double> SigningGateway::max_storage_gb() {
    spdlog::info("[SigningGateway] Get max storage from API");
    const std::string action = "get max storage";
    auto response = execute(make_request(HttpMethod::GET, "storage"), action);
    if (response.is_error()) {
        return Err<double>(response.error());
    }

    auto body = parse_json(response.value().body, action);
    if (body.is_error()) {
        return Err<double>(body.error());
    }
    const auto& data = body.value();
    if (!data.is_object() || !data.contains("maxGB") || !data["maxGB"].is_number()) {
        return Fail<double>(ErrorKind::Transfer, "Storage response has no maxGB", 0, response.value().body);
    }
    const double max_gb = data["maxGB"].get<double>();
    spdlog::info("[SigningGateway] Max storage was {}", max_gb);
    return Ok(max_gb);
}

Result<void> SigningGateway::authenticate() {
    auto response = execute(make_request(HttpMethod::GET, "auth"), "log into cloud store");
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    spdlog::info("[SigningGateway] Auth success!");
    return Ok();
}

Result<json> SigningGateway::run_housekeeping() {
    spdlog::info("[SigningGateway] Run housekeeper");
    auto response = execute(make_request(HttpMethod::POST, "housekeeping"), "run housekeeping");
    if (response.is_error()) {
        return Err<json>(response.error());
    }

    // The summary is informational only; an unparseable one is kept as text
    auto parsed = json::parse(response.value().body, nullptr, false);
    json summary = parsed.is_discarded() ? json(response.value().body) : std::move(parsed);
    spdlog::info("[SigningGateway] Housekeeping results: {}", summary.dump());
    return Ok(std::move(summary));
}

} // namespace clipcloud::storage
