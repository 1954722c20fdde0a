#include "clipcloud/transfer/single_part_uploader.hpp"

#include "clipcloud/transfer/content_type.hpp"
#include "clipcloud/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace clipcloud::transfer {

namespace fs = std::filesystem;

SinglePartUploader::SinglePartUploader(network::HttpClient& http, storage::SigningGateway& gateway)
    : http_(http), gateway_(gateway) {}

Result<void> SinglePartUploader::upload(const std::string& file_path, const ProgressCallback& progress) {
    const std::string key = fs::path(file_path).filename().string();

    auto content_type = content_type_for(key);
    if (content_type.is_error()) {
        return Err<void>(content_type.error());
    }

    std::error_code ec;
    const auto length = fs::file_size(file_path, ec);
    if (ec) {
        return Fail<void>(ErrorKind::Transfer, "Cannot read " + file_path + ": " + ec.message());
    }

    spdlog::info("[SinglePartUploader] Uploading {} ({} bytes)", key, length);

    auto signed_url = gateway_.sign_put(key, length);
    if (signed_url.is_error()) {
        return Err<void>(signed_url.error());
    }

    network::HttpRequest request;
    request.method = network::HttpMethod::PUT;
    request.url = signed_url.value();
    request.set_header("Content-Type", content_type.value());
    request.set_header("Content-Length", std::to_string(length));
    request.file_body = network::FileBody{file_path, 0, length};

    ProgressReporter reporter(progress);
    reporter.report(0);

    network::TransferHooks hooks;
    hooks.upload_progress = [&reporter, length](std::uint64_t sent, std::uint64_t) {
        reporter.report_fraction(sent, length);
    };

    auto result = http_.perform(request, hooks);
    if (result.is_error()) {
        return Fail<void>(ErrorKind::Transfer, "Failed to upload " + key + ": " + result.error().message);
    }

    const auto& response = result.value();
    if (!response.is_success()) {
        spdlog::error("[SinglePartUploader] Upload of {} failed ({}) {}", key, response.status_code, response.body);
        return Fail<void>(ErrorKind::Transfer, "Failed to upload " + key, response.status_code, response.body);
    }

    reporter.finish();
    spdlog::info("[SinglePartUploader] Uploaded {}", key);
    return Ok();
}

} // namespace clipcloud::transfer
