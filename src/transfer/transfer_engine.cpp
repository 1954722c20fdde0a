#include "clipcloud/transfer/transfer_engine.hpp"

#include "clipcloud/events/events.hpp"
#include "clipcloud/transfer/downloader.hpp"
#include "clipcloud/transfer/multi_part_uploader.hpp"
#include "clipcloud/transfer/single_part_uploader.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>

namespace clipcloud::transfer {

namespace fs = std::filesystem;

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

TransferEngine::TransferEngine(network::HttpClient& http,
                               storage::SigningGateway& gateway,
                               sync::ChangeDetector& detector,
                               events::EventBus& bus,
                               TransferPolicy policy)
    : http_(http), gateway_(gateway), detector_(detector), bus_(bus), policy_(policy) {}

void TransferEngine::report_failure(const std::string& key, const std::string& operation, const Error& error) {
    spdlog::error("[TransferEngine] {} {} failed: {}", operation, key, error.describe());
    bus_.emit(events::TransferFailedEvent{key, operation, error});
}

Result<void> TransferEngine::after_mutation(const std::string& key, const std::string& operation) {
    auto advanced = detector_.advance_clock();
    if (advanced.is_error()) {
        report_failure(key, operation, advanced.error());
        return Err<void>(advanced.error());
    }
    return Ok();
}

Result<void> TransferEngine::upload(const std::string& file_path, const ProgressCallback& progress) {
    const std::string key = fs::path(file_path).filename().string();

    auto valid = policy_.validate();
    if (valid.is_error()) {
        report_failure(key, "upload", valid.error());
        return valid;
    }

    std::error_code ec;
    const auto length = fs::file_size(file_path, ec);
    if (ec) {
        auto error = make_error(ErrorKind::Transfer, "Cannot read " + file_path + ": " + ec.message());
        report_failure(key, "upload", error);
        return Err<void>(error);
    }

    const bool multipart = policy_.use_multipart(length);
    spdlog::info("[TransferEngine] Uploading {} ({} bytes) as {}", key, length, multipart ? "multipart" : "single");
    bus_.emit(events::UploadStartedEvent(key, length, multipart));

    const auto start = std::chrono::steady_clock::now();
    std::size_t parts = 1;

    if (multipart) {
        MultiPartUploader uploader(http_, gateway_, bus_, policy_);
        auto result = uploader.upload(file_path, progress);
        if (result.is_error()) {
            report_failure(key, "upload", result.error());
            return Err<void>(result.error());
        }
        parts = result.value();
    } else {
        SinglePartUploader uploader(http_, gateway_);
        auto result = uploader.upload(file_path, progress);
        if (result.is_error()) {
            report_failure(key, "upload", result.error());
            return result;
        }
    }

    bus_.emit(events::UploadCompletedEvent{key, length, parts, elapsed_since(start)});
    return after_mutation(key, "upload");
}

Result<void> TransferEngine::put_json(const std::string& text, const std::string& key) {
    spdlog::info("[TransferEngine] Uploading json {}", key);
    const auto start = std::chrono::steady_clock::now();
    const std::uint64_t length = text.size();

    auto signed_url = gateway_.sign_put(key, length);
    if (signed_url.is_error()) {
        report_failure(key, "put-json", signed_url.error());
        return Err<void>(signed_url.error());
    }

    network::HttpRequest request;
    request.method = network::HttpMethod::PUT;
    request.url = signed_url.value();
    request.set_header("Content-Type", "application/json");
    request.set_header("Content-Length", std::to_string(length));
    request.body = text;

    auto result = http_.perform(request);
    if (result.is_error()) {
        auto error = make_error(ErrorKind::Transfer, "Failed to upload " + key + ": " + result.error().message);
        report_failure(key, "put-json", error);
        return Err<void>(error);
    }
    if (result.value().status_code >= 400) {
        auto error = make_error(ErrorKind::Transfer, "Failed to upload " + key,
                                result.value().status_code, result.value().body);
        report_failure(key, "put-json", error);
        return Err<void>(error);
    }

    bus_.emit(events::UploadCompletedEvent{key, length, 1, elapsed_since(start)});
    return after_mutation(key, "put-json");
}

Result<void> TransferEngine::remove(const std::string& key) {
    auto deleted = gateway_.delete_object(key);
    if (deleted.is_error()) {
        report_failure(key, "delete", deleted.error());
        return deleted;
    }

    bus_.emit(events::ObjectDeletedEvent{key});
    return after_mutation(key, "delete");
}

Result<std::uint64_t> TransferEngine::download(const std::string& key,
                                               const std::string& source_url,
                                               const std::string& dest_dir,
                                               const ProgressCallback& progress) {
    const auto start = std::chrono::steady_clock::now();

    Downloader downloader(http_, gateway_);
    auto result = downloader.download(key, source_url, dest_dir, progress);
    if (result.is_error()) {
        report_failure(key, "download", result.error());
        return result;
    }

    const auto destination = (fs::path(dest_dir) / key).string();
    bus_.emit(events::DownloadCompletedEvent{key, destination, result.value(), elapsed_since(start)});
    return result;
}

} // namespace clipcloud::transfer
