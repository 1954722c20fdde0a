#include "clipcloud/transfer/downloader.hpp"

#include "clipcloud/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace clipcloud::transfer {

namespace fs = std::filesystem;

namespace {

void discard_partial(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("[Downloader] Could not remove partial file {}: {}", path.string(), ec.message());
    }
}

// Keys are written as a single file name directly inside the destination directory
bool is_plain_file_name(const std::string& key) {
    if (key.empty() || key == "." || key == "..") {
        return false;
    }
    return fs::path(key).filename().string() == key;
}

} // namespace

Downloader::Downloader(network::HttpClient& http, storage::SigningGateway& gateway)
    : http_(http), gateway_(gateway) {}

Result<std::uint64_t> Downloader::download(const std::string& key,
                                           const std::string& source_url,
                                           const std::string& dest_dir,
                                           const ProgressCallback& progress) {
    if (!is_plain_file_name(key)) {
        spdlog::error("[Downloader] Refusing to download {}: key is not a plain file name", key);
        return Fail<std::uint64_t>(ErrorKind::Transfer,
                                   "Refusing to download " + key + " outside " + dest_dir);
    }

    auto size = gateway_.object_size(key);
    if (size.is_error()) {
        return Err<std::uint64_t>(size.error());
    }
    const std::uint64_t expected = size.value();

    const fs::path destination = fs::path(dest_dir) / key;
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Fail<std::uint64_t>(ErrorKind::Transfer, "Cannot open " + destination.string() + " for writing");
    }

    spdlog::info("[Downloader] Downloading {} ({} bytes) to {}", key, expected, destination.string());

    ProgressReporter reporter(progress);
    std::uint64_t received = 0;
    bool write_failed = false;

    network::TransferHooks hooks;
    hooks.body_sink = [&](const char* data, std::size_t length) {
        out.write(data, static_cast<std::streamsize>(length));
        if (!out) {
            write_failed = true;
            return false;
        }
        received += length;
        reporter.report_fraction(received, expected);
        return true;
    };

    network::HttpRequest request;
    request.method = network::HttpMethod::GET;
    request.url = source_url;

    auto result = http_.perform(request, hooks);

    if (write_failed) {
        out.close();
        discard_partial(destination);
        return Fail<std::uint64_t>(ErrorKind::Transfer, "Failed writing " + destination.string());
    }
    if (result.is_error()) {
        out.close();
        discard_partial(destination);
        return Fail<std::uint64_t>(ErrorKind::Transfer, "Failed to download " + key + ": " + result.error().message);
    }

    const auto& response = result.value();
    if (!response.is_success()) {
        out.close();
        discard_partial(destination);
        spdlog::error("[Downloader] Download of {} failed ({}) {}", key, response.status_code, response.body);
        return Fail<std::uint64_t>(ErrorKind::Transfer, "Failed to download " + key,
                                   response.status_code, response.body);
    }

    out.close();
    if (out.fail()) {
        discard_partial(destination);
        return Fail<std::uint64_t>(ErrorKind::Transfer, "Failed to finish writing " + destination.string());
    }

    reporter.finish();
    spdlog::info("[Downloader] Downloaded {} ({} bytes)", key, received);
    return Ok(received);
}

} // namespace clipcloud::transfer
