#include "clipcloud/transfer/multi_part_uploader.hpp"

#include "clipcloud/events/events.hpp"
#include "clipcloud/transfer/content_type.hpp"
#include "clipcloud/transfer/part_plan.hpp"
#include "clipcloud/transfer/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <vector>

namespace clipcloud::transfer {

namespace fs = std::filesystem;

namespace {

std::string strip_quotes(std::string token) {
    token.erase(std::remove(token.begin(), token.end(), '"'), token.end());
    return token;
}

// Whole parts done plus the current part's share, in percent
int part_progress(std::size_t index, std::size_t count, std::uint64_t sent, std::uint64_t part_bytes) {
    const double n = static_cast<double>(count);
    double within = 0.0;
    if (part_bytes > 0) {
        within = static_cast<double>(sent) / static_cast<double>(part_bytes);
    }
    return static_cast<int>(std::lround((static_cast<double>(index) / n) * 100.0 + (1.0 / n) * within * 100.0));
}

} // namespace

MultiPartUploader::MultiPartUploader(network::HttpClient& http,
                                     storage::SigningGateway& gateway,
                                     events::EventBus& bus,
                                     TransferPolicy policy)
    : http_(http), gateway_(gateway), bus_(bus), policy_(policy) {}

Result<std::size_t> MultiPartUploader::upload(const std::string& file_path, const ProgressCallback& progress) {
    const std::string key = fs::path(file_path).filename().string();

    auto content_type = content_type_for(key);
    if (content_type.is_error()) {
        return Err<std::size_t>(content_type.error());
    }

    std::error_code ec;
    const auto total = fs::file_size(file_path, ec);
    if (ec) {
        return Fail<std::size_t>(ErrorKind::Transfer, "Cannot read " + file_path + ": " + ec.message());
    }

    spdlog::info("[MultiPartUploader] Uploading {} ({} bytes) in parts", key, total);

    auto session = gateway_.create_multipart_session(key, total);
    if (session.is_error()) {
        return Err<std::size_t>(session.error());
    }
    const auto& urls = session.value().part_urls;

    auto plan = plan_parts(total, policy_.part_size, urls.size());
    if (plan.is_error()) {
        spdlog::error("[MultiPartUploader] {}", plan.error().message);
        return Err<std::size_t>(plan.error());
    }
    const auto& parts = plan.value();
    const std::size_t count = parts.size();

    ProgressReporter reporter(progress);
    reporter.report(0);

    std::vector<std::string> tokens;
    tokens.reserve(count);

    for (const auto& part : parts) {
        const std::size_t number = part.index + 1;
        spdlog::debug("[MultiPartUploader] Uploading part {}/{} of {} (offset {}, {} bytes)",
                      number, count, key, part.offset, part.length);

        network::HttpRequest request;
        request.method = network::HttpMethod::PUT;
        request.url = urls[part.index];
        request.set_header("Content-Type", content_type.value());
        request.set_header("Content-Length", std::to_string(part.length));
        request.file_body = network::FileBody{file_path, part.offset, part.length};

        network::TransferHooks hooks;
        hooks.upload_progress = [&reporter, &part, count](std::uint64_t sent, std::uint64_t) {
            reporter.report(part_progress(part.index, count, sent, part.length));
        };

        auto result = http_.perform(request, hooks);
        if (result.is_error()) {
            return Fail<std::size_t>(ErrorKind::Transfer,
                                     "Failed to upload part " + std::to_string(number) + " of " + key + ": " +
                                     result.error().message);
        }

        const auto& response = result.value();
        if (!response.is_success()) {
            spdlog::error("[MultiPartUploader] Part {} of {} failed ({}) {}",
                          number, key, response.status_code, response.body);
            return Fail<std::size_t>(ErrorKind::Transfer,
                                     "Failed to upload part " + std::to_string(number) + " of " + key,
                                     response.status_code, response.body);
        }

        auto token = strip_quotes(response.get_header("ETag"));
        if (token.empty()) {
            return Fail<std::size_t>(ErrorKind::Transfer,
                                     "Part " + std::to_string(number) + " of " + key + " returned no ETag",
                                     response.status_code, response.body);
        }

        tokens.push_back(token);
        reporter.report_fraction(part.end(), total);
        bus_.emit(events::PartUploadedEvent{key, part.index, count, part.length, token});
    }

    auto completed = gateway_.complete_multipart_session(key, tokens);
    if (completed.is_error()) {
        return Err<std::size_t>(completed.error());
    }

    reporter.finish();
    spdlog::info("[MultiPartUploader] Uploaded {} in {} parts", key, count);
    return Ok(count);
}

} // namespace clipcloud::transfer
