#include "clipcloud/events/components.hpp"
#include "clipcloud/events/event_bus.hpp"
#include "clipcloud/events/events.hpp"
#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/sync/change_detector.hpp"
#include "clipcloud/transfer/transfer_engine.hpp"
#include "support/fake_http_client.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using clipcloud::ErrorKind;
using clipcloud::events::DownloadCompletedEvent;
using clipcloud::events::EventBus;
using clipcloud::events::MetricsComponent;
using clipcloud::events::ObjectDeletedEvent;
using clipcloud::events::TransferFailedEvent;
using clipcloud::events::UploadStartedEvent;
using clipcloud::network::HeaderMap;
using clipcloud::network::HttpMethod;
using clipcloud::storage::SigningGateway;
using clipcloud::sync::ChangeDetector;
using clipcloud::test_support::FakeHttpClient;
using clipcloud::transfer::TransferEngine;
using clipcloud::transfer::TransferPolicy;
using json = nlohmann::json;

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = clipcloud::test_support::create_temp_dir();
        http_.on(HttpMethod::POST, url("mtime/"), 200);
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) { started_.push_back(e.multipart); });
        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) { failed_.push_back(e.operation); });
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    static std::string url(const std::string& path) {
        return "https://api.test/guild/" + path;
    }

    std::size_t clock_pushes() const {
        std::size_t pushes = 0;
        for (const auto& request : http_.requests()) {
            if (request.method == HttpMethod::POST && request.url.rfind(url("mtime/"), 0) == 0) {
                ++pushes;
            }
        }
        return pushes;
    }

    std::size_t requests_matching(HttpMethod method, const std::string& prefix) const {
        std::size_t n = 0;
        for (const auto& request : http_.requests()) {
            if (request.method == method && request.url.rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }

    fs::path root_;
    FakeHttpClient http_;
    EventBus bus_;
    MetricsComponent metrics_{bus_};
    SigningGateway gateway_{http_, "https://api.test", "guild", "alice", "secret"};
    ChangeDetector detector_{gateway_, bus_};
    TransferEngine engine_{http_, gateway_, detector_, bus_, TransferPolicy{1000, 500}};
    std::vector<bool> started_;
    std::vector<std::string> failed_;
};

TEST_F(TransferEngineTest, SmallFileTakesSinglePartPath) {
    const auto file = root_ / "video.mp4";
    clipcloud::test_support::write_file(file, std::string(100, 'v'));

    http_.on(HttpMethod::GET, url("upload/video.mp4/100"), 200, R"({"signed":"https://store.test/video.mp4?s=1"})");
    http_.on(HttpMethod::PUT, "https://store.test/video.mp4", 200);

    const auto before = std::stoull(detector_.cached_clock());
    std::vector<int> progress;
    auto result = engine_.upload(file.string(), [&](int pct) { progress.push_back(pct); });
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    EXPECT_EQ(requests_matching(HttpMethod::GET, url("upload/")), 1u);
    EXPECT_EQ(requests_matching(HttpMethod::GET, url("create-multipart-upload/")), 0u);
    ASSERT_EQ(requests_matching(HttpMethod::PUT, "https://store.test/"), 1u);

    for (const auto& request : http_.requests()) {
        if (request.method == HttpMethod::PUT) {
            EXPECT_EQ(request.get_header("Content-Length"), "100");
            EXPECT_EQ(request.get_header("Content-Type"), "video/mp4");
        }
    }

    EXPECT_EQ(progress.back(), 100);
    EXPECT_EQ(started_, (std::vector<bool>{false}));
    EXPECT_EQ(clock_pushes(), 1u);
    EXPECT_GT(std::stoull(detector_.cached_clock()), before);
    EXPECT_EQ(metrics_.get_stats().uploads.load(), 1u);
    EXPECT_EQ(metrics_.get_stats().bytes_uploaded.load(), 100u);
}

TEST_F(TransferEngineTest, LengthEqualToThresholdTakesMultiPartPath) {
    const auto file = root_ / "edge.mp4";
    clipcloud::test_support::write_file(file, std::string(1000, 'e'));

    http_.on(HttpMethod::GET, url("create-multipart-upload/edge.mp4/1000"), 200,
             R"({"urls":["https://store.test/edge.mp4?part=1","https://store.test/edge.mp4?part=2"]})");
    http_.on(HttpMethod::PUT, "https://store.test/edge.mp4?part=1",
             FakeHttpClient::response(200, "", HeaderMap{{"ETag", "\"one\""}}));
    http_.on(HttpMethod::PUT, "https://store.test/edge.mp4?part=2",
             FakeHttpClient::response(200, "", HeaderMap{{"ETag", "\"two\""}}));
    http_.on(HttpMethod::POST, url("complete-multipart-upload/edge.mp4"), 200);

    auto result = engine_.upload(file.string());
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    EXPECT_EQ(requests_matching(HttpMethod::GET, url("upload/")), 0u);
    EXPECT_EQ(requests_matching(HttpMethod::PUT, "https://store.test/"), 2u);
    EXPECT_EQ(started_, (std::vector<bool>{true}));
    EXPECT_EQ(clock_pushes(), 1u);
    EXPECT_EQ(metrics_.get_stats().parts_uploaded.load(), 2u);
}

TEST_F(TransferEngineTest, UnsupportedTypeFailsWithoutNetwork) {
    const auto file = root_ / "clip.mov";
    clipcloud::test_support::write_file(file, "mov");

    auto result = engine_.upload(file.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::UnsupportedType));
    EXPECT_EQ(http_.request_count(), 0u);
    EXPECT_EQ(failed_, (std::vector<std::string>{"upload"}));
    EXPECT_EQ(metrics_.get_stats().failures.load(), 1u);
}

TEST_F(TransferEngineTest, FailedUploadLeavesClockAlone) {
    const auto file = root_ / "video.mp4";
    clipcloud::test_support::write_file(file, std::string(100, 'v'));
    http_.on(HttpMethod::GET, url("upload/video.mp4/100"), 400, "over quota");

    const auto before = detector_.cached_clock();
    auto result = engine_.upload(file.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().body, "over quota");
    EXPECT_EQ(clock_pushes(), 0u);
    EXPECT_EQ(detector_.cached_clock(), before);
}

TEST_F(TransferEngineTest, ClockPushFailureIsReturned) {
    const auto file = root_ / "video.mp4";
    clipcloud::test_support::write_file(file, std::string(100, 'v'));
    http_.on(HttpMethod::GET, url("upload/video.mp4/100"), 200, R"({"signed":"https://store.test/video.mp4"})");
    http_.on(HttpMethod::PUT, "https://store.test/video.mp4", 200);

    FakeHttpClient::Handler reject = [](const clipcloud::network::HttpRequest&) {
        return clipcloud::Ok(FakeHttpClient::response(500, "kv unavailable"));
    };
    http_.on(HttpMethod::POST, url("mtime/"), reject);

    // First queued route (200) is consumed by this push
    ASSERT_TRUE(detector_.advance_clock().is_ok());

    auto result = engine_.upload(file.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Transfer));
    EXPECT_EQ(result.error().status, 500);
}

TEST_F(TransferEngineTest, InvalidPolicyIsConfigurationError) {
    const auto file = root_ / "video.mp4";
    clipcloud::test_support::write_file(file, "v");

    TransferEngine engine(http_, gateway_, detector_, bus_, TransferPolicy{100, 0});
    auto result = engine.upload(file.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Configuration));
    EXPECT_EQ(http_.request_count(), 0u);
}

TEST_F(TransferEngineTest, PutJsonUploadsDocumentAndAdvancesClock) {
    const std::string text = R"({"a":"über"})";
    http_.on(HttpMethod::GET, url("upload/settings.json/" + std::to_string(text.size())), 200,
             R"({"signed":"https://store.test/settings.json"})");
    http_.on(HttpMethod::PUT, "https://store.test/settings.json", 200);

    auto result = engine_.put_json(text, "settings.json");
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    bool saw_put = false;
    for (const auto& request : http_.requests()) {
        if (request.method == HttpMethod::PUT) {
            saw_put = true;
            EXPECT_EQ(request.body, text);
            EXPECT_EQ(request.get_header("Content-Type"), "application/json");
            EXPECT_FALSE(request.file_body.has_value());
        }
    }
    EXPECT_TRUE(saw_put);
    EXPECT_EQ(clock_pushes(), 1u);
}

TEST_F(TransferEngineTest, PutJsonStoreErrorIsTransferError) {
    http_.on(HttpMethod::GET, url("upload/settings.json/2"), 200, R"({"signed":"https://store.test/settings.json"})");
    http_.on(HttpMethod::PUT, "https://store.test/settings.json", 400, "bad");

    auto result = engine_.put_json("{}", "settings.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Transfer));
    EXPECT_EQ(result.error().status, 400);
    EXPECT_EQ(clock_pushes(), 0u);
}

TEST_F(TransferEngineTest, RemoveDeletesAndAdvancesClock) {
    http_.on(HttpMethod::DELETE_METHOD, url("video.mp4"), 200);
    std::vector<std::string> deleted;
    bus_.subscribe<ObjectDeletedEvent>([&](const ObjectDeletedEvent& e) { deleted.push_back(e.key); });

    const auto before = std::stoull(detector_.cached_clock());
    auto result = engine_.remove("video.mp4");
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    EXPECT_EQ(deleted, (std::vector<std::string>{"video.mp4"}));
    EXPECT_GT(std::stoull(detector_.cached_clock()), before);
    EXPECT_EQ(clock_pushes(), 1u);
}

TEST_F(TransferEngineTest, ConsecutiveMutationsKeepRaisingClock) {
    http_.on(HttpMethod::DELETE_METHOD, url("a.mp4"), 200);
    http_.on(HttpMethod::DELETE_METHOD, url("b.mp4"), 200);

    ASSERT_TRUE(engine_.remove("a.mp4").is_ok());
    const auto first = std::stoull(detector_.cached_clock());
    ASSERT_TRUE(engine_.remove("b.mp4").is_ok());
    EXPECT_GT(std::stoull(detector_.cached_clock()), first);
}

TEST_F(TransferEngineTest, DownloadPublishesCompletionWithoutTouchingClock) {
    http_.on(HttpMethod::GET, url("size/clip.mp4"), 200, R"({"size":5})");
    http_.on(HttpMethod::GET, "https://store.test/clip.mp4", 200, "hello");

    std::vector<DownloadCompletedEvent> completed;
    bus_.subscribe<DownloadCompletedEvent>([&](const DownloadCompletedEvent& e) { completed.push_back(e); });

    auto result = engine_.download("clip.mp4", "https://store.test/clip.mp4", root_.string());
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].total_bytes, 5u);
    EXPECT_EQ(completed[0].destination, (root_ / "clip.mp4").string());
    EXPECT_EQ(clock_pushes(), 0u);
    EXPECT_EQ(metrics_.get_stats().bytes_downloaded.load(), 5u);
}
