#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/transfer/downloader.hpp"
#include "support/fake_http_client.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
using clipcloud::ErrorKind;
using clipcloud::network::HttpMethod;
using clipcloud::storage::SigningGateway;
using clipcloud::test_support::FakeHttpClient;
using clipcloud::transfer::Downloader;

class DownloaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = clipcloud::test_support::create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    static std::string url(const std::string& path) {
        return "https://api.test/guild/" + path;
    }

    fs::path root_;
    FakeHttpClient http_;
    SigningGateway gateway_{http_, "https://api.test", "guild", "alice", "secret"};
    Downloader downloader_{http_, gateway_};
};

TEST_F(DownloaderTest, StreamsBodyToDestinationWithProgress) {
    std::string content;
    for (int i = 0; i < 64; ++i) {
        content += static_cast<char>('a' + i % 26);
    }
    http_.on(HttpMethod::GET, url("size/clip.mp4"), 200, R"({"size":64})");
    http_.on(HttpMethod::GET, "https://store.test/clip.mp4", 200, content);

    std::vector<int> progress;
    auto result = downloader_.download("clip.mp4", "https://store.test/clip.mp4?sig=1", root_.string(),
                                       [&](int pct) { progress.push_back(pct); });
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(result.value(), 64u);
    EXPECT_EQ(clipcloud::test_support::read_file(root_ / "clip.mp4"), content);

    ASSERT_GT(progress.size(), 2u);
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
    EXPECT_EQ(progress.back(), 100);

    // Signed URLs carry their own authorization
    const auto requests = http_.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].get_header("Authorization"), "");
}

TEST_F(DownloaderTest, EmptyObjectReportsOnlyCompletion) {
    http_.on(HttpMethod::GET, url("size/empty.png"), 200, R"({"size":0})");
    http_.on(HttpMethod::GET, "https://store.test/empty.png", 200, "");

    std::vector<int> progress;
    auto result = downloader_.download("empty.png", "https://store.test/empty.png", root_.string(),
                                       [&](int pct) { progress.push_back(pct); });
    ASSERT_TRUE(result.is_ok()) << result.error().describe();
    EXPECT_EQ(progress, (std::vector<int>{100}));
    EXPECT_TRUE(fs::exists(root_ / "empty.png"));
}

TEST_F(DownloaderTest, HttpFailureRemovesPartialFile) {
    http_.on(HttpMethod::GET, url("size/clip.mp4"), 200, R"({"size":10})");
    http_.on(HttpMethod::GET, "https://store.test/clip.mp4", 403, "<Error>Request has expired</Error>");

    auto result = downloader_.download("clip.mp4", "https://store.test/clip.mp4", root_.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Transfer));
    EXPECT_EQ(result.error().status, 403);
    EXPECT_FALSE(fs::exists(root_ / "clip.mp4"));
}

TEST_F(DownloaderTest, SizeLookupFailureStopsBeforeDownload) {
    http_.on(HttpMethod::GET, url("size/clip.mp4"), 500, "boom");

    auto result = downloader_.download("clip.mp4", "https://store.test/clip.mp4", root_.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(http_.count(HttpMethod::GET, "https://store.test/clip.mp4"), 0u);
}

TEST_F(DownloaderTest, UnwritableDestinationIsTransferError) {
    http_.on(HttpMethod::GET, url("size/clip.mp4"), 200, R"({"size":10})");

    auto result = downloader_.download("clip.mp4", "https://store.test/clip.mp4",
                                       (root_ / "missing" / "dir").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Transfer));
    EXPECT_EQ(http_.count(HttpMethod::GET, "https://store.test/clip.mp4"), 0u);
}

TEST_F(DownloaderTest, KeysThatEscapeDestinationAreRejected) {
    const auto dest = root_ / "downloads";
    fs::create_directories(dest);

    for (const std::string key : {"../escape.mp4", "/tmp/abs.mp4", "nested/clip.mp4", "..", ""}) {
        auto result = downloader_.download(key, "https://store.test/x", dest.string());
        ASSERT_TRUE(result.is_error()) << key;
        EXPECT_TRUE(result.error().is(ErrorKind::Transfer)) << key;
    }

    EXPECT_EQ(http_.request_count(), 0u);
    EXPECT_FALSE(fs::exists(root_ / "escape.mp4"));
}
