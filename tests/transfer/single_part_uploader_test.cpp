#include "clipcloud/storage/signing_gateway.hpp"
#include "clipcloud/transfer/single_part_uploader.hpp"
#include "support/fake_http_client.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
using clipcloud::ErrorKind;
using clipcloud::network::HttpMethod;
using clipcloud::storage::SigningGateway;
using clipcloud::test_support::FakeHttpClient;
using clipcloud::transfer::SinglePartUploader;

class SinglePartUploaderTest : public ::testing::Test {
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
    SinglePartUploader uploader_{http_, gateway_};
};

TEST_F(SinglePartUploaderTest, StreamsFileToSignedUrl) {
    const auto file = root_ / "video.mp4";
    clipcloud::test_support::write_file(file, std::string(100, 'v'));

    http_.on(HttpMethod::GET, url("upload/video.mp4/100"), 200,
             R"({"signed":"https://store.test/video.mp4?X-Amz-Signature=abc"})");
    http_.on(HttpMethod::PUT, "https://store.test/video.mp4", 200);

    std::vector<int> progress;
    auto result = uploader_.upload(file.string(), [&](int pct) { progress.push_back(pct); });
    ASSERT_TRUE(result.is_ok()) << result.error().describe();

    const auto requests = http_.requests();
    ASSERT_EQ(requests.size(), 2u);
    const auto& put = requests[1];
    EXPECT_EQ(put.method, HttpMethod::PUT);
    EXPECT_EQ(put.url, "https://store.test/video.mp4?X-Amz-Signature=abc");
    EXPECT_EQ(put.get_header("Content-Length"), "100");
    EXPECT_EQ(put.get_header("Content-Type"), "video/mp4");
    ASSERT_TRUE(put.file_body.has_value());
    EXPECT_EQ(put.file_body->offset, 0u);
    EXPECT_EQ(put.file_body->length, 100u);
    EXPECT_TRUE(put.body.empty());

    EXPECT_EQ(progress, (std::vector<int>{0, 50, 100}));
}

TEST_F(SinglePartUploaderTest, StoreRejectionIsTransferErrorWithBody) {
    const auto file = root_ / "thumb.png";
    clipcloud::test_support::write_file(file, "png");

    http_.on(HttpMethod::GET, url("upload/thumb.png/3"), 200, R"({"signed":"https://store.test/thumb.png"})");
    http_.on(HttpMethod::PUT, "https://store.test/thumb.png", 403, "<Error>SignatureDoesNotMatch</Error>");

    auto result = uploader_.upload(file.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Transfer));
    EXPECT_EQ(result.error().status, 403);
    EXPECT_EQ(result.error().body, "<Error>SignatureDoesNotMatch</Error>");
}

TEST_F(SinglePartUploaderTest, UnsupportedTypeMakesNoRequests) {
    const auto file = root_ / "clip.mov";
    clipcloud::test_support::write_file(file, "mov");

    auto result = uploader_.upload(file.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::UnsupportedType));
    EXPECT_EQ(http_.request_count(), 0u);
}

TEST_F(SinglePartUploaderTest, MissingFileMakesNoRequests) {
    auto result = uploader_.upload((root_ / "gone.mp4").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Transfer));
    EXPECT_EQ(http_.request_count(), 0u);
}
