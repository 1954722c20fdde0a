#include "clipcloud/transfer/content_type.hpp"

#include <gtest/gtest.h>

using clipcloud::ErrorKind;
using clipcloud::transfer::content_type_for;

TEST(ContentType, AllowedSuffixes) {
    EXPECT_EQ(content_type_for("video.mp4").value(), "video/mp4");
    EXPECT_EQ(content_type_for("thumb.png").value(), "image/png");
}

TEST(ContentType, SuffixMatchIsCaseSensitive) {
    for (const char* key : {"LOUD.MP4", "x.PnG", "clip.Mp4"}) {
        auto result = content_type_for(key);
        ASSERT_TRUE(result.is_error()) << key;
        EXPECT_TRUE(result.error().is(ErrorKind::UnsupportedType)) << key;
    }
}

TEST(ContentType, EverythingElseIsUnsupported) {
    for (const char* key : {"clip.mov", "notes.txt", "mp4", "video.mp4.part", ""}) {
        auto result = content_type_for(key);
        ASSERT_TRUE(result.is_error()) << key;
        EXPECT_TRUE(result.error().is(ErrorKind::UnsupportedType)) << key;
    }
}
