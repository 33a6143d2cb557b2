#include "utils/string/sanitize.hpp"

#include <gtest/gtest.h>

namespace darkroom {
TEST(SanitizeTest, LowercasesAndCollapsesDashes) {
  EXPECT_EQ(SanitizeStem("IMG 01"), "img-01");
  EXPECT_EQ(SanitizeStem("  Summer__Trip!!2024  "), "summer-trip-2024");
  EXPECT_EQ(SanitizeStem("--a---b--"), "a-b");
  EXPECT_EQ(SanitizeStem("???"), "file");
  EXPECT_EQ(SanitizeStem(""), "file");
}

TEST(SanitizeTest, NonAsciiBytesBecomeDashes) {
  EXPECT_EQ(SanitizeStem("caf\xC3\xA9 au lait"), "caf-au-lait");
}

TEST(SanitizeTest, DerivedNames) {
  EXPECT_EQ(DeriveItemId("IMG 01.JPG"), "img-01");
  EXPECT_EQ(DeriveMediaFilename("IMG 01.JPG"), "img-01.webp");
  EXPECT_EQ(DeriveMediaFilename("Loop.GIF"), "loop.gif");
  EXPECT_EQ(DeriveMediaFilename("Clip Final.MP4"), "clip-final.mp4");
  EXPECT_EQ(DeriveArchiveFilename("IMG 01.JPG"), "img-01.jpg");
  EXPECT_EQ(DeriveArchiveFilename("README"), "readme");
}

TEST(SanitizeTest, DistinctSourcesCanCollide) {
  EXPECT_EQ(DeriveMediaFilename("IMG 01.JPG"), DeriveMediaFilename("img-01.jpg"));
  EXPECT_EQ(DeriveItemId("a.png"), DeriveItemId("a.jpg"));
}

TEST(SanitizeTest, EscapeXml) {
  EXPECT_EQ(EscapeXml(R"(Tom & "Jerry" <3 'x')"),
            "Tom &amp; &quot;Jerry&quot; &lt;3 &apos;x&apos;");
  EXPECT_EQ(EscapeXml("plain"), "plain");
}
}  // namespace darkroom
