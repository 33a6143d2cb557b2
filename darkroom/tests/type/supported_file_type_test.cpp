#include "type/supported_file_type.hpp"

#include <gtest/gtest.h>

namespace darkroom {
TEST(SupportedFileTypeTest, ClassifiesByLowercasedExtension) {
  EXPECT_EQ(GetFileKind("IMG_0001.JPG"), FileKind::IMAGE);
  EXPECT_EQ(GetFileKind("scan.TIFF"), FileKind::IMAGE);
  EXPECT_EQ(GetFileKind("party.gif"), FileKind::GIF);
  EXPECT_EQ(GetFileKind("clip.MOV"), FileKind::VIDEO);
  EXPECT_EQ(GetFileKind("voice.m4a"), FileKind::AUDIO);
  EXPECT_EQ(GetFileKind("notes.pdf"), FileKind::FILE);
  EXPECT_EQ(GetFileKind("no_extension"), FileKind::FILE);
}

TEST(SupportedFileTypeTest, GifIsVisualButNotProcessable) {
  EXPECT_FALSE(IsProcessableImage("loop.gif"));
  EXPECT_TRUE(IsAnimatedImage("loop.GIF"));
  EXPECT_TRUE(IsVisualKind(FileKind::GIF));
  EXPECT_TRUE(IsVisualKind(FileKind::IMAGE));
  EXPECT_FALSE(IsVisualKind(FileKind::VIDEO));
}

TEST(SupportedFileTypeTest, MimeTypesFallBackToOctetStream) {
  EXPECT_EQ(GetMimeType("a.jpeg"), "image/jpeg");
  EXPECT_EQ(GetMimeType("a.HEIC"), "image/heic");
  EXPECT_EQ(GetMimeType("a.mov"), "video/quicktime");
  EXPECT_EQ(GetMimeType("a.mp3"), "audio/mpeg");
  EXPECT_EQ(GetMimeType("a.docx"),
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document");
  EXPECT_EQ(GetMimeType("a.xyz"), "application/octet-stream");
  EXPECT_EQ(GetMimeType("Makefile"), "application/octet-stream");
}

TEST(SupportedFileTypeTest, NormalizeExtensionAddsDot) {
  EXPECT_EQ(NormalizeExtension("JPG"), ".jpg");
  EXPECT_EQ(NormalizeExtension(".HeIc"), ".heic");
  EXPECT_EQ(NormalizeExtension(""), "");
  EXPECT_TRUE(IsHeifExtension("HIF"));
  EXPECT_TRUE(IsHeifExtension(".heic"));
  EXPECT_FALSE(IsHeifExtension(".jpg"));
}

TEST(SupportedFileTypeTest, KindNamesRoundTrip) {
  for (auto kind : {FileKind::IMAGE, FileKind::VIDEO, FileKind::GIF, FileKind::AUDIO,
                    FileKind::FILE}) {
    EXPECT_EQ(FileKindFromString(FileKindToString(kind)), kind);
  }
  EXPECT_EQ(FileKindFromString("something-else"), FileKind::FILE);
}

TEST(SupportedFileTypeTest, FormatBytes) {
  EXPECT_EQ(FormatBytes(0), "0 B");
  EXPECT_EQ(FormatBytes(1023), "1023 B");
  EXPECT_EQ(FormatBytes(1536), "1.5 KB");
  EXPECT_EQ(FormatBytes(2359296), "2.25 MB");
}
}  // namespace darkroom
