#include "app/ingest_records.hpp"

#include <gtest/gtest.h>

namespace darkroom {
TEST(IngestRecordsTest, ErrorCodeNames) {
  EXPECT_EQ(IngestErrorCodeToString(IngestErrorCode::FOCAL_DETECTION_FAILED),
            "focal_detection_failed");
  EXPECT_EQ(IngestErrorCodeToString(IngestErrorCode::THUMBNAIL_FAILED), "thumbnail_failed");
  EXPECT_EQ(IngestErrorCodeToString(IngestErrorCode::UNKNOWN), "unknown");
}

TEST(IngestRecordsTest, AlbumPhotoJson) {
  AlbumPhotoRecord photo;
  photo.id_     = "img-0001";
  photo.source_ = "IMG 0001.JPG";
  photo.width_  = 4000;
  photo.height_ = 3000;
  photo.focal_  = FocalPoint{30, 70};

  const nlohmann::json j = photo;
  EXPECT_EQ(j.at("focal").at("x"), 30);
  EXPECT_FALSE(j.contains("takenAt"));

  const auto back = j.get<AlbumPhotoRecord>();
  EXPECT_EQ(back.source_, "IMG 0001.JPG");
  EXPECT_EQ(back.focal_, (FocalPoint{30, 70}));
  EXPECT_FALSE(back.taken_at_.has_value());
}

TEST(IngestRecordsTest, TransferFileJsonUsesCamelCase) {
  TransferFileRecord file;
  file.id_        = "clip";
  file.filename_  = "clip.mov";
  file.kind_      = FileKind::VIDEO;
  file.size_      = 12345678901ULL;
  file.mime_type_ = "video/quicktime";

  const nlohmann::json j = file;
  EXPECT_EQ(j.at("mimeType"), "video/quicktime");
  EXPECT_EQ(j.at("kind"), "video");
  EXPECT_EQ(j.at("size").get<uint64_t>(), 12345678901ULL);
  EXPECT_FALSE(j.contains("width"));

  const auto back = j.get<TransferFileRecord>();
  EXPECT_EQ(back.kind_, FileKind::VIDEO);
  EXPECT_FALSE(back.width_.has_value());
}

TEST(IngestRecordsTest, MediaFileJson) {
  const nlohmann::json j = {{"original", "Logo.PNG"}, {"filename", "logo.webp"}, {"kind", "image"},
                            {"size", 2048},           {"width", 640},            {"height", 480}};
  const auto           media = j.get<MediaFileRecord>();
  EXPECT_EQ(media.original_, "Logo.PNG");
  EXPECT_EQ(media.width_, 640);
  EXPECT_FALSE(media.overwrote_);
  EXPECT_TRUE(media.markdown_.empty());

  MediaFileRecord pdf;
  pdf.filename_ = "pricing.pdf";
  pdf.markdown_ = "[pricing](assets/brand-kit/pricing.pdf)";
  EXPECT_EQ(nlohmann::json(pdf).at("markdown"), pdf.markdown_);
}

TEST(IngestRecordsTest, MarkdownSnippets) {
  EXPECT_EQ(MarkdownSnippet("words/launch-notes/media/", "hero.webp", FileKind::IMAGE),
            "![hero](words/launch-notes/media/hero.webp)");
  EXPECT_EQ(MarkdownSnippet("assets/brand-kit/", "intro.mp4", FileKind::VIDEO),
            "![intro](assets/brand-kit/intro.mp4)");
  EXPECT_EQ(MarkdownSnippet("assets/brand-kit/", "spin.gif", FileKind::GIF),
            "![spin](assets/brand-kit/spin.gif)");
  EXPECT_EQ(MarkdownSnippet("assets/brand-kit/", "logo.svg", FileKind::FILE),
            "[logo](assets/brand-kit/logo.svg)");
  EXPECT_EQ(MarkdownSnippet("assets/brand-kit/", "theme.tar.gz", FileKind::FILE),
            "[theme.tar](assets/brand-kit/theme.tar.gz)");
  EXPECT_EQ(MarkdownSnippet("assets/brand-kit/", "README", FileKind::FILE),
            "[README](assets/brand-kit/README)");
}

TEST(IngestRecordsTest, ManifestOrdering) {
  struct Item {
    std::string                name_;
    bool                       visual_;
    std::optional<std::string> taken_at_;
  };
  std::vector<Item> items = {{"notes.pdf", false, std::nullopt},
                             {"c.jpg", true, std::nullopt},
                             {"b.jpg", true, "2024-07-02T10:00:00"},
                             {"a.mp3", false, std::nullopt},
                             {"z.jpg", true, "2024-07-01T09:00:00"},
                             {"a.jpg", true, std::nullopt},
                             {"y.jpg", true, "2024-07-02T10:00:00"}};

  SortForManifest(items, [](const Item& item) {
    return ManifestSortKey{item.visual_, item.taken_at_, item.name_};
  });

  std::vector<std::string> order;
  for (const auto& item : items) order.push_back(item.name_);
  EXPECT_EQ(order, (std::vector<std::string>{"z.jpg", "b.jpg", "y.jpg", "a.jpg", "c.jpg", "a.mp3",
                                             "notes.pdf"}));
}
}  // namespace darkroom
