#include "storage/local_object_store.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "utils/utils_test_fixation.hpp"

namespace darkroom {
namespace {
auto Bytes(const std::string& text) -> byte_buffer_t { return {text.begin(), text.end()}; }
}  // namespace

class LocalObjectStoreTests : public TempDirTests {
 protected:
  std::unique_ptr<LocalObjectStore> store_;

  void                              SetUp() override {
    TempDirTests::SetUp();
    store_ = std::make_unique<LocalObjectStore>(dir_ / "bucket");
  }
};

TEST_F(LocalObjectStoreTests, UploadThenHead) {
  store_->Upload("albums/summer/thumb/a.webp", Bytes("webp!"), "image/webp");

  const auto head = store_->Head("albums/summer/thumb/a.webp");
  EXPECT_TRUE(head.exists_);
  EXPECT_EQ(head.size_, 5u);
  EXPECT_EQ(head.content_type_, "image/webp");

  EXPECT_FALSE(store_->Head("albums/summer/thumb/b.webp").exists_);
}

TEST_F(LocalObjectStoreTests, ListMatchesPrefixOnly) {
  store_->Upload("albums/summer/og/a.jpg", Bytes("a"), "image/jpeg");
  store_->Upload("albums/summer/og/b.jpg", Bytes("bb"), "image/jpeg");
  store_->Upload("albums/summertime/og/c.jpg", Bytes("c"), "image/jpeg");

  const auto og = store_->List("albums/summer/og/");
  ASSERT_EQ(og.size(), 2u);
  EXPECT_EQ(og[0].key_, "albums/summer/og/a.jpg");
  EXPECT_EQ(og[1].size_, 2u);
  EXPECT_TRUE(og[0].last_modified_.has_value());

  EXPECT_EQ(store_->List("albums/summer").size(), 3u);
  EXPECT_TRUE(store_->List("transfers/").empty());
}

TEST_F(LocalObjectStoreTests, ListPrefixesAndDelete) {
  store_->Upload("albums/summer/og/a.jpg", Bytes("a"), "image/jpeg");
  store_->Upload("albums/winter/og/b.jpg", Bytes("b"), "image/jpeg");

  EXPECT_EQ(store_->ListPrefixes("albums/"),
            (std::vector<std::string>{"albums/summer/", "albums/winter/"}));

  EXPECT_EQ(store_->BatchDelete({"albums/summer/og/a.jpg", "albums/summer/og/missing.jpg"}), 1u);
  EXPECT_EQ(store_->ListPrefixes("albums"), (std::vector<std::string>{"albums/winter/"}));
  EXPECT_TRUE(std::filesystem::exists(store_->Root()));
}

TEST_F(LocalObjectStoreTests, HeadReportsUploadedContentType) {
  // Extension and payload type disagree on purpose
  store_->Upload("albums/summer/og/a.jpg", Bytes("RIFF"), "image/webp");
  store_->Upload("transfers/t/original/notes", Bytes("hello"), "text/plain");
  store_->Upload("transfers/t/original/b.png", Bytes("png"), "");

  EXPECT_EQ(store_->Head("albums/summer/og/a.jpg").content_type_, "image/webp");
  EXPECT_EQ(store_->Head("transfers/t/original/notes").content_type_, "text/plain");
  EXPECT_EQ(store_->Head("transfers/t/original/b.png").content_type_, "image/png");

  store_->Upload("albums/summer/og/a.jpg", Bytes("jpeg"), "image/jpeg");
  EXPECT_EQ(store_->Head("albums/summer/og/a.jpg").content_type_, "image/jpeg");

  // Metadata never shows up as an object
  ASSERT_EQ(store_->List("albums/").size(), 1u);
  EXPECT_EQ(store_->List("albums/")[0].key_, "albums/summer/og/a.jpg");

  EXPECT_EQ(store_->BatchDelete({"albums/summer/og/a.jpg"}), 1u);
  EXPECT_TRUE(store_->ListPrefixes("albums/").empty());
  EXPECT_FALSE(std::filesystem::exists(store_->Root() / "albums"));
}

TEST_F(LocalObjectStoreTests, RejectsKeysOutsideBucket) {
  EXPECT_THROW(store_->Upload("../escape.jpg", Bytes("x"), "image/jpeg"), std::invalid_argument);
  EXPECT_THROW(store_->Upload("/abs.jpg", Bytes("x"), "image/jpeg"), std::invalid_argument);
  EXPECT_THROW(store_->Head("albums/"), std::invalid_argument);
  EXPECT_THROW(store_->Upload("albums/.a.jpg.content-type", Bytes("x"), "text/plain"),
               std::invalid_argument);
  EXPECT_FALSE(std::filesystem::exists(dir_ / "escape.jpg"));
}
}  // namespace darkroom
