#include <gtest/gtest.h>

#include <stdexcept>

#include "storage/manifest_store.hpp"
#include "utils/fs/atomic_file.hpp"
#include "utils/utils_test_fixation.hpp"

namespace darkroom {
using JsonManifestStoreTests = TempDirTests;

TEST_F(JsonManifestStoreTests, PutGetDelete) {
  JsonManifestStore store(dir_);
  const nlohmann::json record = {{"title", "Summer"}, {"photos", nlohmann::json::array()}};

  EXPECT_FALSE(store.Get("albums/summer").has_value());
  store.Put("albums/summer", record);
  EXPECT_TRUE(std::filesystem::exists(dir_ / "albums" / "summer.json"));

  const auto loaded = store.Get("albums/summer");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, record);

  EXPECT_TRUE(store.Delete("albums/summer"));
  EXPECT_FALSE(store.Delete("albums/summer"));
  EXPECT_FALSE(store.Get("albums/summer").has_value());
}

TEST_F(JsonManifestStoreTests, PutReplacesRecord) {
  JsonManifestStore store(dir_);
  store.Put("transfers/abc", {{"title", "old"}});
  store.Put("transfers/abc", {{"title", "new"}});
  EXPECT_EQ(store.Get("transfers/abc")->at("title"), "new");
}

TEST_F(JsonManifestStoreTests, ListByPrefix) {
  JsonManifestStore store(dir_);
  EXPECT_TRUE(store.List("transfers/").empty());

  store.Put("transfers/b", {{"title", "b"}});
  store.Put("transfers/a", {{"title", "a"}});
  store.Put("albums/summer", {{"title", "s"}});
  store.Put("media/words/kettle", {{"files", nlohmann::json::array()}});
  // In-flight writes are not records
  WriteFileAtomic(dir_ / "transfers" / "c.json.tmp", std::string("{}"));

  EXPECT_EQ(store.List("transfers/"), (std::vector<std::string>{"transfers/a", "transfers/b"}));
  EXPECT_EQ(store.List("media/"), (std::vector<std::string>{"media/words/kettle"}));
  EXPECT_EQ(store.List("").size(), 4u);
}

TEST_F(JsonManifestStoreTests, CorruptRecordThrows) {
  JsonManifestStore store(dir_);
  WriteFileAtomic(store.PathForKey("media/words/kettle"), std::string("{not json"));
  EXPECT_THROW(store.Get("media/words/kettle"), std::runtime_error);
}

TEST_F(JsonManifestStoreTests, InvalidKeys) {
  JsonManifestStore store(dir_);
  EXPECT_THROW(store.Put("", {}), std::invalid_argument);
  EXPECT_THROW(store.Put("../up", {}), std::invalid_argument);
  EXPECT_THROW(store.Get("/abs"), std::invalid_argument);
}
}  // namespace darkroom
