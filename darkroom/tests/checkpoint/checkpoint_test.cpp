#include "checkpoint/checkpoint.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <stdexcept>
#include <thread>

#include "checkpoint/checkpoint_store.hpp"
#include "utils/fs/atomic_file.hpp"
#include "utils/utils_test_fixation.hpp"

namespace darkroom {
namespace {
auto SampleCheckpoint(const std::string& directory) -> Checkpoint {
  Checkpoint checkpoint;
  checkpoint.directory_          = directory;
  checkpoint.file_list_snapshot_ = {"a.jpg", "b.mov", "c.jpg"};
  checkpoint.run_parameters_     = {{"slug", "summer"}, {"force", false}};
  checkpoint.skipped_            = {"c.jpg"};
  checkpoint.plan_ = {{"a.jpg", "a", false, UploadLane::IMAGE},
                      {"b.mov", "b", true, UploadLane::RAW}};
  return checkpoint;
}

class BrokenCheckpointStore final : public CheckpointStore {
 public:
  int  writes_ = 0;
  auto Read() -> std::optional<Checkpoint> override { return std::nullopt; }
  void Write(const Checkpoint&) override {
    ++writes_;
    throw std::runtime_error("disk full");
  }
  void Delete() override {}
  auto Location() const -> std::string override { return "memory"; }
};

void ExpectMessage(const std::function<void()>& fn, const std::string& needle) {
  try {
    fn();
    FAIL() << "expected an exception mentioning \"" << needle << "\"";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find(needle), std::string::npos) << e.what();
  }
}
}  // namespace

using CheckpointStoreTests = TempDirTests;

TEST(CheckpointTest, PendingFollowsPlanOrder) {
  auto checkpoint = SampleCheckpoint("/tmp/x");
  EXPECT_FALSE(checkpoint.IsComplete());
  ASSERT_EQ(checkpoint.Pending().size(), 2u);

  checkpoint.completed_["a.jpg"] = {{"id", "a"}};
  ASSERT_EQ(checkpoint.Pending().size(), 1u);
  EXPECT_EQ(checkpoint.Pending().front().source_filename_, "b.mov");

  checkpoint.completed_["b.mov"] = nlohmann::json::object();
  EXPECT_TRUE(checkpoint.IsComplete());
}

TEST(CheckpointTest, JsonShape) {
  auto checkpoint                = SampleCheckpoint("/photos");
  checkpoint.completed_["a.jpg"] = {{"id", "a"}};
  const auto json                = CheckpointToJson(checkpoint);

  EXPECT_EQ(json.at("version"), 1);
  EXPECT_EQ(json.at("directory"), "/photos");
  EXPECT_EQ(json.at("plan").at(1).at("lane"), "raw");
  EXPECT_TRUE(json.at("plan").at(1).at("overwrites").get<bool>());
  EXPECT_EQ(json.at("completed").at("a.jpg").at("id"), "a");

  const auto parsed = CheckpointFromJson(json, "test");
  EXPECT_EQ(parsed.plan_, checkpoint.plan_);
  EXPECT_EQ(parsed.completed_, checkpoint.completed_);
  EXPECT_EQ(parsed.skipped_, checkpoint.skipped_);
}

TEST(CheckpointTest, MalformedPayloadFailsClosed) {
  auto json = CheckpointToJson(SampleCheckpoint("/photos"));
  json.erase("plan");
  ExpectMessage([&]() { CheckpointFromJson(json, "cp.json"); }, "Invalid checkpoint file: cp.json");

  auto wrong_version       = CheckpointToJson(SampleCheckpoint("/photos"));
  wrong_version["version"] = 7;
  ExpectMessage([&]() { CheckpointFromJson(wrong_version, "cp.json"); }, "unsupported version");

  auto bad_lane               = CheckpointToJson(SampleCheckpoint("/photos"));
  bad_lane["plan"][0]["lane"] = "turbo";
  ExpectMessage([&]() { CheckpointFromJson(bad_lane, "cp.json"); }, "Delete it");

  EXPECT_THROW(CheckpointFromJson(nlohmann::json::array(), "cp.json"), std::runtime_error);
}

TEST(CheckpointTest, VerifyResumableMismatches) {
  const auto stored = SampleCheckpoint("/photos");
  const auto files  = stored.file_list_snapshot_;
  const auto params = stored.run_parameters_;

  EXPECT_NO_THROW(VerifyResumable(stored, "/photos", params, files, "cp"));

  ExpectMessage([&]() { VerifyResumable(stored, "/other", params, files, "cp"); },
                "directory mismatch");

  auto forced     = params;
  forced["force"] = true;
  ExpectMessage([&]() { VerifyResumable(stored, "/photos", forced, files, "cp"); },
                "same --force setting");

  auto retitled    = params;
  retitled["slug"] = "winter";
  ExpectMessage([&]() { VerifyResumable(stored, "/photos", retitled, files, "cp"); },
                "Rerun with the original arguments");

  auto more_files = files;
  more_files.push_back("d.jpg");
  ExpectMessage([&]() { VerifyResumable(stored, "/photos", params, more_files, "cp"); },
                "Restore the original files");
}

TEST_F(CheckpointStoreTests, MissingFileReadsAsNothing) {
  FileCheckpointStore store(dir_ / "absent.json");
  EXPECT_FALSE(store.Read().has_value());
  EXPECT_NO_THROW(store.Delete());
}

TEST_F(CheckpointStoreTests, WriteReadDelete) {
  auto store = FileCheckpointStore::ForJob(dir_, "album", "summer");
  EXPECT_EQ(store->Location(), (dir_ / ".darkroom-album.summer.checkpoint.json").string());

  auto checkpoint                = SampleCheckpoint(dir_.string());
  checkpoint.completed_["a.jpg"] = {{"id", "a"}, {"width", 10}};
  store->Write(checkpoint);

  const auto loaded = store->Read();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->directory_, dir_.string());
  EXPECT_EQ(loaded->completed_.at("a.jpg").at("width"), 10);

  store->Delete();
  EXPECT_FALSE(std::filesystem::exists(store->Location()));
}

TEST_F(CheckpointStoreTests, CorruptFileIsReported) {
  const auto path = dir_ / "broken.json";
  WriteFileAtomic(path, std::string("{\"version\": 1, \"plan\": ["));
  FileCheckpointStore store(path);
  ExpectMessage([&]() { store.Read(); }, "Invalid checkpoint file");
  // Left in place for the operator
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(CheckpointStoreTests, JournalPersistsEveryRecord) {
  auto              store = FileCheckpointStore::ForJob(dir_, "media", "word-kettle");
  CheckpointJournal journal(store, SampleCheckpoint(dir_.string()));

  std::vector<std::thread> workers;
  for (const auto* file : {"a.jpg", "b.mov"}) {
    workers.emplace_back([&journal, file]() { journal.Record(file, {{"file", file}}); });
  }
  for (auto& worker : workers) worker.join();

  EXPECT_EQ(journal.CompletedCount(), 2u);
  const auto on_disk = store->Read();
  ASSERT_TRUE(on_disk.has_value());
  EXPECT_TRUE(on_disk->IsComplete());
  EXPECT_EQ(on_disk->completed_.at("b.mov").at("file"), "b.mov");
}

TEST(CheckpointJournalTest, FailedWriteIsRolledBack) {
  auto              store = std::make_shared<BrokenCheckpointStore>();
  CheckpointJournal journal(store, SampleCheckpoint("/photos"));
  EXPECT_THROW(journal.Record("a.jpg", {{"id", "a"}}), std::runtime_error);
  EXPECT_EQ(store->writes_, 1);
  EXPECT_EQ(journal.CompletedCount(), 0u);
  EXPECT_TRUE(journal.Snapshot().completed_.empty());
}

TEST(CheckpointJournalTest, NullStoreIsRejected) {
  EXPECT_THROW(CheckpointJournal(nullptr, Checkpoint{}), std::invalid_argument);
}
}  // namespace darkroom
